#pragma once

#include <doc_chunker/section.h>
#include <vector>

namespace doc_chunker {

/**
 * Drops a table of contents in place. The block starts at a line reading
 * "contents", "table of contents", "目录", "目次", "致谢" or "acknowledge"
 * (spaces ignored). Its first entry gives a prefix (first three characters,
 * or first two words when `english`); every line up to the next line
 * starting with that prefix, looked for within 128 lines, is removed.
 */
void remove_contents_table(std::vector<Section>& sections, bool english);

// Splits a trailing short clause ending in a colon out of a longer
// paragraph and inserts it as a "title" section in front of the paragraph.
void make_colon_as_title(std::vector<Section>& sections);

} // namespace doc_chunker
