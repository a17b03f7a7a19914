#pragma once

#include <doc_chunker/image.h>
#include <doc_chunker/position_tag.h>
#include <doc_chunker/section.h>
#include <doc_chunker/tokenizer.h>
#include <string>
#include <utility>
#include <vector>

namespace doc_chunker {

struct Chunk {
    std::string text;                        // may carry inline position tags
    size_t token_count = 0;
    std::vector<PositionTag> position_tags;  // parsed from text
    Image image;
    std::string doc_type;                    // "", "table" or "image"
};

using ChunkSet = std::vector<Chunk>;

struct MergeOptions {
    size_t chunk_token_num = 128;
    std::string delimiter = "\n。；！？";
    int overlapped_percent = 0;              // clamped to [0, 99]
};

// Fragments shorter than this lose their position tag
constexpr size_t kMinTaggedTokens = 8;

// Backtick-quoted literals of a delimiter string, unique, longest first.
// "`\n\n`。" yields {"\n\n"}.
std::vector<std::string> custom_delimiters(const std::string& delimiter);

/**
 * Regex alternation over every delimiter of the string: the backtick literals
 * plus each remaining character on its own, escaped and ordered longest
 * first. Empty when the string is empty.
 */
std::string get_delimiters(const std::string& delimiter);

/**
 * Greedy token-budget merge.
 *
 * Each section is fed as "\n" + text. A new chunk starts when the running
 * chunk's count exceeds chunk_token_num * (100 - overlapped_percent) / 100,
 * seeded with the tail of the previous chunk's untagged text. A section's
 * position tag is appended unless the receiving text already contains it.
 *
 * When the delimiter string holds backtick literals every section is split on
 * them instead and each piece becomes its own chunk, whatever its size.
 */
ChunkSet naive_merge(const std::vector<Section>& sections, const Tokenizer& tokenizer,
                     const MergeOptions& options = MergeOptions());

// Same merge, carrying one image per section. Images of merged sections are
// stacked with concat_img(). Returns nothing when the sizes differ.
ChunkSet naive_merge_with_images(const std::vector<Section>& sections,
                                 const std::vector<Image>& images,
                                 const Tokenizer& tokenizer,
                                 const MergeOptions& options = MergeOptions());

// Image-carrying merge for word-processor documents: no overlap, no
// position tags, and chunks close once they pass chunk_token_num.
ChunkSet naive_merge_docx(const std::vector<std::pair<std::string, Image>>& sections,
                          const Tokenizer& tokenizer,
                          const MergeOptions& options = MergeOptions());

} // namespace doc_chunker
