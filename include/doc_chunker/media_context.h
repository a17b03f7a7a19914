#pragma once

#include <doc_chunker/chunk_document.h>
#include <doc_chunker/tokenizer.h>
#include <string>
#include <vector>

namespace doc_chunker {

// Splits after each of . 。 ！ ？ ! ? ； ; ： : and newline, keeping the
// terminator with its sentence
std::vector<std::string> split_sentences(const std::string& text);

/**
 * Whole sentences of `text` up to `token_budget` tokens, taken from the head
 * or, with `from_tail`, from the tail. The sentence that crosses the budget
 * is still included; collection stops after it.
 */
std::string trim_to_tokens(const std::string& text, size_t token_budget,
                           const Tokenizer& tokenizer, bool from_tail = false);

/**
 * Prepends and appends neighbouring text to table and image documents.
 *
 * Documents with a page and top coordinate are put in reading order
 * (page, top, left, original index) ahead of those without. Around each
 * table/image the scan collects text documents backward and forward until
 * `table_context_size` / `image_context_size` tokens are used or another
 * table/image is met. When any document had a position the list is left in
 * reading order.
 */
void attach_media_context(std::vector<ChunkDocument>& docs, const Tokenizer& tokenizer,
                          size_t table_context_size, size_t image_context_size);

} // namespace doc_chunker
