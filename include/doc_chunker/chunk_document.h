#pragma once

#include <doc_chunker/image.h>
#include <doc_chunker/naive_merger.h>
#include <doc_chunker/position_tag.h>
#include <doc_chunker/tokenizer.h>
#include <array>
#include <string>
#include <vector>

namespace doc_chunker {

// Retrieval-ready record built from one merged chunk
struct ChunkDocument {
    std::string content_with_weight;
    std::string content_ltks;
    std::string content_sm_ltks;
    std::string mom_with_weight;                 // parent chunk when split by child delimiters
    std::vector<int> page_num_int;               // one-based
    std::vector<int> top_int;
    std::vector<std::array<int, 5>> position_int; // page, left, right, top, bottom
    std::string doc_type_kwd;                    // "", "table" or "image"
    Image image;

    bool has_position() const { return !page_num_int.empty() && !top_int.empty(); }
};

// One row of add_positions() input: zero-based page, left, right, top, bottom
using PositionBox = std::array<double, 5>;

std::vector<PositionBox> position_boxes(const std::vector<PositionTag>& tags);

// Fills page_num_int, top_int and position_int. No-op for an empty list.
void add_positions(ChunkDocument& doc, const std::vector<PositionBox>& boxes);

// Sets content_with_weight and the token fields. Table markup is blanked out
// before tokenizing.
void tokenize(ChunkDocument& doc, const std::string& text, const Tokenizer& tokenizer);

/**
 * Builds one document per non-blank chunk. Chunks carrying position tags
 * get their positions from the tags and lose the tags from their text;
 * untagged chunks are positioned by their index in the list.
 *
 * With a non-empty `child_delimiter` pattern every chunk is further split
 * into child documents that keep the whole chunk in mom_with_weight.
 */
std::vector<ChunkDocument> tokenize_chunks(const ChunkSet& chunks, const Tokenizer& tokenizer,
                                           const std::string& child_delimiter = "");

// Same, for chunks paired with images (chunk.image is carried over)
std::vector<ChunkDocument> tokenize_chunks_with_images(const ChunkSet& chunks,
                                                       const Tokenizer& tokenizer,
                                                       const std::string& child_delimiter = "");

struct TableBlock {
    Image image;
    std::string html;               // whole table as one string, or
    std::vector<std::string> rows;  // row descriptions, batched
    std::vector<PositionBox> positions;
};

// Tables become "table" documents ("image" when a picture is attached).
// Row lists are joined batch_size rows at a time. A block holding only a
// picture becomes an image document with empty text.
std::vector<ChunkDocument> tokenize_table(const std::vector<TableBlock>& tables,
                                          const Tokenizer& tokenizer, bool english,
                                          size_t batch_size = 10);

} // namespace doc_chunker
