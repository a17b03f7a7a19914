#include "doc_chunker/chunk_document.h"
#include "doc_chunker/text_utils.h"
#include <algorithm>
#include <regex>

namespace doc_chunker {

namespace {

bool is_blank(const std::string& text) {
    return trim(text).empty();
}

void emit(std::vector<ChunkDocument>& out, ChunkDocument doc, const std::string& text,
          const Tokenizer& tokenizer, const std::string& child_delimiter) {
    if (child_delimiter.empty()) {
        tokenize(doc, text, tokenizer);
        out.push_back(std::move(doc));
        return;
    }

    doc.mom_with_weight = text;
    std::wregex pattern(utf8_to_wide(child_delimiter), std::regex::ECMAScript);
    for (const auto& piece : split_by_pattern(text, pattern)) {
        if (is_blank(piece)) continue;
        ChunkDocument child = doc;
        tokenize(child, piece, tokenizer);
        out.push_back(std::move(child));
    }
}

std::vector<PositionBox> index_box(size_t index) {
    double v = static_cast<double>(index);
    return {PositionBox{v, v, v, v, v}};
}

} // namespace

std::vector<PositionBox> position_boxes(const std::vector<PositionTag>& tags) {
    std::vector<PositionBox> boxes;
    for (const auto& tag : tags) {
        for (int page : tag.pages) {
            boxes.push_back({static_cast<double>(page), tag.left, tag.right, tag.top, tag.bottom});
        }
    }
    return boxes;
}

void add_positions(ChunkDocument& doc, const std::vector<PositionBox>& boxes) {
    if (boxes.empty()) {
        return;
    }
    doc.page_num_int.clear();
    doc.top_int.clear();
    doc.position_int.clear();
    for (const auto& [page, left, right, top, bottom] : boxes) {
        int page_number = static_cast<int>(page + 1);
        doc.page_num_int.push_back(page_number);
        doc.top_int.push_back(static_cast<int>(top));
        doc.position_int.push_back({page_number, static_cast<int>(left), static_cast<int>(right),
                                    static_cast<int>(top), static_cast<int>(bottom)});
    }
}

void tokenize(ChunkDocument& doc, const std::string& text, const Tokenizer& tokenizer) {
    static const std::regex table_markup("</?(table|td|caption|tr|th)( [^<>]{0,12})?>");

    doc.content_with_weight = text;
    std::string plain = std::regex_replace(text, table_markup, " ");
    doc.content_ltks = tokenizer.tokenize(plain);
    doc.content_sm_ltks = tokenizer.fine_grained_tokenize(doc.content_ltks);
}

std::vector<ChunkDocument> tokenize_chunks(const ChunkSet& chunks, const Tokenizer& tokenizer,
                                           const std::string& child_delimiter) {
    std::vector<ChunkDocument> out;
    for (size_t i = 0; i < chunks.size(); ++i) {
        const Chunk& chunk = chunks[i];
        if (is_blank(chunk.text)) continue;

        ChunkDocument doc;
        doc.doc_type_kwd = chunk.doc_type;
        doc.image = chunk.image;

        std::string text = chunk.text;
        if (!chunk.position_tags.empty()) {
            add_positions(doc, position_boxes(chunk.position_tags));
            text = remove_tag(text);
        } else {
            add_positions(doc, index_box(i));
        }
        emit(out, std::move(doc), text, tokenizer, child_delimiter);
    }
    return out;
}

std::vector<ChunkDocument> tokenize_chunks_with_images(const ChunkSet& chunks,
                                                       const Tokenizer& tokenizer,
                                                       const std::string& child_delimiter) {
    std::vector<ChunkDocument> out;
    for (size_t i = 0; i < chunks.size(); ++i) {
        const Chunk& chunk = chunks[i];
        if (is_blank(chunk.text)) continue;

        ChunkDocument doc;
        doc.image = chunk.image;
        doc.doc_type_kwd = chunk.doc_type;
        add_positions(doc, index_box(i));
        emit(out, std::move(doc), chunk.text, tokenizer, child_delimiter);
    }
    return out;
}

std::vector<ChunkDocument> tokenize_table(const std::vector<TableBlock>& tables,
                                          const Tokenizer& tokenizer, bool english,
                                          size_t batch_size) {
    std::vector<ChunkDocument> out;
    if (batch_size == 0) batch_size = 1;

    auto make_doc = [&](const TableBlock& table, const std::string& text) {
        ChunkDocument doc;
        tokenize(doc, text, tokenizer);
        doc.doc_type_kwd = "table";
        if (table.image) {
            doc.image = table.image;
            doc.doc_type_kwd = "image";
        }
        add_positions(doc, table.positions);
        return doc;
    };

    for (const auto& table : tables) {
        if (!table.html.empty() || (table.rows.empty() && table.image)) {
            out.push_back(make_doc(table, table.html));
            continue;
        }
        if (table.rows.empty()) continue;

        const std::string separator = english ? "; " : "； ";
        for (size_t i = 0; i < table.rows.size(); i += batch_size) {
            std::string joined;
            for (size_t j = i; j < std::min(i + batch_size, table.rows.size()); ++j) {
                if (j > i) joined += separator;
                joined += table.rows[j];
            }
            out.push_back(make_doc(table, joined));
        }
    }
    return out;
}

} // namespace doc_chunker
