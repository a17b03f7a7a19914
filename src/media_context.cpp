#include "doc_chunker/media_context.h"
#include "doc_chunker/text_utils.h"
#include <algorithm>
#include <tuple>

namespace doc_chunker {

namespace {

bool is_sentence_end(wchar_t c) {
    static const std::wstring terminators = L".\u3002\uFF01\uFF1F!?\uFF1B;\uFF1A:\n";
    return terminators.find(c) != std::wstring::npos;
}

bool is_image_doc(const ChunkDocument& doc) {
    if (doc.doc_type_kwd == "image") return true;
    return doc.image && trim(doc.content_with_weight).empty();
}

bool is_table_doc(const ChunkDocument& doc) {
    return doc.doc_type_kwd == "table";
}

bool is_text_doc(const ChunkDocument& doc) {
    return !is_image_doc(doc) && !is_table_doc(doc);
}

struct ReadingPosition {
    size_t index;
    int page;
    int top;
    int left;
};

// Context gathered on one side of a media document
std::vector<std::string> collect_context(const std::vector<ChunkDocument>& docs,
                                         const std::vector<size_t>& order, size_t from,
                                         bool backward, size_t budget,
                                         const Tokenizer& tokenizer) {
    std::vector<std::string> pieces;
    size_t remaining = budget;

    auto step = [&](size_t pos) {
        const ChunkDocument& neighbour = docs[order[pos]];
        if (!is_text_doc(neighbour)) return false;

        std::string text = neighbour.content_with_weight;
        if (text.empty()) return true;
        size_t tokens = tokenizer.count_tokens(text);
        if (tokens == 0) return true;

        if (tokens > remaining) {
            text = trim_to_tokens(text, remaining, tokenizer, backward);
            tokens = tokenizer.count_tokens(text);
        }
        pieces.push_back(text);
        remaining = tokens >= remaining ? 0 : remaining - tokens;
        return true;
    };

    if (backward) {
        for (size_t pos = from; pos-- > 0;) {
            if (remaining == 0 || !step(pos)) break;
        }
        std::reverse(pieces.begin(), pieces.end());
    } else {
        for (size_t pos = from + 1; pos < order.size(); ++pos) {
            if (remaining == 0 || !step(pos)) break;
        }
    }
    return pieces;
}

} // namespace

std::vector<std::string> split_sentences(const std::string& text) {
    std::vector<std::string> sentences;
    std::wstring buffer;
    for (wchar_t c : utf8_to_wide(text)) {
        buffer += c;
        if (is_sentence_end(c)) {
            sentences.push_back(wide_to_utf8(buffer));
            buffer.clear();
        }
    }
    if (!buffer.empty()) {
        sentences.push_back(wide_to_utf8(buffer));
    }
    return sentences;
}

std::string trim_to_tokens(const std::string& text, size_t token_budget,
                           const Tokenizer& tokenizer, bool from_tail) {
    if (token_budget == 0 || text.empty()) {
        return "";
    }
    std::vector<std::string> sentences = split_sentences(text);
    if (from_tail) {
        std::reverse(sentences.begin(), sentences.end());
    }

    std::vector<std::string> collected;
    size_t remaining = token_budget;
    for (const auto& sentence : sentences) {
        size_t tokens = tokenizer.count_tokens(sentence);
        if (tokens == 0) continue;
        collected.push_back(sentence);
        if (tokens > remaining) break;
        remaining -= tokens;
    }

    if (from_tail) {
        std::reverse(collected.begin(), collected.end());
    }
    std::string joined;
    for (const auto& sentence : collected) {
        joined += sentence;
    }
    return joined;
}

void attach_media_context(std::vector<ChunkDocument>& docs, const Tokenizer& tokenizer,
                          size_t table_context_size, size_t image_context_size) {
    if (docs.empty() || (table_context_size == 0 && image_context_size == 0)) {
        return;
    }

    std::vector<ReadingPosition> positioned;
    std::vector<size_t> unpositioned;
    for (size_t i = 0; i < docs.size(); ++i) {
        const ChunkDocument& doc = docs[i];
        if (doc.has_position()) {
            int left = doc.position_int.empty() ? 0 : doc.position_int.front()[1];
            positioned.push_back({i, doc.page_num_int.front(), doc.top_int.front(), left});
        } else {
            unpositioned.push_back(i);
        }
    }

    std::vector<size_t> order;
    if (!positioned.empty()) {
        std::sort(positioned.begin(), positioned.end(),
                  [](const ReadingPosition& a, const ReadingPosition& b) {
                      return std::tie(a.page, a.top, a.left, a.index) <
                             std::tie(b.page, b.top, b.left, b.index);
                  });
        for (const auto& p : positioned) order.push_back(p.index);
        order.insert(order.end(), unpositioned.begin(), unpositioned.end());
    } else {
        for (size_t i = 0; i < docs.size(); ++i) order.push_back(i);
    }

    for (size_t pos = 0; pos < order.size(); ++pos) {
        ChunkDocument& doc = docs[order[pos]];
        size_t budget = is_image_doc(doc) ? image_context_size
                      : is_table_doc(doc) ? table_context_size
                                          : 0;
        if (budget == 0) continue;

        std::vector<std::string> before = collect_context(docs, order, pos, true, budget, tokenizer);
        std::vector<std::string> after = collect_context(docs, order, pos, false, budget, tokenizer);
        if (before.empty() && after.empty()) continue;

        std::vector<std::string> pieces = before;
        if (!doc.content_with_weight.empty()) {
            pieces.push_back(doc.content_with_weight);
        }
        pieces.insert(pieces.end(), after.begin(), after.end());

        std::string combined;
        for (size_t i = 0; i < pieces.size(); ++i) {
            if (i) combined += "\n";
            combined += pieces[i];
        }

        if (combined != doc.content_with_weight) {
            doc.content_with_weight = combined;
            doc.content_ltks = tokenizer.tokenize(combined);
            doc.content_sm_ltks = tokenizer.fine_grained_tokenize(doc.content_ltks);
        }
    }

    if (!positioned.empty()) {
        std::vector<ChunkDocument> reordered;
        reordered.reserve(docs.size());
        for (size_t index : order) {
            reordered.push_back(std::move(docs[index]));
        }
        docs = std::move(reordered);
    }
}

} // namespace doc_chunker
