#include "doc_chunker/naive_merger.h"
#include "doc_chunker/text_utils.h"
#include <algorithm>
#include <regex>
#include <set>

namespace doc_chunker {

namespace {

const std::regex& backtick_literal() {
    static const std::regex pattern("`([^`]+)`");
    return pattern;
}

bool longer_first(const std::string& a, const std::string& b) {
    return utf8_length(a) > utf8_length(b);
}

std::wregex custom_pattern(const std::vector<std::string>& literals) {
    std::string alternation;
    for (const auto& literal : literals) {
        if (!alternation.empty()) alternation += "|";
        alternation += regex_escape(literal);
    }
    return std::wregex(utf8_to_wide(alternation), std::regex::ECMAScript);
}

void fill_positions(ChunkSet& chunks) {
    for (auto& chunk : chunks) {
        chunk.position_tags = extract_positions(chunk.text);
    }
}

// Running state shared by the budgeted merges
class ChunkAccumulator {
public:
    ChunkAccumulator(const Tokenizer& tokenizer, const MergeOptions& options)
        : tokenizer_(tokenizer),
          overlap_(std::clamp(options.overlapped_percent, 0, 99)),
          threshold_(static_cast<double>(options.chunk_token_num) * (100 - overlap_) / 100.0) {}

    void add(std::string text, const Image& image, std::string pos) {
        size_t tnum = tokenizer_.count_tokens(text);
        if (tnum < kMinTaggedTokens) {
            pos.clear();
        }

        if (chunks_.empty() || chunks_.back().text.empty() ||
            chunks_.back().token_count > threshold_) {
            if (!chunks_.empty()) {
                text = overlap_tail(chunks_.back().text) + text;
            }
            if (text.find(pos) == std::string::npos) {
                text += pos;
            }
            Chunk chunk;
            chunk.text = std::move(text);
            chunk.token_count = tnum;
            chunk.image = image;
            chunks_.push_back(std::move(chunk));
            return;
        }

        Chunk& last = chunks_.back();
        if (last.text.find(pos) == std::string::npos) {
            text += pos;
        }
        last.text += text;
        last.image = concat_img(last.image, image);
        last.token_count += tnum;
    }

    ChunkSet finish() {
        fill_positions(chunks_);
        return std::move(chunks_);
    }

private:
    std::string overlap_tail(const std::string& previous) const {
        if (overlap_ == 0) {
            return "";
        }
        std::string untagged = remove_tag(previous);
        size_t length = utf8_length(untagged);
        size_t start = static_cast<size_t>(length * (100 - overlap_) / 100.0);
        return utf8_substr(untagged, start);
    }

    const Tokenizer& tokenizer_;
    int overlap_;
    double threshold_;
    ChunkSet chunks_;
};

ChunkSet split_on_custom(const std::vector<Section>& sections,
                         const std::vector<Image>& images,
                         const std::vector<std::string>& literals,
                         const Tokenizer& tokenizer) {
    std::wregex pattern = custom_pattern(literals);

    ChunkSet chunks;
    for (size_t i = 0; i < sections.size(); ++i) {
        std::string pos = sections[i].position_string();
        for (const auto& piece : split_by_pattern(sections[i].text, pattern)) {
            Chunk chunk;
            chunk.text = "\n" + piece;
            if (tokenizer.count_tokens(chunk.text) >= kMinTaggedTokens && !pos.empty() &&
                chunk.text.find(pos) == std::string::npos) {
                chunk.text += pos;
            }
            chunk.token_count = tokenizer.count_tokens(chunk.text);
            if (i < images.size()) {
                chunk.image = images[i];
            }
            chunks.push_back(std::move(chunk));
        }
    }
    fill_positions(chunks);
    return chunks;
}

} // namespace

std::vector<std::string> custom_delimiters(const std::string& delimiter) {
    std::set<std::string> unique;
    for (std::sregex_iterator it(delimiter.begin(), delimiter.end(), backtick_literal()), end;
         it != end; ++it) {
        unique.insert((*it)[1].str());
    }
    std::vector<std::string> literals(unique.begin(), unique.end());
    std::stable_sort(literals.begin(), literals.end(), longer_first);
    return literals;
}

std::string get_delimiters(const std::string& delimiter) {
    std::vector<std::string> delimiters;
    auto add_characters = [&delimiters](const std::string& text) {
        for (wchar_t c : utf8_to_wide(text)) {
            delimiters.push_back(wide_to_utf8(std::wstring(1, c)));
        }
    };

    size_t start = 0;
    for (std::sregex_iterator it(delimiter.begin(), delimiter.end(), backtick_literal()), end;
         it != end; ++it) {
        size_t from = static_cast<size_t>(it->position(0));
        delimiters.push_back((*it)[1].str());
        add_characters(delimiter.substr(start, from - start));
        start = from + static_cast<size_t>(it->length(0));
    }
    if (start < delimiter.size()) {
        add_characters(delimiter.substr(start));
    }

    std::stable_sort(delimiters.begin(), delimiters.end(), longer_first);

    std::string pattern;
    for (const auto& d : delimiters) {
        if (d.empty()) continue;
        if (!pattern.empty()) pattern += "|";
        pattern += regex_escape(d);
    }
    return pattern;
}

ChunkSet naive_merge(const std::vector<Section>& sections, const Tokenizer& tokenizer,
                     const MergeOptions& options) {
    if (sections.empty()) {
        return {};
    }

    std::vector<std::string> literals = custom_delimiters(options.delimiter);
    if (!literals.empty()) {
        return split_on_custom(sections, {}, literals, tokenizer);
    }

    ChunkAccumulator accumulator(tokenizer, options);
    for (const auto& section : sections) {
        accumulator.add("\n" + section.text, Image(), section.position_string());
    }
    return accumulator.finish();
}

ChunkSet naive_merge_with_images(const std::vector<Section>& sections,
                                 const std::vector<Image>& images,
                                 const Tokenizer& tokenizer,
                                 const MergeOptions& options) {
    if (sections.empty() || sections.size() != images.size()) {
        return {};
    }

    std::vector<std::string> literals = custom_delimiters(options.delimiter);
    if (!literals.empty()) {
        return split_on_custom(sections, images, literals, tokenizer);
    }

    ChunkAccumulator accumulator(tokenizer, options);
    for (size_t i = 0; i < sections.size(); ++i) {
        accumulator.add("\n" + sections[i].text, images[i], sections[i].position_string());
    }
    return accumulator.finish();
}

ChunkSet naive_merge_docx(const std::vector<std::pair<std::string, Image>>& sections,
                          const Tokenizer& tokenizer,
                          const MergeOptions& options) {
    if (sections.empty()) {
        return {};
    }

    ChunkSet chunks;
    std::vector<std::string> literals = custom_delimiters(options.delimiter);
    if (!literals.empty()) {
        std::wregex pattern = custom_pattern(literals);
        for (const auto& [text, image] : sections) {
            for (const auto& piece : split_by_pattern(text, pattern)) {
                if (piece.empty()) continue;
                Chunk chunk;
                chunk.text = "\n" + piece;
                chunk.token_count = tokenizer.count_tokens(chunk.text);
                chunk.image = image;
                chunks.push_back(std::move(chunk));
            }
        }
        return chunks;
    }

    for (const auto& [text, image] : sections) {
        std::string piece = "\n" + text;
        size_t tnum = tokenizer.count_tokens(piece);
        if (chunks.empty() || chunks.back().token_count > options.chunk_token_num) {
            Chunk chunk;
            chunk.text = std::move(piece);
            chunk.token_count = tnum;
            chunk.image = image;
            chunks.push_back(std::move(chunk));
            continue;
        }
        Chunk& last = chunks.back();
        last.text += piece;
        last.image = concat_img(last.image, image);
        last.token_count += tnum;
    }
    return chunks;
}

} // namespace doc_chunker
