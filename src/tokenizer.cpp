#include "doc_chunker/tokenizer.h"
#include "doc_chunker/text_utils.h"
#include <cctype>

namespace doc_chunker {

namespace {

bool is_ascii_alnum(wchar_t c) {
    return c < 0x80 && std::isalnum(static_cast<unsigned char>(c));
}

bool is_space(wchar_t c) {
    return c == L' ' || c == L'\t' || c == L'\n' || c == L'\r' || c == L'\f' ||
           c == L'\v' || c == 0x00A0 || c == 0x3000;
}

} // namespace

std::vector<std::string> WordTokenizer::split(const std::string& text) const {
    std::wstring wide = utf8_to_wide(text);
    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < wide.size()) {
        wchar_t c = wide[i];
        if (is_space(c)) {
            ++i;
            continue;
        }
        if (is_ascii_alnum(c)) {
            size_t end = i;
            while (end < wide.size() && is_ascii_alnum(wide[end])) ++end;
            tokens.push_back(wide_to_utf8(wide.substr(i, end - i)));
            i = end;
            continue;
        }
        tokens.push_back(wide_to_utf8(std::wstring(1, c)));
        ++i;
    }
    return tokens;
}

size_t WordTokenizer::count_tokens(const std::string& text) const {
    return split(text).size();
}

std::string WordTokenizer::tokenize(const std::string& text) const {
    std::string result;
    for (const auto& token : split(text)) {
        if (!result.empty()) result += " ";
        for (char c : token) {
            result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return result;
}

std::string WordTokenizer::fine_grained_tokenize(const std::string& coarse_tokens) const {
    std::string result;
    auto emit = [&result](const std::string& piece) {
        if (piece.empty()) return;
        if (!result.empty()) result += " ";
        result += piece;
    };

    for (const auto& token : split(coarse_tokens)) {
        std::string piece;
        int last_kind = -1;  // 0 letter, 1 digit, 2 other
        for (char c : token) {
            unsigned char uc = static_cast<unsigned char>(c);
            int kind = std::isalpha(uc) ? 0 : (std::isdigit(uc) ? 1 : 2);
            if (last_kind != -1 && kind != last_kind && kind != 2 && last_kind != 2) {
                emit(piece);
                piece.clear();
            }
            piece += c;
            last_kind = kind;
        }
        emit(piece);
    }
    return result;
}

} // namespace doc_chunker
