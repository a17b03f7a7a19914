#include "doc_chunker/preprocess.h"
#include "doc_chunker/text_utils.h"
#include <algorithm>
#include <regex>

namespace doc_chunker {

namespace {

constexpr size_t kContentsLookahead = 128;
constexpr size_t kMaxColonTitleLength = 32;

std::string stripped(const Section& section) {
    return trim(section.text);
}

bool is_contents_heading(const std::string& text) {
    static const std::wregex heading(L"(contents|目录|目次|tableofcontents|"
                                     L"致谢|acknowledge)$",
                                     std::regex::ECMAScript | std::regex::icase);

    std::string before_tag = text.substr(0, text.find("@@"));
    std::wstring compact;
    for (wchar_t c : utf8_to_wide(before_tag)) {
        if (c == L' ' || c == 0x00A0 || c == 0x3000) continue;
        compact += c;
    }
    return std::regex_match(compact, heading);
}

std::string entry_prefix(const std::string& text, bool english) {
    if (!english) {
        return utf8_substr(text, 0, 3);
    }
    std::vector<std::wstring> words = split_whitespace(utf8_to_wide(text));
    std::wstring prefix;
    for (size_t i = 0; i < std::min<size_t>(2, words.size()); ++i) {
        if (i) prefix += L' ';
        prefix += words[i];
    }
    return wide_to_utf8(prefix);
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

void remove_contents_table(std::vector<Section>& sections, bool english) {
    size_t i = 0;
    while (i < sections.size()) {
        if (!is_contents_heading(stripped(sections[i]))) {
            ++i;
            continue;
        }
        sections.erase(sections.begin() + i);
        if (i >= sections.size()) break;

        std::string prefix = entry_prefix(stripped(sections[i]), english);
        while (prefix.empty()) {
            sections.erase(sections.begin() + i);
            if (i >= sections.size()) break;
            prefix = entry_prefix(stripped(sections[i]), english);
        }
        if (i >= sections.size()) break;
        sections.erase(sections.begin() + i);
        if (i >= sections.size()) break;

        size_t limit = std::min(i + kContentsLookahead, sections.size());
        for (size_t j = i; j < limit; ++j) {
            if (!starts_with(stripped(sections[j]), prefix)) continue;
            sections.erase(sections.begin() + i, sections.begin() + j);
            break;
        }
    }
}

void make_colon_as_title(std::vector<Section>& sections) {
    static const std::wstring terminators = L"。？！!?;；";

    for (size_t i = 0; i < sections.size(); ++i) {
        if (sections[i].kind == Section::Kind::Plain) continue;

        std::wstring text = trim(utf8_to_wide(sections[i].text.substr(0, sections[i].text.find('@'))));
        if (text.empty() || (text.back() != L':' && text.back() != 0xFF1A)) continue;

        size_t clause_start = std::wstring::npos;
        for (size_t k = text.size(); k-- > 0;) {
            if (terminators.find(text[k]) != std::wstring::npos) {
                clause_start = k + 1;
                break;
            }
            if (text[k] == L'.' && k + 1 < text.size() && text[k + 1] == L' ') {
                clause_start = k + 2;
                break;
            }
        }
        if (clause_start == std::wstring::npos) continue;

        std::wstring clause = trim(text.substr(clause_start));
        if (clause.empty() || clause.size() >= kMaxColonTitleLength) continue;

        sections.insert(sections.begin() + i, Section::with_layout(wide_to_utf8(clause), "title"));
        ++i;
    }
}

} // namespace doc_chunker
