#include "doc_chunker/text_utils.h"
#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdint>
#include <map>

namespace doc_chunker {

namespace {

bool is_trim_space(wchar_t c) {
    return c == L' ' || c == L'\t' || c == L'\n' || c == L'\r' || c == L'\f' ||
           c == L'\v' || c == 0x00A0 || c == 0x3000;
}

bool is_english_char(wchar_t c) {
    if (c < 0x80 && std::isalnum(static_cast<unsigned char>(c))) return true;
    if (is_trim_space(c)) return true;
    static const std::wstring punct = L"`.,':;/\"?<>!()-";
    return punct.find(c) != std::wstring::npos;
}

int parse_decimal(const std::string& text) {
    std::string s = trim(text);
    if (s.empty()) return -1;
    size_t start = (s[0] == '+') ? 1 : 0;
    if (start == s.size()) return -1;
    long long value = 0;
    for (size_t i = start; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return -1;
        value = value * 10 + (s[i] - '0');
        if (value > INT_MAX) return -1;
    }
    return static_cast<int>(value);
}

int parse_english_words(const std::string& text) {
    static const std::map<std::string, int> small = {
        {"zero", 0}, {"one", 1}, {"two", 2}, {"three", 3}, {"four", 4},
        {"five", 5}, {"six", 6}, {"seven", 7}, {"eight", 8}, {"nine", 9},
        {"ten", 10}, {"eleven", 11}, {"twelve", 12}, {"thirteen", 13},
        {"fourteen", 14}, {"fifteen", 15}, {"sixteen", 16}, {"seventeen", 17},
        {"eighteen", 18}, {"nineteen", 19}, {"twenty", 20}, {"thirty", 30},
        {"forty", 40}, {"fifty", 50}, {"sixty", 60}, {"seventy", 70},
        {"eighty", 80}, {"ninety", 90}
    };

    std::string lowered;
    for (char c : text) {
        lowered += (c == '-') ? ' ' : static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    long long total = 0;
    long long current = 0;
    bool any = false;
    size_t pos = 0;
    while (pos < lowered.size()) {
        while (pos < lowered.size() && std::isspace(static_cast<unsigned char>(lowered[pos]))) ++pos;
        size_t end = pos;
        while (end < lowered.size() && !std::isspace(static_cast<unsigned char>(lowered[end]))) ++end;
        if (end == pos) break;
        std::string word = lowered.substr(pos, end - pos);
        pos = end;

        if (word == "and") continue;
        auto it = small.find(word);
        if (it != small.end()) {
            current += it->second;
        } else if (word == "hundred") {
            current = (current == 0 ? 1 : current) * 100;
        } else if (word == "thousand") {
            total += (current == 0 ? 1 : current) * 1000;
            current = 0;
        } else if (word == "million") {
            total += (current == 0 ? 1 : current) * 1000000;
            current = 0;
        } else {
            return -1;
        }
        any = true;
    }
    if (!any || total + current > INT_MAX) return -1;
    return static_cast<int>(total + current);
}

int parse_chinese_numeral(const std::wstring& text) {
    static const std::map<wchar_t, int> digits = {
        {L'零', 0}, {L'〇', 0}, {L'一', 1}, {L'二', 2}, {L'两', 2}, {L'三', 3},
        {L'四', 4}, {L'五', 5}, {L'六', 6}, {L'七', 7}, {L'八', 8}, {L'九', 9}
    };
    static const std::map<wchar_t, int> units = {
        {L'十', 10}, {L'百', 100}, {L'千', 1000}
    };

    if (text.empty()) return -1;
    long long total = 0;
    long long section = 0;
    long long number = 0;
    for (wchar_t c : text) {
        auto d = digits.find(c);
        if (d != digits.end()) {
            number = d->second;
            continue;
        }
        auto u = units.find(c);
        if (u != units.end()) {
            if (number == 0 && u->second == 10) number = 1;
            section += number * u->second;
            number = 0;
            continue;
        }
        if (c == L'万') {
            section += number;
            total += section * 10000;
            section = 0;
            number = 0;
            continue;
        }
        return -1;
    }
    long long value = total + section + number;
    return value > INT_MAX ? -1 : static_cast<int>(value);
}

int parse_roman(const std::string& text) {
    static const std::map<char, int> values = {
        {'I', 1}, {'V', 5}, {'X', 10}, {'L', 50}, {'C', 100}, {'D', 500}, {'M', 1000}
    };
    std::string s = trim(text);
    if (s.empty()) return -1;

    int result = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        auto it = values.find(static_cast<char>(std::toupper(static_cast<unsigned char>(s[i]))));
        if (it == values.end()) return -1;
        int next = 0;
        if (i + 1 < s.size()) {
            auto nx = values.find(static_cast<char>(std::toupper(static_cast<unsigned char>(s[i + 1]))));
            if (nx == values.end()) return -1;
            next = nx->second;
        }
        result += (it->second < next) ? -it->second : it->second;
    }
    return result > 0 ? result : -1;
}

} // namespace

std::wstring utf8_to_wide(const std::string& text) {
    std::wstring out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        uint32_t cp;
        size_t len;
        if (c < 0x80) {
            cp = c;
            len = 1;
        } else if ((c >> 5) == 0x6) {
            cp = c & 0x1F;
            len = 2;
        } else if ((c >> 4) == 0xE) {
            cp = c & 0x0F;
            len = 3;
        } else if ((c >> 3) == 0x1E) {
            cp = c & 0x07;
            len = 4;
        } else {
            out += static_cast<wchar_t>(0xFFFD);
            ++i;
            continue;
        }

        if (i + len > text.size()) {
            out += static_cast<wchar_t>(0xFFFD);
            ++i;
            continue;
        }
        bool valid = true;
        for (size_t k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(text[i + k]);
            if ((cc >> 6) != 0x2) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (!valid) {
            out += static_cast<wchar_t>(0xFFFD);
            ++i;
            continue;
        }
        out += static_cast<wchar_t>(cp);
        i += len;
    }
    return out;
}

std::string wide_to_utf8(const std::wstring& text) {
    std::string out;
    out.reserve(text.size());
    for (wchar_t wc : text) {
        uint32_t cp = static_cast<uint32_t>(wc);
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }
    return out;
}

std::wstring trim(const std::wstring& text) {
    size_t start = 0;
    size_t end = text.size();
    while (start < end && is_trim_space(text[start])) ++start;
    while (end > start && is_trim_space(text[end - 1])) --end;
    return text.substr(start, end - start);
}

std::string trim(const std::string& text) {
    return wide_to_utf8(trim(utf8_to_wide(text)));
}

size_t utf8_length(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

std::string utf8_substr(const std::string& text, size_t start, size_t count) {
    std::wstring wide = utf8_to_wide(text);
    if (start >= wide.size()) return "";
    return wide_to_utf8(wide.substr(start, count));
}

bool match_prefix(const std::wstring& text, const std::wregex& pattern) {
    return std::regex_search(text, pattern, std::regex_constants::match_continuous);
}

bool match_prefix(const std::wstring& text, const std::wregex& pattern,
                  std::wsmatch& match) {
    return std::regex_search(text, match, pattern, std::regex_constants::match_continuous);
}

std::vector<std::wstring> split_whitespace(const std::wstring& text) {
    std::vector<std::wstring> parts;
    std::wstring current;
    for (wchar_t c : text) {
        if (is_trim_space(c)) {
            if (!current.empty()) {
                parts.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) parts.push_back(current);
    return parts;
}

std::vector<std::string> split_by_pattern(const std::string& text, const std::wregex& pattern) {
    std::wstring wide = utf8_to_wide(text);
    std::vector<std::string> pieces;

    size_t last = 0;
    for (std::wsregex_iterator it(wide.begin(), wide.end(), pattern), end; it != end; ++it) {
        if (it->length(0) == 0) continue;
        size_t pos = static_cast<size_t>(it->position(0));
        pieces.push_back(wide_to_utf8(wide.substr(last, pos - last)));
        last = pos + static_cast<size_t>(it->length(0));
    }
    pieces.push_back(wide_to_utf8(wide.substr(last)));
    return pieces;
}

std::string regex_escape(const std::string& literal) {
    static const std::string special = "\\^$.|?*+()[]{}";
    std::string escaped;
    for (char c : literal) {
        if (special.find(c) != std::string::npos) escaped += '\\';
        escaped += c;
    }
    return escaped;
}

bool is_english(const std::vector<std::string>& texts) {
    size_t total = 0;
    size_t eng = 0;
    for (const auto& t : texts) {
        std::wstring stripped = trim(utf8_to_wide(t));
        if (stripped.empty()) continue;
        ++total;
        if (std::all_of(stripped.begin(), stripped.end(), is_english_char)) {
            ++eng;
        }
    }
    if (total == 0) return false;
    return static_cast<double>(eng) / total > 0.8;
}

bool is_chinese(const std::string& text) {
    std::wstring wide = utf8_to_wide(text);
    if (wide.empty()) return false;
    size_t chinese = 0;
    for (wchar_t c : wide) {
        if (c >= 0x4E00 && c <= 0x9FFF) ++chinese;
    }
    return static_cast<double>(chinese) / wide.size() > 0.2;
}

int index_int(const std::string& index_str) {
    int res = parse_decimal(index_str);
    if (res >= 0) return res;
    res = parse_english_words(index_str);
    if (res >= 0) return res;
    res = parse_chinese_numeral(trim(utf8_to_wide(index_str)));
    if (res >= 0) return res;
    return parse_roman(index_str);
}

} // namespace doc_chunker
