#pragma once

#include <string>
#include <vector>
#include <regex>

namespace doc_chunker {

// UTF-8 <-> wide conversion. Patterns containing CJK characters are matched
// on wide strings so that bracket expressions work per code point.
// Invalid byte sequences decode to U+FFFD.
std::wstring utf8_to_wide(const std::string& text);
std::string wide_to_utf8(const std::wstring& text);

// Strips ASCII whitespace, U+00A0 and U+3000 from both ends
std::string trim(const std::string& text);
std::wstring trim(const std::wstring& text);

// Number of code points
size_t utf8_length(const std::string& text);

// Substring by code point offset
std::string utf8_substr(const std::string& text, size_t start,
                        size_t count = std::string::npos);

// Anchored-at-start match (no end anchor), the way heading rules are applied
bool match_prefix(const std::wstring& text, const std::wregex& pattern);
bool match_prefix(const std::wstring& text, const std::wregex& pattern,
                  std::wsmatch& match);

// Splits on runs of whitespace, like a bare str.split()
std::vector<std::wstring> split_whitespace(const std::wstring& text);

// Pieces of `text` between the matches of `pattern`, empty pieces included
std::vector<std::string> split_by_pattern(const std::string& text, const std::wregex& pattern);

// Backslash-escapes regex metacharacters so the literal matches itself
std::string regex_escape(const std::string& literal);

// More than 80% of the non-blank entries are made of ASCII letters, digits,
// whitespace and common punctuation only
bool is_english(const std::vector<std::string>& texts);

// More than 20% of the code points are CJK unified ideographs
bool is_chinese(const std::string& text);

/**
 * Parses a bullet index: decimal digits, English number words
 * ("twenty one"), Chinese numerals ("十二", "一百零五") or Roman numerals
 * ("XIV"). Returns -1 when nothing applies.
 */
int index_int(const std::string& index_str);

} // namespace doc_chunker
