#include "doc_chunker/hierarchical_merger.h"
#include "doc_chunker/bullet_patterns.h"
#include "doc_chunker/text_utils.h"
#include <algorithm>
#include <cctype>
#include <string>

namespace doc_chunker {

namespace {

bool keep_fragment(const std::string& text) {
    if (text.empty()) return false;
    std::string visible = visible_text(text);
    if (utf8_length(visible) <= 1) return false;
    return !std::all_of(visible.begin(), visible.end(),
                        [](unsigned char c) { return std::isdigit(c); });
}

// Position in `bucket` of the largest index below `target`, or -1
int nearest_preceding(const std::vector<size_t>& bucket, size_t target) {
    auto it = std::lower_bound(bucket.begin(), bucket.end(), target);
    if (it == bucket.begin()) return -1;
    return static_cast<int>(std::distance(bucket.begin(), it)) - 1;
}

// Cuts each line at its first "@@<digit>" marker
std::string strip_trailing_tags(const std::string& text) {
    std::string out;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t at = text.find("@@", pos);
        while (at != std::string::npos &&
               !(at + 2 < text.size() && std::isdigit(static_cast<unsigned char>(text[at + 2])))) {
            at = text.find("@@", at + 1);
        }
        if (at == std::string::npos) {
            out.append(text, pos, std::string::npos);
            break;
        }
        out.append(text, pos, at - pos);
        pos = text.find_first_of("\r\n", at);
        if (pos == std::string::npos) {
            break;
        }
    }
    return out;
}

} // namespace

std::vector<std::vector<std::string>> hierarchical_merge(int style,
                                                         const std::vector<Section>& sections,
                                                         int depth,
                                                         const Tokenizer& tokenizer) {
    if (sections.empty() || style < 0) {
        return {};
    }

    std::vector<Section> kept;
    for (const auto& section : sections) {
        if (keep_fragment(section.text)) {
            kept.push_back(section);
        }
    }

    size_t bullets_size = PatternRegistry::instance().body_style(style).size();
    std::vector<std::vector<size_t>> levels(bullets_size + 2);
    for (size_t i = 0; i < kept.size(); ++i) {
        levels[assign_level(style, kept[i])].push_back(i);
    }
    std::reverse(levels.begin(), levels.end());

    std::vector<std::vector<size_t>> groups;
    std::vector<bool> read(kept.size(), false);
    size_t opening_buckets = std::min(levels.size(), static_cast<size_t>(std::max(depth, 0)));

    for (size_t i = 0; i < opening_buckets; ++i) {
        for (size_t j : levels[i]) {
            if (read[j]) continue;
            read[j] = true;
            groups.push_back({j});
            std::vector<size_t>& group = groups.back();
            if (i + 1 == levels.size() - 1) continue;

            for (size_t ii = i + 1; ii < levels.size(); ++ii) {
                int found = nearest_preceding(levels[ii], j);
                if (found < 0) continue;
                size_t index = levels[ii][found];
                if (read[index]) continue;
                if (index > group.back()) {
                    group.pop_back();
                }
                group.push_back(index);
            }
            for (size_t index : group) {
                read[index] = true;
            }
        }
    }

    groups.erase(std::remove_if(groups.begin(), groups.end(),
                                [](const std::vector<size_t>& g) { return g.empty(); }),
                 groups.end());
    if (groups.empty()) {
        return {};
    }

    std::vector<std::vector<std::string>> result(1);
    std::vector<size_t> counts{0};
    for (const auto& group : groups) {
        std::vector<std::string> texts;
        for (auto it = group.rbegin(); it != group.rend(); ++it) {
            texts.push_back(kept[*it].text);
        }

        if (texts.size() == 1) {
            size_t n = tokenizer.count_tokens(strip_trailing_tags(texts.front()));
            if (n + counts.back() < kSingletonTokenCeiling) {
                result.back().push_back(texts.front());
                counts.back() += n;
                continue;
            }
            result.push_back(std::move(texts));
            counts.push_back(n);
            continue;
        }
        result.push_back(std::move(texts));
        counts.push_back(kSingletonTokenCeiling);
    }

    result.erase(std::remove_if(result.begin(), result.end(),
                                [](const std::vector<std::string>& g) { return g.empty(); }),
                 result.end());
    return result;
}

} // namespace doc_chunker
