#pragma once

#include <doc_chunker/section.h>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace doc_chunker {

// An ordered list of heading rules; the rule's position is its level
struct BulletStyle {
    std::string name;
    std::vector<std::string> sources;   // UTF-8 pattern text
    std::vector<std::wregex> rules;     // compiled, matched anchored at start

    size_t size() const { return rules.size(); }
};

/**
 * Read-only catalog of numbering styles, built once on first use.
 *
 * Body styles, in declaration order (the order is the tie-break):
 *   0  Chinese legal/administrative  第X编 / 第X章 / 第X节 / 第X条 / (X)
 *   1  numeric outline               第N章 / 第N节 / N. / N.N / N.N.N / N.N.N.N
 *   2  Chinese mixed                 第X章 / 第X节 / X、 / (X) / (N)
 *   3  English keywords              PART ONE / Chapter IV / Section 3 / Article 7
 *   4  Markdown headings             # .. ######
 *
 * The question style drives FAQ-like documents and is scored separately.
 */
class PatternRegistry {
public:
    static const PatternRegistry& instance();

    const std::vector<BulletStyle>& body_styles() const { return body_styles_; }
    const BulletStyle& body_style(int index) const { return body_styles_.at(index); }
    const BulletStyle& question_style() const { return question_style_; }

    // Lines that look numbered but are not headings: a leading "0",
    // "3 个"-style counters, dot leaders
    bool not_bullet(const std::wstring& line) const;

    PatternRegistry(const PatternRegistry&) = delete;
    PatternRegistry& operator=(const PatternRegistry&) = delete;

private:
    PatternRegistry();

    std::vector<BulletStyle> body_styles_;
    BulletStyle question_style_;
    std::vector<std::wregex> not_bullet_rules_;
};

bool not_bullet(const std::string& line);

// True when a layout-tagged line is unlikely to be a real heading: more than
// 12 words, 32+ characters without a space, or sentence punctuation.
// "第X条" lines are always accepted.
bool not_title(const std::string& text);

/**
 * Picks the body style that matches the most sample lines (each line is
 * trimmed and must pass not_bullet). Returns -1 when nothing matches.
 * Ties go to the style declared first.
 */
int bullets_category(const std::vector<std::string>& texts);

// Same scoring over the question catalog, where a pattern scores at most
// one hit. Returns the winning index and its pattern text, or {-1, ""}.
std::pair<int, std::string> qbullets_category(const std::vector<std::string>& texts);

/**
 * Level of one fragment under `style`:
 *   0 .. n-1  index of the first matching rule
 *   n         layout says title/heading and not_title() is false
 *   n + 1     plain body
 * where n is the number of rules in the style.
 */
int assign_level(int style, const Section& section);

// Levels of every section plus the most frequent heading level
// (n + 1 when no heading level occurs). A negative style yields -1 for all.
std::pair<int, std::vector<int>> title_frequency(int style, const std::vector<Section>& sections);

// A layout box as seen by the question detector
struct QaBox {
    std::string text;
    std::optional<double> x0;
    std::optional<double> top;
    std::string layout_type;
};

struct QBulletResult {
    bool is_question = false;
    std::optional<int> index;  // index to carry into the next call
};

/**
 * Decides whether `box` opens a new question under `pattern` (one entry of
 * the question catalog). Indentation against the previous box and against
 * the average bullet x0, a trailing colon on the previous box and the
 * numbering order are all taken into account. Accepted bullets record
 * their x0 in `bullet_x0s`; `last_box` gets missing coordinates filled in
 * from `box`.
 */
QBulletResult has_qbullet(const std::string& pattern, const QaBox& box, QaBox& last_box,
                          std::optional<int> last_index, bool last_bullet,
                          std::vector<double>& bullet_x0s);

} // namespace doc_chunker
