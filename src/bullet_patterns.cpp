#include "doc_chunker/bullet_patterns.h"
#include "doc_chunker/text_utils.h"
#include <algorithm>
#include <cctype>
#include <numeric>

namespace doc_chunker {

namespace {

const char* const kCnNum = "[零一二三四五六七八九十百]";
const char* const kCnNumOrDigit = "[零一二三四五六七八九十百0-9]";

std::wregex compile(const std::string& source) {
    return std::wregex(utf8_to_wide(source), std::regex::ECMAScript);
}

BulletStyle make_style(const std::string& name, const std::vector<std::string>& sources) {
    BulletStyle style;
    style.name = name;
    style.sources = sources;
    for (const auto& source : sources) {
        style.rules.push_back(compile(source));
    }
    return style;
}

std::wstring normalize(const std::string& text) {
    std::wstring wide = utf8_to_wide(text);
    std::replace(wide.begin(), wide.end(), static_cast<wchar_t>(0x3000), L' ');
    return trim(wide);
}

bool is_heading_layout(const std::string& layout) {
    return layout.find("title") != std::string::npos || layout.find("head") != std::string::npos;
}

} // namespace

PatternRegistry::PatternRegistry() {
    const std::string cn = kCnNum;
    const std::string cn_digit = kCnNumOrDigit;

    body_styles_.push_back(make_style("chinese_legal", {
        "第" + cn_digit + "+(分?编|部分)",
        "第" + cn_digit + "+章",
        "第" + cn_digit + "+节",
        "第" + cn_digit + "+条",
        "[(（]" + cn + "+[)）]",
    }));
    body_styles_.push_back(make_style("numeric_outline", {
        "第[0-9]+章",
        "第[0-9]+节",
        "[0-9]{0,2}[. 、]",
        "[0-9]{0,2}\\.[0-9]{0,2}[^a-zA-Z/%~-]",
        "[0-9]{0,2}\\.[0-9]{0,2}\\.[0-9]{0,2}",
        "[0-9]{0,2}\\.[0-9]{0,2}\\.[0-9]{0,2}\\.[0-9]{0,2}",
    }));
    body_styles_.push_back(make_style("chinese_mixed", {
        "第" + cn_digit + "+章",
        "第" + cn_digit + "+节",
        cn + "+[ 、]",
        "[(（]" + cn + "+[)）]",
        "[(（][0-9]{0,2}[)）]",
    }));
    body_styles_.push_back(make_style("english_keywords", {
        "PART (ONE|TWO|THREE|FOUR|FIVE|SIX|SEVEN|EIGHT|NINE|TEN)",
        "Chapter (I+V?|VI*|XI|IX|X)",
        "Section [0-9]+",
        "Article [0-9]+",
    }));
    body_styles_.push_back(make_style("markdown", {
        "^#[^#]",
        "^##[^#]",
        "^###",
        "^####",
        "^#####",
        "^######",
    }));

    question_style_ = make_style("question", {
        "第(" + cn_digit + "+)问",
        "第(" + cn_digit + "+)条",
        "[(（](" + cn + "+)[)）]",
        "第([0-9]+)问",
        "第([0-9]+)条",
        "([0-9]{1,2})[. 、]",
        "(" + cn + "+)[ 、]",
        "[(（]([0-9]{1,2})[)）]",
        "QUESTION (ONE|TWO|THREE|FOUR|FIVE|SIX|SEVEN|EIGHT|NINE|TEN)",
        "QUESTION (I+V?|VI*|XI|IX|X)",
        "QUESTION ([0-9]+)",
    });

    for (const char* source : {"0", "[0-9]+ +[0-9~个只-]", "[0-9]+\\.{2,}"}) {
        not_bullet_rules_.push_back(compile(source));
    }
}

const PatternRegistry& PatternRegistry::instance() {
    static const PatternRegistry registry;
    return registry;
}

bool PatternRegistry::not_bullet(const std::wstring& line) const {
    return std::any_of(not_bullet_rules_.begin(), not_bullet_rules_.end(),
                       [&line](const std::wregex& rule) { return match_prefix(line, rule); });
}

bool not_bullet(const std::string& line) {
    return PatternRegistry::instance().not_bullet(utf8_to_wide(line));
}

bool not_title(const std::string& text) {
    static const std::wregex article = compile(std::string("第") + kCnNumOrDigit + "+条");
    static const std::wregex punctuation = compile("[,;，。；！!]");

    std::wstring wide = utf8_to_wide(text);
    if (match_prefix(wide, article)) {
        return false;
    }
    if (split_whitespace(wide).size() > 12 ||
        (wide.find(L' ') == std::wstring::npos && wide.size() >= 32)) {
        return true;
    }
    return std::regex_search(wide, punctuation);
}

int bullets_category(const std::vector<std::string>& texts) {
    const auto& registry = PatternRegistry::instance();
    const auto& styles = registry.body_styles();

    std::vector<std::wstring> lines;
    lines.reserve(texts.size());
    for (const auto& text : texts) {
        lines.push_back(trim(utf8_to_wide(text)));
    }

    std::vector<int> hits(styles.size(), 0);
    for (size_t i = 0; i < styles.size(); ++i) {
        for (const auto& line : lines) {
            for (const auto& rule : styles[i].rules) {
                if (match_prefix(line, rule) && !registry.not_bullet(line)) {
                    hits[i]++;
                    break;
                }
            }
        }
    }

    int maximum = 0;
    int res = -1;
    for (size_t i = 0; i < hits.size(); ++i) {
        if (hits[i] <= maximum) continue;
        res = static_cast<int>(i);
        maximum = hits[i];
    }
    return res;
}

std::pair<int, std::string> qbullets_category(const std::vector<std::string>& texts) {
    const auto& registry = PatternRegistry::instance();
    const auto& style = registry.question_style();

    std::vector<int> hits(style.size(), 0);
    for (size_t i = 0; i < style.size(); ++i) {
        for (const auto& text : texts) {
            std::wstring line = utf8_to_wide(text);
            if (match_prefix(line, style.rules[i]) && !registry.not_bullet(line)) {
                hits[i]++;
                break;
            }
        }
    }

    int maximum = 0;
    int res = -1;
    for (size_t i = 0; i < hits.size(); ++i) {
        if (hits[i] <= maximum) continue;
        res = static_cast<int>(i);
        maximum = hits[i];
    }
    if (res < 0) {
        return {-1, ""};
    }
    return {res, style.sources[res]};
}

int assign_level(int style, const Section& section) {
    const auto& registry = PatternRegistry::instance();
    const auto& bullets = registry.body_style(style);
    int size = static_cast<int>(bullets.size());

    std::wstring text = normalize(section.text);
    for (int i = 0; i < size; ++i) {
        if (match_prefix(text, bullets.rules[i]) && !registry.not_bullet(text)) {
            return i;
        }
    }

    if (is_heading_layout(section.layout) && !not_title(visible_text(section.text))) {
        return size;
    }
    return size + 1;
}

std::pair<int, std::vector<int>> title_frequency(int style, const std::vector<Section>& sections) {
    if (style < 0) {
        return {-1, std::vector<int>(sections.size(), -1)};
    }

    int bullets_size = static_cast<int>(PatternRegistry::instance().body_style(style).size());
    std::vector<int> levels(sections.size(), bullets_size + 1);
    if (sections.empty()) {
        return {bullets_size + 1, levels};
    }

    // level -> count, remembering first appearance for stable ties
    std::vector<std::pair<int, int>> counts;
    for (size_t i = 0; i < sections.size(); ++i) {
        levels[i] = assign_level(style, sections[i]);
        auto it = std::find_if(counts.begin(), counts.end(),
                               [&](const std::pair<int, int>& c) { return c.first == levels[i]; });
        if (it == counts.end()) {
            counts.emplace_back(levels[i], 1);
        } else {
            it->second++;
        }
    }
    std::stable_sort(counts.begin(), counts.end(),
                     [](const std::pair<int, int>& a, const std::pair<int, int>& b) {
                         return a.second > b.second;
                     });

    int most_level = bullets_size + 1;
    for (const auto& [level, count] : counts) {
        if (level <= bullets_size) {
            most_level = level;
            break;
        }
    }
    return {most_level, levels};
}

QBulletResult has_qbullet(const std::string& pattern, const QaBox& box, QaBox& last_box,
                          std::optional<int> last_index, bool last_bullet,
                          std::vector<double>& bullet_x0s) {
    static const std::wregex ask = compile("(what|when|where|how|why|which|who|whose|为什么|为啥|哪)");

    QBulletResult rejected{false, last_index};

    std::wstring section = utf8_to_wide(box.text);
    std::wregex rule = compile(pattern);
    std::wsmatch bullet;
    if (!match_prefix(section, rule, bullet)) {
        return rejected;
    }

    if (!last_box.x0) last_box.x0 = box.x0;
    if (!last_box.top) last_box.top = box.top;
    double x0 = box.x0.value_or(0);
    double top = box.top.value_or(0);
    double last_x0 = last_box.x0.value_or(0);
    double last_top = last_box.top.value_or(0);

    if (last_bullet && x0 - last_x0 > 10) {
        return rejected;
    }
    if (!last_bullet && x0 >= last_x0 && top - last_top < 20) {
        return rejected;
    }

    double avg_bullet_x0 = bullet_x0s.empty()
        ? x0
        : std::accumulate(bullet_x0s.begin(), bullet_x0s.end(), 0.0) / bullet_x0s.size();
    if (x0 - avg_bullet_x0 > 10) {
        return rejected;
    }

    int index = -1;
    if (bullet.size() > 1 && bullet[1].matched) {
        index = index_int(wide_to_utf8(bullet[1].str()));
    }

    std::wstring last_section = utf8_to_wide(last_box.text);
    if (!last_section.empty() && (last_section.back() == L':' || last_section.back() == L'：')) {
        return rejected;
    }

    auto accept = [&]() {
        bullet_x0s.push_back(x0);
        return QBulletResult{true, index};
    };

    if (!last_index || *last_index == 0 || index >= *last_index) {
        return accept();
    }
    if (!section.empty() && (section.back() == L'?' || section.back() == L'？')) {
        return accept();
    }
    if (box.layout_type == "title") {
        return accept();
    }

    std::wstring pure = section.substr(bullet.length(0));
    for (auto& c : pure) {
        if (c < 0x80) c = static_cast<wchar_t>(std::tolower(static_cast<int>(c)));
    }
    if (match_prefix(pure, ask)) {
        return accept();
    }
    return rejected;
}

} // namespace doc_chunker
