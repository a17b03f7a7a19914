#include "doc_chunker/tree_merger.h"
#include "doc_chunker/bullet_patterns.h"
#include "doc_chunker/text_utils.h"
#include <algorithm>
#include <cctype>
#include <set>
#include <utility>

namespace doc_chunker {

namespace {

std::string join_lines(const std::vector<std::string>& lines) {
    std::string joined;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i) joined += "\n";
        joined += lines[i];
    }
    return joined;
}

bool is_digits(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isdigit(c);
    });
}

std::string normalize_fragment(const std::string& text) {
    std::wstring wide = utf8_to_wide(text);
    std::replace(wide.begin(), wide.end(), static_cast<wchar_t>(0x3000), L' ');
    return wide_to_utf8(trim(wide));
}

} // namespace

SectionTree::SectionTree(int depth_limit) : depth_limit_(depth_limit) {
    nodes_.push_back(Node{});
}

size_t SectionTree::add_node(int level, int parent, std::string text) {
    Node node;
    node.level = level;
    node.parent = parent;
    node.texts.push_back(std::move(text));
    nodes_.push_back(std::move(node));
    size_t index = nodes_.size() - 1;
    nodes_[parent].children.push_back(index);
    return index;
}

void SectionTree::build(const std::vector<LeveledFragment>& lines) {
    std::vector<size_t> stack{0};

    for (const auto& [level, text] : lines) {
        if (depth_limit_ != -1 && level > depth_limit_) {
            nodes_[stack.back()].texts.push_back(text);
            continue;
        }

        // Climb to the nearest node strictly shallower than this one
        while (stack.size() > 1 && level <= nodes_[stack.back()].level) {
            stack.pop_back();
        }

        size_t index = add_node(level, static_cast<int>(stack.back()), text);
        stack.push_back(index);
    }
}

std::vector<std::string> SectionTree::flatten() const {
    std::vector<std::string> chunks;

    struct Frame {
        size_t index;
        std::vector<std::string> titles;
    };
    std::vector<Frame> work{{0, {}}};

    while (!work.empty()) {
        Frame frame = std::move(work.back());
        work.pop_back();

        const Node& node = nodes_[frame.index];
        bool within_depth = node.level >= 1 && node.level <= depth_limit_;

        if (node.level == 0 && !node.texts.empty()) {
            std::vector<std::string> lines = frame.titles;
            lines.insert(lines.end(), node.texts.begin(), node.texts.end());
            chunks.push_back(join_lines(lines));
        }

        std::vector<std::string> path_titles = frame.titles;
        if (within_depth) {
            path_titles.insert(path_titles.end(), node.texts.begin(), node.texts.end());
        }

        if (node.level > depth_limit_ && !node.texts.empty()) {
            std::vector<std::string> lines = path_titles;
            lines.insert(lines.end(), node.texts.begin(), node.texts.end());
            chunks.push_back(join_lines(lines));
        } else if (node.children.empty() && within_depth) {
            chunks.push_back(join_lines(path_titles));
        }

        for (auto it = node.children.rbegin(); it != node.children.rend(); ++it) {
            work.push_back(Frame{*it, path_titles});
        }
    }

    chunks.erase(std::remove_if(chunks.begin(), chunks.end(),
                                [](const std::string& c) { return c.empty(); }),
                 chunks.end());
    return chunks;
}

std::vector<std::string> tree_merge(int style, const std::vector<Section>& sections, int depth) {
    std::vector<std::string> passthrough;
    if (sections.empty() || style < 0) {
        for (const auto& section : sections) {
            passthrough.push_back(section.text);
        }
        return passthrough;
    }

    int bullets_size = static_cast<int>(PatternRegistry::instance().body_style(style).size());
    int body_level = bullets_size + 2;

    std::vector<LeveledFragment> lines;
    std::set<int> level_set;
    for (const auto& section : sections) {
        std::string visible = visible_text(section.text);
        if (section.text.empty() || utf8_length(visible) <= 1 || is_digits(visible)) {
            continue;
        }

        int level = assign_level(style, section) + 1;
        std::string text = normalize_fragment(section.text);
        if (text.find_first_not_of('\n') == std::string::npos) {
            continue;
        }
        lines.push_back({level, text});
        level_set.insert(level);
    }

    if (lines.empty()) {
        return {};
    }

    std::vector<int> sorted_levels(level_set.begin(), level_set.end());
    size_t wanted = static_cast<size_t>(std::max(depth, 1));
    int target_level = wanted <= sorted_levels.size() ? sorted_levels[wanted - 1]
                                                      : sorted_levels.back();
    if (target_level == body_level) {
        target_level = sorted_levels.size() > 1 ? sorted_levels[sorted_levels.size() - 2]
                                                : sorted_levels.front();
    }

    SectionTree tree(target_level);
    tree.build(lines);
    return tree.flatten();
}

} // namespace doc_chunker
