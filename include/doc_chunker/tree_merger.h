#pragma once

#include <doc_chunker/section.h>
#include <string>
#include <vector>

namespace doc_chunker {

struct LeveledFragment {
    int level;
    std::string text;
};

/**
 * Heading hierarchy stored as an arena of nodes addressed by index. Node 0
 * is the synthetic document root at level 0; each node keeps its parent
 * index and its children in document order.
 *
 * Fragments deeper than the depth limit never create nodes: their text is
 * folded into the node currently on top of the construction stack.
 */
class SectionTree {
public:
    struct Node {
        int level = 0;
        int parent = -1;
        std::vector<std::string> texts;
        std::vector<size_t> children;
    };

    explicit SectionTree(int depth_limit);

    void build(const std::vector<LeveledFragment>& lines);

    // One string per qualifying node, depth-first pre-order:
    //  - the root with texts: its texts
    //  - a node past the depth limit with texts: title path + texts
    //  - a childless node within depth: its title path (header-only section)
    // Lines are joined with '\n'; empty results are dropped.
    std::vector<std::string> flatten() const;

    int depth_limit() const { return depth_limit_; }
    size_t size() const { return nodes_.size(); }
    const Node& node(size_t index) const { return nodes_.at(index); }
    const Node& root() const { return nodes_.front(); }

private:
    size_t add_node(int level, int parent, std::string text);

    int depth_limit_;
    std::vector<Node> nodes_;
};

/**
 * Groups sections under their headings.
 *
 * Sections whose visible text is empty, a single character or purely
 * numeric are dropped. Levels come from assign_level() shifted by one so
 * that the root keeps level 0. `depth` picks the grouping level among the
 * distinct levels present (clamped to the deepest); plain body text is
 * never the grouping level unless it is the only level.
 *
 * With style < 0 the section texts are returned unchanged.
 */
std::vector<std::string> tree_merge(int style, const std::vector<Section>& sections, int depth);

} // namespace doc_chunker
