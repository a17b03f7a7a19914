#pragma once

#include <string>
#include <vector>

namespace doc_chunker {

// Page region a fragment was extracted from. Pages are zero-based here and
// one-based in the text encoding:
//   @@<p1>[-<p2>...]\t<left>\t<right>\t<top>\t<bottom>##
struct PositionTag {
    std::vector<int> pages;
    double left = 0;
    double right = 0;
    double top = 0;
    double bottom = 0;

    bool operator==(const PositionTag& other) const {
        return pages == other.pages && left == other.left && right == other.right &&
               top == other.top && bottom == other.bottom;
    }
};

// Coordinates are written with one decimal place
std::string format_position_tag(const PositionTag& tag);

// Every well-formed tag in the blob, in order of appearance. Malformed tags
// are skipped.
std::vector<PositionTag> extract_positions(const std::string& text);

// Removes all tags from the text
std::string remove_tag(const std::string& text);

// Text before the first '@', trimmed
std::string visible_text(const std::string& text);

} // namespace doc_chunker
