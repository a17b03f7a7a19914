#pragma once

#include <doc_chunker/position_tag.h>
#include <optional>
#include <string>
#include <utility>

namespace doc_chunker {

// One fragment handed over by the extraction layer. The three shapes a
// fragment can arrive in are normalized into this tagged struct once, at
// ingestion.
struct Section {
    enum class Kind {
        Plain,         // text only
        WithLayout,    // text plus a layout tag ("title", "text", ...)
        WithPosition   // text plus the page region it came from
    };

    Kind kind = Kind::Plain;
    std::string text;
    std::string layout;
    std::optional<PositionTag> position;

    static Section plain(std::string text) {
        Section s;
        s.text = std::move(text);
        return s;
    }

    static Section with_layout(std::string text, std::string layout) {
        Section s;
        s.kind = Kind::WithLayout;
        s.text = std::move(text);
        s.layout = std::move(layout);
        return s;
    }

    static Section with_position(std::string text, PositionTag position) {
        Section s;
        s.kind = Kind::WithPosition;
        s.text = std::move(text);
        s.position = std::move(position);
        return s;
    }

    // Encoded tag, or empty when the fragment has no position
    std::string position_string() const {
        return position ? format_position_tag(*position) : std::string();
    }
};

} // namespace doc_chunker
