#include "doc_chunker/position_tag.h"
#include "doc_chunker/text_utils.h"
#include <cstdio>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace doc_chunker {

namespace {

std::vector<std::string> split(const std::string& text, char sep) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream stream(text);
    while (std::getline(stream, part, sep)) {
        parts.push_back(part);
    }
    if (!text.empty() && text.back() == sep) {
        parts.emplace_back();
    }
    return parts;
}

double parse_coordinate(const std::string& field) {
    size_t used = 0;
    double value = std::stod(field, &used);
    if (used != field.size()) {
        throw std::invalid_argument("trailing characters in coordinate");
    }
    return value;
}

} // namespace

std::string format_position_tag(const PositionTag& tag) {
    std::string pages;
    for (size_t i = 0; i < tag.pages.size(); ++i) {
        if (i) pages += "-";
        pages += std::to_string(tag.pages[i] + 1);
    }

    char coords[128];
    std::snprintf(coords, sizeof(coords), "\t%.1f\t%.1f\t%.1f\t%.1f",
                  tag.left, tag.right, tag.top, tag.bottom);
    return "@@" + pages + coords + "##";
}

std::vector<PositionTag> extract_positions(const std::string& text) {
    static const std::regex tag_regex("@@[0-9-]+\t[0-9.\t-]+##");

    std::vector<PositionTag> positions;
    for (std::sregex_iterator it(text.begin(), text.end(), tag_regex), end; it != end; ++it) {
        std::string tag = it->str();
        std::string body = tag.substr(2, tag.size() - 4);

        auto fields = split(body, '\t');
        if (fields.size() != 5) {
            continue;
        }

        try {
            PositionTag position;
            for (const auto& page : split(fields[0], '-')) {
                if (page.empty()) {
                    throw std::invalid_argument("empty page index");
                }
                position.pages.push_back(std::stoi(page) - 1);
            }
            position.left = parse_coordinate(fields[1]);
            position.right = parse_coordinate(fields[2]);
            position.top = parse_coordinate(fields[3]);
            position.bottom = parse_coordinate(fields[4]);
            positions.push_back(position);
        } catch (const std::exception&) {
            // Not a usable tag; the fragment stays untagged
            continue;
        }
    }
    return positions;
}

std::string remove_tag(const std::string& text) {
    static const std::regex tag_regex("@@[\t0-9.-]+?##");
    return std::regex_replace(text, tag_regex, "");
}

std::string visible_text(const std::string& text) {
    return trim(text.substr(0, text.find('@')));
}

} // namespace doc_chunker
