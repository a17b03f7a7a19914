#include "doc_chunker/json_serializer.h"
#include "doc_chunker/json_types.h"
#include "doc_chunker/position_tag.h"
#include <cstdint>
#include <fstream>
#include <optional>
#include <stdexcept>

namespace doc_chunker {

namespace {

std::optional<PositionTag> position_from_json(const nlohmann::json& position) {
    if (position.is_string()) {
        auto tags = extract_positions(position.get<std::string>());
        if (tags.empty()) return std::nullopt;
        return tags.front();
    }
    if (!position.is_object() || !position.contains("pages")) {
        return std::nullopt;
    }

    PositionTag tag;
    for (const auto& page : position["pages"]) {
        if (!page.is_number_integer() || page.get<int>() < 1) return std::nullopt;
        tag.pages.push_back(page.get<int>() - 1);
    }
    if (tag.pages.empty()) return std::nullopt;
    tag.left = position.value("left", 0.0);
    tag.right = position.value("right", 0.0);
    tag.top = position.value("top", 0.0);
    tag.bottom = position.value("bottom", 0.0);
    return tag;
}

// {"page": 1-based, "left", "right", "top", "bottom"}
PositionBox box_from_json(const nlohmann::json& box) {
    return {static_cast<double>(box.value("page", 1) - 1), box.value("left", 0.0),
            box.value("right", 0.0), box.value("top", 0.0), box.value("bottom", 0.0)};
}

TableBlock table_from_json(const nlohmann::json& item) {
    TableBlock table;
    if (item.is_string()) {
        table.html = item.get<std::string>();
        return table;
    }
    table.html = item.value("html", std::string());
    if (item.contains("rows")) {
        for (const auto& row : item["rows"]) {
            table.rows.push_back(row.get<std::string>());
        }
    }
    if (item.contains("positions")) {
        for (const auto& box : item["positions"]) {
            table.positions.push_back(box_from_json(box));
        }
    }
    return table;
}

JsonValue int_array(JsonBuilder& builder, const std::vector<int>& values) {
    JsonValue array(rapidjson::kArrayType);
    for (int v : values) {
        array.PushBack(v, builder.allocator());
    }
    return array;
}

} // namespace

Section JsonSerializer::section_from_json(const nlohmann::json& item) {
    if (item.is_string()) {
        return Section::plain(item.get<std::string>());
    }
    if (!item.is_object() || !item.contains("text") || !item["text"].is_string()) {
        throw std::invalid_argument("Section must be a string or an object with \"text\"");
    }

    std::string text = item["text"].get<std::string>();
    std::string layout = item.value("layout", std::string());

    if (item.contains("position")) {
        auto tag = position_from_json(item["position"]);
        if (tag) {
            Section section = Section::with_position(std::move(text), *tag);
            section.layout = std::move(layout);
            return section;
        }
    }
    if (item.contains("layout")) {
        return Section::with_layout(std::move(text), std::move(layout));
    }
    return Section::plain(std::move(text));
}

SectionInput JsonSerializer::read_sections(const nlohmann::json& input) {
    SectionInput result;

    const nlohmann::json* sections = nullptr;
    if (input.is_array()) {
        sections = &input;
    } else if (input.is_object() && input.contains("sections")) {
        sections = &input["sections"];
        if (input.contains("tables")) {
            for (const auto& table : input["tables"]) {
                result.tables.push_back(table_from_json(table));
            }
        }
    } else {
        throw std::invalid_argument("Expected an array of sections or an object with \"sections\"");
    }

    for (const auto& item : *sections) {
        result.sections.push_back(section_from_json(item));
    }
    return result;
}

SectionInput JsonSerializer::read_sections_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open section file: " + path);
    }

    nlohmann::json input;
    try {
        file >> input;
        return read_sections(input);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid section file " + path + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Invalid section file " + path + ": " + e.what());
    }
}

std::string JsonSerializer::serialize_documents(const std::vector<ChunkDocument>& docs,
                                                const DocumentSummary& summary,
                                                bool pretty) {
    JsonBuilder builder;
    auto& alloc = builder.allocator();

    builder.add_member("source", builder.string(summary.source));
    builder.add_member("strategy", builder.string(summary.strategy));
    builder.add_member("detected_style", JsonValue(summary.detected_style));
    builder.add_member("section_count", JsonValue(static_cast<uint64_t>(summary.section_count)));
    builder.add_member("processing_time_ms", JsonValue(summary.processing_time_ms));
    builder.add_member("chunk_count", JsonValue(static_cast<uint64_t>(docs.size())));

    JsonValue chunks(rapidjson::kArrayType);
    for (const auto& doc : docs) {
        JsonValue chunk(rapidjson::kObjectType);
        builder.add_member(chunk, "content_with_weight", builder.string(doc.content_with_weight));
        builder.add_member(chunk, "content_ltks", builder.string(doc.content_ltks));
        builder.add_member(chunk, "content_sm_ltks", builder.string(doc.content_sm_ltks));
        if (!doc.mom_with_weight.empty()) {
            builder.add_member(chunk, "mom_with_weight", builder.string(doc.mom_with_weight));
        }
        if (!doc.doc_type_kwd.empty()) {
            builder.add_member(chunk, "doc_type_kwd", builder.string(doc.doc_type_kwd));
        }
        builder.add_member(chunk, "page_num_int", int_array(builder, doc.page_num_int));
        builder.add_member(chunk, "top_int", int_array(builder, doc.top_int));

        JsonValue positions(rapidjson::kArrayType);
        for (const auto& position : doc.position_int) {
            JsonValue row(rapidjson::kArrayType);
            for (int v : position) {
                row.PushBack(v, alloc);
            }
            positions.PushBack(row, alloc);
        }
        builder.add_member(chunk, "position_int", std::move(positions));

        if (doc.image) {
            JsonValue image(rapidjson::kObjectType);
            builder.add_member(image, "width", JsonValue(doc.image.width()));
            builder.add_member(image, "height", JsonValue(doc.image.height()));
            builder.add_member(chunk, "image", std::move(image));
        }
        chunks.PushBack(chunk, alloc);
    }
    builder.add_member("chunks", std::move(chunks));

    return builder.serialize(pretty);
}

} // namespace doc_chunker
