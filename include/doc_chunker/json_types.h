#pragma once

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/prettywriter.h>
#include <string>
#include <memory>
#include <utility>

namespace doc_chunker {

using JsonDocument = rapidjson::Document;
using JsonValue = rapidjson::Value;
using JsonAllocator = rapidjson::MemoryPoolAllocator<>;

// Builds an output document with RapidJSON's pooled allocator
class JsonBuilder {
public:
    JsonBuilder() : doc_(std::make_unique<JsonDocument>()) {
        doc_->SetObject();
    }

    JsonDocument* document() { return doc_.get(); }
    JsonAllocator& allocator() { return doc_->GetAllocator(); }

    // Copies the string into the document's allocator
    JsonValue string(const std::string& text) {
        JsonValue value;
        value.SetString(text.c_str(), static_cast<rapidjson::SizeType>(text.size()), allocator());
        return value;
    }

    void add_member(JsonValue& object, const char* key, JsonValue value) {
        object.AddMember(rapidjson::StringRef(key), value, allocator());
    }

    void add_member(const char* key, JsonValue value) {
        add_member(*doc_, key, std::move(value));
    }

    std::string serialize(bool pretty = false) const {
        rapidjson::StringBuffer buffer;

        if (pretty) {
            rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
            writer.SetIndent(' ', 2);
            doc_->Accept(writer);
        } else {
            rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
            doc_->Accept(writer);
        }

        return std::string(buffer.GetString(), buffer.GetSize());
    }

private:
    std::unique_ptr<JsonDocument> doc_;
};

} // namespace doc_chunker
