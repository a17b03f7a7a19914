#pragma once

#include <doc_chunker/chunk_document.h>
#include <doc_chunker/section.h>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace doc_chunker {

struct SectionInput {
    std::vector<Section> sections;
    std::vector<TableBlock> tables;
};

struct DocumentSummary {
    std::string source;
    std::string strategy;
    int detected_style = -1;
    size_t section_count = 0;
    double processing_time_ms = 0;
};

class JsonSerializer {
public:
    // Accepts an array of sections or {"sections": [...], "tables": [...]}.
    // Throws std::invalid_argument on a shape it does not recognize.
    static SectionInput read_sections(const nlohmann::json& input);

    // Throws std::runtime_error when the file cannot be read or parsed
    static SectionInput read_sections_file(const std::string& path);

    static Section section_from_json(const nlohmann::json& item);

    // {"source", "strategy", "detected_style", "section_count",
    //  "processing_time_ms", "chunk_count", "chunks": [...]}
    static std::string serialize_documents(const std::vector<ChunkDocument>& docs,
                                           const DocumentSummary& summary,
                                           bool pretty = true);
};

} // namespace doc_chunker
