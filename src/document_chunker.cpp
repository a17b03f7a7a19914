#include "doc_chunker/document_chunker.h"
#include "doc_chunker/bullet_patterns.h"
#include "doc_chunker/hierarchical_merger.h"
#include "doc_chunker/json_serializer.h"
#include "doc_chunker/media_context.h"
#include "doc_chunker/naive_merger.h"
#include "doc_chunker/pdf_section_extractor.h"
#include "doc_chunker/preprocess.h"
#include "doc_chunker/text_utils.h"
#include "doc_chunker/tree_merger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace doc_chunker {

namespace {

std::string lower_extension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

// Structural merges see fragments the way the extraction layer emits them:
// text followed by its position tag
std::vector<Section> with_inline_positions(const std::vector<Section>& sections) {
    std::vector<Section> inlined;
    inlined.reserve(sections.size());
    for (const auto& section : sections) {
        std::string tag = section.position_string();
        std::string text = section.text;
        if (!tag.empty() && text.find(tag) == std::string::npos) {
            text += tag;
        }
        inlined.push_back(Section::with_layout(std::move(text), section.layout));
    }
    return inlined;
}

std::vector<Section> as_plain(const std::vector<std::string>& texts) {
    std::vector<Section> sections;
    sections.reserve(texts.size());
    for (const auto& text : texts) {
        sections.push_back(Section::plain(text));
    }
    return sections;
}

} // namespace

MergeStrategy parse_strategy(const std::string& name) {
    if (name == "naive") return MergeStrategy::Naive;
    if (name == "tree") return MergeStrategy::Tree;
    if (name == "hierarchical") return MergeStrategy::Hierarchical;
    throw std::invalid_argument("Unknown merge strategy: " + name);
}

std::string strategy_name(MergeStrategy strategy) {
    switch (strategy) {
        case MergeStrategy::Tree: return "tree";
        case MergeStrategy::Hierarchical: return "hierarchical";
        case MergeStrategy::Naive: break;
    }
    return "naive";
}

void ChunkOptions::validate() const {
    if (chunk_token_num <= 0) {
        throw std::invalid_argument("chunk_token_num must be positive");
    }
    if (overlapped_percent < 0 || overlapped_percent >= 100) {
        throw std::invalid_argument("overlapped_percent must be in [0, 100)");
    }
    if (depth < 1) {
        throw std::invalid_argument("depth must be at least 1");
    }
    if (table_context_size < 0 || image_context_size < 0) {
        throw std::invalid_argument("context sizes cannot be negative");
    }
    if (classifier_sample_size == 0) {
        throw std::invalid_argument("classifier_sample_size must be positive");
    }
}

ChunkOptions ChunkOptions::from_json(const nlohmann::json& config, const ChunkOptions& base) {
    if (!config.is_object()) {
        throw std::invalid_argument("Chunk options must be a JSON object");
    }

    ChunkOptions options = base;
    try {
        options.chunk_token_num = config.value("chunk_token_num", base.chunk_token_num);
        options.delimiter = config.value("delimiter", base.delimiter);
        options.overlapped_percent = config.value("overlapped_percent", base.overlapped_percent);
        options.depth = config.value("depth", base.depth);
        if (config.contains("strategy")) {
            options.strategy = parse_strategy(config["strategy"].get<std::string>());
        }
        options.table_context_size = config.value("table_context_size", base.table_context_size);
        options.image_context_size = config.value("image_context_size", base.image_context_size);
        options.classifier_sample_size =
            config.value("classifier_sample_size", base.classifier_sample_size);
        options.remove_contents_table =
            config.value("remove_contents_table", base.remove_contents_table);
        options.colon_as_title = config.value("colon_as_title", base.colon_as_title);
        options.child_delimiter = config.value("child_delimiter", base.child_delimiter);
        options.extract_images = config.value("extract_images", base.extract_images);
        options.verbose = config.value("verbose", base.verbose);
    } catch (const nlohmann::json::type_error& e) {
        throw std::invalid_argument(std::string("Bad option type: ") + e.what());
    }

    options.validate();
    return options;
}

ChunkOptions load_options(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    nlohmann::json config;
    try {
        file >> config;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    }
    return ChunkOptions::from_json(config);
}

bool is_supported_input(const std::string& path) {
    std::string ext = lower_extension(path);
    return ext == ".pdf" || ext == ".json";
}

std::vector<std::string> sample_texts(const std::vector<Section>& sections, size_t sample_size) {
    std::vector<std::string> sample;
    if (sections.empty() || sample_size == 0) {
        return sample;
    }
    if (sections.size() <= sample_size) {
        for (const auto& section : sections) sample.push_back(section.text);
        return sample;
    }

    double step = static_cast<double>(sections.size()) / sample_size;
    for (size_t i = 0; i < sample_size; ++i) {
        sample.push_back(sections[static_cast<size_t>(i * step)].text);
    }
    return sample;
}

class DocumentChunker::Impl {
public:
    ChunkOptions options;
    std::shared_ptr<const Tokenizer> tokenizer;

    Impl(const ChunkOptions& opts, std::shared_ptr<const Tokenizer> tok)
        : options(opts),
          tokenizer(tok ? std::move(tok) : std::make_shared<WordTokenizer>()) {
        options.validate();
    }

    void log(const std::string& method, const std::string& message) const {
        if (options.verbose) {
            std::cout << "[DocumentChunker::" << method << "] " << message << std::endl;
        }
    }

    ChunkingResult run(std::vector<Section> sections, const std::vector<TableBlock>& tables) {
        ChunkingResult result;
        auto start_time = std::chrono::high_resolution_clock::now();

        try {
            sections.erase(std::remove_if(sections.begin(), sections.end(),
                                          [](const Section& s) { return trim(s.text).empty(); }),
                           sections.end());
            result.section_count = sections.size();
            log("chunk_sections", std::to_string(sections.size()) + " sections, " +
                                      std::to_string(tables.size()) + " tables");

            std::vector<std::string> sample = sample_texts(sections, options.classifier_sample_size);
            bool english = is_english(sample);

            if (options.remove_contents_table) {
                remove_contents_table(sections, english);
            }
            if (options.colon_as_title) {
                make_colon_as_title(sections);
            }

            result.detected_style = bullets_category(sample_texts(sections, options.classifier_sample_size));
            log("chunk_sections", "Detected style " + std::to_string(result.detected_style) +
                                      ", strategy " + strategy_name(options.strategy));

            std::vector<Section> merged = structure(sections, result.detected_style);

            MergeOptions merge_options;
            merge_options.chunk_token_num = static_cast<size_t>(options.chunk_token_num);
            merge_options.delimiter = options.delimiter;
            merge_options.overlapped_percent = options.overlapped_percent;
            ChunkSet chunks = naive_merge(merged, *tokenizer, merge_options);
            log("chunk_sections", std::to_string(chunks.size()) + " chunks after flat merge");

            std::string child_pattern = options.child_delimiter.empty()
                ? std::string()
                : get_delimiters(options.child_delimiter);
            result.documents = tokenize_chunks(chunks, *tokenizer, child_pattern);

            auto table_docs = tokenize_table(tables, *tokenizer, english);
            result.documents.insert(result.documents.end(),
                                    std::make_move_iterator(table_docs.begin()),
                                    std::make_move_iterator(table_docs.end()));

            attach_media_context(result.documents, *tokenizer,
                                 static_cast<size_t>(options.table_context_size),
                                 static_cast<size_t>(options.image_context_size));
        } catch (const std::exception& e) {
            result.error = std::string("Error chunking sections: ") + e.what();
            result.documents.clear();
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        result.processing_time_ms =
            std::chrono::duration<double, std::milli>(end_time - start_time).count();
        return result;
    }

private:
    std::vector<Section> structure(const std::vector<Section>& sections, int style) const {
        switch (options.strategy) {
            case MergeStrategy::Tree: {
                if (style < 0) break;
                auto texts = tree_merge(style, with_inline_positions(sections), options.depth);
                log("structure", std::to_string(texts.size()) + " tree sections");
                return as_plain(texts);
            }
            case MergeStrategy::Hierarchical: {
                auto groups = hierarchical_merge(style, with_inline_positions(sections),
                                                 options.depth, *tokenizer);
                if (groups.empty()) break;
                std::vector<std::string> texts;
                for (const auto& group : groups) {
                    std::string joined;
                    for (size_t i = 0; i < group.size(); ++i) {
                        if (i) joined += "\n";
                        joined += group[i];
                    }
                    texts.push_back(std::move(joined));
                }
                log("structure", std::to_string(texts.size()) + " hierarchical groups");
                return as_plain(texts);
            }
            case MergeStrategy::Naive:
                break;
        }
        return sections;
    }
};

DocumentChunker::DocumentChunker(const ChunkOptions& options,
                                 std::shared_ptr<const Tokenizer> tokenizer)
    : pImpl(std::make_unique<Impl>(options, std::move(tokenizer))) {
}

DocumentChunker::~DocumentChunker() = default;

ChunkingResult DocumentChunker::chunk_sections(const std::vector<Section>& sections,
                                               const std::vector<TableBlock>& tables) {
    return pImpl->run(sections, tables);
}

ChunkingResult DocumentChunker::chunk_file(const std::string& path) {
    ChunkingResult result;
    auto start_time = std::chrono::high_resolution_clock::now();

    try {
        if (!fs::exists(path)) {
            throw std::runtime_error("Input file not found: " + path);
        }

        std::string ext = lower_extension(path);
        if (ext == ".pdf") {
            ExtractOptions extract_options;
            extract_options.extract_images = pImpl->options.extract_images;

            PdfSectionExtractor extractor;
            ExtractedDocument extracted = extractor.extract(path, extract_options);
            pImpl->log("chunk_file", "Extracted " + std::to_string(extracted.sections.size()) +
                                         " sections from " + std::to_string(extracted.page_count) +
                                         " pages");
            result = pImpl->run(std::move(extracted.sections), extracted.figures);
        } else if (ext == ".json") {
            SectionInput input = JsonSerializer::read_sections_file(path);
            result = pImpl->run(std::move(input.sections), input.tables);
        } else {
            throw std::runtime_error("Unsupported input type: " + path);
        }
    } catch (const std::exception& e) {
        result.error = std::string("Error chunking file: ") + e.what();
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    result.processing_time_ms =
        std::chrono::duration<double, std::milli>(end_time - start_time).count();
    return result;
}

ChunkOptions DocumentChunker::get_options() const {
    return pImpl->options;
}

void DocumentChunker::set_options(const ChunkOptions& options) {
    options.validate();
    pImpl->options = options;
}

const Tokenizer& DocumentChunker::tokenizer() const {
    return *pImpl->tokenizer;
}

} // namespace doc_chunker
