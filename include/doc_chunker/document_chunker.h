#pragma once

#include <doc_chunker/chunk_document.h>
#include <doc_chunker/section.h>
#include <doc_chunker/tokenizer.h>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace doc_chunker {

enum class MergeStrategy {
    Naive,         // budgeted flat merge only
    Tree,          // heading tree, then flat merge
    Hierarchical   // level buckets, then flat merge
};

// "naive", "tree" or "hierarchical"; throws std::invalid_argument otherwise
MergeStrategy parse_strategy(const std::string& name);
std::string strategy_name(MergeStrategy strategy);

struct ChunkOptions {
    int chunk_token_num = 128;
    std::string delimiter = "\n。；！？";
    int overlapped_percent = 0;
    int depth = 1;
    MergeStrategy strategy = MergeStrategy::Naive;
    int table_context_size = 0;
    int image_context_size = 0;
    size_t classifier_sample_size = 200;
    bool remove_contents_table = false;
    bool colon_as_title = false;
    std::string child_delimiter;   // backtick literals, splits chunks into children
    bool extract_images = false;   // PDF picture blocks become image documents
    bool verbose = false;

    // Throws std::invalid_argument describing the first bad value
    void validate() const;

    // Keys missing from `config` keep the value they have in `base`
    static ChunkOptions from_json(const nlohmann::json& config,
                                  const ChunkOptions& base);
    static ChunkOptions from_json(const nlohmann::json& config);
};

inline ChunkOptions ChunkOptions::from_json(const nlohmann::json& config) {
    return from_json(config, ChunkOptions{});
}

// Reads a JSON config file. Throws std::runtime_error when unreadable.
ChunkOptions load_options(const std::string& path);

// True for .pdf and .json paths, ignoring case
bool is_supported_input(const std::string& path);

struct ChunkingResult {
    std::vector<ChunkDocument> documents;
    int detected_style = -1;
    size_t section_count = 0;
    double processing_time_ms = 0;
    std::string error;  // Empty if successful
};

// Evenly spaced sample of at most `sample_size` section texts, in document order
std::vector<std::string> sample_texts(const std::vector<Section>& sections, size_t sample_size);

class DocumentChunker {
public:
    // A WordTokenizer is used when no tokenizer is given
    explicit DocumentChunker(const ChunkOptions& options = ChunkOptions{},
                             std::shared_ptr<const Tokenizer> tokenizer = nullptr);
    ~DocumentChunker();

    ChunkingResult chunk_sections(const std::vector<Section>& sections,
                                  const std::vector<TableBlock>& tables = {});

    // PDF through MuPDF, or a section JSON file
    ChunkingResult chunk_file(const std::string& path);

    ChunkOptions get_options() const;
    void set_options(const ChunkOptions& options);

    const Tokenizer& tokenizer() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace doc_chunker
