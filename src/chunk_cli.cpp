#include <doc_chunker/document_chunker.h>
#include <doc_chunker/json_serializer.h>
#include <doc_chunker/tiktoken_tokenizer.h>
#include <iostream>
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <numeric>
#include <algorithm>
#include <string>
#include <utility>
#include <vector>
#include <getopt.h>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using namespace doc_chunker;

struct CLIOptions {
    std::vector<std::string> inputs;
    std::string output_dir;
    std::string config_file;
    std::string vocab_file;
    nlohmann::json overrides = nlohmann::json::object();
    bool verbose = false;
    bool quiet = false;
    bool analyze = true;
    bool help = false;
    bool version = false;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] INPUT...\n";
    std::cout << "\nINPUT is a PDF, a section JSON file or a directory of them.\n";
    std::cout << "\nOptional:\n";
    std::cout << "  -o, --output DIR           Output directory (default: next to each input)\n";
    std::cout << "  -c, --config FILE          JSON file with chunking options\n";
    std::cout << "  --chunk-tokens N           Token budget per chunk (default: 128)\n";
    std::cout << "  --delimiter S              Delimiters, `literal` for hard splits\n";
    std::cout << "  --overlap-percent N        Overlap between chunks, 0-99 (default: 0)\n";
    std::cout << "  --strategy S               naive, tree or hierarchical (default: naive)\n";
    std::cout << "  --depth N                  Heading levels kept by tree/hierarchical (default: 1)\n";
    std::cout << "  --table-context N          Context tokens around tables (default: 0)\n";
    std::cout << "  --image-context N          Context tokens around images (default: 0)\n";
    std::cout << "  --child-delimiter S        Split chunks into children on these delimiters\n";
    std::cout << "  --remove-toc               Drop the table of contents\n";
    std::cout << "  --colon-title              Promote trailing clauses ending in ':' to titles\n";
    std::cout << "  --extract-images           Keep PDF pictures as image chunks\n";
    std::cout << "  --vocab FILE               tiktoken vocabulary for token counting\n";
    std::cout << "  -v, --verbose              Verbose output\n";
    std::cout << "  -q, --quiet                Quiet mode (minimal output)\n";
    std::cout << "  --no-analyze               Skip chunk distribution analysis\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  --version                  Show version information\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " document.pdf\n";
    std::cout << "  " << program_name << " --strategy tree --depth 2 -o out/ sections.json\n";
    std::cout << "  " << program_name << " --delimiter '`---`' --vocab cl100k_base.tiktoken docs/\n";
}

void print_version() {
    std::cout << "doc-chunker chunk_cli version 1.0.0\n";
    std::cout << "Built with C++17, MuPDF, nlohmann/json and RapidJSON\n";
}

int parse_int(const char* value, const char* name) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + " expects an integer, got '" + value + "'");
    }
}

CLIOptions parse_arguments(int argc, char* argv[]) {
    CLIOptions options;

    const char* short_opts = "o:c:vqh";
    const struct option long_opts[] = {
        {"output", required_argument, nullptr, 'o'},
        {"config", required_argument, nullptr, 'c'},
        {"chunk-tokens", required_argument, nullptr, 1001},
        {"delimiter", required_argument, nullptr, 1002},
        {"overlap-percent", required_argument, nullptr, 1003},
        {"strategy", required_argument, nullptr, 1004},
        {"depth", required_argument, nullptr, 1005},
        {"table-context", required_argument, nullptr, 1006},
        {"image-context", required_argument, nullptr, 1007},
        {"child-delimiter", required_argument, nullptr, 1008},
        {"remove-toc", no_argument, nullptr, 1009},
        {"colon-title", no_argument, nullptr, 1010},
        {"extract-images", no_argument, nullptr, 1011},
        {"vocab", required_argument, nullptr, 1012},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"no-analyze", no_argument, nullptr, 1013},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 1014},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, short_opts, long_opts, &option_index)) != -1) {
        switch (opt) {
            case 'o':
                options.output_dir = optarg;
                break;
            case 'c':
                options.config_file = optarg;
                break;
            case 1001:  // chunk-tokens
                options.overrides["chunk_token_num"] = parse_int(optarg, "--chunk-tokens");
                break;
            case 1002:  // delimiter
                options.overrides["delimiter"] = std::string(optarg);
                break;
            case 1003:  // overlap-percent
                options.overrides["overlapped_percent"] = parse_int(optarg, "--overlap-percent");
                break;
            case 1004:  // strategy
                options.overrides["strategy"] = std::string(optarg);
                break;
            case 1005:  // depth
                options.overrides["depth"] = parse_int(optarg, "--depth");
                break;
            case 1006:  // table-context
                options.overrides["table_context_size"] = parse_int(optarg, "--table-context");
                break;
            case 1007:  // image-context
                options.overrides["image_context_size"] = parse_int(optarg, "--image-context");
                break;
            case 1008:  // child-delimiter
                options.overrides["child_delimiter"] = std::string(optarg);
                break;
            case 1009:
                options.overrides["remove_contents_table"] = true;
                break;
            case 1010:
                options.overrides["colon_as_title"] = true;
                break;
            case 1011:
                options.overrides["extract_images"] = true;
                break;
            case 1012:
                options.vocab_file = optarg;
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'q':
                options.quiet = true;
                break;
            case 1013:  // no-analyze
                options.analyze = false;
                break;
            case 'h':
                options.help = true;
                return options;
            case 1014:  // version
                options.version = true;
                return options;
            default:
                throw std::invalid_argument("Unknown option");
        }
    }

    for (int i = optind; i < argc; ++i) {
        options.inputs.push_back(argv[i]);
    }

    if (options.inputs.empty()) {
        throw std::invalid_argument("At least one input is required");
    }

    if (options.verbose && options.quiet) {
        throw std::invalid_argument("Cannot use both --verbose and --quiet");
    }

    if (options.verbose) {
        options.overrides["verbose"] = true;
    }

    return options;
}

// Inputs with a supported extension; directories are scanned one level deep
std::vector<fs::path> collect_inputs(const std::vector<std::string>& inputs) {
    std::vector<fs::path> files;
    for (const auto& input : inputs) {
        fs::path path(input);
        if (!fs::exists(path)) {
            throw std::runtime_error("Input not found: " + input);
        }
        if (fs::is_directory(path)) {
            std::vector<fs::path> entries;
            for (const auto& entry : fs::directory_iterator(path)) {
                if (entry.is_regular_file() && is_supported_input(entry.path().string())) {
                    entries.push_back(entry.path());
                }
            }
            std::sort(entries.begin(), entries.end());
            files.insert(files.end(), entries.begin(), entries.end());
        } else {
            files.push_back(path);
        }
    }
    return files;
}

fs::path output_path_for(const fs::path& input, const std::string& output_dir) {
    fs::path dir = output_dir.empty() ? input.parent_path() : fs::path(output_dir);
    if (dir.empty()) {
        dir = ".";
    }
    return dir / (input.stem().string() + "_chunks.json");
}

void analyze_chunk_distribution(const std::vector<ChunkDocument>& docs, const Tokenizer& tokenizer) {
    if (docs.empty()) {
        std::cout << "\nNo chunks created\n";
        return;
    }

    std::vector<size_t> token_counts;
    for (const auto& doc : docs) {
        token_counts.push_back(tokenizer.count_tokens(doc.content_with_weight));
    }

    std::sort(token_counts.begin(), token_counts.end());

    size_t min_tokens = token_counts.front();
    size_t max_tokens = token_counts.back();
    double avg_tokens = std::accumulate(token_counts.begin(), token_counts.end(), 0.0) / token_counts.size();

    std::cout << "\n=== Chunk Distribution Analysis ===\n";
    std::cout << "Total chunks: " << docs.size() << "\n";
    std::cout << "Min tokens: " << min_tokens << "\n";
    std::cout << "Max tokens: " << max_tokens << "\n";
    std::cout << "Average tokens: " << static_cast<int>(avg_tokens) << "\n";

    std::cout << "\nQuintiles:\n";
    for (int p = 20; p <= 80; p += 20) {
        size_t idx = (token_counts.size() - 1) * p / 100;
        std::cout << "  " << p << "th percentile: " << token_counts[idx] << " tokens\n";
    }

    std::vector<std::pair<std::string, size_t>> ranges = {
        {"1-32", 32}, {"33-64", 64}, {"65-128", 128}, {"129-256", 256}, {"257-512", 512}
    };
    std::vector<int> distribution(ranges.size() + 1, 0);
    for (size_t tokens : token_counts) {
        size_t slot = 0;
        while (slot < ranges.size() && tokens > ranges[slot].second) ++slot;
        distribution[slot]++;
    }

    std::cout << "\nToken Range Distribution:\n";
    for (size_t i = 0; i < distribution.size(); ++i) {
        std::string label = i < ranges.size() ? ranges[i].first : "513+";
        double percentage = (distribution[i] * 100.0) / docs.size();
        std::cout << "  " << std::setw(10) << label << " tokens: "
                  << std::setw(5) << distribution[i] << " chunks ("
                  << std::fixed << std::setprecision(1) << percentage << "%)\n";
    }
}

int main(int argc, char* argv[]) {
    try {
        CLIOptions options = parse_arguments(argc, argv);

        if (options.help) {
            print_usage(argv[0]);
            return 0;
        }

        if (options.version) {
            print_version();
            return 0;
        }

        ChunkOptions base;
        if (!options.config_file.empty()) {
            base = load_options(options.config_file);
        }
        ChunkOptions chunk_opts = ChunkOptions::from_json(options.overrides, base);

        std::shared_ptr<const Tokenizer> tokenizer;
        if (!options.vocab_file.empty()) {
            tokenizer = TiktokenTokenizer::from_file(options.vocab_file);
        }

        DocumentChunker chunker(chunk_opts, tokenizer);
        std::vector<fs::path> files = collect_inputs(options.inputs);

        if (!options.output_dir.empty() && !fs::exists(options.output_dir)) {
            if (options.verbose) {
                std::cout << "Creating output directory: " << options.output_dir << "\n";
            }
            fs::create_directories(options.output_dir);
        }

        if (!options.quiet) {
            std::cout << "Inputs: " << files.size() << " file(s)\n";
            std::cout << "Configuration:\n";
            std::cout << "  Strategy: " << strategy_name(chunk_opts.strategy) << "\n";
            std::cout << "  Chunk size: " << chunk_opts.chunk_token_num << " tokens\n";
            std::cout << "  Overlap: " << chunk_opts.overlapped_percent << "%\n";
            std::cout << "  Depth: " << chunk_opts.depth << "\n";
            std::cout << "  Tokenizer: " << (options.vocab_file.empty() ? "word" : options.vocab_file) << "\n";
            std::cout << "\n";
        }

        int failures = 0;
        auto start = std::chrono::high_resolution_clock::now();

        for (const auto& file : files) {
            fs::path output_file = output_path_for(file, options.output_dir);
            if (!options.quiet) {
                std::cout << "Processing: " << file.string() << "\n";
            }

            auto result = chunker.chunk_file(file.string());
            if (!result.error.empty()) {
                std::cerr << "Error: " << file.string() << ": " << result.error << "\n";
                if (options.quiet) {
                    std::cout << "FAILED|" << file.string() << "\n";
                }
                ++failures;
                continue;
            }

            DocumentSummary summary;
            summary.source = file.filename().string();
            summary.strategy = strategy_name(chunk_opts.strategy);
            summary.detected_style = result.detected_style;
            summary.section_count = result.section_count;
            summary.processing_time_ms = result.processing_time_ms;

            std::ofstream outfile(output_file);
            if (!outfile) {
                std::cerr << "Error: cannot write " << output_file.string() << "\n";
                ++failures;
                continue;
            }
            outfile << JsonSerializer::serialize_documents(result.documents, summary);
            outfile.close();

            if (options.analyze && !options.quiet) {
                analyze_chunk_distribution(result.documents, chunker.tokenizer());
            }

            if (!options.quiet) {
                std::cout << "Sections: " << result.section_count
                          << ", style: " << result.detected_style
                          << ", chunks: " << result.documents.size()
                          << ", time: " << std::fixed << std::setprecision(1)
                          << result.processing_time_ms << "ms\n";
                std::cout << "Output saved to: " << output_file.string() << "\n\n";
            } else {
                std::cout << "SUCCESS|" << file.string() << "|"
                          << result.section_count << "|"
                          << result.documents.size() << "|"
                          << static_cast<long long>(result.processing_time_ms) << "\n";
            }
        }

        auto end = std::chrono::high_resolution_clock::now();
        auto total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

        if (!options.quiet) {
            std::cout << "=== Processing Complete ===\n";
            std::cout << "Files processed: " << files.size() - failures << "/" << files.size() << "\n";
            std::cout << "Total time: " << total_duration.count() << "ms\n";
        }

        return failures == 0 ? 0 : 1;

    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: Invalid argument - " << e.what() << "\n";
        std::cerr << "Use --help for usage information\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
