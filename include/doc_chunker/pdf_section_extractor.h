#pragma once

#include <doc_chunker/chunk_document.h>
#include <doc_chunker/image.h>
#include <doc_chunker/section.h>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace doc_chunker {

struct ExtractOptions {
    bool extract_images = false;   // picture blocks become image tables
    int page_limit = -1;           // -1 = all pages
    double title_size_ratio = 1.2; // block font size vs page median
};

struct ExtractedDocument {
    std::vector<Section> sections;
    std::vector<TableBlock> figures;
    int page_count = 0;
};

/**
 * Turns a PDF into layout-tagged sections with MuPDF.
 *
 * Every text block becomes one section whose text carries the block's
 * position tag inline. A block of at most two lines set in a font at least
 * title_size_ratio times the page's median size, or entirely in bold, is
 * tagged "title"; everything else is "text".
 */
class PdfSectionExtractor {
public:
    explicit PdfSectionExtractor(std::shared_ptr<MupdfContext> context = nullptr);
    ~PdfSectionExtractor();

    ExtractedDocument extract(const std::string& pdf_path,
                              const ExtractOptions& options = ExtractOptions{});

    // Blocks of one page: {"page_number", "width", "height", "blocks": [...]}
    nlohmann::json extract_page(const std::string& pdf_path, int page_number);

    int get_page_count(const std::string& pdf_path);

    // Sections of a page produced by extract_page()
    static std::vector<Section> sections_from_page(const nlohmann::json& page,
                                                   double title_size_ratio = 1.2);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace doc_chunker
