#include "doc_chunker/pdf_section_extractor.h"
#include "doc_chunker/position_tag.h"
#include "doc_chunker/text_utils.h"
#include <mupdf/fitz.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace doc_chunker {

namespace {

bool ascii_boundary(const std::string& left, const std::string& right) {
    if (left.empty() || right.empty()) return false;
    unsigned char a = static_cast<unsigned char>(left.back());
    unsigned char b = static_cast<unsigned char>(right.front());
    return a < 0x80 && b < 0x80 && !std::isspace(a) && !std::isspace(b);
}

double median(std::vector<double> values) {
    if (values.empty()) return 0.0;
    std::sort(values.begin(), values.end());
    size_t mid = values.size() / 2;
    return values.size() % 2 ? values[mid] : (values[mid - 1] + values[mid]) / 2.0;
}

} // namespace

class PdfSectionExtractor::Impl {
public:
    explicit Impl(std::shared_ptr<MupdfContext> context)
        : context_(context ? context : MupdfContext::create()) {}

    ExtractedDocument extract(const std::string& pdf_path, const ExtractOptions& options) {
        if (!fs::exists(pdf_path)) {
            throw std::runtime_error("PDF file not found: " + pdf_path);
        }

        ExtractedDocument result;
        fz_context* ctx = context_->get();
        fz_document* doc = open(pdf_path);

        int page_count = 0;
        bool failed = false;
        fz_try(ctx) {
            page_count = fz_count_pages(ctx, doc);
        }
        fz_catch(ctx) {
            failed = true;
        }
        if (failed) {
            fz_drop_document(ctx, doc);
            throw std::runtime_error("MuPDF error counting pages of " + pdf_path);
        }

        result.page_count = page_count;
        if (options.page_limit > 0) {
            page_count = std::min(page_count, options.page_limit);
        }

        for (int i = 0; i < page_count; ++i) {
            nlohmann::json page;
            std::vector<TableBlock> figures;
            if (!load_page(doc, i, options.extract_images, page, figures)) {
                // Unreadable pages are skipped, the rest of the document still counts
                std::cerr << "[PdfSectionExtractor::extract] Skipping page " << i
                          << " of " << pdf_path << std::endl;
                continue;
            }
            for (auto& section : sections_from_page(page, options.title_size_ratio)) {
                result.sections.push_back(std::move(section));
            }
            for (auto& figure : figures) {
                result.figures.push_back(std::move(figure));
            }
        }

        fz_drop_document(ctx, doc);
        return result;
    }

    nlohmann::json extract_page(const std::string& pdf_path, int page_number) {
        fz_document* doc = open(pdf_path);
        int page_count = count_pages(doc);
        if (page_number < 0 || page_number >= page_count) {
            fz_drop_document(context_->get(), doc);
            throw std::out_of_range("Page number out of range");
        }

        nlohmann::json page;
        std::vector<TableBlock> unused;
        bool ok = load_page(doc, page_number, false, page, unused);
        fz_drop_document(context_->get(), doc);
        if (!ok) {
            throw std::runtime_error("MuPDF error during text extraction");
        }
        return page;
    }

    int get_page_count(const std::string& pdf_path) {
        fz_document* doc = open(pdf_path);
        int page_count = count_pages(doc);
        fz_drop_document(context_->get(), doc);
        return page_count;
    }

private:
    fz_document* open(const std::string& pdf_path) {
        fz_context* ctx = context_->get();
        fz_document* doc = nullptr;
        fz_var(doc);

        fz_try(ctx) {
            doc = fz_open_document(ctx, pdf_path.c_str());
        }
        fz_catch(ctx) {
            doc = nullptr;
        }
        if (!doc) {
            throw std::runtime_error("Failed to open PDF document: " + pdf_path);
        }
        return doc;
    }

    int count_pages(fz_document* doc) {
        fz_context* ctx = context_->get();
        int page_count = -1;
        fz_try(ctx) {
            page_count = fz_count_pages(ctx, doc);
        }
        fz_catch(ctx) {
            page_count = -1;
        }
        if (page_count < 0) {
            fz_drop_document(ctx, doc);
            throw std::runtime_error("MuPDF error getting page count");
        }
        return page_count;
    }

    bool load_page(fz_document* doc, int page_number, bool with_images, nlohmann::json& page_json,
                   std::vector<TableBlock>& figures) {
        fz_context* ctx = context_->get();
        fz_page* page = nullptr;
        fz_stext_page* stext = nullptr;
        std::vector<std::pair<fz_pixmap*, fz_rect>> pictures;
        bool ok = true;

        fz_var(page);
        fz_var(stext);

        fz_try(ctx) {
            page = fz_load_page(ctx, doc, page_number);

            fz_stext_options opts = { 0 };
            opts.flags = FZ_STEXT_PRESERVE_LIGATURES | FZ_STEXT_PRESERVE_WHITESPACE;
            if (with_images) {
                opts.flags |= FZ_STEXT_PRESERVE_IMAGES;
            }
            stext = fz_new_stext_page_from_page(ctx, page, &opts);

            fz_rect bounds = fz_bound_page(ctx, page);
            page_json = stext_to_json(stext);
            page_json["page_number"] = page_number;
            page_json["width"] = bounds.x1 - bounds.x0;
            page_json["height"] = bounds.y1 - bounds.y0;

            if (with_images) {
                collect_pictures(stext, pictures);
            }
        }
        fz_always(ctx) {
            if (stext) fz_drop_stext_page(ctx, stext);
            if (page) fz_drop_page(ctx, page);
        }
        fz_catch(ctx) {
            ok = false;
        }

        for (auto& [pix, bbox] : pictures) {
            if (ok) {
                TableBlock figure;
                figure.image = to_image(pix);
                figure.positions.push_back({static_cast<double>(page_number), bbox.x0, bbox.x1,
                                            bbox.y0, bbox.y1});
                figures.push_back(std::move(figure));
            }
            fz_drop_pixmap(ctx, pix);
        }
        return ok;
    }

    nlohmann::json stext_to_json(fz_stext_page* stext) {
        fz_context* ctx = context_->get();
        nlohmann::json result;
        result["blocks"] = nlohmann::json::array();

        for (fz_stext_block* block = stext->first_block; block; block = block->next) {
            if (block->type != FZ_STEXT_BLOCK_TEXT) continue;

            nlohmann::json block_json;
            block_json["type"] = "text";
            block_json["bbox"] = bbox_to_json(block->bbox);
            block_json["lines"] = nlohmann::json::array();

            for (fz_stext_line* line = block->u.t.first_line; line; line = line->next) {
                std::string line_text;
                double size_sum = 0.0;
                int char_count = 0;
                bool all_bold = true;

                for (fz_stext_char* ch = line->first_char; ch; ch = ch->next) {
                    char utf8[8] = {0};
                    int len = fz_runetochar(utf8, ch->c);
                    line_text.append(utf8, len);

                    size_sum += ch->size;
                    ++char_count;
                    if (ch->c != ' ' && (!ch->font || !fz_font_is_bold(ctx, ch->font))) {
                        all_bold = false;
                    }
                }

                nlohmann::json line_json;
                line_json["text"] = line_text;
                line_json["bbox"] = bbox_to_json(line->bbox);
                line_json["size"] = char_count ? size_sum / char_count : 0.0;
                line_json["bold"] = char_count > 0 && all_bold;
                block_json["lines"].push_back(line_json);
            }

            result["blocks"].push_back(block_json);
        }

        return result;
    }

    // RGB pixmaps of the picture blocks; the caller drops them
    void collect_pictures(fz_stext_page* stext, std::vector<std::pair<fz_pixmap*, fz_rect>>& pictures) {
        fz_context* ctx = context_->get();

        for (fz_stext_block* block = stext->first_block; block; block = block->next) {
            if (block->type != FZ_STEXT_BLOCK_IMAGE || !block->u.i.image) continue;

            fz_pixmap* pix = fz_get_pixmap_from_image(ctx, block->u.i.image, NULL, NULL, NULL, NULL);
            fz_pixmap* rgb = nullptr;
            fz_var(rgb);
            fz_try(ctx) {
                rgb = fz_convert_pixmap(ctx, pix, fz_device_rgb(ctx), NULL, NULL,
                                        fz_default_color_params, 0);
            }
            fz_always(ctx) {
                fz_drop_pixmap(ctx, pix);
            }
            fz_catch(ctx) {
                fz_rethrow(ctx);
            }
            pictures.emplace_back(rgb, block->bbox);
        }
    }

    Image to_image(fz_pixmap* rgb) {
        fz_context* ctx = context_->get();
        int width = fz_pixmap_width(ctx, rgb);
        int height = fz_pixmap_height(ctx, rgb);
        const unsigned char* samples = fz_pixmap_samples(ctx, rgb);
        ptrdiff_t stride = fz_pixmap_stride(ctx, rgb);

        std::vector<unsigned char> packed(static_cast<size_t>(width) * height * 3);
        for (int y = 0; y < height; ++y) {
            std::memcpy(packed.data() + static_cast<size_t>(y) * width * 3,
                        samples + y * stride, static_cast<size_t>(width) * 3);
        }
        return Image::from_rgb(context_, width, height, packed);
    }

    static nlohmann::json bbox_to_json(const fz_rect& bbox) {
        return {
            {"x0", bbox.x0},
            {"y0", bbox.y0},
            {"x1", bbox.x1},
            {"y1", bbox.y1}
        };
    }

    std::shared_ptr<MupdfContext> context_;
};

PdfSectionExtractor::PdfSectionExtractor(std::shared_ptr<MupdfContext> context)
    : pImpl(std::make_unique<Impl>(std::move(context))) {}

PdfSectionExtractor::~PdfSectionExtractor() = default;

ExtractedDocument PdfSectionExtractor::extract(const std::string& pdf_path,
                                               const ExtractOptions& options) {
    return pImpl->extract(pdf_path, options);
}

nlohmann::json PdfSectionExtractor::extract_page(const std::string& pdf_path, int page_number) {
    return pImpl->extract_page(pdf_path, page_number);
}

int PdfSectionExtractor::get_page_count(const std::string& pdf_path) {
    return pImpl->get_page_count(pdf_path);
}

std::vector<Section> PdfSectionExtractor::sections_from_page(const nlohmann::json& page,
                                                             double title_size_ratio) {
    std::vector<Section> sections;
    if (!page.contains("blocks")) {
        return sections;
    }
    int page_number = page.value("page_number", 0);

    const nlohmann::json no_lines = nlohmann::json::array();

    std::vector<double> sizes;
    for (const auto& block : page["blocks"]) {
        for (const auto& line : block.value("lines", no_lines)) {
            double size = line.value("size", 0.0);
            if (size > 0) sizes.push_back(size);
        }
    }
    double median_size = median(sizes);

    for (const auto& block : page["blocks"]) {
        std::string text;
        double size_sum = 0.0;
        size_t line_count = 0;
        bool all_bold = true;

        for (const auto& line : block.value("lines", no_lines)) {
            std::string line_text = trim(line.value("text", std::string()));
            if (line_text.empty()) continue;
            if (ascii_boundary(text, line_text)) text += " ";
            text += line_text;
            size_sum += line.value("size", 0.0);
            all_bold = all_bold && line.value("bold", false);
            ++line_count;
        }
        if (line_count == 0) continue;

        double average_size = size_sum / line_count;
        bool large = median_size > 0 && line_count <= 2 &&
                     average_size >= title_size_ratio * median_size;
        std::string layout = (large || all_bold) ? "title" : "text";

        PositionTag tag;
        tag.pages = {page_number};
        nlohmann::json bbox = block.value("bbox", nlohmann::json::object());
        tag.left = bbox.value("x0", 0.0);
        tag.right = bbox.value("x1", 0.0);
        tag.top = bbox.value("y0", 0.0);
        tag.bottom = bbox.value("y1", 0.0);

        sections.push_back(Section::with_layout(text + format_position_tag(tag), layout));
    }
    return sections;
}

} // namespace doc_chunker
