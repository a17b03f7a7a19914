#include "doc_chunker/image.h"
#include <mupdf/fitz.h>
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>

namespace doc_chunker {

MupdfContext::MupdfContext() {
    ctx_ = fz_new_context(NULL, NULL, FZ_STORE_UNLIMITED);
    if (!ctx_) {
        throw std::runtime_error("Failed to create MuPDF context");
    }
    fz_register_document_handlers(ctx_);
}

MupdfContext::~MupdfContext() {
    if (ctx_) {
        fz_drop_context(ctx_);
    }
}

std::shared_ptr<MupdfContext> MupdfContext::create() {
    return std::make_shared<MupdfContext>();
}

Image::Image(std::shared_ptr<MupdfContext> context, fz_pixmap* pixmap)
    : context_(context),
      pixmap_(pixmap, [context](fz_pixmap* p) { fz_drop_pixmap(context->get(), p); }) {
}

Image Image::create(std::shared_ptr<MupdfContext> context, int width, int height,
                    unsigned char value) {
    if (!context) {
        throw std::invalid_argument("Image requires a MuPDF context");
    }
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("Image dimensions must be positive");
    }

    fz_context* ctx = context->get();
    fz_pixmap* pix = nullptr;
    fz_var(pix);

    fz_try(ctx) {
        pix = fz_new_pixmap(ctx, fz_device_rgb(ctx), width, height, nullptr, 0);
        fz_clear_pixmap_with_value(ctx, pix, value);
    }
    fz_catch(ctx) {
        fz_drop_pixmap(ctx, pix);
        pix = nullptr;
    }

    if (!pix) {
        throw std::runtime_error("MuPDF error allocating " + std::to_string(width) + "x" +
                                 std::to_string(height) + " pixmap");
    }
    return Image(context, pix);
}

Image Image::from_rgb(std::shared_ptr<MupdfContext> context, int width, int height,
                      const std::vector<unsigned char>& rgb) {
    if (rgb.size() != static_cast<size_t>(width) * height * 3) {
        throw std::invalid_argument("RGB buffer does not match image dimensions");
    }

    Image image = create(context, width, height);
    fz_context* ctx = context->get();
    unsigned char* samples = fz_pixmap_samples(ctx, image.pixmap_.get());
    ptrdiff_t stride = fz_pixmap_stride(ctx, image.pixmap_.get());
    size_t row_bytes = static_cast<size_t>(width) * 3;
    for (int y = 0; y < height; ++y) {
        std::memcpy(samples + y * stride, rgb.data() + y * row_bytes, row_bytes);
    }
    return image;
}

int Image::width() const {
    return pixmap_ ? fz_pixmap_width(context_->get(), pixmap_.get()) : 0;
}

int Image::height() const {
    return pixmap_ ? fz_pixmap_height(context_->get(), pixmap_.get()) : 0;
}

std::vector<unsigned char> Image::rgb() const {
    std::vector<unsigned char> out;
    if (!pixmap_) return out;

    fz_context* ctx = context_->get();
    const unsigned char* samples = fz_pixmap_samples(ctx, pixmap_.get());
    ptrdiff_t stride = fz_pixmap_stride(ctx, pixmap_.get());
    size_t row_bytes = static_cast<size_t>(width()) * 3;

    out.resize(row_bytes * height());
    for (int y = 0; y < height(); ++y) {
        std::memcpy(out.data() + y * row_bytes, samples + y * stride, row_bytes);
    }
    return out;
}

bool Image::pixels_equal(const Image& other) const {
    if (empty() || other.empty()) return false;
    if (width() != other.width() || height() != other.height()) return false;
    return rgb() == other.rgb();
}

void Image::copy_rows_into(Image& target, int y_offset) const {
    fz_context* src_ctx = context_->get();
    fz_context* dst_ctx = target.context_->get();
    const unsigned char* src = fz_pixmap_samples(src_ctx, pixmap_.get());
    unsigned char* dst = fz_pixmap_samples(dst_ctx, target.pixmap_.get());
    ptrdiff_t src_stride = fz_pixmap_stride(src_ctx, pixmap_.get());
    ptrdiff_t dst_stride = fz_pixmap_stride(dst_ctx, target.pixmap_.get());
    size_t row_bytes = static_cast<size_t>(width()) * 3;

    for (int y = 0; y < height(); ++y) {
        std::memcpy(dst + (y + y_offset) * dst_stride, src + y * src_stride, row_bytes);
    }
}

Image concat_img(const Image& first, const Image& second) {
    if (first && !second) return first;
    if (!first && second) return second;
    if (!first && !second) return Image();

    if (first.same_as(second)) return first;
    if (first.pixels_equal(second)) return first;

    Image canvas = Image::create(first.context_,
                                 std::max(first.width(), second.width()),
                                 first.height() + second.height());
    first.copy_rows_into(canvas, 0);
    second.copy_rows_into(canvas, first.height());
    return canvas;
}

} // namespace doc_chunker
