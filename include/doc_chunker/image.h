#pragma once

#include <memory>
#include <vector>

struct fz_context;
struct fz_pixmap;

namespace doc_chunker {

// Owns a MuPDF context. Shared by every pixmap created from it and by the
// PDF extractor; a context must only be used from one thread at a time.
class MupdfContext {
public:
    MupdfContext();
    ~MupdfContext();

    MupdfContext(const MupdfContext&) = delete;
    MupdfContext& operator=(const MupdfContext&) = delete;

    fz_context* get() const { return ctx_; }

    static std::shared_ptr<MupdfContext> create();

private:
    fz_context* ctx_ = nullptr;
};

// RGB raster attached to a chunk. Copies share the underlying pixmap, so
// copying is cheap and same_as() tells copies apart from equal content.
// A default-constructed Image is "no image".
class Image {
public:
    Image() = default;

    // Blank canvas filled with `value` in every channel
    static Image create(std::shared_ptr<MupdfContext> context, int width, int height,
                        unsigned char value = 0);

    // Takes `rgb` as tightly packed rows of width * 3 bytes
    static Image from_rgb(std::shared_ptr<MupdfContext> context, int width, int height,
                          const std::vector<unsigned char>& rgb);

    bool empty() const { return !pixmap_; }
    explicit operator bool() const { return !empty(); }

    int width() const;
    int height() const;

    // Packed RGB bytes, row by row
    std::vector<unsigned char> rgb() const;

    // Same underlying pixmap
    bool same_as(const Image& other) const { return pixmap_ && pixmap_ == other.pixmap_; }

    // Same size and same pixel bytes
    bool pixels_equal(const Image& other) const;

    const std::shared_ptr<MupdfContext>& context() const { return context_; }

private:
    Image(std::shared_ptr<MupdfContext> context, fz_pixmap* pixmap);

    void copy_rows_into(Image& target, int y_offset) const;

    std::shared_ptr<MupdfContext> context_;
    std::shared_ptr<fz_pixmap> pixmap_;

    friend Image concat_img(const Image& first, const Image& second);
};

/**
 * Stacks `second` below `first`. An absent image yields the other one, and
 * the same image (or pixel-identical content) is returned unchanged so that
 * repeated merging of one picture does not grow it. The canvas is as wide as
 * the wider input; uncovered pixels are black.
 */
Image concat_img(const Image& first, const Image& second);

} // namespace doc_chunker
