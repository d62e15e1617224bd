#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include <cairo.h>
#include <librsvg/rsvg.h>

namespace svgraster
{

    // cairo image surfaces cannot be wider or taller than this, so larger
    // pixmaps are drawn in tiles of at most this size.
    constexpr std::uint32_t kMaxTileExtent = 32767;

    struct GObjectDeleter
    {
        void operator()(gpointer object) const
        {
            g_object_unref(object);
        }
    };

    struct CairoSurfaceDeleter
    {
        void operator()(cairo_surface_t* surface) const
        {
            cairo_surface_destroy(surface);
        }
    };

    struct CairoContextDeleter
    {
        void operator()(cairo_t* cr) const
        {
            cairo_destroy(cr);
        }
    };

    using DocumentPtr     = std::unique_ptr<RsvgHandle, GObjectDeleter>;
    using CairoSurfacePtr = std::unique_ptr<cairo_surface_t, CairoSurfaceDeleter>;
    using CairoContextPtr = std::unique_ptr<cairo_t, CairoContextDeleter>;

    struct DocumentSize
    {
        double width {0.0};
        double height {0.0};
    };

    // Parses with librsvg's default options at 96 DPI. Returns nullptr and the
    // parser's diagnostic in out_error on failure.
    DocumentPtr ParseDocument(const std::uint8_t* data, std::size_t length, std::string& out_error);

    // Resolves width and height to pixels one axis at a time. A missing side
    // follows the viewBox aspect ratio and a percentage is taken of the
    // viewBox. A side that cannot be resolved is 0.
    DocumentSize GetIntrinsicSize(RsvgHandle* document);

    // Computes width * height * 4, failing on overflow.
    bool PixmapByteLength(std::uint32_t width, std::uint32_t height, std::size_t* out_length);

    class Pixmap
    {
    public:
        // Zero-filled RGBA target, or nullptr if it cannot be allocated.
        static std::unique_ptr<Pixmap> Create(std::uint32_t width, std::uint32_t height);

        Pixmap(const Pixmap&)            = delete;
        Pixmap& operator=(const Pixmap&) = delete;

        std::uint32_t width() const { return width_; }
        std::uint32_t height() const { return height_; }
        std::size_t   length() const { return length_; }

        // Draws the document laid out in a viewport of its intrinsic size,
        // scaled by (scaleX, scaleY). No translation or rotation.
        bool Draw(RsvgHandle* document, const DocumentSize& viewport, double scaleX, double scaleY,
                  std::string& out_error);

        // Rewrites the cairo pixels as R, G, B, A bytes and gives up the
        // buffer. Release it with delete[].
        std::uint8_t* TakeRgba();

    private:
        Pixmap(std::unique_ptr<std::uint8_t[]> pixels, std::size_t length, std::uint32_t width,
               std::uint32_t height);

        bool DrawTile(RsvgHandle* document, const DocumentSize& viewport, double scaleX, double scaleY,
                      std::uint32_t x0, std::uint32_t y0, std::uint32_t tileWidth, std::uint32_t tileHeight,
                      int stride, std::string& out_error);

        std::unique_ptr<std::uint8_t[]> pixels_;
        std::size_t                     length_ {0};
        std::uint32_t                   width_ {0};
        std::uint32_t                   height_ {0};
    };

} // namespace svgraster
