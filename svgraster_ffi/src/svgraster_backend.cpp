#include "svgraster_backend.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <new>
#include <utility>

namespace
{

    constexpr double kDocumentDpi = 96.0;
    // Font size librsvg assumes for em/ex on the root element.
    constexpr double kRootFontSize = 12.0;

    struct GErrorDeleter
    {
        void operator()(GError* error) const
        {
            g_error_free(error);
        }
    };

    using GErrorPtr = std::unique_ptr<GError, GErrorDeleter>;

    std::string DescribeError(const GError* error)
    {
        if (error == nullptr || error->message == nullptr)
        {
            return "unknown error";
        }
        return error->message;
    }

    double LengthToPixels(const RsvgLength& length)
    {
        switch (length.unit)
        {
            case RSVG_UNIT_PX:
                return length.length;
            case RSVG_UNIT_IN:
                return length.length * kDocumentDpi;
            case RSVG_UNIT_CM:
                return length.length * kDocumentDpi / 2.54;
            case RSVG_UNIT_MM:
                return length.length * kDocumentDpi / 25.4;
            case RSVG_UNIT_PT:
                return length.length * kDocumentDpi / 72.0;
            case RSVG_UNIT_PC:
                return length.length * kDocumentDpi / 6.0;
            case RSVG_UNIT_EM:
                return length.length * kRootFontSize;
            case RSVG_UNIT_EX:
                return length.length * kRootFontSize / 2.0;
            default:
                return 0.0;
        }
    }

    bool IsPercentage(const RsvgLength& length)
    {
        return length.unit == RSVG_UNIT_PERCENT;
    }

    // librsvg reports an absent width or height as 100%.
    bool IsUnspecified(const RsvgLength& length)
    {
        return IsPercentage(length) && length.length == 1.0;
    }

} // namespace

namespace svgraster
{

    DocumentPtr ParseDocument(const std::uint8_t* data, std::size_t length, std::string& out_error)
    {
        GError*     rawError = nullptr;
        DocumentPtr document(rsvg_handle_new_from_data(data, length, &rawError));
        GErrorPtr   error(rawError);
        if (!document)
        {
            out_error = DescribeError(error.get());
            return nullptr;
        }

        rsvg_handle_set_dpi(document.get(), kDocumentDpi);
        return document;
    }

    DocumentSize GetIntrinsicSize(RsvgHandle* document)
    {
        DocumentSize size;
        if (rsvg_handle_get_intrinsic_size_in_pixels(document, &size.width, &size.height))
        {
            return size;
        }

        gboolean      hasWidth   = FALSE;
        gboolean      hasHeight  = FALSE;
        gboolean      hasViewBox = FALSE;
        RsvgLength    width {};
        RsvgLength    height {};
        RsvgRectangle viewBox {};
        rsvg_handle_get_intrinsic_dimensions(document, &hasWidth, &width, &hasHeight, &height, &hasViewBox,
                                             &viewBox);

        if (!hasViewBox || viewBox.width <= 0.0 || viewBox.height <= 0.0)
        {
            size.width  = IsPercentage(width) ? 0.0 : LengthToPixels(width);
            size.height = IsPercentage(height) ? 0.0 : LengthToPixels(height);
            return size;
        }

        if (!IsPercentage(width))
        {
            size.width  = LengthToPixels(width);
            size.height = IsUnspecified(height) ? size.width * viewBox.height / viewBox.width
                                                : height.length * viewBox.height;
        }
        else if (!IsPercentage(height))
        {
            size.height = LengthToPixels(height);
            size.width  = IsUnspecified(width) ? size.height * viewBox.width / viewBox.height
                                               : width.length * viewBox.width;
        }
        else
        {
            size.width  = width.length * viewBox.width;
            size.height = height.length * viewBox.height;
        }
        return size;
    }

    bool PixmapByteLength(std::uint32_t width, std::uint32_t height, std::size_t* out_length)
    {
        const std::size_t rowBytes = static_cast<std::size_t>(width) * 4;
        if (height != 0 && rowBytes > std::numeric_limits<std::size_t>::max() / height)
        {
            return false;
        }

        *out_length = rowBytes * height;
        return true;
    }

    Pixmap::Pixmap(std::unique_ptr<std::uint8_t[]> pixels, std::size_t length, std::uint32_t width,
                   std::uint32_t height)
        : pixels_(std::move(pixels)), length_(length), width_(width), height_(height)
    {
    }

    std::unique_ptr<Pixmap> Pixmap::Create(std::uint32_t width, std::uint32_t height)
    {
        std::size_t length = 0;
        if (!PixmapByteLength(width, height, &length) || length == 0)
        {
            return nullptr;
        }

        std::unique_ptr<std::uint8_t[]> pixels(new (std::nothrow) std::uint8_t[length]());
        if (!pixels)
        {
            return nullptr;
        }

        return std::unique_ptr<Pixmap>(new (std::nothrow) Pixmap(std::move(pixels), length, width, height));
    }

    bool Pixmap::Draw(RsvgHandle* document, const DocumentSize& viewport, double scaleX, double scaleY,
                      std::string& out_error)
    {
        const std::size_t rowBytes   = static_cast<std::size_t>(width_) * 4;
        const bool        fullStride = rowBytes <= static_cast<std::size_t>(std::numeric_limits<int>::max());
        // Rows too long for a cairo stride are drawn one row per tile.
        const std::uint32_t tileRows = fullStride ? kMaxTileExtent : 1;

        std::uint32_t y0 = 0;
        while (y0 < height_)
        {
            const std::uint32_t tileHeight = std::min(tileRows, height_ - y0);

            std::uint32_t x0 = 0;
            while (x0 < width_)
            {
                const std::uint32_t tileWidth = std::min(kMaxTileExtent, width_ - x0);
                const int           stride    = fullStride ? static_cast<int>(rowBytes)
                                                           : static_cast<int>(tileWidth * 4);
                if (!DrawTile(document, viewport, scaleX, scaleY, x0, y0, tileWidth, tileHeight, stride,
                              out_error))
                {
                    return false;
                }
                x0 += tileWidth;
            }
            y0 += tileHeight;
        }
        return true;
    }

    bool Pixmap::DrawTile(RsvgHandle* document, const DocumentSize& viewport, double scaleX, double scaleY,
                          std::uint32_t x0, std::uint32_t y0, std::uint32_t tileWidth, std::uint32_t tileHeight,
                          int stride, std::string& out_error)
    {
        std::uint8_t* origin = pixels_.get() + static_cast<std::size_t>(y0) * width_ * 4 +
                               static_cast<std::size_t>(x0) * 4;

        CairoSurfacePtr surface(cairo_image_surface_create_for_data(origin, CAIRO_FORMAT_ARGB32,
                                                                    static_cast<int>(tileWidth),
                                                                    static_cast<int>(tileHeight), stride));
        if (cairo_surface_status(surface.get()) != CAIRO_STATUS_SUCCESS)
        {
            out_error = cairo_status_to_string(cairo_surface_status(surface.get()));
            return false;
        }

        CairoContextPtr cr(cairo_create(surface.get()));
        if (cairo_status(cr.get()) != CAIRO_STATUS_SUCCESS)
        {
            out_error = cairo_status_to_string(cairo_status(cr.get()));
            return false;
        }

        cairo_translate(cr.get(), -static_cast<double>(x0), -static_cast<double>(y0));
        cairo_scale(cr.get(), scaleX, scaleY);

        RsvgRectangle area {};
        area.x      = 0.0;
        area.y      = 0.0;
        area.width  = viewport.width;
        area.height = viewport.height;

        GError*        rawError = nullptr;
        const gboolean drawn    = rsvg_handle_render_document(document, cr.get(), &area, &rawError);
        GErrorPtr      error(rawError);
        cairo_surface_flush(surface.get());

        if (!drawn)
        {
            out_error = DescribeError(error.get());
            return false;
        }

        const cairo_status_t status = cairo_status(cr.get());
        if (status != CAIRO_STATUS_SUCCESS)
        {
            out_error = cairo_status_to_string(status);
            return false;
        }
        return true;
    }

    std::uint8_t* Pixmap::TakeRgba()
    {
        // cairo stores premultiplied ARGB as one native-endian 32-bit word.
        std::uint8_t* pixels = pixels_.get();
        for (std::size_t offset = 0; offset + 4 <= length_; offset += 4)
        {
            std::uint32_t argb = 0;
            std::memcpy(&argb, pixels + offset, sizeof(argb));
            pixels[offset + 0] = static_cast<std::uint8_t>((argb >> 16) & 0xff);
            pixels[offset + 1] = static_cast<std::uint8_t>((argb >> 8) & 0xff);
            pixels[offset + 2] = static_cast<std::uint8_t>(argb & 0xff);
            pixels[offset + 3] = static_cast<std::uint8_t>((argb >> 24) & 0xff);
        }

        return pixels_.release();
    }

} // namespace svgraster
