#define SVGRASTER_FFI_IMPLEMENTATION
#include "svgraster_ffi.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <string>

#include <spdlog/spdlog.h>

#include "svgraster_backend.hpp"
#include "svgraster_error.hpp"
#include "svgraster_log.hpp"

namespace
{

    using svgraster::SetLastError;

    svgraster_image_t EmptyImage()
    {
        return svgraster_image_t {nullptr, 0, 0, 0};
    }

    svgraster_image_t FailImage(svgraster_error_kind_t kind, const char* message)
    {
        SetLastError(kind, message);
        return EmptyImage();
    }

    bool ValidateSvgInput(const std::uint8_t* svg_data, std::size_t svg_length)
    {
        return svg_data != nullptr && svg_length > 0;
    }

    svgraster::DocumentPtr ParseOrFail(const std::uint8_t* svg_data, std::size_t svg_length)
    {
        std::string            diagnostic;
        svgraster::DocumentPtr document = svgraster::ParseDocument(svg_data, svg_length, diagnostic);
        if (!document)
        {
            svgraster::Log()->debug("parse failed for {} byte document: {}", svg_length, diagnostic);
            SetLastError(svgraster_error_kind_t::parse_error, svgraster::kParseErrorPrefix + diagnostic);
        }
        return document;
    }

    // Zero intrinsic extents are treated as 1 so the scale stays finite.
    double FlooredExtent(double extent)
    {
        return std::max(extent, 1.0);
    }

    bool ScaledExtent(double extent, float scale, std::uint32_t* out_extent)
    {
        const double scaled = std::trunc(extent * static_cast<double>(scale));
        if (!(scaled <= static_cast<double>(std::numeric_limits<std::uint32_t>::max())))
        {
            return false;
        }
        *out_extent = std::max<std::uint32_t>(1, static_cast<std::uint32_t>(std::max(scaled, 0.0)));
        return true;
    }

    svgraster_image_t RenderDocument(RsvgHandle* document, std::uint32_t width, std::uint32_t height)
    {
        auto pixmap = svgraster::Pixmap::Create(width, height);
        if (!pixmap)
        {
            svgraster::Log()->debug("cannot allocate {}x{} pixmap", width, height);
            return FailImage(svgraster_error_kind_t::allocation_failure, svgraster::kAllocPixmapFailed);
        }

        const svgraster::DocumentSize intrinsic = svgraster::GetIntrinsicSize(document);
        svgraster::DocumentSize       viewport;
        viewport.width  = FlooredExtent(intrinsic.width);
        viewport.height = FlooredExtent(intrinsic.height);

        const double scaleX = static_cast<double>(width) / viewport.width;
        const double scaleY = static_cast<double>(height) / viewport.height;
        svgraster::Log()->debug("rendering {}x{} document into {}x{}, scale ({}, {})", intrinsic.width,
                                intrinsic.height, width, height, scaleX, scaleY);

        std::string diagnostic;
        if (!pixmap->Draw(document, viewport, scaleX, scaleY, diagnostic))
        {
            svgraster::Log()->warn("renderer reported a draw failure: {}", diagnostic);
        }

        svgraster_image_t image {};
        image.length = pixmap->length();
        image.width  = pixmap->width();
        image.height = pixmap->height();
        image.data   = pixmap->TakeRgba();
        return image;
    }

} // namespace

extern "C"
{

    svgraster_image_t svgraster_render(const std::uint8_t* svg_data, std::size_t svg_length, std::uint32_t width,
                                       std::uint32_t height)
    {
        svgraster::ClearLastError();

        if (!ValidateSvgInput(svg_data, svg_length) || width == 0 || height == 0)
        {
            return FailImage(svgraster_error_kind_t::invalid_arguments, svgraster::kInvalidArgs);
        }

        svgraster_image_t image = EmptyImage();
        const bool        ran   = svgraster::RunGuarded(
            [&]()
            {
                svgraster::DocumentPtr document = ParseOrFail(svg_data, svg_length);
                if (document)
                {
                    image = RenderDocument(document.get(), width, height);
                }
            });
        return ran ? image : EmptyImage();
    }

    svgraster_image_t svgraster_render_scaled(const std::uint8_t* svg_data, std::size_t svg_length, float scale)
    {
        svgraster::ClearLastError();

        if (!ValidateSvgInput(svg_data, svg_length) || !std::isfinite(scale) || scale <= 0.0f)
        {
            return FailImage(svgraster_error_kind_t::invalid_arguments, svgraster::kInvalidArgs);
        }

        svgraster_image_t image = EmptyImage();
        const bool        ran   = svgraster::RunGuarded(
            [&]()
            {
                svgraster::DocumentPtr document = ParseOrFail(svg_data, svg_length);
                if (!document)
                {
                    return;
                }

                const svgraster::DocumentSize intrinsic = svgraster::GetIntrinsicSize(document.get());
                std::uint32_t                 width     = 0;
                std::uint32_t                 height    = 0;
                if (!ScaledExtent(intrinsic.width, scale, &width) || !ScaledExtent(intrinsic.height, scale, &height))
                {
                    image = FailImage(svgraster_error_kind_t::allocation_failure, svgraster::kAllocPixmapFailed);
                    return;
                }
                image = RenderDocument(document.get(), width, height);
            });
        return ran ? image : EmptyImage();
    }

    void svgraster_image_free(svgraster_image_t image)
    {
        if (image.data != nullptr && image.length > 0)
        {
            delete[] image.data;
        }
    }

    svgraster_error_kind_t svgraster_get_document_size(const std::uint8_t* svg_data, std::size_t svg_length,
                                                       double* out_width, double* out_height)
    {
        svgraster::ClearLastError();

        if (!ValidateSvgInput(svg_data, svg_length) || out_width == nullptr || out_height == nullptr)
        {
            SetLastError(svgraster_error_kind_t::invalid_arguments, svgraster::kInvalidArgs);
            return svgraster_error_kind_t::invalid_arguments;
        }

        svgraster::RunGuarded(
            [&]()
            {
                svgraster::DocumentPtr document = ParseOrFail(svg_data, svg_length);
                if (!document)
                {
                    return;
                }

                const svgraster::DocumentSize size = svgraster::GetIntrinsicSize(document.get());
                *out_width                         = size.width;
                *out_height                        = size.height;
            });
        return svgraster::LastErrorKind();
    }

    const char* svgraster_get_last_error()
    {
        return svgraster::HasLastError() ? svgraster::LastErrorMessage().c_str() : nullptr;
    }

    std::size_t svgraster_copy_last_error(char* buffer, std::size_t buffer_length)
    {
        if (buffer == nullptr || buffer_length == 0 || !svgraster::HasLastError())
        {
            return 0;
        }

        const std::string& message = svgraster::LastErrorMessage();
        const std::size_t  to_copy = std::min(message.size(), buffer_length - 1);
        std::memcpy(buffer, message.data(), to_copy);
        buffer[to_copy] = '\0';
        return to_copy;
    }

    svgraster_error_kind_t svgraster_get_last_error_kind()
    {
        return svgraster::LastErrorKind();
    }

    void svgraster_clear_last_error()
    {
        svgraster::ClearLastError();
    }

    svgraster_error_kind_t svgraster_run_self_test()
    {
        static constexpr char kSquare[] = "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"10\" height=\"10\">"
                                          "<rect width=\"10\" height=\"10\" fill=\"#ff0000\"/></svg>";

        const svgraster_image_t image =
            svgraster_render(reinterpret_cast<const std::uint8_t*>(kSquare), sizeof(kSquare) - 1, 20, 20);
        if (image.data == nullptr)
        {
            return svgraster::LastErrorKind();
        }

        const std::size_t   centre = (static_cast<std::size_t>(10) * image.width + 10) * 4;
        const std::uint8_t* pixel  = image.data + centre;
        const bool          valid  = image.width == 20 && image.height == 20 && image.length == 1600u &&
                            pixel[0] == 0xff && pixel[1] == 0 && pixel[3] == 0xff;
        svgraster_image_free(image);

        if (!valid)
        {
            SetLastError(svgraster_error_kind_t::internal_error, "self test failed: unexpected raster contents");
            return svgraster_error_kind_t::internal_error;
        }
        return svgraster_error_kind_t::none;
    }

} // extern "C"
