#pragma once

#include <cstddef>
#include <cstdint>

#if defined(_WIN32)
#if defined(SVGRASTER_FFI_IMPLEMENTATION)
#define SVGRASTER_FFI_EXPORT __declspec(dllexport)
#else
#define SVGRASTER_FFI_EXPORT __declspec(dllimport)
#endif
#else
#define SVGRASTER_FFI_EXPORT __attribute__((visibility("default")))
#endif

extern "C"
{

    enum class svgraster_error_kind_t : std::int32_t
    {
        none               = 0,
        invalid_arguments  = 1,
        parse_error        = 2,
        allocation_failure = 3,
        internal_error     = 4,
    };

    // Row-major RGBA8 (premultiplied), width * 4 bytes per row, no padding.
    // data == nullptr marks a failed call; all other fields are then zero.
    // A non-empty image belongs to the caller and must be passed to
    // svgraster_image_free exactly once.
    struct svgraster_image_t
    {
        std::uint8_t* data;
        std::size_t   length;
        std::uint32_t width;
        std::uint32_t height;
    };

    // svg_data is borrowed for the duration of the call only.
    SVGRASTER_FFI_EXPORT svgraster_image_t svgraster_render(const std::uint8_t* svg_data, std::size_t svg_length,
                                                            std::uint32_t width, std::uint32_t height);

    SVGRASTER_FFI_EXPORT svgraster_image_t svgraster_render_scaled(const std::uint8_t* svg_data,
                                                                   std::size_t svg_length, float scale);

    SVGRASTER_FFI_EXPORT void svgraster_image_free(svgraster_image_t image);

    SVGRASTER_FFI_EXPORT svgraster_error_kind_t svgraster_get_document_size(const std::uint8_t* svg_data,
                                                                            std::size_t         svg_length,
                                                                            double*             out_width,
                                                                            double*             out_height);

    // Valid until the next svgraster_* call on the calling thread.
    SVGRASTER_FFI_EXPORT const char* svgraster_get_last_error();

    SVGRASTER_FFI_EXPORT std::size_t svgraster_copy_last_error(char* buffer, std::size_t buffer_length);

    SVGRASTER_FFI_EXPORT svgraster_error_kind_t svgraster_get_last_error_kind();

    SVGRASTER_FFI_EXPORT void svgraster_clear_last_error();

    SVGRASTER_FFI_EXPORT svgraster_error_kind_t svgraster_run_self_test();

} // extern "C"

static_assert(sizeof(svgraster_error_kind_t) == 4, "Error kind size mismatch");
static_assert(sizeof(void*) != 8 || sizeof(svgraster_image_t) == 24, "Image handle size mismatch");
