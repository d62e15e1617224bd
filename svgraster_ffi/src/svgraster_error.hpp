#pragma once

#include <exception>
#include <new>
#include <string>

#include "svgraster_ffi.h"

namespace svgraster
{

    constexpr const char* kInvalidArgs       = "invalid args";
    constexpr const char* kAllocPixmapFailed = "alloc pixmap failed";
    constexpr const char* kParseErrorPrefix  = "parse error: ";

    // Per-thread error slot behind the svgraster_*_last_error accessors.
    // The kind is none exactly when no message is stored. Never throws.
    void SetLastError(svgraster_error_kind_t kind, const char* message);
    void SetLastError(svgraster_error_kind_t kind, const std::string& message);
    void ClearLastError();
    bool HasLastError();
    svgraster_error_kind_t LastErrorKind();
    const std::string&     LastErrorMessage();

    // Runs body, turning any exception into an error slot entry so nothing
    // escapes through an extern "C" function. Returns false if body threw.
    template <typename Body>
    bool RunGuarded(Body&& body)
    {
        try
        {
            body();
            return true;
        }
        catch (const std::bad_alloc&)
        {
            SetLastError(svgraster_error_kind_t::allocation_failure, kAllocPixmapFailed);
        }
        catch (const std::exception& e)
        {
            SetLastError(svgraster_error_kind_t::internal_error, e.what());
        }
        return false;
    }

} // namespace svgraster
