#include "svgraster_error.hpp"

namespace
{

    thread_local std::string            g_lastError;
    thread_local svgraster_error_kind_t g_lastErrorKind = svgraster_error_kind_t::none;

} // namespace

namespace svgraster
{

    void SetLastError(svgraster_error_kind_t kind, const char* message)
    {
        g_lastErrorKind = kind;
        try
        {
            g_lastError = message ? message : "";
        }
        catch (const std::bad_alloc&)
        {
            // Keep the kind even when the text cannot be stored.
            g_lastError.clear();
        }
    }

    void SetLastError(svgraster_error_kind_t kind, const std::string& message)
    {
        SetLastError(kind, message.c_str());
    }

    void ClearLastError()
    {
        g_lastError.clear();
        g_lastErrorKind = svgraster_error_kind_t::none;
    }

    bool HasLastError()
    {
        return g_lastErrorKind != svgraster_error_kind_t::none;
    }

    svgraster_error_kind_t LastErrorKind()
    {
        return g_lastErrorKind;
    }

    const std::string& LastErrorMessage()
    {
        return g_lastError;
    }

} // namespace svgraster
