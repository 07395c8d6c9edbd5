#pragma once

#include <datapod/datapod.hpp>

#include <filesystem>
#include <system_error>

namespace duet {

    // =============================================================================================
    // Error kinds - every provider / engine failure is reported as one of these
    // =============================================================================================

    enum class ErrorKind : dp::u8 {
        NotFound,
        PermissionDenied,
        AlreadyExists,
        QuotaOrNetwork,
        PartiallyMoved,
        Unsupported,
        Io,
    };

    struct Error {
        ErrorKind kind{};
        dp::String message;
    };

    template <typename T> using Result = dp::Result<T, Error>;

    // Operations with nothing to return yield Ok(true)
    using Status = dp::Result<bool, Error>;

    const char *kind_name(ErrorKind k);

    // "not found: /tmp/x"
    dp::String describe(const Error &e);

    inline Error make_error(ErrorKind k, const dp::String &message) { return Error{k, message}; }

    inline Status ok() { return dp::result::Ok(true); }

    inline Status fail(ErrorKind k, const dp::String &message) { return dp::result::Err(make_error(k, message)); }

    // Maps std::error_code values from <filesystem> onto ErrorKind
    ErrorKind kind_from_code(const std::error_code &ec);

    Error from_code(const std::error_code &ec, const dp::String &what);

    Error from_filesystem_error(const std::filesystem::filesystem_error &ex);

} // namespace duet
