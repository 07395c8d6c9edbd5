#include "duet/error.hpp"

namespace duet {

    const char *kind_name(ErrorKind k) {
        switch (k) {
        case ErrorKind::NotFound:
            return "not found";
        case ErrorKind::PermissionDenied:
            return "permission denied";
        case ErrorKind::AlreadyExists:
            return "already exists";
        case ErrorKind::QuotaOrNetwork:
            return "quota or network error";
        case ErrorKind::PartiallyMoved:
            return "partially moved";
        case ErrorKind::Unsupported:
            return "unsupported";
        case ErrorKind::Io:
            return "i/o error";
        default:
            return "error";
        }
    }

    dp::String describe(const Error &e) {
        dp::String out = kind_name(e.kind);
        if (!e.message.empty()) {
            out += ": ";
            out += e.message;
        }
        return out;
    }

    ErrorKind kind_from_code(const std::error_code &ec) {
        if (ec == std::errc::no_such_file_or_directory)
            return ErrorKind::NotFound;
        if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted ||
            ec == std::errc::read_only_file_system)
            return ErrorKind::PermissionDenied;
        if (ec == std::errc::file_exists || ec == std::errc::is_a_directory)
            return ErrorKind::AlreadyExists;
        if (ec == std::errc::no_space_on_device || ec == std::errc::file_too_large)
            return ErrorKind::QuotaOrNetwork;
        if (ec == std::errc::not_a_directory || ec == std::errc::directory_not_empty ||
            ec == std::errc::cross_device_link)
            return ErrorKind::Unsupported;
        return ErrorKind::Io;
    }

    Error from_code(const std::error_code &ec, const dp::String &what) {
        dp::String msg = what;
        msg += " (";
        msg += ec.message().c_str();
        msg += ")";
        return make_error(kind_from_code(ec), msg);
    }

    Error from_filesystem_error(const std::filesystem::filesystem_error &ex) {
        return from_code(ex.code(), dp::String(ex.path1().string().c_str()));
    }

} // namespace duet
