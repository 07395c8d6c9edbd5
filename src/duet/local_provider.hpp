#pragma once

#include "duet/provider.hpp"

#include <filesystem>

namespace duet {

    // =============================================================================================
    // LocalProvider - the hierarchical local filesystem
    // =============================================================================================
    //
    // Locations are the segments of an absolute path; raw keys are absolute path strings.

    class LocalProvider : public Provider {
      public:
        static constexpr const char *ID = "local";

        dp::String id() const override { return ID; }
        dp::String display(const Location &location) const override;
        Location root() const override;

        Result<dp::Vector<Entry>> list(const Location &location) const override;
        Result<Entry> stat(const Location &location) const override;

        Result<std::unique_ptr<ReadStream>> open_read(const Location &location) const override;
        Result<std::unique_ptr<WriteStream>> open_write(const Location &location) override;

        Status remove(const Location &location) override;
        Status make_container(const Location &location) override;
        Status remove_container(const Location &location) override;

        bool supports_rename() const override { return true; }
        Status rename(const Location &from, const Location &to) override;

        // Conversions between absolute paths and locations of this provider
        static std::filesystem::path to_path(const Location &location);
        static Location locate(const std::filesystem::path &path);
    };

} // namespace duet
