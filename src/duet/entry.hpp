#pragma once

#include <datapod/datapod.hpp>

#include <ctime>

namespace duet {

    enum class EntryKind : dp::u8 { File, Directory };

    // =============================================================================================
    // Entry - one listable item of a provider
    // =============================================================================================

    struct Entry {
        dp::String name;    // last path segment
        EntryKind kind{};
        dp::u64 size{};     // files only
        dp::String raw_key; // absolute path (local) or full object key; opaque outside the provider
        std::time_t mtime{};
        bool is_symlink{};  // kind describes the link target; the link itself is a leaf

        bool is_directory() const { return kind == EntryKind::Directory; }
    };

    // Directories first, then files; byte-wise by name inside each group
    inline bool listing_order(const Entry &a, const Entry &b) {
        if (a.kind != b.kind)
            return a.kind == EntryKind::Directory;
        return a.name < b.name;
    }

} // namespace duet
