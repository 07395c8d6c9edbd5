#pragma once

#include "duet/entry.hpp"
#include "duet/error.hpp"
#include "duet/location.hpp"

#include <datapod/datapod.hpp>

#include <memory>

namespace duet {

    // =============================================================================================
    // Byte streams handed out by providers; each one is exclusively owned by its reader/writer
    // =============================================================================================

    class ReadStream {
      public:
        virtual ~ReadStream() = default;

        // Fills at most cap bytes into buf. Ok(0) signals end-of-stream.
        virtual Result<dp::usize> read(char *buf, dp::usize cap) = 0;

        // Total size when known up front
        virtual dp::u64 size() const = 0;
    };

    class WriteStream {
      public:
        virtual ~WriteStream() = default;

        virtual Status write(const char *buf, dp::usize len) = 0;

        // Commits the data; the target is not guaranteed to exist before this returns Ok
        virtual Status close() = 0;

        // Discards whatever was written. Implementations call this from their destructor when
        // the stream was never closed.
        virtual void abort() = 0;
    };

    // =============================================================================================
    // Provider - uniform list/read/write/delete access to one storage backend
    // =============================================================================================
    //
    // Every operation works on a single entity. Recursion over containers belongs to the
    // TransferEngine. Implementations must tolerate concurrent list/stat/open_read calls.

    class Provider {
      public:
        virtual ~Provider() = default;

        // Stamped on every Location this provider hands out
        virtual dp::String id() const = 0;

        // Human readable name for headers ("/home/me", "bucket:photos")
        virtual dp::String display(const Location &location) const = 0;

        virtual Location root() const = 0;

        virtual Result<dp::Vector<Entry>> list(const Location &location) const = 0;
        virtual Result<Entry> stat(const Location &location) const = 0;

        virtual Result<std::unique_ptr<ReadStream>> open_read(const Location &location) const = 0;
        virtual Result<std::unique_ptr<WriteStream>> open_write(const Location &location) = 0;

        // Removes one file / object. Containers are rejected with Unsupported.
        virtual Status remove(const Location &location) = 0;

        // Directory creation; backends with implicit containers succeed without doing anything
        virtual Status make_container(const Location &location) = 0;

        // Removes an already emptied container
        virtual Status remove_container(const Location &location) = 0;

        virtual bool supports_rename() const { return false; }

        virtual Status rename(const Location &from, const Location &to) {
            (void)to;
            return fail(ErrorKind::Unsupported, "rename is not supported for " + display(from));
        }

        // Entries the engine recurses into. A symlink is never one, whatever it points at.
        bool is_container(const Entry &entry) const { return entry.kind == EntryKind::Directory && !entry.is_symlink; }
    };

} // namespace duet
