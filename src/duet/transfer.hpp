#pragma once

#include "duet/action.hpp"
#include "duet/provider.hpp"

#include <datapod/datapod.hpp>

#include <functional>
#include <memory>

namespace duet {

    // =============================================================================================
    // TransferTask / Outcome
    // =============================================================================================

    struct TransferTask {
        Action action{};
        std::shared_ptr<Provider> source;
        Location source_dir; // where entry lives
        Entry entry;
        std::shared_ptr<Provider> destination;
        Location destination_dir; // other pane's location
    };

    // Where a task writes: destination_dir/name for a file. A container's descendants are mirrored
    // relative to the container directly under destination_dir.
    Location target_of(const TransferTask &task);

    struct Outcome {
        dp::Optional<Error> failure; // empty on success
        dp::u64 files{};             // files written or removed
        dp::u64 bytes{};             // bytes streamed

        bool succeeded() const { return !failure.has_value(); }
    };

    struct Progress {
        dp::String path; // display name of the file being streamed
        dp::u64 bytes_done{};
        dp::u64 bytes_total{};
    };

    using ProgressCallback = std::function<void(const Progress &)>;

    struct TransferOptions {
        dp::usize buffer_size = 64 * 1024;
        bool overwrite = true;     // false: an existing destination fails with AlreadyExists
        bool native_rename = true; // same-provider moves try Provider::rename first
    };

    // =============================================================================================
    // TransferEngine - executes one task: recursion, streaming, move/delete semantics
    // =============================================================================================

    class TransferEngine {
      public:
        explicit TransferEngine(TransferOptions options = {});

        const TransferOptions &options() const { return options_; }

        // Never throws; every provider error ends up in Outcome::failure
        Outcome execute(const TransferTask &task, const ProgressCallback &progress = nullptr);

      private:
        struct Counters {
            dp::u64 files = 0;
            dp::u64 bytes = 0;
        };

        Status copy_tree(Provider &src, const Location &from, const Entry &entry, Provider &dst, const Location &to,
                         Counters &counters, const ProgressCallback &progress);
        Status copy_file(Provider &src, const Location &from, const Entry &entry, Provider &dst, const Location &to,
                         Counters &counters, const ProgressCallback &progress);
        Status delete_tree(Provider &provider, const Location &at, const Entry &entry, Counters &counters);

        Status move(const TransferTask &task, const Location &from, const Location &to, Counters &counters,
                    const ProgressCallback &progress);
        Status check_destination(Provider &dst, const Location &to, const Entry &entry);
        Status check_overlap(const TransferTask &task, const Location &from, const Location &to);

        TransferOptions options_;
    };

} // namespace duet
