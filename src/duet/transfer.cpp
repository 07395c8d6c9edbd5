#include "duet/transfer.hpp"
#include "duet/log.hpp"

#include <utility>
#include <vector>

namespace duet {

    Location target_of(const TransferTask &task) {
        if (task.entry.is_directory() && !task.entry.is_symlink)
            return task.destination_dir;
        return task.destination_dir.child(task.entry.name);
    }

    TransferEngine::TransferEngine(TransferOptions options) : options_(options) {
        if (options_.buffer_size == 0)
            options_.buffer_size = 64 * 1024;
    }

    // =============================================================================================
    // Task dispatch
    // =============================================================================================

    Outcome TransferEngine::execute(const TransferTask &task, const ProgressCallback &progress) {
        Outcome outcome;
        Counters counters;
        Location from = task.source_dir.child(task.entry.name);
        Location to = target_of(task);

        log::debug(action_name(task.action), " ", task.source->display(from), " -> ",
                   task.destination->display(to));

        Status status = ok();
        switch (task.action) {
        case Action::Delete:
            status = delete_tree(*task.source, from, task.entry, counters);
            break;
        case Action::Copy:
            status = check_overlap(task, from, to);
            if (status && !task.source->is_container(task.entry))
                status = check_destination(*task.destination, to, task.entry);
            if (status)
                status = copy_tree(*task.source, from, task.entry, *task.destination, to, counters, progress);
            break;
        case Action::Move:
            status = move(task, from, to, counters, progress);
            break;
        }

        outcome.files = counters.files;
        outcome.bytes = counters.bytes;
        if (!status) {
            log::warn(action_name(task.action), " of ", task.source->display(from), " failed: ",
                      describe(status.error()));
            outcome.failure = status.error();
        }
        return outcome;
    }

    // =============================================================================================
    // Move = copy, then delete the source. Same-provider files try a native rename first.
    // =============================================================================================

    Status TransferEngine::move(const TransferTask &task, const Location &from, const Location &to,
                                Counters &counters, const ProgressCallback &progress) {
        auto checked = check_overlap(task, from, to);
        if (!checked)
            return checked;
        bool container = task.source->is_container(task.entry);
        if (!container) {
            checked = check_destination(*task.destination, to, task.entry);
            if (!checked)
                return checked;
        }

        bool same_provider = task.source->id() == task.destination->id();
        if (same_provider && options_.native_rename && !container &&
            task.destination->supports_rename()) {
            auto renamed = task.destination->rename(from, to);
            if (renamed) {
                counters.files += 1;
                counters.bytes += task.entry.size;
                return renamed;
            }
            auto kind = renamed.error().kind;
            if (kind == ErrorKind::NotFound || kind == ErrorKind::PermissionDenied)
                return renamed;
            log::debug("rename failed (", describe(renamed.error()), "), falling back to copy");
        }

        auto copied = copy_tree(*task.source, from, task.entry, *task.destination, to, counters, progress);
        if (!copied)
            return copied;

        Counters removed;
        auto deleted = delete_tree(*task.source, from, task.entry, removed);
        if (!deleted) {
            return fail(ErrorKind::PartiallyMoved, "copied to " + task.destination->display(to) +
                                                       " but source remains: " + describe(deleted.error()));
        }
        return ok();
    }

    // =============================================================================================
    // Guards
    // =============================================================================================

    Status TransferEngine::check_overlap(const TransferTask &task, const Location &from, const Location &to) {
        if (task.source->id() != task.destination->id())
            return ok();
        if (from == to)
            return fail(ErrorKind::AlreadyExists, "source and destination are the same: " + task.source->display(from));
        if (!task.source->is_container(task.entry))
            return ok();
        if (from.contains(to))
            return fail(ErrorKind::Unsupported,
                        "cannot copy a directory into itself: " + task.source->display(from));
        // Contents land directly under to, so an ancestor destination writes back into the source tree
        if (to.contains(from))
            return fail(ErrorKind::Unsupported,
                        "cannot copy a directory into one of its parents: " + task.source->display(from));
        return ok();
    }

    Status TransferEngine::check_destination(Provider &dst, const Location &to, const Entry &entry) {
        auto existing = dst.stat(to);
        if (!existing) {
            if (existing.error().kind == ErrorKind::NotFound)
                return ok();
            return dp::result::Err(existing.error());
        }
        if (existing.value().kind != entry.kind)
            return fail(ErrorKind::AlreadyExists, "a different kind of entry occupies " + dst.display(to));
        if (!options_.overwrite)
            return fail(ErrorKind::AlreadyExists, dst.display(to));
        return ok();
    }

    // =============================================================================================
    // Copy
    // =============================================================================================

    Status TransferEngine::copy_tree(Provider &src, const Location &from, const Entry &entry, Provider &dst,
                                     const Location &to, Counters &counters, const ProgressCallback &progress) {
        if (!src.is_container(entry))
            return copy_file(src, from, entry, dst, to, counters, progress);

        auto made = dst.make_container(to);
        if (!made)
            return made;

        auto children = src.list(from);
        if (!children)
            return dp::result::Err(children.error());

        for (const auto &child : children.value()) {
            Location child_to = to.child(child.name);
            if (!src.is_container(child) && !options_.overwrite) {
                auto checked = check_destination(dst, child_to, child);
                if (!checked)
                    return checked;
            }
            auto copied = copy_tree(src, from.child(child.name), child, dst, child_to, counters, progress);
            if (!copied)
                return copied;
        }
        return ok();
    }

    Status TransferEngine::copy_file(Provider &src, const Location &from, const Entry &entry, Provider &dst,
                                     const Location &to, Counters &counters, const ProgressCallback &progress) {
        auto reader = src.open_read(from);
        if (!reader)
            return dp::result::Err(reader.error());
        auto writer = dst.open_write(to);
        if (!writer)
            return dp::result::Err(writer.error());

        auto &in = *reader.value();
        auto &out = *writer.value();

        Progress p;
        p.path = dst.display(to);
        p.bytes_total = in.size();

        // Bounded buffer; the file is never held in memory as a whole
        std::vector<char> buffer(options_.buffer_size);
        for (;;) {
            auto n = in.read(buffer.data(), buffer.size());
            if (!n) {
                out.abort();
                return dp::result::Err(n.error());
            }
            if (n.value() == 0)
                break;
            auto written = out.write(buffer.data(), n.value());
            if (!written) {
                out.abort();
                return written;
            }
            p.bytes_done += n.value();
            counters.bytes += n.value();
            if (progress)
                progress(p);
        }

        auto closed = out.close();
        if (!closed)
            return closed;

        counters.files += 1;
        log::trace("copied ", entry.name, " (", p.bytes_done, " bytes)");
        if (progress && p.bytes_done == 0)
            progress(p);
        return ok();
    }

    // =============================================================================================
    // Delete - depth first, files before the containers holding them
    // =============================================================================================

    Status TransferEngine::delete_tree(Provider &provider, const Location &at, const Entry &entry,
                                       Counters &counters) {
        if (!provider.is_container(entry)) {
            auto removed = provider.remove(at);
            if (removed)
                counters.files += 1;
            return removed;
        }

        auto children = provider.list(at);
        if (!children)
            return dp::result::Err(children.error());

        for (const auto &child : children.value()) {
            auto removed = delete_tree(provider, at.child(child.name), child, counters);
            if (!removed)
                return removed;
        }
        return provider.remove_container(at);
    }

} // namespace duet
