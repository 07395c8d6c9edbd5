#include "duet/object_store_provider.hpp"
#include "duet/log.hpp"

#include <algorithm>
#include <map>
#include <utility>

namespace duet {

    namespace {

        // =========================================================================================
        // Streams - ranged GETs for reads, one multipart upload per write
        // =========================================================================================

        // Keys like "a//b" or "/a" have an empty path segment and no location reaches them
        bool has_empty_segment(const dp::String &rest) {
            if (!rest.empty() && rest[0] == '/')
                return true;
            for (dp::usize i = 1; i < rest.size(); ++i)
                if (rest[i] == '/' && rest[i - 1] == '/')
                    return true;
            return false;
        }

        class ObjectReadStream : public ReadStream {
          public:
            ObjectReadStream(std::shared_ptr<ObjectStoreClient> client, dp::String key, dp::u64 size)
                : client_(std::move(client)), key_(std::move(key)), size_(size) {}

            Result<dp::usize> read(char *buf, dp::usize cap) override {
                if (offset_ >= size_)
                    return dp::result::Ok(dp::usize{0});
                auto n = client_->get_object_range(key_, offset_, buf, cap);
                if (!n)
                    return n;
                offset_ += n.value();
                return n;
            }

            dp::u64 size() const override { return size_; }

          private:
            std::shared_ptr<ObjectStoreClient> client_;
            dp::String key_;
            dp::u64 size_;
            dp::u64 offset_ = 0;
        };

        class ObjectWriteStream : public WriteStream {
          public:
            ObjectWriteStream(std::shared_ptr<ObjectStoreClient> client, dp::String upload_id, dp::String key)
                : client_(std::move(client)), upload_id_(std::move(upload_id)), key_(std::move(key)) {}

            ~ObjectWriteStream() override {
                if (!finished_)
                    abort();
            }

            Status write(const char *buf, dp::usize len) override {
                if (finished_)
                    return fail(ErrorKind::Io, "upload already finished: " + key_);
                return client_->upload_part(upload_id_, buf, len);
            }

            Status close() override {
                if (finished_)
                    return fail(ErrorKind::Io, "upload already finished: " + key_);
                finished_ = true;
                auto done = client_->complete_upload(upload_id_);
                if (!done)
                    log::warn("upload of ", key_, " failed: ", describe(done.error()));
                return done;
            }

            void abort() override {
                if (finished_)
                    return;
                finished_ = true;
                auto aborted = client_->abort_upload(upload_id_);
                if (!aborted)
                    log::warn("abort of upload ", upload_id_, " failed: ", describe(aborted.error()));
            }

          private:
            std::shared_ptr<ObjectStoreClient> client_;
            dp::String upload_id_;
            dp::String key_;
            bool finished_ = false;
        };

        bool is_not_found(const Error &e) { return e.kind == ErrorKind::NotFound; }

    } // namespace

    ObjectStoreProvider::ObjectStoreProvider(std::shared_ptr<ObjectStoreClient> client) : client_(std::move(client)) {}

    dp::String ObjectStoreProvider::id() const { return "bucket:" + client_->bucket(); }

    dp::String ObjectStoreProvider::display(const Location &location) const {
        return "bucket:" + client_->bucket() + "/" + prefix_of(location);
    }

    Location ObjectStoreProvider::root() const { return Location(id(), {}); }

    dp::String ObjectStoreProvider::key_of(const Location &location) { return location.join('/'); }

    dp::String ObjectStoreProvider::prefix_of(const Location &location) {
        if (location.is_root())
            return "";
        return location.join('/') + "/";
    }

    Result<bool> ObjectStoreProvider::has_children(const dp::String &prefix) const {
        auto objects = client_->list_objects(prefix);
        if (!objects)
            return dp::result::Err(objects.error());
        return dp::result::Ok(!objects.value().empty());
    }

    // =============================================================================================
    // Listing - synthesize pseudo-directories from the next path segment of each key
    // =============================================================================================

    Result<dp::Vector<Entry>> ObjectStoreProvider::list(const Location &location) const {
        dp::String prefix = prefix_of(location);
        auto objects = client_->list_objects(prefix);
        if (!objects)
            return dp::result::Err(objects.error());

        if (objects.value().empty() && !location.is_root()) {
            auto head = client_->head_object(key_of(location));
            if (head)
                return dp::result::Err(make_error(ErrorKind::Unsupported, "not a directory: " + display(location)));
            return dp::result::Ok(dp::Vector<Entry>{});
        }

        dp::Vector<Entry> out;
        std::map<dp::String, Entry> dirs;
        for (const auto &obj : objects.value()) {
            dp::String rest = obj.key.substr(prefix.size());
            if (rest.empty())
                continue; // marker object of this directory
            if (has_empty_segment(rest)) {
                log::debug("skipping unaddressable key ", obj.key);
                continue;
            }
            auto slash = rest.find('/');
            if (slash == dp::String::npos) {
                Entry e;
                e.name = rest;
                e.kind = EntryKind::File;
                e.size = obj.size;
                e.raw_key = obj.key;
                e.mtime = obj.mtime;
                out.push_back(std::move(e));
                continue;
            }
            dp::String name = rest.substr(0, slash);
            auto it = dirs.find(name);
            if (it == dirs.end()) {
                Entry e;
                e.name = name;
                e.kind = EntryKind::Directory;
                e.raw_key = prefix + name + "/";
                e.mtime = obj.mtime;
                dirs.emplace(name, std::move(e));
            } else if (obj.mtime > it->second.mtime) {
                it->second.mtime = obj.mtime;
            }
        }
        for (auto &kv : dirs)
            out.push_back(std::move(kv.second));

        std::sort(out.begin(), out.end(), listing_order);
        return dp::result::Ok(std::move(out));
    }

    Result<Entry> ObjectStoreProvider::stat(const Location &location) const {
        if (location.is_root()) {
            Entry e;
            e.kind = EntryKind::Directory;
            return dp::result::Ok(std::move(e));
        }

        dp::String key = key_of(location);
        auto head = client_->head_object(key);
        if (head) {
            Entry e;
            e.name = location.name();
            e.kind = EntryKind::File;
            e.size = head.value().size;
            e.raw_key = key;
            e.mtime = head.value().mtime;
            return dp::result::Ok(std::move(e));
        }
        if (!is_not_found(head.error()))
            return dp::result::Err(head.error());

        auto children = has_children(prefix_of(location));
        if (!children)
            return dp::result::Err(children.error());
        if (!children.value())
            return dp::result::Err(make_error(ErrorKind::NotFound, display(location)));

        Entry e;
        e.name = location.name();
        e.kind = EntryKind::Directory;
        e.raw_key = prefix_of(location);
        return dp::result::Ok(std::move(e));
    }

    // =============================================================================================
    // Streams
    // =============================================================================================

    Result<std::unique_ptr<ReadStream>> ObjectStoreProvider::open_read(const Location &location) const {
        auto entry = stat(location);
        if (!entry)
            return dp::result::Err(entry.error());
        if (entry.value().is_directory())
            return dp::result::Err(make_error(ErrorKind::Unsupported, "cannot read a directory: " + display(location)));

        std::unique_ptr<ReadStream> stream =
            std::make_unique<ObjectReadStream>(client_, key_of(location), entry.value().size);
        return dp::result::Ok(std::move(stream));
    }

    Result<std::unique_ptr<WriteStream>> ObjectStoreProvider::open_write(const Location &location) {
        if (location.is_root())
            return dp::result::Err(make_error(ErrorKind::Unsupported, "cannot write the bucket root"));

        auto children = has_children(prefix_of(location));
        if (!children)
            return dp::result::Err(children.error());
        if (children.value())
            return dp::result::Err(
                make_error(ErrorKind::AlreadyExists, "a directory occupies " + display(location)));

        dp::String key = key_of(location);
        auto upload = client_->create_upload(key);
        if (!upload)
            return dp::result::Err(upload.error());

        std::unique_ptr<WriteStream> stream = std::make_unique<ObjectWriteStream>(client_, upload.value(), key);
        return dp::result::Ok(std::move(stream));
    }

    // =============================================================================================
    // Mutations
    // =============================================================================================

    Status ObjectStoreProvider::remove(const Location &location) {
        if (location.is_root())
            return fail(ErrorKind::Unsupported, "cannot remove the bucket root");

        dp::String key = key_of(location);
        auto head = client_->head_object(key);
        if (!head) {
            if (!is_not_found(head.error()))
                return dp::result::Err(head.error());
            auto children = has_children(prefix_of(location));
            if (children && children.value())
                return fail(ErrorKind::Unsupported,
                            "directories are removed with remove_container: " + display(location));
            return dp::result::Err(head.error());
        }
        return client_->delete_object(key);
    }

    Status ObjectStoreProvider::make_container(const Location &location) {
        if (location.is_root())
            return ok();
        auto head = client_->head_object(key_of(location));
        if (head)
            return fail(ErrorKind::AlreadyExists, "an object occupies " + display(location));
        if (!is_not_found(head.error()))
            return dp::result::Err(head.error());
        // Prefixes exist implicitly
        return ok();
    }

    Status ObjectStoreProvider::remove_container(const Location &location) {
        if (location.is_root())
            return fail(ErrorKind::Unsupported, "cannot remove the bucket root");

        dp::String prefix = prefix_of(location);
        auto marker = client_->head_object(prefix);
        if (marker) {
            auto removed = client_->delete_object(prefix);
            if (!removed)
                return removed;
        } else if (!is_not_found(marker.error())) {
            return dp::result::Err(marker.error());
        }

        auto children = has_children(prefix);
        if (!children)
            return dp::result::Err(children.error());
        if (children.value())
            return fail(ErrorKind::Unsupported, "directory is not empty: " + display(location));
        return ok();
    }

} // namespace duet
