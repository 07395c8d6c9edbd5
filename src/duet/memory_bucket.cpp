#include "duet/memory_bucket.hpp"
#include "duet/log.hpp"

#include <algorithm>
#include <cstring>
#include <mutex>
#include <string>
#include <utility>

namespace duet {

    MemoryBucket::MemoryBucket(dp::String name, dp::u64 quota_bytes) : name_(std::move(name)), quota_(quota_bytes) {}

    Result<dp::Vector<ObjectInfo>> MemoryBucket::list_objects(const dp::String &prefix) const {
        std::shared_lock lock(mutex_);
        dp::Vector<ObjectInfo> out;
        for (auto it = objects_.lower_bound(prefix); it != objects_.end(); ++it) {
            if (!has_prefix(it->first, prefix))
                break;
            out.push_back(ObjectInfo{it->first, static_cast<dp::u64>(it->second.data.size()), it->second.mtime});
        }
        return dp::result::Ok(std::move(out));
    }

    Result<ObjectInfo> MemoryBucket::head_object(const dp::String &key) const {
        std::shared_lock lock(mutex_);
        auto it = objects_.find(key);
        if (it == objects_.end())
            return dp::result::Err(make_error(ErrorKind::NotFound, name_ + "/" + key));
        return dp::result::Ok(ObjectInfo{it->first, static_cast<dp::u64>(it->second.data.size()), it->second.mtime});
    }

    Result<dp::usize> MemoryBucket::get_object_range(const dp::String &key, dp::u64 offset, char *buf,
                                                     dp::usize len) const {
        std::shared_lock lock(mutex_);
        auto it = objects_.find(key);
        if (it == objects_.end())
            return dp::result::Err(make_error(ErrorKind::NotFound, name_ + "/" + key));
        const auto &data = it->second.data;
        if (offset >= data.size())
            return dp::result::Ok(dp::usize{0});
        dp::usize n = std::min<dp::usize>(len, static_cast<dp::usize>(data.size() - offset));
        std::memcpy(buf, data.data() + offset, n);
        return dp::result::Ok(n);
    }

    Result<dp::String> MemoryBucket::create_upload(const dp::String &key) {
        std::unique_lock lock(mutex_);
        dp::String id = dp::String("upload-") + std::to_string(next_upload_++).c_str();
        uploads_[id] = Upload{key, {}};
        return dp::result::Ok(id);
    }

    Status MemoryBucket::upload_part(const dp::String &upload_id, const char *data, dp::usize len) {
        std::unique_lock lock(mutex_);
        auto it = uploads_.find(upload_id);
        if (it == uploads_.end())
            return fail(ErrorKind::NotFound, "no such upload " + upload_id);
        if (quota_ > 0 && used_ + staged_ + len > quota_)
            return fail(ErrorKind::QuotaOrNetwork, "bucket " + name_ + " is over quota");
        it->second.data.insert(it->second.data.end(), data, data + len);
        staged_ += len;
        return ok();
    }

    Status MemoryBucket::complete_upload(const dp::String &upload_id) {
        std::unique_lock lock(mutex_);
        auto it = uploads_.find(upload_id);
        if (it == uploads_.end())
            return fail(ErrorKind::NotFound, "no such upload " + upload_id);

        Upload upload = std::move(it->second);
        uploads_.erase(it);
        staged_ -= upload.data.size();

        auto existing = objects_.find(upload.key);
        if (existing != objects_.end())
            used_ -= existing->second.data.size();
        used_ += upload.data.size();

        Object obj;
        obj.data = std::move(upload.data);
        obj.mtime = std::time(nullptr);
        objects_[upload.key] = std::move(obj);
        return ok();
    }

    Status MemoryBucket::abort_upload(const dp::String &upload_id) {
        std::unique_lock lock(mutex_);
        auto it = uploads_.find(upload_id);
        if (it == uploads_.end())
            return fail(ErrorKind::NotFound, "no such upload " + upload_id);
        staged_ -= it->second.data.size();
        uploads_.erase(it);
        return ok();
    }

    Status MemoryBucket::delete_object(const dp::String &key) {
        std::unique_lock lock(mutex_);
        auto it = objects_.find(key);
        if (it == objects_.end())
            return fail(ErrorKind::NotFound, name_ + "/" + key);
        used_ -= it->second.data.size();
        objects_.erase(it);
        return ok();
    }

    Status MemoryBucket::put(const dp::String &key, const std::string &bytes) {
        auto id = create_upload(key);
        if (!id)
            return dp::result::Err(id.error());
        auto part = upload_part(id.value(), bytes.data(), bytes.size());
        if (!part) {
            auto aborted = abort_upload(id.value());
            if (!aborted)
                log::warn("abort of ", id.value(), " failed: ", describe(aborted.error()));
            return part;
        }
        return complete_upload(id.value());
    }

    dp::u64 MemoryBucket::used_bytes() const {
        std::shared_lock lock(mutex_);
        return used_;
    }

    dp::usize MemoryBucket::pending_uploads() const {
        std::shared_lock lock(mutex_);
        return uploads_.size();
    }

} // namespace duet
