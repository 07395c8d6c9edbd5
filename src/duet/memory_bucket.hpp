#pragma once

#include "duet/object_store.hpp"

#include <map>
#include <shared_mutex>
#include <vector>

namespace duet {

    // In-process bucket. Readers share the lock; uploads are staged aside and swapped in under the
    // exclusive lock, so a concurrent listing sees either the old or the new key set.
    class MemoryBucket : public ObjectStoreClient {
      public:
        explicit MemoryBucket(dp::String name, dp::u64 quota_bytes = 0);

        dp::String bucket() const override { return name_; }

        Result<dp::Vector<ObjectInfo>> list_objects(const dp::String &prefix) const override;
        Result<ObjectInfo> head_object(const dp::String &key) const override;
        Result<dp::usize> get_object_range(const dp::String &key, dp::u64 offset, char *buf,
                                           dp::usize len) const override;

        Result<dp::String> create_upload(const dp::String &key) override;
        Status upload_part(const dp::String &upload_id, const char *data, dp::usize len) override;
        Status complete_upload(const dp::String &upload_id) override;
        Status abort_upload(const dp::String &upload_id) override;

        Status delete_object(const dp::String &key) override;

        // Convenience for seeding buckets
        Status put(const dp::String &key, const std::string &bytes);

        dp::u64 used_bytes() const;
        dp::usize pending_uploads() const;

      private:
        struct Object {
            std::vector<char> data;
            std::time_t mtime{};
        };

        struct Upload {
            dp::String key;
            std::vector<char> data;
        };

        dp::String name_;
        dp::u64 quota_;
        dp::u64 used_ = 0;
        dp::u64 staged_ = 0;
        dp::u64 next_upload_ = 1;

        mutable std::shared_mutex mutex_;
        std::map<dp::String, Object> objects_;
        std::map<dp::String, Upload> uploads_;
    };

} // namespace duet
