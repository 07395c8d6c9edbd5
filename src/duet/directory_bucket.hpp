#pragma once

#include "duet/object_store.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>

namespace duet {

    // Bucket emulated by one flat local directory: each object is a file named after its
    // percent-encoded key. Uploads are staged under .uploads/ and published by rename.
    class DirectoryBucket : public ObjectStoreClient {
      public:
        DirectoryBucket(std::filesystem::path root, dp::String name);

        // Creates root and the staging area
        Status open();

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

        static dp::String encode_key(const dp::String &key);
        static dp::Optional<dp::String> decode_key(const dp::String &file_name);

      private:
        struct Upload {
            dp::String key;
            std::filesystem::path staging;
            std::ofstream out;
        };

        std::filesystem::path object_path(const dp::String &key) const;

        std::filesystem::path root_;
        std::filesystem::path staging_dir_;
        dp::String name_;

        std::mutex mutex_;
        dp::u64 next_upload_ = 1;
        std::map<dp::String, std::unique_ptr<Upload>> uploads_;
    };

} // namespace duet
