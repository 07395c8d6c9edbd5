#pragma once

#include "duet/error.hpp"

#include <datapod/datapod.hpp>

#include <ctime>

namespace duet {

    struct ObjectInfo {
        dp::String key;
        dp::u64 size{};
        std::time_t mtime{};
    };

    inline bool has_prefix(const dp::String &key, const dp::String &prefix) {
        return key.size() >= prefix.size() && key.substr(0, prefix.size()) == prefix;
    }

    // =============================================================================================
    // ObjectStoreClient - the calls the object-store provider needs from a bucket backend
    // =============================================================================================
    //
    // The session layer hands over an already authenticated client. Keys form a flat namespace;
    // '/' has no meaning here. All calls may be issued from several threads at once.

    class ObjectStoreClient {
      public:
        virtual ~ObjectStoreClient() = default;

        virtual dp::String bucket() const = 0;

        // Every key starting with prefix, in ascending key order
        virtual Result<dp::Vector<ObjectInfo>> list_objects(const dp::String &prefix) const = 0;

        virtual Result<ObjectInfo> head_object(const dp::String &key) const = 0;

        // Ranged GET. Returns the number of bytes copied into buf; 0 once offset reaches the end.
        virtual Result<dp::usize> get_object_range(const dp::String &key, dp::u64 offset, char *buf,
                                                   dp::usize len) const = 0;

        // Multipart upload. The object becomes visible, replacing any previous one, only when
        // complete_upload succeeds.
        virtual Result<dp::String> create_upload(const dp::String &key) = 0;
        virtual Status upload_part(const dp::String &upload_id, const char *data, dp::usize len) = 0;
        virtual Status complete_upload(const dp::String &upload_id) = 0;
        virtual Status abort_upload(const dp::String &upload_id) = 0;

        virtual Status delete_object(const dp::String &key) = 0;
    };

} // namespace duet
