#pragma once

#include "duet/object_store.hpp"

#include <aws/core/client/AWSError.h>
#include <aws/core/client/CoreErrors.h>
#include <aws/core/http/HttpResponse.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/model/CompletedPart.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace duet {

    struct S3Options {
        std::string region;   // empty = region from the SDK default chain
        std::string endpoint; // "http://host:port" for S3-compatible servers; empty = AWS
    };

    // Parts other than the last must be at least 5 MiB
    constexpr dp::usize S3_PART_SIZE = 8 * 1024 * 1024;

    // Holds Aws::InitAPI for as long as any instance is alive
    class AwsSdkLifetime {
      public:
        AwsSdkLifetime();
        ~AwsSdkLifetime();

        AwsSdkLifetime(const AwsSdkLifetime &) = delete;
        AwsSdkLifetime &operator=(const AwsSdkLifetime &) = delete;
    };

    ErrorKind kind_from_http(Aws::Http::HttpResponseCode code);

    template <typename E> Error error_from_aws(const Aws::Client::AWSError<E> &err, const dp::String &what) {
        ErrorKind kind = kind_from_http(err.GetResponseCode());
        if (static_cast<int>(err.GetErrorType()) == static_cast<int>(Aws::Client::CoreErrors::NETWORK_CONNECTION))
            kind = ErrorKind::QuotaOrNetwork;
        dp::String message = what;
        if (!err.GetMessage().empty())
            message += dp::String(": ") + err.GetMessage().c_str();
        return make_error(kind, message);
    }

    // HTTP Range header value covering len bytes from offset, e.g. "bytes=0-1023"
    std::string range_header(dp::u64 offset, dp::usize len);

    // =============================================================================================
    // S3Bucket - ObjectStoreClient over the AWS S3 API
    // =============================================================================================
    //
    // Credentials come from the SDK default chain (environment, profile, instance role). Writes are
    // multipart uploads fed in S3_PART_SIZE pieces; an object smaller than one part is sent with a
    // single PutObject instead.

    class S3Bucket : public ObjectStoreClient {
      public:
        S3Bucket(dp::String name, const S3Options &options);

        dp::String bucket() const override { return name_; }

        Result<dp::Vector<ObjectInfo>> list_objects(const dp::String &prefix) const override;
        Result<ObjectInfo> head_object(const dp::String &key) const override;
        Result<dp::usize> get_object_range(const dp::String &key, dp::u64 offset, char *buf,
                                           dp::usize len) const override;

        Result<dp::String> create_upload(const dp::String &key) override;
        Status upload_part(const dp::String &upload_id, const char *data, dp::usize len) override;
        Status complete_upload(const dp::String &upload_id) override;
        Status abort_upload(const dp::String &upload_id) override;

        // S3 deletes are idempotent: a missing key is not an error
        Status delete_object(const dp::String &key) override;

      private:
        struct Upload {
            dp::String key;
            Aws::String upload_id;
            std::string pending;
            Aws::Vector<Aws::S3::Model::CompletedPart> parts;
            int next_part = 1;
        };

        Status send_part(Upload &upload, const char *data, dp::usize len);
        Status put_whole(const Upload &upload);
        Status abort_remote(const Upload &upload);
        std::shared_ptr<Upload> find_upload(const dp::String &upload_id);
        std::shared_ptr<Upload> take_upload(const dp::String &upload_id);

        AwsSdkLifetime sdk_;
        dp::String name_;
        Aws::String aws_name_;
        std::unique_ptr<Aws::S3::S3Client> client_;

        std::mutex mutex_;
        std::map<dp::String, std::shared_ptr<Upload>> uploads_;
    };

} // namespace duet
