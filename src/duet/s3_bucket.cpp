#include "duet/s3_bucket.hpp"
#include "duet/log.hpp"

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSAuthSigner.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/utils/memory/stl/AWSStringStream.h>
#include <aws/s3/model/AbortMultipartUploadRequest.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/DeleteObjectRequest.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/s3/model/ListObjectsV2Request.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <aws/s3/model/UploadPartRequest.h>

#include <algorithm>
#include <utility>

namespace duet {

    namespace {

        constexpr const char *ALLOC_TAG = "duet-s3";

        std::mutex sdk_mutex;
        int sdk_users = 0;
        Aws::SDKOptions sdk_options;

        Aws::String to_aws(const dp::String &s) { return Aws::String(s.c_str(), s.size()); }
        Aws::String to_aws(const std::string &s) { return Aws::String(s.c_str(), s.size()); }
        dp::String to_dp(const Aws::String &s) { return dp::String(s.c_str()); }

        std::time_t to_time(const Aws::Utils::DateTime &t) { return static_cast<std::time_t>(t.Seconds()); }

        Aws::Client::ClientConfiguration make_client_config(const S3Options &options) {
            Aws::Client::ClientConfiguration cfg;
            if (!options.region.empty())
                cfg.region = to_aws(options.region);

            std::string endpoint = options.endpoint;
            if (endpoint.rfind("http://", 0) == 0) {
                cfg.scheme = Aws::Http::Scheme::HTTP;
                endpoint.erase(0, 7);
            } else if (endpoint.rfind("https://", 0) == 0) {
                cfg.scheme = Aws::Http::Scheme::HTTPS;
                endpoint.erase(0, 8);
            }
            while (!endpoint.empty() && endpoint.back() == '/')
                endpoint.pop_back();
            if (!endpoint.empty())
                cfg.endpointOverride = to_aws(endpoint);

            cfg.connectTimeoutMs = 10'000;
            return cfg;
        }

    } // namespace

    AwsSdkLifetime::AwsSdkLifetime() {
        std::lock_guard lock(sdk_mutex);
        if (sdk_users++ == 0) {
            log::debug("initializing AWS SDK");
            Aws::InitAPI(sdk_options);
        }
    }

    AwsSdkLifetime::~AwsSdkLifetime() {
        std::lock_guard lock(sdk_mutex);
        if (--sdk_users == 0) {
            log::debug("shutting down AWS SDK");
            Aws::ShutdownAPI(sdk_options);
        }
    }

    ErrorKind kind_from_http(Aws::Http::HttpResponseCode code) {
        using Aws::Http::HttpResponseCode;
        switch (code) {
        case HttpResponseCode::NOT_FOUND:
            return ErrorKind::NotFound;
        case HttpResponseCode::FORBIDDEN:
        case HttpResponseCode::UNAUTHORIZED:
            return ErrorKind::PermissionDenied;
        case HttpResponseCode::REQUEST_NOT_MADE:
        case HttpResponseCode::REQUEST_TIMEOUT:
        case HttpResponseCode::TOO_MANY_REQUESTS:
        case HttpResponseCode::INSUFFICIENT_STORAGE:
            return ErrorKind::QuotaOrNetwork;
        default:
            break;
        }
        if (static_cast<int>(code) >= 500)
            return ErrorKind::QuotaOrNetwork;
        return ErrorKind::Io;
    }

    std::string range_header(dp::u64 offset, dp::usize len) {
        return "bytes=" + std::to_string(offset) + "-" + std::to_string(offset + len - 1);
    }

    S3Bucket::S3Bucket(dp::String name, const S3Options &options) : name_(std::move(name)), aws_name_(to_aws(name_)) {
        // Path-style addressing for custom endpoints; most S3-compatible servers lack virtual hosts
        bool virtual_hosts = options.endpoint.empty();
        client_ = std::make_unique<Aws::S3::S3Client>(make_client_config(options),
                                                      Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
                                                      virtual_hosts);
    }

    // =============================================================================================
    // Reads
    // =============================================================================================

    Result<dp::Vector<ObjectInfo>> S3Bucket::list_objects(const dp::String &prefix) const {
        Aws::S3::Model::ListObjectsV2Request req;
        req.SetBucket(aws_name_);
        if (!prefix.empty())
            req.SetPrefix(to_aws(prefix));

        dp::Vector<ObjectInfo> out;
        Aws::String token;
        do {
            if (!token.empty())
                req.SetContinuationToken(token);
            auto outcome = client_->ListObjectsV2(req);
            if (!outcome.IsSuccess())
                return dp::result::Err(error_from_aws(outcome.GetError(), name_ + "/" + prefix));

            const auto &result = outcome.GetResult();
            for (const auto &obj : result.GetContents())
                out.push_back(ObjectInfo{to_dp(obj.GetKey()), static_cast<dp::u64>(obj.GetSize()),
                                         to_time(obj.GetLastModified())});
            token = result.GetIsTruncated() ? result.GetNextContinuationToken() : Aws::String();
        } while (!token.empty());

        std::sort(out.begin(), out.end(), [](const ObjectInfo &a, const ObjectInfo &b) { return a.key < b.key; });
        return dp::result::Ok(std::move(out));
    }

    Result<ObjectInfo> S3Bucket::head_object(const dp::String &key) const {
        Aws::S3::Model::HeadObjectRequest req;
        req.SetBucket(aws_name_);
        req.SetKey(to_aws(key));
        auto outcome = client_->HeadObject(req);
        if (!outcome.IsSuccess())
            return dp::result::Err(error_from_aws(outcome.GetError(), name_ + "/" + key));
        const auto &result = outcome.GetResult();
        return dp::result::Ok(
            ObjectInfo{key, static_cast<dp::u64>(result.GetContentLength()), to_time(result.GetLastModified())});
    }

    Result<dp::usize> S3Bucket::get_object_range(const dp::String &key, dp::u64 offset, char *buf,
                                                 dp::usize len) const {
        if (len == 0)
            return dp::result::Ok(dp::usize{0});

        Aws::S3::Model::GetObjectRequest req;
        req.SetBucket(aws_name_);
        req.SetKey(to_aws(key));
        req.SetRange(to_aws(range_header(offset, len)));
        auto outcome = client_->GetObject(req);
        if (!outcome.IsSuccess()) {
            const auto &err = outcome.GetError();
            if (err.GetResponseCode() == Aws::Http::HttpResponseCode::REQUESTED_RANGE_NOT_SATISFIABLE)
                return dp::result::Ok(dp::usize{0}); // offset at or past the end
            return dp::result::Err(error_from_aws(err, name_ + "/" + key));
        }

        auto result = outcome.GetResultWithOwnership();
        Aws::IOStream &body = result.GetBody();
        dp::usize got = 0;
        while (got < len && body.good()) {
            body.read(buf + got, static_cast<std::streamsize>(len - got));
            auto n = body.gcount();
            if (n <= 0)
                break;
            got += static_cast<dp::usize>(n);
        }
        if (body.bad())
            return dp::result::Err(make_error(ErrorKind::QuotaOrNetwork, "read failed: " + name_ + "/" + key));
        return dp::result::Ok(got);
    }

    // =============================================================================================
    // Uploads
    // =============================================================================================

    Result<dp::String> S3Bucket::create_upload(const dp::String &key) {
        Aws::S3::Model::CreateMultipartUploadRequest req;
        req.SetBucket(aws_name_);
        req.SetKey(to_aws(key));
        auto outcome = client_->CreateMultipartUpload(req);
        if (!outcome.IsSuccess())
            return dp::result::Err(error_from_aws(outcome.GetError(), name_ + "/" + key));

        auto upload = std::make_shared<Upload>();
        upload->key = key;
        upload->upload_id = outcome.GetResult().GetUploadId();
        dp::String id = to_dp(upload->upload_id);
        log::debug("multipart upload ", id, " started for ", key);

        std::lock_guard lock(mutex_);
        uploads_[id] = std::move(upload);
        return dp::result::Ok(id);
    }

    Status S3Bucket::upload_part(const dp::String &upload_id, const char *data, dp::usize len) {
        auto upload = find_upload(upload_id);
        if (!upload)
            return fail(ErrorKind::NotFound, "no such upload " + upload_id);

        upload->pending.append(data, len);
        while (upload->pending.size() >= S3_PART_SIZE) {
            auto sent = send_part(*upload, upload->pending.data(), S3_PART_SIZE);
            if (!sent)
                return sent;
            upload->pending.erase(0, S3_PART_SIZE);
        }
        return ok();
    }

    Status S3Bucket::complete_upload(const dp::String &upload_id) {
        auto upload = take_upload(upload_id);
        if (!upload)
            return fail(ErrorKind::NotFound, "no such upload " + upload_id);

        // Smaller than one part: a plain PUT, and the multipart upload is dropped
        if (upload->parts.empty()) {
            auto put = put_whole(*upload);
            auto dropped = abort_remote(*upload);
            if (!dropped)
                log::warn("abort of upload ", upload_id, " failed: ", describe(dropped.error()));
            return put;
        }

        if (!upload->pending.empty()) {
            auto sent = send_part(*upload, upload->pending.data(), upload->pending.size());
            if (!sent) {
                auto dropped = abort_remote(*upload);
                if (!dropped)
                    log::warn("abort of upload ", upload_id, " failed: ", describe(dropped.error()));
                return sent;
            }
            upload->pending.clear();
        }

        Aws::S3::Model::CompletedMultipartUpload parts;
        parts.SetParts(upload->parts);
        Aws::S3::Model::CompleteMultipartUploadRequest req;
        req.SetBucket(aws_name_);
        req.SetKey(to_aws(upload->key));
        req.SetUploadId(upload->upload_id);
        req.SetMultipartUpload(parts);
        auto outcome = client_->CompleteMultipartUpload(req);
        if (!outcome.IsSuccess()) {
            auto err = error_from_aws(outcome.GetError(), name_ + "/" + upload->key);
            auto dropped = abort_remote(*upload);
            if (!dropped)
                log::warn("abort of upload ", upload_id, " failed: ", describe(dropped.error()));
            return dp::result::Err(err);
        }
        log::debug("multipart upload ", upload_id, " completed with ", upload->parts.size(), " parts");
        return ok();
    }

    Status S3Bucket::abort_upload(const dp::String &upload_id) {
        auto upload = take_upload(upload_id);
        if (!upload)
            return fail(ErrorKind::NotFound, "no such upload " + upload_id);
        return abort_remote(*upload);
    }

    Status S3Bucket::send_part(Upload &upload, const char *data, dp::usize len) {
        auto body = Aws::MakeShared<Aws::StringStream>(ALLOC_TAG);
        body->write(data, static_cast<std::streamsize>(len));

        Aws::S3::Model::UploadPartRequest req;
        req.SetBucket(aws_name_);
        req.SetKey(to_aws(upload.key));
        req.SetUploadId(upload.upload_id);
        req.SetPartNumber(upload.next_part);
        req.SetContentLength(static_cast<long long>(len));
        req.SetBody(body);
        auto outcome = client_->UploadPart(req);
        if (!outcome.IsSuccess())
            return dp::result::Err(error_from_aws(outcome.GetError(), name_ + "/" + upload.key));

        Aws::S3::Model::CompletedPart part;
        part.SetPartNumber(upload.next_part++);
        part.SetETag(outcome.GetResult().GetETag());
        upload.parts.push_back(std::move(part));
        return ok();
    }

    Status S3Bucket::put_whole(const Upload &upload) {
        auto body = Aws::MakeShared<Aws::StringStream>(ALLOC_TAG);
        body->write(upload.pending.data(), static_cast<std::streamsize>(upload.pending.size()));

        Aws::S3::Model::PutObjectRequest req;
        req.SetBucket(aws_name_);
        req.SetKey(to_aws(upload.key));
        req.SetContentLength(static_cast<long long>(upload.pending.size()));
        req.SetBody(body);
        auto outcome = client_->PutObject(req);
        if (!outcome.IsSuccess())
            return dp::result::Err(error_from_aws(outcome.GetError(), name_ + "/" + upload.key));
        return ok();
    }

    Status S3Bucket::abort_remote(const Upload &upload) {
        Aws::S3::Model::AbortMultipartUploadRequest req;
        req.SetBucket(aws_name_);
        req.SetKey(to_aws(upload.key));
        req.SetUploadId(upload.upload_id);
        auto outcome = client_->AbortMultipartUpload(req);
        if (!outcome.IsSuccess())
            return dp::result::Err(error_from_aws(outcome.GetError(), name_ + "/" + upload.key));
        return ok();
    }

    std::shared_ptr<S3Bucket::Upload> S3Bucket::find_upload(const dp::String &upload_id) {
        std::lock_guard lock(mutex_);
        auto it = uploads_.find(upload_id);
        return it == uploads_.end() ? nullptr : it->second;
    }

    std::shared_ptr<S3Bucket::Upload> S3Bucket::take_upload(const dp::String &upload_id) {
        std::lock_guard lock(mutex_);
        auto it = uploads_.find(upload_id);
        if (it == uploads_.end())
            return nullptr;
        auto upload = std::move(it->second);
        uploads_.erase(it);
        return upload;
    }

    // =============================================================================================
    // Deletes
    // =============================================================================================

    Status S3Bucket::delete_object(const dp::String &key) {
        Aws::S3::Model::DeleteObjectRequest req;
        req.SetBucket(aws_name_);
        req.SetKey(to_aws(key));
        auto outcome = client_->DeleteObject(req);
        if (!outcome.IsSuccess())
            return dp::result::Err(error_from_aws(outcome.GetError(), name_ + "/" + key));
        return ok();
    }

} // namespace duet
