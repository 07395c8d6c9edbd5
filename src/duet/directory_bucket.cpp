#include "duet/directory_bucket.hpp"
#include "duet/log.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <utility>

namespace fs = std::filesystem;

namespace duet {

    namespace {

        constexpr const char *STAGING_DIR = ".uploads";
        constexpr const char *HEX = "0123456789ABCDEF";

        bool is_plain(char c) {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' ||
                   c == '_' || c == '.';
        }

        int hex_value(char c) {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            return -1;
        }

        std::time_t mtime_of(const fs::path &p) {
            std::error_code ec;
            auto t = fs::last_write_time(p, ec);
            if (ec)
                return 0;
            return std::chrono::system_clock::to_time_t(std::chrono::file_clock::to_sys(t));
        }

        dp::String path_to_string(const fs::path &p) { return dp::String(p.string().c_str()); }

    } // namespace

    DirectoryBucket::DirectoryBucket(fs::path root, dp::String name)
        : root_(std::move(root)), staging_dir_(root_ / STAGING_DIR), name_(std::move(name)) {}

    Status DirectoryBucket::open() {
        std::error_code ec;
        fs::create_directories(staging_dir_, ec);
        if (ec)
            return dp::result::Err(from_code(ec, path_to_string(staging_dir_)));
        return ok();
    }

    // =============================================================================================
    // Key encoding - '%XX' for everything outside [A-Za-z0-9._-], plus a leading '.'
    // =============================================================================================

    dp::String DirectoryBucket::encode_key(const dp::String &key) {
        dp::String out;
        for (dp::usize i = 0; i < key.size(); ++i) {
            char c = key[i];
            if (is_plain(c) && !(i == 0 && c == '.')) {
                out += c;
            } else {
                auto b = static_cast<unsigned char>(c);
                out += '%';
                out += HEX[b >> 4];
                out += HEX[b & 0x0F];
            }
        }
        return out;
    }

    dp::Optional<dp::String> DirectoryBucket::decode_key(const dp::String &file_name) {
        dp::String out;
        for (dp::usize i = 0; i < file_name.size(); ++i) {
            char c = file_name[i];
            if (c != '%') {
                out += c;
                continue;
            }
            if (i + 2 >= file_name.size())
                return dp::Optional<dp::String>{};
            int hi = hex_value(file_name[i + 1]);
            int lo = hex_value(file_name[i + 2]);
            if (hi < 0 || lo < 0)
                return dp::Optional<dp::String>{};
            out += static_cast<char>((hi << 4) | lo);
            i += 2;
        }
        return dp::Optional<dp::String>(out);
    }

    fs::path DirectoryBucket::object_path(const dp::String &key) const { return root_ / encode_key(key).c_str(); }

    // =============================================================================================
    // Reads
    // =============================================================================================

    Result<dp::Vector<ObjectInfo>> DirectoryBucket::list_objects(const dp::String &prefix) const {
        dp::Vector<ObjectInfo> out;
        try {
            for (const auto &it : fs::directory_iterator(root_)) {
                if (!it.is_regular_file())
                    continue;
                auto key = decode_key(dp::String(it.path().filename().string().c_str()));
                if (!key.has_value() || !has_prefix(key.value(), prefix))
                    continue;
                std::error_code ec;
                auto size = fs::file_size(it.path(), ec);
                if (ec)
                    continue; // deleted while listing
                out.push_back(ObjectInfo{key.value(), static_cast<dp::u64>(size), mtime_of(it.path())});
            }
        } catch (const fs::filesystem_error &ex) {
            return dp::result::Err(from_filesystem_error(ex));
        }
        std::sort(out.begin(), out.end(), [](const ObjectInfo &a, const ObjectInfo &b) { return a.key < b.key; });
        return dp::result::Ok(std::move(out));
    }

    Result<ObjectInfo> DirectoryBucket::head_object(const dp::String &key) const {
        fs::path p = object_path(key);
        std::error_code ec;
        auto size = fs::file_size(p, ec);
        if (ec) {
            if (ec == std::errc::no_such_file_or_directory)
                return dp::result::Err(make_error(ErrorKind::NotFound, name_ + "/" + key));
            return dp::result::Err(from_code(ec, name_ + "/" + key));
        }
        return dp::result::Ok(ObjectInfo{key, static_cast<dp::u64>(size), mtime_of(p)});
    }

    Result<dp::usize> DirectoryBucket::get_object_range(const dp::String &key, dp::u64 offset, char *buf,
                                                        dp::usize len) const {
        std::ifstream in(object_path(key), std::ios::binary);
        if (!in.is_open())
            return dp::result::Err(make_error(ErrorKind::NotFound, name_ + "/" + key));
        in.seekg(static_cast<std::streamoff>(offset));
        if (!in)
            return dp::result::Ok(dp::usize{0});
        in.read(buf, static_cast<std::streamsize>(len));
        if (in.bad())
            return dp::result::Err(make_error(ErrorKind::Io, "read failed: " + name_ + "/" + key));
        return dp::result::Ok(static_cast<dp::usize>(in.gcount()));
    }

    // =============================================================================================
    // Uploads
    // =============================================================================================

    Result<dp::String> DirectoryBucket::create_upload(const dp::String &key) {
        std::lock_guard lock(mutex_);
        dp::String id = dp::String("upload-") + std::to_string(next_upload_++).c_str();
        auto upload = std::make_unique<Upload>();
        upload->key = key;
        upload->staging = staging_dir_ / id.c_str();
        upload->out.open(upload->staging, std::ios::binary | std::ios::trunc);
        if (!upload->out.is_open())
            return dp::result::Err(make_error(ErrorKind::PermissionDenied, path_to_string(upload->staging)));
        uploads_[id] = std::move(upload);
        return dp::result::Ok(id);
    }

    Status DirectoryBucket::upload_part(const dp::String &upload_id, const char *data, dp::usize len) {
        std::lock_guard lock(mutex_);
        auto it = uploads_.find(upload_id);
        if (it == uploads_.end())
            return fail(ErrorKind::NotFound, "no such upload " + upload_id);
        it->second->out.write(data, static_cast<std::streamsize>(len));
        if (!it->second->out)
            return fail(ErrorKind::QuotaOrNetwork, "staging write failed for " + it->second->key);
        return ok();
    }

    Status DirectoryBucket::complete_upload(const dp::String &upload_id) {
        std::unique_ptr<Upload> upload;
        {
            std::lock_guard lock(mutex_);
            auto it = uploads_.find(upload_id);
            if (it == uploads_.end())
                return fail(ErrorKind::NotFound, "no such upload " + upload_id);
            upload = std::move(it->second);
            uploads_.erase(it);
        }

        upload->out.close();
        std::error_code ec;
        if (upload->out.fail()) {
            fs::remove(upload->staging, ec);
            return fail(ErrorKind::QuotaOrNetwork, "staging flush failed for " + upload->key);
        }
        fs::rename(upload->staging, object_path(upload->key), ec);
        if (ec) {
            std::error_code rm_ec;
            fs::remove(upload->staging, rm_ec);
            return dp::result::Err(from_code(ec, name_ + "/" + upload->key));
        }
        return ok();
    }

    Status DirectoryBucket::abort_upload(const dp::String &upload_id) {
        std::unique_ptr<Upload> upload;
        {
            std::lock_guard lock(mutex_);
            auto it = uploads_.find(upload_id);
            if (it == uploads_.end())
                return fail(ErrorKind::NotFound, "no such upload " + upload_id);
            upload = std::move(it->second);
            uploads_.erase(it);
        }
        upload->out.close();
        std::error_code ec;
        fs::remove(upload->staging, ec);
        if (ec)
            log::warn("could not remove staging file ", upload->staging.string(), ": ", ec.message());
        return ok();
    }

    Status DirectoryBucket::delete_object(const dp::String &key) {
        std::error_code ec;
        if (!fs::remove(object_path(key), ec)) {
            if (ec)
                return dp::result::Err(from_code(ec, name_ + "/" + key));
            return fail(ErrorKind::NotFound, name_ + "/" + key);
        }
        return ok();
    }

} // namespace duet
