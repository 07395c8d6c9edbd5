#include "duet/local_provider.hpp"
#include "duet/log.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <utility>

namespace fs = std::filesystem;

namespace duet {

    namespace {

        dp::String path_to_string(const fs::path &p) { return dp::String(p.string().c_str()); }

        std::time_t mtime_of(const fs::path &p) {
            std::error_code ec;
            auto t = fs::last_write_time(p, ec);
            if (ec)
                return 0;
            return std::chrono::system_clock::to_time_t(std::chrono::file_clock::to_sys(t));
        }

        Entry make_entry(const fs::path &p, const fs::file_status &status, bool is_symlink) {
            Entry e;
            e.is_symlink = is_symlink;
            e.name = dp::String(p.filename().string().c_str());
            e.raw_key = path_to_string(p);
            e.mtime = mtime_of(p);
            if (fs::is_directory(status)) {
                e.kind = EntryKind::Directory;
            } else {
                e.kind = EntryKind::File;
                std::error_code ec;
                auto size = fs::file_size(p, ec);
                e.size = ec ? 0 : static_cast<dp::u64>(size);
            }
            return e;
        }

        // =========================================================================================
        // Streams over std::fstream
        // =========================================================================================

        class LocalReadStream : public ReadStream {
          public:
            LocalReadStream(fs::path path, std::ifstream in, dp::u64 size)
                : path_(std::move(path)), in_(std::move(in)), size_(size) {}

            Result<dp::usize> read(char *buf, dp::usize cap) override {
                if (in_.eof())
                    return dp::result::Ok(dp::usize{0});
                in_.read(buf, static_cast<std::streamsize>(cap));
                if (in_.bad())
                    return dp::result::Err(make_error(ErrorKind::Io, "read failed: " + path_to_string(path_)));
                return dp::result::Ok(static_cast<dp::usize>(in_.gcount()));
            }

            dp::u64 size() const override { return size_; }

          private:
            fs::path path_;
            std::ifstream in_;
            dp::u64 size_;
        };

        class LocalWriteStream : public WriteStream {
          public:
            LocalWriteStream(fs::path path, std::ofstream out) : path_(std::move(path)), out_(std::move(out)) {}

            ~LocalWriteStream() override {
                if (!finished_)
                    abort();
            }

            Status write(const char *buf, dp::usize len) override {
                out_.write(buf, static_cast<std::streamsize>(len));
                if (!out_)
                    return fail(ErrorKind::Io, "write failed: " + path_to_string(path_));
                return ok();
            }

            Status close() override {
                out_.close();
                finished_ = true;
                if (out_.fail()) {
                    std::error_code ec;
                    fs::remove(path_, ec);
                    return fail(ErrorKind::Io, "flush failed: " + path_to_string(path_));
                }
                return ok();
            }

            void abort() override {
                if (finished_)
                    return;
                finished_ = true;
                out_.close();
                std::error_code ec;
                fs::remove(path_, ec);
                if (ec)
                    log::warn("could not remove partial file ", path_.string(), ": ", ec.message());
            }

          private:
            fs::path path_;
            std::ofstream out_;
            bool finished_ = false;
        };

    } // namespace

    // =============================================================================================
    // Location <-> path
    // =============================================================================================

    fs::path LocalProvider::to_path(const Location &location) {
        fs::path p = "/";
        for (const auto &seg : location.segments())
            p /= seg.c_str();
        return p;
    }

    Location LocalProvider::locate(const fs::path &path) {
        fs::path abs = fs::absolute(path).lexically_normal();
        dp::Vector<dp::String> segments;
        for (const auto &part : abs.relative_path()) {
            auto s = part.string();
            if (s.empty() || s == ".")
                continue;
            segments.push_back(dp::String(s.c_str()));
        }
        return Location(ID, std::move(segments));
    }

    dp::String LocalProvider::display(const Location &location) const { return path_to_string(to_path(location)); }

    Location LocalProvider::root() const { return Location(ID, {}); }

    // =============================================================================================
    // Listing
    // =============================================================================================

    Result<dp::Vector<Entry>> LocalProvider::list(const Location &location) const {
        fs::path dir = to_path(location);
        std::error_code ec;
        auto status = fs::status(dir, ec);
        if (ec || !fs::exists(status)) {
            if (!ec || ec == std::errc::no_such_file_or_directory)
                return dp::result::Err(make_error(ErrorKind::NotFound, path_to_string(dir)));
            return dp::result::Err(from_code(ec, path_to_string(dir)));
        }
        if (!fs::is_directory(status))
            return dp::result::Err(make_error(ErrorKind::Unsupported, "not a directory: " + path_to_string(dir)));

        dp::Vector<Entry> out;
        try {
            for (const auto &it : fs::directory_iterator(dir)) {
                std::error_code st_ec;
                auto link = it.symlink_status(st_ec);
                if (st_ec)
                    return dp::result::Err(from_code(st_ec, path_to_string(it.path())));
                bool is_link = fs::is_symlink(link);
                auto st = is_link ? it.status(st_ec) : link;
                if (st_ec) {
                    // Dangling symlink: list it as a plain file
                    st = link;
                }
                out.push_back(make_entry(it.path(), st, is_link));
            }
        } catch (const fs::filesystem_error &ex) {
            return dp::result::Err(from_filesystem_error(ex));
        }

        std::sort(out.begin(), out.end(), listing_order);
        return dp::result::Ok(std::move(out));
    }

    Result<Entry> LocalProvider::stat(const Location &location) const {
        fs::path p = to_path(location);
        std::error_code ec;
        auto link = fs::symlink_status(p, ec);
        if (ec || !fs::exists(link)) {
            if (!ec || ec == std::errc::no_such_file_or_directory)
                return dp::result::Err(make_error(ErrorKind::NotFound, path_to_string(p)));
            return dp::result::Err(from_code(ec, path_to_string(p)));
        }
        bool is_link = fs::is_symlink(link);
        auto status = link;
        if (is_link) {
            status = fs::status(p, ec);
            if (ec || !fs::exists(status))
                status = link;
        }
        return dp::result::Ok(make_entry(p, status, is_link));
    }

    // =============================================================================================
    // Streams
    // =============================================================================================

    Result<std::unique_ptr<ReadStream>> LocalProvider::open_read(const Location &location) const {
        auto entry = stat(location);
        if (!entry)
            return dp::result::Err(entry.error());
        fs::path p = to_path(location);
        if (entry.value().is_directory())
            return dp::result::Err(make_error(ErrorKind::Unsupported, "cannot read a directory: " + path_to_string(p)));

        std::ifstream in(p, std::ios::binary);
        if (!in.is_open())
            return dp::result::Err(make_error(ErrorKind::PermissionDenied, path_to_string(p)));

        std::unique_ptr<ReadStream> stream = std::make_unique<LocalReadStream>(p, std::move(in), entry.value().size);
        return dp::result::Ok(std::move(stream));
    }

    Result<std::unique_ptr<WriteStream>> LocalProvider::open_write(const Location &location) {
        fs::path p = to_path(location);
        std::error_code ec;
        if (fs::is_directory(p, ec))
            return dp::result::Err(make_error(ErrorKind::AlreadyExists, "a directory occupies " + path_to_string(p)));
        if (!fs::is_directory(p.parent_path(), ec))
            return dp::result::Err(make_error(ErrorKind::NotFound, path_to_string(p.parent_path())));

        std::ofstream out(p, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
            return dp::result::Err(make_error(ErrorKind::PermissionDenied, path_to_string(p)));

        std::unique_ptr<WriteStream> stream = std::make_unique<LocalWriteStream>(p, std::move(out));
        return dp::result::Ok(std::move(stream));
    }

    // =============================================================================================
    // Mutations
    // =============================================================================================

    Status LocalProvider::remove(const Location &location) {
        fs::path p = to_path(location);
        std::error_code ec;
        auto status = fs::symlink_status(p, ec);
        if (ec || !fs::exists(status))
            return fail(ErrorKind::NotFound, path_to_string(p));
        if (fs::is_directory(status))
            return fail(ErrorKind::Unsupported, "directories are removed with remove_container: " + path_to_string(p));
        if (!fs::remove(p, ec) || ec)
            return dp::result::Err(from_code(ec, path_to_string(p)));
        return ok();
    }

    Status LocalProvider::make_container(const Location &location) {
        fs::path p = to_path(location);
        std::error_code ec;
        auto status = fs::status(p, ec);
        if (fs::exists(status)) {
            if (fs::is_directory(status))
                return ok();
            return fail(ErrorKind::AlreadyExists, "a file occupies " + path_to_string(p));
        }
        fs::create_directories(p, ec);
        if (ec)
            return dp::result::Err(from_code(ec, path_to_string(p)));
        return ok();
    }

    Status LocalProvider::remove_container(const Location &location) {
        fs::path p = to_path(location);
        std::error_code ec;
        if (!fs::is_directory(p, ec))
            return fail(ErrorKind::NotFound, path_to_string(p));
        if (!fs::remove(p, ec) || ec)
            return dp::result::Err(from_code(ec, path_to_string(p)));
        return ok();
    }

    Status LocalProvider::rename(const Location &from, const Location &to) {
        fs::path src = to_path(from);
        fs::path dst = to_path(to);
        std::error_code ec;
        fs::rename(src, dst, ec);
        if (ec)
            return dp::result::Err(from_code(ec, path_to_string(src)));
        log::debug("renamed ", src.string(), " -> ", dst.string());
        return ok();
    }

} // namespace duet
