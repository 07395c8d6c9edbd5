#include "duet/session.hpp"
#include "duet/directory_bucket.hpp"
#include "duet/local_provider.hpp"
#include "duet/object_store_provider.hpp"
#include "duet/s3_bucket.hpp"

#include <filesystem>
#include <utility>

namespace fs = std::filesystem;

namespace duet {

    namespace {

        Result<Location> local_start(const std::string &path) {
            std::error_code ec;
            fs::path p = path.empty() ? fs::current_path(ec) : fs::absolute(fs::path(path), ec);
            if (ec)
                return dp::result::Err(from_code(ec, dp::String(path.c_str())));
            if (!fs::exists(p))
                return dp::result::Err(make_error(ErrorKind::NotFound, dp::String(p.string().c_str())));
            if (!fs::is_directory(p))
                return dp::result::Err(make_error(ErrorKind::Unsupported, "not a directory: " + dp::String(p.string().c_str())));
            return dp::result::Ok(LocalProvider::locate(p));
        }

    } // namespace

    Result<Session> open_session(const Config &config) {
        auto checked = config.validate();
        if (!checked)
            return dp::result::Err(checked.error());

        auto local = std::make_shared<LocalProvider>();

        auto left_start = local_start(config.left_path);
        if (!left_start)
            return dp::result::Err(left_start.error());

        Session session;
        session.left = std::make_unique<Pane>(local, left_start.value());

        if (!config.bucket_dir.empty()) {
            std::error_code ec;
            fs::path dir = fs::absolute(fs::path(config.bucket_dir), ec);
            if (ec)
                return dp::result::Err(from_code(ec, dp::String(config.bucket_dir.c_str())));
            dp::String name = config.bucket_name.empty() ? dp::String(dir.filename().string().c_str())
                                                         : dp::String(config.bucket_name.c_str());
            auto bucket = std::make_shared<DirectoryBucket>(dir, name);
            auto opened = bucket->open();
            if (!opened)
                return dp::result::Err(opened.error());
            auto store = std::make_shared<ObjectStoreProvider>(bucket);
            Location start = Location::parse(store->id(), dp::String(config.bucket_prefix.c_str()));
            session.right = std::make_unique<Pane>(store, start);
        } else if (!config.bucket_name.empty()) {
            S3Options options;
            options.region = config.s3_region;
            options.endpoint = config.s3_endpoint;
            auto bucket = std::make_shared<S3Bucket>(dp::String(config.bucket_name.c_str()), options);
            auto store = std::make_shared<ObjectStoreProvider>(bucket);
            Location start = Location::parse(store->id(), dp::String(config.bucket_prefix.c_str()));
            session.right = std::make_unique<Pane>(store, start);
        } else {
            auto right_start = local_start(config.right_path);
            if (!right_start)
                return dp::result::Err(right_start.error());
            session.right = std::make_unique<Pane>(local, right_start.value());
        }

        session.left->set_show_hidden(config.show_hidden);
        session.right->set_show_hidden(config.show_hidden);
        return dp::result::Ok(std::move(session));
    }

} // namespace duet
