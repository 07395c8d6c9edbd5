#pragma once

#include "duet/local_provider.hpp"
#include "duet/provider.hpp"

#include <datapod/datapod.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

namespace duet::testing {

    inline std::string str(const dp::String &s) { return std::string(s.c_str()); }

    // Fresh directory under the system temp dir, removed again on destruction
    class TempDir {
      public:
        TempDir() {
            static std::atomic<int> counter{0};
            const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
            std::string tag = info ? std::string(info->test_suite_name()) + "-" + info->name() : "duet";
            path_ = fs::temp_directory_path() /
                    ("duet-" + tag + "-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
            fs::remove_all(path_);
            fs::create_directories(path_);
        }
        ~TempDir() {
            std::error_code ec;
            fs::remove_all(path_, ec);
        }

        TempDir(const TempDir &) = delete;
        TempDir &operator=(const TempDir &) = delete;

        const fs::path &path() const { return path_; }
        fs::path operator/(const std::string &rel) const { return path_ / rel; }

      private:
        fs::path path_;
    };

    inline void write_file(const fs::path &p, const std::string &content) {
        fs::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary);
        out << content;
    }

    inline std::string read_file(const fs::path &p) {
        std::ifstream in(p, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    inline std::vector<std::string> names(const dp::Vector<Entry> &entries) {
        std::vector<std::string> out;
        for (const auto &e : entries)
            out.push_back(str(e.name) + (e.is_directory() ? "/" : ""));
        return out;
    }

    inline std::vector<std::string> list_names(const Provider &p, const Location &at) {
        auto listed = p.list(at);
        if (!listed)
            return {"<" + str(describe(listed.error())) + ">"};
        return names(listed.value());
    }

    // Reads a whole file through a provider stream
    inline std::string slurp(const Provider &p, const Location &at) {
        auto reader = p.open_read(at);
        if (!reader)
            return "<" + str(describe(reader.error())) + ">";
        std::string out;
        char buf[7];
        for (;;) {
            auto n = reader.value()->read(buf, sizeof(buf));
            if (!n)
                return "<" + str(describe(n.error())) + ">";
            if (n.value() == 0)
                break;
            out.append(buf, n.value());
        }
        return out;
    }

    inline Status put(Provider &p, const Location &at, const std::string &content) {
        auto writer = p.open_write(at);
        if (!writer)
            return dp::result::Err(writer.error());
        if (!content.empty()) {
            auto written = writer.value()->write(content.data(), content.size());
            if (!written)
                return written;
        }
        return writer.value()->close();
    }

    inline Entry find_entry(const dp::Vector<Entry> &entries, const std::string &name) {
        for (const auto &e : entries) {
            if (str(e.name) == name)
                return e;
        }
        ADD_FAILURE() << "no entry named " << name;
        return Entry{};
    }

    // Forwards everything to an inner provider but refuses to remove files
    class NoRemoveProvider : public Provider {
      public:
        explicit NoRemoveProvider(std::shared_ptr<Provider> inner) : inner_(std::move(inner)) {}

        dp::String id() const override { return inner_->id(); }
        dp::String display(const Location &l) const override { return inner_->display(l); }
        Location root() const override { return inner_->root(); }
        Result<dp::Vector<Entry>> list(const Location &l) const override { return inner_->list(l); }
        Result<Entry> stat(const Location &l) const override { return inner_->stat(l); }
        Result<std::unique_ptr<ReadStream>> open_read(const Location &l) const override {
            return inner_->open_read(l);
        }
        Result<std::unique_ptr<WriteStream>> open_write(const Location &l) override { return inner_->open_write(l); }
        Status remove(const Location &l) override {
            return fail(ErrorKind::PermissionDenied, "read-only: " + display(l));
        }
        Status make_container(const Location &l) override { return inner_->make_container(l); }
        Status remove_container(const Location &l) override { return inner_->remove_container(l); }

      private:
        std::shared_ptr<Provider> inner_;
    };

} // namespace duet::testing
