#include "duet/local_provider.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace duet;
using namespace duet::testing;

class LocalProviderTest : public ::testing::Test {
  protected:
    TempDir tmp;
    LocalProvider local;

    Location at(const std::string &rel = "") const {
        return LocalProvider::locate(rel.empty() ? tmp.path() : tmp.path() / rel);
    }
};

TEST_F(LocalProviderTest, LocateRoundTripsThroughPaths) {
    auto loc = at("a/b");
    EXPECT_EQ(str(loc.provider()), LocalProvider::ID);
    EXPECT_EQ(LocalProvider::to_path(loc), tmp.path() / "a" / "b");
    EXPECT_TRUE(LocalProvider::locate("/").is_root());
}

TEST_F(LocalProviderTest, ListsDirectoriesFirstThenFilesByName) {
    write_file(tmp / "b.txt", "bb");
    write_file(tmp / "a.txt", "a");
    fs::create_directories(tmp / "zdir");
    fs::create_directories(tmp / "Adir");

    auto listed = local.list(at());
    ASSERT_TRUE(listed);
    EXPECT_EQ(names(listed.value()), (std::vector<std::string>{"Adir/", "zdir/", "a.txt", "b.txt"}));

    auto b = find_entry(listed.value(), "b.txt");
    EXPECT_EQ(b.size, 2u);
    EXPECT_EQ(str(b.raw_key), (tmp / "b.txt").string());
}

TEST_F(LocalProviderTest, SymlinksAreFlaggedAndNeverContainers) {
    write_file(tmp / "target" / "f", "x");
    fs::create_directory_symlink(tmp / "target", tmp / "dirlink");
    fs::create_symlink(tmp / "missing", tmp / "dangling");

    auto listed = local.list(at());
    ASSERT_TRUE(listed);
    auto dirlink = find_entry(listed.value(), "dirlink");
    EXPECT_TRUE(dirlink.is_symlink);
    EXPECT_TRUE(dirlink.is_directory());
    EXPECT_FALSE(local.is_container(dirlink));

    auto dangling = find_entry(listed.value(), "dangling");
    EXPECT_TRUE(dangling.is_symlink);
    EXPECT_FALSE(dangling.is_directory());

    auto target = find_entry(listed.value(), "target");
    EXPECT_FALSE(target.is_symlink);
    EXPECT_TRUE(local.is_container(target));

    auto st = local.stat(at("dirlink"));
    ASSERT_TRUE(st);
    EXPECT_TRUE(st.value().is_symlink);
    auto dangling_st = local.stat(at("dangling"));
    ASSERT_TRUE(dangling_st);
    EXPECT_TRUE(dangling_st.value().is_symlink);

    EXPECT_TRUE(local.remove(at("dirlink")));
    EXPECT_TRUE(fs::exists(tmp / "target" / "f"));
}

TEST_F(LocalProviderTest, ListOfMissingDirectoryIsNotFound) {
    auto listed = local.list(at("missing"));
    ASSERT_FALSE(listed);
    EXPECT_EQ(listed.error().kind, ErrorKind::NotFound);
}

TEST_F(LocalProviderTest, ListOfFileIsUnsupported) {
    write_file(tmp / "f", "x");
    auto listed = local.list(at("f"));
    ASSERT_FALSE(listed);
    EXPECT_EQ(listed.error().kind, ErrorKind::Unsupported);
}

TEST_F(LocalProviderTest, StatReportsKindAndSize) {
    write_file(tmp / "f", "hello");
    auto f = local.stat(at("f"));
    ASSERT_TRUE(f);
    EXPECT_FALSE(f.value().is_directory());
    EXPECT_EQ(f.value().size, 5u);

    auto d = local.stat(at());
    ASSERT_TRUE(d);
    EXPECT_TRUE(d.value().is_directory());

    auto missing = local.stat(at("nope"));
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().kind, ErrorKind::NotFound);
}

TEST_F(LocalProviderTest, WriteThenReadStreams) {
    ASSERT_TRUE(put(local, at("out.bin"), "some bytes that span several reads"));
    EXPECT_EQ(read_file(tmp / "out.bin"), "some bytes that span several reads");
    EXPECT_EQ(slurp(local, at("out.bin")), "some bytes that span several reads");
}

TEST_F(LocalProviderTest, AbortedWriteLeavesNothingBehind) {
    {
        auto writer = local.open_write(at("partial"));
        ASSERT_TRUE(writer);
        ASSERT_TRUE(writer.value()->write("abc", 3));
        writer.value()->abort();
    }
    EXPECT_FALSE(fs::exists(tmp / "partial"));

    {
        auto writer = local.open_write(at("dropped"));
        ASSERT_TRUE(writer);
        ASSERT_TRUE(writer.value()->write("abc", 3));
    }
    EXPECT_FALSE(fs::exists(tmp / "dropped"));
}

TEST_F(LocalProviderTest, OpenWriteRejectsDirectoryAndMissingParent) {
    fs::create_directories(tmp / "d");
    auto onto_dir = local.open_write(at("d"));
    ASSERT_FALSE(onto_dir);
    EXPECT_EQ(onto_dir.error().kind, ErrorKind::AlreadyExists);

    auto orphan = local.open_write(at("no/such/parent"));
    ASSERT_FALSE(orphan);
    EXPECT_EQ(orphan.error().kind, ErrorKind::NotFound);
}

TEST_F(LocalProviderTest, RemoveRejectsDirectories) {
    fs::create_directories(tmp / "d");
    auto removed = local.remove(at("d"));
    ASSERT_FALSE(removed);
    EXPECT_EQ(removed.error().kind, ErrorKind::Unsupported);
    EXPECT_TRUE(fs::exists(tmp / "d"));

    write_file(tmp / "f", "x");
    EXPECT_TRUE(local.remove(at("f")));
    EXPECT_FALSE(fs::exists(tmp / "f"));

    auto again = local.remove(at("f"));
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().kind, ErrorKind::NotFound);
}

TEST_F(LocalProviderTest, ContainersAreCreatedAndRemovedWhenEmpty) {
    EXPECT_TRUE(local.make_container(at("x/y")));
    EXPECT_TRUE(fs::is_directory(tmp / "x" / "y"));
    EXPECT_TRUE(local.make_container(at("x/y")));

    write_file(tmp / "x" / "file", "1");
    auto occupied = local.make_container(at("x/file"));
    ASSERT_FALSE(occupied);
    EXPECT_EQ(occupied.error().kind, ErrorKind::AlreadyExists);

    auto not_empty = local.remove_container(at("x"));
    ASSERT_FALSE(not_empty);
    EXPECT_TRUE(fs::exists(tmp / "x"));

    EXPECT_TRUE(local.remove_container(at("x/y")));
    EXPECT_FALSE(fs::exists(tmp / "x" / "y"));
}

TEST_F(LocalProviderTest, RenameMovesFiles) {
    write_file(tmp / "from", "payload");
    fs::create_directories(tmp / "dst");
    ASSERT_TRUE(local.supports_rename());
    EXPECT_TRUE(local.rename(at("from"), at("dst/to")));
    EXPECT_FALSE(fs::exists(tmp / "from"));
    EXPECT_EQ(read_file(tmp / "dst" / "to"), "payload");

    auto missing = local.rename(at("from"), at("dst/again"));
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().kind, ErrorKind::NotFound);
}

TEST(ErrorMapping, ErrnoValuesMapToKinds) {
    EXPECT_EQ(kind_from_code(std::make_error_code(std::errc::no_such_file_or_directory)), ErrorKind::NotFound);
    EXPECT_EQ(kind_from_code(std::make_error_code(std::errc::permission_denied)), ErrorKind::PermissionDenied);
    EXPECT_EQ(kind_from_code(std::make_error_code(std::errc::file_exists)), ErrorKind::AlreadyExists);
    EXPECT_EQ(kind_from_code(std::make_error_code(std::errc::no_space_on_device)), ErrorKind::QuotaOrNetwork);
    EXPECT_EQ(kind_from_code(std::make_error_code(std::errc::io_error)), ErrorKind::Io);
    EXPECT_EQ(str(describe(make_error(ErrorKind::NotFound, "/tmp/x"))), "not found: /tmp/x");
}
