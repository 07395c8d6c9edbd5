#include "duet/memory_bucket.hpp"
#include "duet/object_store_provider.hpp"
#include "duet/pane.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace duet;
using namespace duet::testing;

class PaneTest : public ::testing::Test {
  protected:
    void SetUp() override {
        write_file(tmp / "alpha.txt", "a");
        write_file(tmp / "beta.txt", "bb");
        write_file(tmp / ".hidden", "h");
        write_file(tmp / "sub" / "inner.txt", "i");
    }

    TempDir tmp;
    std::shared_ptr<LocalProvider> local = std::make_shared<LocalProvider>();
};

TEST_F(PaneTest, ListsLazilyAndHidesDotEntries) {
    Pane pane(local, LocalProvider::locate(tmp.path()));
    EXPECT_FALSE(pane.is_loaded());

    auto entries = pane.current_entries();
    ASSERT_TRUE(entries);
    EXPECT_TRUE(pane.is_loaded());
    EXPECT_EQ(names(entries.value()), (std::vector<std::string>{"sub/", "alpha.txt", "beta.txt"}));

    pane.set_show_hidden(true);
    EXPECT_FALSE(pane.is_loaded());
    auto all = pane.current_entries();
    ASSERT_TRUE(all);
    EXPECT_EQ(all.value().size(), 4u);
}

TEST_F(PaneTest, CachedListingSurvivesUntilInvalidated) {
    Pane pane(local, LocalProvider::locate(tmp.path()));
    ASSERT_TRUE(pane.refresh());
    write_file(tmp / "gamma.txt", "g");
    EXPECT_EQ(pane.entries().size(), 3u);

    pane.invalidate();
    auto entries = pane.current_entries();
    ASSERT_TRUE(entries);
    EXPECT_EQ(entries.value().size(), 4u);
}

TEST_F(PaneTest, CursorStaysInRange) {
    Pane pane(local, LocalProvider::locate(tmp.path()));
    ASSERT_TRUE(pane.refresh());
    pane.move_cursor(-5);
    EXPECT_EQ(pane.cursor(), 0u);
    pane.move_cursor(10);
    EXPECT_EQ(pane.cursor(), 2u);
    ASSERT_TRUE(pane.selected().has_value());
    EXPECT_EQ(str(pane.selected().value().name), "beta.txt");
    pane.set_cursor(99);
    EXPECT_EQ(pane.cursor(), 2u);
}

TEST_F(PaneTest, NavigationIntoAndBackUp) {
    Pane pane(local, LocalProvider::locate(tmp.path()));
    ASSERT_TRUE(pane.refresh());
    auto sub = find_entry(pane.entries(), "sub");

    auto into = pane.navigate_into(sub);
    ASSERT_TRUE(into);
    EXPECT_TRUE(into.value());
    EXPECT_EQ(pane.location(), LocalProvider::locate(tmp.path() / "sub"));
    EXPECT_EQ(names(pane.entries()), std::vector<std::string>{"inner.txt"});

    auto up = pane.navigate_up();
    ASSERT_TRUE(up);
    EXPECT_EQ(pane.location(), LocalProvider::locate(tmp.path()));
    ASSERT_TRUE(pane.selected().has_value());
    EXPECT_EQ(str(pane.selected().value().name), "sub");
}

TEST_F(PaneTest, NavigatingIntoAFileIsRejected) {
    Pane pane(local, LocalProvider::locate(tmp.path()));
    ASSERT_TRUE(pane.refresh());
    auto file = find_entry(pane.entries(), "alpha.txt");
    auto into = pane.navigate_into(file);
    ASSERT_FALSE(into);
    EXPECT_EQ(into.error().kind, ErrorKind::Unsupported);
    EXPECT_EQ(pane.location(), LocalProvider::locate(tmp.path()));
}

TEST_F(PaneTest, FailedNavigationKeepsTheLocation) {
    Pane pane(local, LocalProvider::locate(tmp.path()));
    ASSERT_TRUE(pane.refresh());
    auto moved = pane.navigate_to(LocalProvider::locate(tmp.path() / "missing"));
    ASSERT_FALSE(moved);
    EXPECT_EQ(moved.error().kind, ErrorKind::NotFound);
    EXPECT_EQ(pane.location(), LocalProvider::locate(tmp.path()));
    EXPECT_EQ(pane.entries().size(), 3u);
}

TEST_F(PaneTest, NavigateUpAtRootIsANoOp) {
    auto bucket = std::make_shared<MemoryBucket>("b");
    ASSERT_TRUE(bucket->put("k", "v"));
    auto store = std::make_shared<ObjectStoreProvider>(bucket);
    Pane pane(store, store->root());
    auto up = pane.navigate_up();
    ASSERT_TRUE(up);
    EXPECT_FALSE(up.value());
    EXPECT_TRUE(pane.location().is_root());
}

TEST_F(PaneTest, MarkingForAnotherActionMovesTheEntry) {
    Pane pane(local, LocalProvider::locate(tmp.path()));
    ASSERT_TRUE(pane.refresh());
    auto alpha = find_entry(pane.entries(), "alpha.txt");

    pane.mark(alpha, Action::Delete);
    pane.mark(alpha, Action::Copy);

    EXPECT_TRUE(pane.marked(Action::Delete).empty());
    ASSERT_EQ(pane.marked(Action::Copy).size(), 1u);
    EXPECT_EQ(str(pane.marked(Action::Copy)[0].entry.name), "alpha.txt");
    EXPECT_EQ(pane.mark_count(), 1u);
    ASSERT_TRUE(pane.mark_of(alpha).has_value());
    EXPECT_EQ(pane.mark_of(alpha).value(), Action::Copy);
}

TEST_F(PaneTest, MarksKeepInsertionOrderAndSurviveNavigation) {
    Pane pane(local, LocalProvider::locate(tmp.path()));
    ASSERT_TRUE(pane.refresh());
    auto beta = find_entry(pane.entries(), "beta.txt");
    auto alpha = find_entry(pane.entries(), "alpha.txt");
    pane.mark(beta, Action::Move);
    pane.mark(alpha, Action::Move);
    pane.mark(beta, Action::Move); // already marked: keeps its position

    ASSERT_TRUE(pane.navigate_into(find_entry(pane.entries(), "sub")));
    pane.mark(find_entry(pane.entries(), "inner.txt"), Action::Move);

    auto moves = pane.marked(Action::Move);
    ASSERT_EQ(moves.size(), 3u);
    EXPECT_EQ(str(moves[0].entry.name), "beta.txt");
    EXPECT_EQ(str(moves[1].entry.name), "alpha.txt");
    EXPECT_EQ(str(moves[2].entry.name), "inner.txt");
    EXPECT_EQ(moves[0].location, LocalProvider::locate(tmp.path()));
    EXPECT_EQ(moves[2].location, LocalProvider::locate(tmp.path() / "sub"));

    pane.unmark(alpha);
    EXPECT_EQ(pane.marked(Action::Move).size(), 2u);
    pane.clear_marks();
    EXPECT_EQ(pane.mark_count(), 0u);
}

TEST_F(PaneTest, TitleComesFromTheProvider) {
    Pane pane(local, LocalProvider::locate(tmp.path()));
    EXPECT_EQ(str(pane.title()), tmp.path().string());
}
