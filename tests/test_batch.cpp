#include "duet/batch.hpp"
#include "duet/memory_bucket.hpp"
#include "duet/object_store_provider.hpp"
#include "duet/view.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace duet;
using namespace duet::testing;

class BatchTest : public ::testing::Test {
  protected:
    void SetUp() override {
        write_file(tmp / "src" / "a.txt", "a");
        write_file(tmp / "src" / "sub" / "b.txt", "bb");
        write_file(tmp / "notes.txt", "notes");
        write_file(tmp / "trash.txt", "trash");
        ASSERT_TRUE(bucket->put("dest/existing", "e"));
        ASSERT_TRUE(bucket->put("remote.txt", "remote"));
    }

    Pane left_pane() const { return Pane(local, LocalProvider::locate(tmp.path())); }
    Pane right_pane(const char *prefix = "dest") const { return Pane(store, Location::parse(store->id(), prefix)); }

    static Entry entry_named(Pane &pane, const std::string &name) {
        auto entries = pane.current_entries();
        EXPECT_TRUE(entries);
        return find_entry(entries ? entries.value() : dp::Vector<Entry>{}, name);
    }

    TempDir tmp;
    std::shared_ptr<LocalProvider> local = std::make_shared<LocalProvider>();
    std::shared_ptr<MemoryBucket> bucket = std::make_shared<MemoryBucket>("demo");
    std::shared_ptr<ObjectStoreProvider> store = std::make_shared<ObjectStoreProvider>(bucket);
};

TEST_F(BatchTest, EmptyCommitLeavesPanesUntouched) {
    Pane left = left_pane();
    Pane right = right_pane();
    ASSERT_TRUE(left.refresh());
    ASSERT_TRUE(right.refresh());

    TransferEngine engine;
    auto result = commit(left, right, engine);
    EXPECT_TRUE(result.empty());
    EXPECT_TRUE(left.is_loaded());
    EXPECT_TRUE(right.is_loaded());
}

TEST_F(BatchTest, CopyDirectoryIntoBucketLocation) {
    Pane left = left_pane();
    Pane right = right_pane();
    left.mark(entry_named(left, "src"), Action::Copy);

    TransferEngine engine;
    auto result = commit(left, right, engine);
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result.succeeded(), 1u);

    EXPECT_EQ(left.mark_count(), 0u);
    EXPECT_FALSE(right.is_loaded());
    auto listed = right.current_entries();
    ASSERT_TRUE(listed);
    EXPECT_EQ(names(listed.value()), (std::vector<std::string>{"sub/", "a.txt", "existing"}));
    EXPECT_EQ(slurp(*store, Location::parse(store->id(), "dest/sub/b.txt")), "bb");
    EXPECT_TRUE(fs::exists(tmp / "src" / "a.txt"));
}

TEST_F(BatchTest, PlanOrdersMovesCopiesThenDeletes) {
    Pane left = left_pane();
    Pane right = right_pane("");

    left.mark(entry_named(left, "trash.txt"), Action::Delete);
    left.mark(entry_named(left, "notes.txt"), Action::Copy);
    left.mark(entry_named(left, "src"), Action::Move);
    right.mark(entry_named(right, "remote.txt"), Action::Copy);
    right.mark(entry_named(right, "dest"), Action::Delete);

    auto tasks = plan_batch(left, right);
    ASSERT_EQ(tasks.size(), 5u);
    EXPECT_EQ(tasks[0].action, Action::Move);
    EXPECT_EQ(str(tasks[0].entry.name), "src");
    EXPECT_EQ(tasks[1].action, Action::Copy);
    EXPECT_EQ(str(tasks[1].entry.name), "notes.txt");
    EXPECT_EQ(tasks[2].action, Action::Copy);
    EXPECT_EQ(str(tasks[2].entry.name), "remote.txt");
    EXPECT_EQ(tasks[2].destination_dir, left.location());
    EXPECT_EQ(tasks[3].action, Action::Delete);
    EXPECT_EQ(str(tasks[3].entry.name), "trash.txt");
    EXPECT_EQ(tasks[4].action, Action::Delete);
    EXPECT_EQ(str(tasks[4].entry.name), "dest");
}

TEST_F(BatchTest, FailuresDoNotStopTheBatch) {
    Pane left = left_pane();
    Pane right = right_pane();
    Entry notes = entry_named(left, "notes.txt");
    Entry trash = entry_named(left, "trash.txt");
    left.mark(notes, Action::Copy);
    left.mark(trash, Action::Delete);
    fs::remove(tmp / "notes.txt");

    TransferEngine engine;
    auto result = commit(left, right, engine);
    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result.failed(), 1u);
    EXPECT_FALSE(result.results[0].outcome.succeeded());
    EXPECT_EQ(result.results[0].outcome.failure.value().kind, ErrorKind::NotFound);
    EXPECT_TRUE(result.results[1].outcome.succeeded());
    EXPECT_FALSE(fs::exists(tmp / "trash.txt"));

    auto lines = summarize(result);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(str(lines[0]), "2 task(s): 1 ok, 1 failed");
    EXPECT_NE(str(lines[1]).find("notes.txt"), std::string::npos);
}

TEST_F(BatchTest, ProgressReportsEveryTask) {
    Pane left = left_pane();
    Pane right = right_pane();
    left.mark(entry_named(left, "notes.txt"), Action::Copy);
    left.mark(entry_named(left, "trash.txt"), Action::Copy);

    TransferEngine engine;
    dp::usize highest = 0;
    auto result = run_batch(plan_batch(left, right), engine, [&](const BatchProgress &p) {
        EXPECT_EQ(p.task_count, 2u);
        if (p.task_index > highest)
            highest = p.task_index;
    });
    EXPECT_EQ(result.succeeded(), 2u);
    EXPECT_EQ(highest, 1u);
}

TEST_F(BatchTest, ListingStaysConsistentWhileDeleting) {
    for (int i = 0; i < 200; ++i)
        ASSERT_TRUE(bucket->put(("bulk/f" + std::to_string(i)).c_str(), "x"));

    Pane left = left_pane();
    Pane right = right_pane("");
    right.mark(entry_named(right, "bulk"), Action::Delete);
    auto tasks = plan_batch(left, right);

    std::atomic<bool> done{false};
    std::atomic<int> bad{0};
    std::thread reader([&] {
        auto at = Location::parse(store->id(), "bulk");
        while (!done) {
            auto listed = store->list(at);
            if (!listed) {
                ++bad;
                continue;
            }
            for (const auto &e : listed.value()) {
                if (e.is_directory() || e.size != 1)
                    ++bad;
            }
        }
    });

    TransferEngine engine;
    auto result = run_batch(tasks, engine);
    done = true;
    reader.join();

    EXPECT_EQ(result.succeeded(), 1u);
    EXPECT_EQ(bad.load(), 0);
    EXPECT_EQ(list_names(*store, store->root()), (std::vector<std::string>{"dest/", "remote.txt"}));
}

TEST_F(BatchTest, RunnerCommitsInTheBackground) {
    Pane left = left_pane();
    Pane right = right_pane();
    left.mark(entry_named(left, "src"), Action::Move);

    BatchRunner runner;
    ASSERT_TRUE(runner.start(left, right));
    EXPECT_TRUE(runner.running());
    EXPECT_FALSE(runner.start(left, right));

    while (!runner.poll())
        std::this_thread::sleep_for(std::chrono::milliseconds(5));

    auto result = runner.finish(left, right);
    EXPECT_FALSE(runner.running());
    ASSERT_EQ(result.size(), 1u);
    EXPECT_TRUE(result.results[0].outcome.succeeded());
    EXPECT_EQ(left.mark_count(), 0u);
    EXPECT_FALSE(fs::exists(tmp / "src"));
    EXPECT_EQ(slurp(*store, Location::parse(store->id(), "dest/a.txt")), "a");
}

TEST_F(BatchTest, RunnerRefusesAnEmptyPlan) {
    Pane left = left_pane();
    Pane right = right_pane();
    BatchRunner runner;
    EXPECT_FALSE(runner.start(left, right));
    EXPECT_FALSE(runner.poll());
    EXPECT_TRUE(runner.finish(left, right).empty());
}
