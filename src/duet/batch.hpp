#pragma once

#include "duet/pane.hpp"
#include "duet/transfer.hpp"

#include <datapod/datapod.hpp>

#include <future>
#include <mutex>

namespace duet {

    struct TaskResult {
        TransferTask task;
        Outcome outcome;
    };

    // Per-commit report, in commit order; every planned task appears exactly once
    struct BatchResult {
        dp::Vector<TaskResult> results;

        bool empty() const { return results.empty(); }
        dp::usize size() const { return results.size(); }
        dp::usize succeeded() const;
        dp::usize failed() const;
    };

    // =============================================================================================
    // Planning and running
    // =============================================================================================

    // Left Move, left Copy, right Move, right Copy, then left Delete, right Delete; insertion
    // order inside each set. A pane's marks target the other pane's current location.
    dp::Vector<TransferTask> plan_batch(const Pane &left, const Pane &right);

    struct BatchProgress {
        dp::usize task_index{}; // 0-based index of the running task
        dp::usize task_count{};
        Progress file;
    };

    using BatchProgressCallback = std::function<void(const BatchProgress &)>;

    // Runs every task in order; one failure never stops the rest
    BatchResult run_batch(const dp::Vector<TransferTask> &tasks, TransferEngine &engine,
                          const BatchProgressCallback &progress = nullptr);

    // Clears both panes' marks and drops their cached listings
    void reset_after_batch(Pane &left, Pane &right);

    // Synchronous commit: plan, run, reset. An empty plan leaves both panes untouched.
    BatchResult commit(Pane &left, Pane &right, TransferEngine &engine);

    // =============================================================================================
    // BatchRunner - the same commit on a background thread
    // =============================================================================================
    //
    // start() plans on the caller's thread and hands owned tasks to a worker; the worker never
    // touches a Pane. The view polls progress() / poll() and calls finish() once, on its own thread,
    // to apply the pane reset.

    class BatchRunner {
      public:
        explicit BatchRunner(TransferOptions options = {});
        ~BatchRunner();

        BatchRunner(const BatchRunner &) = delete;
        BatchRunner &operator=(const BatchRunner &) = delete;

        // false when a batch is already running or there is nothing to do
        bool start(const Pane &left, const Pane &right);

        bool running() const { return running_; }

        // True once the worker has produced its result
        bool poll();

        BatchProgress progress() const;

        // Blocks until the worker is done, resets the panes and returns the report
        BatchResult finish(Pane &left, Pane &right);

      private:
        TransferEngine engine_;
        std::future<BatchResult> result_;
        bool running_ = false;

        mutable std::mutex progress_mutex_;
        BatchProgress progress_;
    };

} // namespace duet
