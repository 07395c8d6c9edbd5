#include "duet/batch.hpp"
#include "duet/log.hpp"

#include <chrono>
#include <utility>

namespace duet {

    dp::usize BatchResult::succeeded() const {
        dp::usize n = 0;
        for (const auto &r : results) {
            if (r.outcome.succeeded())
                ++n;
        }
        return n;
    }

    dp::usize BatchResult::failed() const { return results.size() - succeeded(); }

    namespace {

        void append_tasks(dp::Vector<TransferTask> &out, const Pane &from, const Pane &to, Action action) {
            for (const auto &m : from.marked(action)) {
                TransferTask task;
                task.action = action;
                task.source = from.provider();
                task.source_dir = m.location;
                task.entry = m.entry;
                task.destination = to.provider();
                task.destination_dir = to.location();
                out.push_back(std::move(task));
            }
        }

    } // namespace

    dp::Vector<TransferTask> plan_batch(const Pane &left, const Pane &right) {
        dp::Vector<TransferTask> tasks;
        append_tasks(tasks, left, right, Action::Move);
        append_tasks(tasks, left, right, Action::Copy);
        append_tasks(tasks, right, left, Action::Move);
        append_tasks(tasks, right, left, Action::Copy);
        append_tasks(tasks, left, right, Action::Delete);
        append_tasks(tasks, right, left, Action::Delete);
        return tasks;
    }

    BatchResult run_batch(const dp::Vector<TransferTask> &tasks, TransferEngine &engine,
                          const BatchProgressCallback &progress) {
        BatchResult result;
        for (dp::usize i = 0; i < tasks.size(); ++i) {
            ProgressCallback file_progress;
            if (progress) {
                file_progress = [&progress, i, &tasks](const Progress &p) {
                    progress(BatchProgress{i, tasks.size(), p});
                };
                progress(BatchProgress{i, tasks.size(), Progress{tasks[i].entry.name, 0, tasks[i].entry.size}});
            }
            Outcome outcome = engine.execute(tasks[i], file_progress);
            result.results.push_back(TaskResult{tasks[i], std::move(outcome)});
        }
        log::info("batch finished: ", result.succeeded(), " succeeded, ", result.failed(), " failed");
        return result;
    }

    void reset_after_batch(Pane &left, Pane &right) {
        left.clear_marks();
        right.clear_marks();
        left.invalidate();
        right.invalidate();
    }

    BatchResult commit(Pane &left, Pane &right, TransferEngine &engine) {
        auto tasks = plan_batch(left, right);
        if (tasks.empty())
            return BatchResult{};
        auto result = run_batch(tasks, engine);
        reset_after_batch(left, right);
        return result;
    }

    // =============================================================================================
    // BatchRunner
    // =============================================================================================

    BatchRunner::BatchRunner(TransferOptions options) : engine_(options) {}

    BatchRunner::~BatchRunner() {
        // No cancellation: a committed batch runs to completion
        if (result_.valid())
            result_.wait();
    }

    bool BatchRunner::start(const Pane &left, const Pane &right) {
        if (running_)
            return false;
        auto tasks = plan_batch(left, right);
        if (tasks.empty())
            return false;

        {
            std::lock_guard lock(progress_mutex_);
            progress_ = BatchProgress{0, tasks.size(), Progress{}};
        }
        running_ = true;
        result_ = std::async(std::launch::async, [this, tasks = std::move(tasks)]() {
            return run_batch(tasks, engine_, [this](const BatchProgress &p) {
                std::lock_guard lock(progress_mutex_);
                progress_ = p;
            });
        });
        return true;
    }

    bool BatchRunner::poll() {
        if (!running_ || !result_.valid())
            return false;
        return result_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    BatchProgress BatchRunner::progress() const {
        std::lock_guard lock(progress_mutex_);
        return progress_;
    }

    BatchResult BatchRunner::finish(Pane &left, Pane &right) {
        if (!running_ || !result_.valid())
            return BatchResult{};
        BatchResult result = result_.get();
        running_ = false;
        reset_after_batch(left, right);
        return result;
    }

} // namespace duet
