#include "interpretation_worker_pool.h"
#include "logger.h"

namespace domo_nlu {

InterpretationWorkerPool::InterpretationWorkerPool(const InterpretationOrchestrator& orchestrator, size_t worker_count)
    : orchestrator_(orchestrator), running_(true), next_id_(1), active_(0) {
    if (worker_count == 0) {
        worker_count = 1;
    }

    // Start worker threads
    for (size_t i = 0; i < worker_count; ++i) {
        worker_threads_.emplace_back(&InterpretationWorkerPool::worker_thread, this);
    }
    LOG_DEBUG("Worker pool started with " + std::to_string(worker_count) + " threads");
}

InterpretationWorkerPool::~InterpretationWorkerPool() {
    shutdown();

    for (auto& thread : worker_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

uint64_t InterpretationWorkerPool::submit(const std::string& text, InterpretationCallback callback) {
    Task task;
    task.text = text;
    task.cancel = make_cancel_token();
    task.callback = std::move(callback);

    uint64_t id = 0;
    {
        // Checked under the queue lock: a task accepted here is always seen by a worker
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_) {
            Logger::warn("Worker pool is shut down, rejecting request: " + text);
            return 0;
        }
        id = next_id_.fetch_add(1);
        task.request_id = id;
        in_flight_[id] = task.cancel;
        task_queue_.push(std::move(task));
    }

    queue_cv_.notify_one();
    return id;
}

Result<Interpretation> InterpretationWorkerPool::interpret_sync(const std::string& text, int wait_ms) {
    // Shared with the callback, which may fire after this call has timed out and returned
    struct SyncState {
        std::mutex mutex;
        std::condition_variable cv;
        bool completed = false;
        Interpretation interpretation;
    };
    auto state = std::make_shared<SyncState>();

    uint64_t id = submit(text, [state](const InterpretationOutcome& outcome) {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->interpretation = outcome.interpretation;
        state->completed = true;
        state->cv.notify_one();
    });
    if (id == 0) {
        return make_internal_error("worker pool is shut down");
    }

    std::unique_lock<std::mutex> lock(state->mutex);
    if (wait_ms > 0) {
        state->cv.wait_for(lock, std::chrono::milliseconds(wait_ms), [&] { return state->completed; });
        if (!state->completed) {
            lock.unlock();
            cancel(id);
            return make_timeout_error("interpretation did not finish within " + std::to_string(wait_ms) + "ms");
        }
    } else {
        state->cv.wait(lock, [&] { return state->completed; });
    }

    return state->interpretation;
}

bool InterpretationWorkerPool::cancel(uint64_t request_id) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    auto it = in_flight_.find(request_id);
    if (it == in_flight_.end()) {
        return false;
    }
    it->second->store(true);
    LOG_DEBUG("Cancelled request " + std::to_string(request_id));
    return true;
}

bool InterpretationWorkerPool::is_idle() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return task_queue_.empty() && active_ == 0;
}

size_t InterpretationWorkerPool::pending_count() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return task_queue_.size() + active_;
}

bool InterpretationWorkerPool::wait_for_completion(int timeout_ms) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    auto idle = [this] { return task_queue_.empty() && active_ == 0; };
    if (timeout_ms > 0) {
        return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), idle);
    }
    idle_cv_.wait(lock, idle);
    return true;
}

void InterpretationWorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_ = false;
    }
    queue_cv_.notify_all();
}

void InterpretationWorkerPool::worker_thread() {
    while (true) {
        Task task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] {
                return !task_queue_.empty() || !running_;
            });

            // Drain what was queued before shutdown
            if (task_queue_.empty()) {
                break;
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
            active_++;
        }

        run_task(task);

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            in_flight_.erase(task.request_id);
            active_--;
        }
        idle_cv_.notify_all();
    }
}

void InterpretationWorkerPool::run_task(const Task& task) {
    InterpretationOutcome outcome;
    outcome.request_id = task.request_id;
    outcome.text = task.text;

    try {
        outcome.interpretation = orchestrator_.interpret(task.text, task.cancel);
    } catch (const std::exception& e) {
        Logger::error("Interpretation exception for request " + std::to_string(task.request_id) + ": " + e.what());
        outcome.interpretation.degraded = true;
        outcome.interpretation.note = std::string("internal error: ") + e.what();
    }

    if (task.callback) {
        task.callback(outcome);
    }
}

} // namespace domo_nlu
