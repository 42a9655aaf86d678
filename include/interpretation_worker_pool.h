#pragma once

#include "errors.h"
#include "interpretation_orchestrator.h"
#include <string>
#include <functional>
#include <memory>
#include <vector>
#include <thread>
#include <atomic>
#include <mutex>
#include <queue>
#include <unordered_map>
#include <condition_variable>
#include <chrono>
#include <cstdint>

namespace domo_nlu {

/**
 * @brief Completed request handed to the submit() callback
 */
struct InterpretationOutcome {
    uint64_t request_id = 0;
    std::string text;
    Interpretation interpretation;
};

/**
 * @brief Callback type for request completion (runs on a worker thread)
 */
using InterpretationCallback = std::function<void(const InterpretationOutcome&)>;

/**
 * @brief Fixed pool of worker threads running requests through one orchestrator
 *
 * Requests are independent; the orchestrator's snapshot reads make concurrent
 * interpretation and vocabulary reloads safe. Each queued request carries its
 * own cancel token so a caller can abandon a slow fallback wait.
 */
class InterpretationWorkerPool {
public:
    /**
     * @param orchestrator Must outlive the pool
     * @param worker_count Number of worker threads (at least 1)
     */
    explicit InterpretationWorkerPool(const InterpretationOrchestrator& orchestrator, size_t worker_count = 4);

    /**
     * @brief Destructor - drains the queue and joins workers
     */
    ~InterpretationWorkerPool();

    InterpretationWorkerPool(const InterpretationWorkerPool&) = delete;
    InterpretationWorkerPool& operator=(const InterpretationWorkerPool&) = delete;

    /**
     * @brief Queue a request
     * @return Request id (> 0), or 0 if the pool is shut down
     */
    uint64_t submit(const std::string& text, InterpretationCallback callback);

    /**
     * @brief Queue a request and block until it completes
     * @param wait_ms Maximum wait (0 = wait indefinitely). On expiry the request
     *        is cancelled and a Timeout error is returned.
     */
    Result<Interpretation> interpret_sync(const std::string& text, int wait_ms = 0);

    /**
     * @brief Raise the cancel token of a queued or running request
     * @return false if the id is unknown or already finished
     */
    bool cancel(uint64_t request_id);

    /**
     * @brief Check if the pool is idle (nothing queued or running)
     */
    bool is_idle() const;

    /**
     * @brief Count of queued and running requests
     */
    size_t pending_count() const;

    /**
     * @brief Wait for all pending requests to complete
     * @param timeout_ms Maximum time to wait (0 = wait indefinitely)
     * @return true if all completed, false if timeout
     */
    bool wait_for_completion(int timeout_ms = 0);

    /**
     * @brief Stop accepting requests; queued ones still run
     */
    void shutdown();

private:
    struct Task {
        uint64_t request_id = 0;
        std::string text;
        CancelToken cancel;
        InterpretationCallback callback;
    };

    void worker_thread();
    void run_task(const Task& task);

    const InterpretationOrchestrator& orchestrator_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> next_id_;
    size_t active_;

    std::queue<Task> task_queue_;
    std::unordered_map<uint64_t, CancelToken> in_flight_;
    mutable std::mutex queue_mutex_;  // mutable to allow locking in const methods
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;

    std::vector<std::thread> worker_threads_;
};

} // namespace domo_nlu
