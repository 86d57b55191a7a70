#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <string>
#include <thread>

namespace pixelair::core {

/**
 * @brief Base class for the client's background loops (discovery, push, poll).
 *
 * Threading model:
 * - `start()` launches a worker thread that calls the virtual `run()`.
 * - `run()` checks `isRunning()` and waits through `sleepFor()`, which wakes
 *   immediately when `stop()` is requested.
 * - `stop()` waits for the worker up to a deadline, then joins. Workers only
 *   block in sliced waits, so the deadline is a diagnostic bound: overruns are
 *   logged as errors.
 */
class BackgroundWorker {
public:
    explicit BackgroundWorker(std::string name);
    virtual ~BackgroundWorker();

    BackgroundWorker(const BackgroundWorker&) = delete;
    BackgroundWorker& operator=(const BackgroundWorker&) = delete;

    /// Start the worker thread. Returns false if it is already running.
    bool start();

    /// Request the thread to stop and wait for it to finish.
    void stop(std::chrono::milliseconds deadline = std::chrono::milliseconds{2000});

    bool isRunning() const { return running.load(); }

protected:
    virtual void run() = 0; // the worker loop

    /// Interruptible sleep. Returns false if the worker was asked to stop.
    bool sleepFor(std::chrono::milliseconds duration);

    std::atomic<bool> running{false};

private:
    void joinWorker();

    std::string workerName;
    std::thread worker;
    std::future<void> finished;
    mutable std::mutex wakeMutex;
    std::condition_variable wake;
};

} // namespace pixelair::core
