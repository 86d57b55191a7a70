#include "pixelair/core/BackgroundWorker.hpp"
#include "pixelair/log/Log.hpp"

#include <exception>

namespace pixelair::core {

BackgroundWorker::BackgroundWorker(std::string name) : workerName(std::move(name)) {}

BackgroundWorker::~BackgroundWorker() {
    // Derived classes stop in their own destructor, while run() is still valid.
    running = false;
    wake.notify_all();
    if (worker.joinable()) {
        worker.join();
    }
}

bool BackgroundWorker::start() {
    std::lock_guard lock(wakeMutex);
    if (running) {
        return false;
    }
    if (worker.joinable()) {
        // Previous run finished on its own (e.g. a completed discovery scan).
        worker.join();
    }
    running = true;
    std::packaged_task<void()> task([this] {
        try {
            this->run();
        } catch (const std::exception& ex) {
            logError("[", workerName, "] worker loop failed: ", ex.what(), "\n");
        }
        running = false;
    });
    finished = task.get_future();
    worker = std::thread(std::move(task));
    return true;
}

void BackgroundWorker::stop(std::chrono::milliseconds deadline) {
    {
        std::lock_guard lock(wakeMutex);
        running = false;
    }
    wake.notify_all();

    if (!worker.joinable()) {
        return;
    }
    if (finished.valid() &&
        finished.wait_for(deadline) != std::future_status::ready) {
        logError("[", workerName, "] did not stop within ", deadline.count(),
                 "ms; waiting for the current wait slice to expire\n");
    }
    joinWorker();
}

bool BackgroundWorker::sleepFor(std::chrono::milliseconds duration) {
    std::unique_lock lock(wakeMutex);
    wake.wait_for(lock, duration, [this] { return !running.load(); });
    return running.load();
}

void BackgroundWorker::joinWorker() {
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
        worker.join();
    }
}

} // namespace pixelair::core
