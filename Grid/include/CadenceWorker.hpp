#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

// Runs a task on its own thread each time it is kicked. Kicks that arrive
// while a round is still running are coalesced into one follow-up round,
// so the kicking thread never waits.
class CadenceWorker {
public:
    CadenceWorker(std::string name, std::function<void()> task);
    ~CadenceWorker();

    void start();
    void stop();

    // Non-blocking. Returns false when a round was already pending.
    bool kick();

    // Run the task on the calling thread (used when the worker is not started).
    void runInline();

    int completedRounds() const { return completed_.load(); }
    int failedRounds() const { return failed_.load(); }
    bool running() const { return running_.load(); }

private:
    void loop_();
    void runOnce_();

    std::string name_;
    std::function<void()> task_;
    std::thread thread_;
    std::mutex mtx_;
    std::condition_variable cv_;
    std::atomic<bool> running_{false};
    bool pending_ = false;
    std::atomic<int> completed_{0};
    std::atomic<int> failed_{0};
};
