#include "CadenceWorker.hpp"
#include "Logger.hpp"

#include <exception>
#include <utility>

CadenceWorker::CadenceWorker(std::string name, std::function<void()> task)
    : name_(std::move(name)),
      task_(std::move(task)) {}

CadenceWorker::~CadenceWorker() {
    stop();
}

void CadenceWorker::start() {
    if (running_) return;
    running_ = true;
    thread_ = std::thread([this]() { loop_(); });
}

void CadenceWorker::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

bool CadenceWorker::kick() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (pending_) return false;
        pending_ = true;
    }
    cv_.notify_one();
    return true;
}

void CadenceWorker::runInline() {
    runOnce_();
}

void CadenceWorker::runOnce_() {
    // A failed round is reported and the next kick tries again; the control
    // cycle is never affected.
    try {
        task_();
        completed_.fetch_add(1);
    } catch (const std::exception& e) {
        failed_.fetch_add(1);
        Logger::instance().message("[warn] " + name_ + " round failed: " + e.what() + "\n");
    }
}

void CadenceWorker::loop_() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_.wait(lock, [&]() { return !running_ || pending_; });
            if (!running_) break;
            pending_ = false;
        }
        runOnce_();
    }
}
