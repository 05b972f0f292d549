#include "TaskDispatch.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <QMetaObject>
#include <QObject>
#include <spdlog/spdlog.h>

namespace {

void log_task_failure(const char* what)
{
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->error("Background task failed: {}", what);
    } else {
        std::fprintf(stderr, "Background task failed: %s\n", what);
    }
}

}


void InlineExecutor::post(std::function<void()> task)
{
    if (task) {
        task();
    }
}


ThreadExecutor::~ThreadExecutor()
{
    // Tasks may post follow-up tasks while we join, so drain until empty.
    for (;;) {
        std::vector<std::thread> workers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (workers_.empty()) {
                break;
            }
            workers.swap(workers_);
            finished_.clear();
        }
        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }
}


void ThreadExecutor::post(std::function<void()> task)
{
    if (!task) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    reap_finished_locked();
    ++running_;
    workers_.emplace_back([this, task = std::move(task)]() {
        try {
            task();
        } catch (const std::exception& ex) {
            log_task_failure(ex.what());
        }
        std::lock_guard<std::mutex> done_lock(mutex_);
        finished_.push_back(std::this_thread::get_id());
        --running_;
        if (running_ == 0) {
            idle_cv_.notify_all();
        }
    });
}


bool ThreadExecutor::idle() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return running_ == 0;
}


void ThreadExecutor::wait_idle()
{
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]() { return running_ == 0; });
}


void ThreadExecutor::reap_finished_locked()
{
    for (const auto& id : finished_) {
        auto it = std::find_if(workers_.begin(), workers_.end(),
                               [&id](const std::thread& worker) { return worker.get_id() == id; });
        if (it != workers_.end()) {
            it->join();
            workers_.erase(it);
        }
    }
    finished_.clear();
}


QtMainThreadDispatcher::QtMainThreadDispatcher(QObject* context)
    : context_(context)
{
}


void QtMainThreadDispatcher::post(std::function<void()> task)
{
    if (!task || !context_) {
        return;
    }
    QMetaObject::invokeMethod(context_, std::move(task), Qt::QueuedConnection);
}
