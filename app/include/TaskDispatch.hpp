#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

class QObject;

class IExecutor {
public:
    virtual ~IExecutor() = default;
    virtual void post(std::function<void()> task) = 0;
};


/**
 * @brief Runs tasks immediately on the calling thread.
 */
class InlineExecutor : public IExecutor {
public:
    void post(std::function<void()> task) override;
};


/**
 * @brief Runs each task on its own worker thread; joins all of them on destruction.
 */
class ThreadExecutor : public IExecutor {
public:
    ThreadExecutor() = default;
    ~ThreadExecutor() override;

    ThreadExecutor(const ThreadExecutor&) = delete;
    ThreadExecutor& operator=(const ThreadExecutor&) = delete;

    void post(std::function<void()> task) override;
    bool idle() const;
    void wait_idle();

private:
    void reap_finished_locked();

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::vector<std::thread> workers_;
    std::vector<std::thread::id> finished_;
    std::size_t running_{0};
};


/**
 * @brief Queues tasks onto the thread that owns @p context (the Qt event loop).
 */
class QtMainThreadDispatcher : public IExecutor {
public:
    explicit QtMainThreadDispatcher(QObject* context);
    void post(std::function<void()> task) override;

private:
    QObject* context_;
};
