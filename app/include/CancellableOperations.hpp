#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>

/**
 * @brief Cooperative cancellation flag shared between an owner and a worker.
 */
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true); }
    bool is_cancelled() const noexcept { return cancelled_.load(); }

    /**
     * @brief Throws OperationCancelled once cancel() has been called.
     */
    void throw_if_cancelled() const;

private:
    std::atomic<bool> cancelled_{false};
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;


/**
 * @brief Keyed table of in-flight operations.
 *
 * Starting an operation under a key cancels the token previously stored
 * there, so only the newest operation per key can apply its result.
 */
class OperationSlots {
public:
    CancellationTokenPtr begin(const std::string& key);
    bool is_current(const std::string& key, const CancellationTokenPtr& token) const;
    /**
     * @brief Clears the slot when @p token still owns it.
     * @return True when the token was current (its result may be applied).
     */
    bool finish(const std::string& key, const CancellationTokenPtr& token);
    void cancel(const std::string& key);
    void cancel_all();
    bool active(const std::string& key) const;
    bool empty() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, CancellationTokenPtr> slots_;
};
