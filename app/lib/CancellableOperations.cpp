#include "CancellableOperations.hpp"
#include "EnhancementErrors.hpp"


void CancellationToken::throw_if_cancelled() const
{
    if (is_cancelled()) {
        throw OperationCancelled();
    }
}


CancellationTokenPtr OperationSlots::begin(const std::string& key)
{
    auto token = std::make_shared<CancellationToken>();
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = slots_[key];
    if (slot) {
        slot->cancel();
    }
    slot = token;
    return token;
}


bool OperationSlots::is_current(const std::string& key, const CancellationTokenPtr& token) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = slots_.find(key);
    return it != slots_.end() && it->second == token && !token->is_cancelled();
}


bool OperationSlots::finish(const std::string& key, const CancellationTokenPtr& token)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = slots_.find(key);
    if (it == slots_.end() || it->second != token) {
        return false;
    }
    slots_.erase(it);
    return !token->is_cancelled();
}


void OperationSlots::cancel(const std::string& key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = slots_.find(key);
    if (it == slots_.end()) {
        return;
    }
    it->second->cancel();
    slots_.erase(it);
}


void OperationSlots::cancel_all()
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : slots_) {
        entry.second->cancel();
    }
    slots_.clear();
}


bool OperationSlots::active(const std::string& key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.find(key) != slots_.end();
}


bool OperationSlots::empty() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.empty();
}
