#pragma once

#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <unordered_map>

namespace vaultagent {

/**
 * @brief Collapses concurrent calls for the same key into one execution
 *
 * The first caller for a key runs the work; callers arriving while it is in
 * flight block on a shared_future and receive the same value or the same
 * exception. Once the work completes the key is released, so the next call
 * starts a fresh execution (results are not cached).
 *
 * The work runs outside the internal lock.
 */
template<typename Key, typename T>
class SingleFlight {
public:
    T run(const Key& key, const std::function<T()>& work) {
        std::shared_future<T> pending;
        std::promise<T> promise;
        bool leader = false;

        {
            std::lock_guard lock(mutex_);
            if (const auto it = in_flight_.find(key); it != in_flight_.end()) {
                pending = it->second;
            } else {
                pending = promise.get_future().share();
                in_flight_.emplace(key, pending);
                leader = true;
            }
        }

        if (!leader) {
            return pending.get();
        }

        try {
            T value = work();
            release(key);
            promise.set_value(value);
            return value;
        } catch (...) {
            release(key);
            promise.set_exception(std::current_exception());
            throw;
        }
    }

    [[nodiscard]] size_t in_flight() const {
        std::lock_guard lock(mutex_);
        return in_flight_.size();
    }

private:
    void release(const Key& key) {
        std::lock_guard lock(mutex_);
        in_flight_.erase(key);
    }

    mutable std::mutex mutex_;
    std::unordered_map<Key, std::shared_future<T>> in_flight_;
};

} // namespace vaultagent
