#pragma once

#include "core/types.hpp"
#include "db/iconnection_pool.hpp"
#include "pool/ipool_factory.hpp"
#include <atomic>
#include <memory>

namespace vaultagent {

enum class HandleState : uint8_t {
    ACTIVE,
    DRAINING,
    RETIRED
};

inline constexpr const char* handle_state_name(HandleState state) {
    switch (state) {
        case HandleState::ACTIVE:   return "active";
        case HandleState::DRAINING: return "draining";
        case HandleState::RETIRED:  return "retired";
    }
    return "unknown";
}

/**
 * @brief A pool together with the credential it was built from
 *
 * Borrow bookkeeping is lock-free: a borrower increments the outstanding
 * count and then checks the state, the drainer sets the state and then
 * checks the count, so whichever side observes DRAINING with zero
 * outstanding retires the handle. Retirement closes the pool exactly once.
 */
class PoolHandle {
public:
    PoolHandle(std::shared_ptr<IConnectionPool> pool,
               Credential credential,
               std::shared_ptr<IPoolFactory> factory);

    PoolHandle(const PoolHandle&) = delete;
    PoolHandle& operator=(const PoolHandle&) = delete;

    [[nodiscard]] const Credential& credential() const { return credential_; }
    [[nodiscard]] IConnectionPool& pool() const { return *pool_; }
    [[nodiscard]] HandleState state() const { return state_.load(); }
    [[nodiscard]] size_t outstanding() const { return outstanding_.load(); }

    /// Register a borrow. False (and nothing registered) unless ACTIVE.
    [[nodiscard]] bool try_borrow();

    /// Unregister a borrow; retires the handle if it was the last one on a draining pool.
    void end_borrow();

    /// ACTIVE -> DRAINING; retires immediately when nothing is borrowed.
    void begin_drain();

private:
    bool retire_if_idle();

    std::shared_ptr<IConnectionPool> pool_;
    const Credential credential_;
    std::shared_ptr<IPoolFactory> factory_;

    std::atomic<HandleState> state_{HandleState::ACTIVE};
    std::atomic<size_t> outstanding_{0};
};

} // namespace vaultagent
