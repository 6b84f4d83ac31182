#include "pool/pool_handle.hpp"
#include "core/utils.hpp"
#include <format>

namespace vaultagent {

PoolHandle::PoolHandle(std::shared_ptr<IConnectionPool> pool,
                       Credential credential,
                       std::shared_ptr<IPoolFactory> factory)
    : pool_(std::move(pool)),
      credential_(std::move(credential)),
      factory_(std::move(factory)) {}

bool PoolHandle::try_borrow() {
    outstanding_.fetch_add(1);
    if (state_.load() == HandleState::ACTIVE) {
        return true;
    }
    end_borrow();
    return false;
}

void PoolHandle::end_borrow() {
    if (outstanding_.fetch_sub(1) == 1) {
        retire_if_idle();
    }
}

void PoolHandle::begin_drain() {
    auto expected = HandleState::ACTIVE;
    if (!state_.compare_exchange_strong(expected, HandleState::DRAINING)) {
        return;
    }
    utils::log::debug(std::format("Pool '{}' draining ({} borrowed)",
        pool_->name(), outstanding_.load()));
    retire_if_idle();
}

bool PoolHandle::retire_if_idle() {
    if (outstanding_.load() != 0) {
        return false;
    }
    auto expected = HandleState::DRAINING;
    if (!state_.compare_exchange_strong(expected, HandleState::RETIRED)) {
        return false;
    }
    // Reached from borrow destructors, so close failures are logged, not thrown
    try {
        factory_->close(*pool_);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Pool '{}': close failed: {}", pool_->name(), e.what()));
    }
    utils::log::info(std::format("Pool '{}' retired (lease {})",
        pool_->name(), credential_.lease_id));
    return true;
}

} // namespace vaultagent
