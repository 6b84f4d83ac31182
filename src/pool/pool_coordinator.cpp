#include "pool/pool_coordinator.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <format>

namespace vaultagent {

// ============================================================================
// BorrowedConnection
// ============================================================================

BorrowedConnection::BorrowedConnection(std::shared_ptr<PoolHandle> handle,
                                       std::unique_ptr<PooledConnection> conn)
    : handle_(std::move(handle)), conn_(std::move(conn)) {}

BorrowedConnection::~BorrowedConnection() {
    finish(true);
}

BorrowedConnection::BorrowedConnection(BorrowedConnection&& other) noexcept
    : handle_(std::move(other.handle_)), conn_(std::move(other.conn_)) {}

BorrowedConnection& BorrowedConnection::operator=(BorrowedConnection&& other) noexcept {
    if (this != &other) {
        finish(true);
        handle_ = std::move(other.handle_);
        conn_ = std::move(other.conn_);
    }
    return *this;
}

const Credential& BorrowedConnection::credential() const {
    if (!handle_) {
        throw VaultAgentError("Borrowed connection has already been returned");
    }
    return handle_->credential();
}

void BorrowedConnection::discard() {
    finish(false);
}

void BorrowedConnection::finish(bool reusable) {
    if (conn_) {
        if (reusable) {
            conn_->release();
        } else {
            conn_->discard();
        }
        conn_.reset();
    }
    if (handle_) {
        handle_->end_borrow();
        handle_.reset();
    }
}

// ============================================================================
// PoolCoordinator
// ============================================================================

PoolCoordinator::PoolCoordinator(std::shared_ptr<IPoolFactory> factory, PoolConfig options)
    : factory_(std::move(factory)), options_(std::move(options)) {
    if (!factory_) {
        throw ConfigurationError("PoolCoordinator requires a pool factory");
    }
    if (options_.max_connections == 0 || options_.min_connections > options_.max_connections) {
        throw ConfigurationError(std::format("Invalid pool bounds: min={}, max={}",
            options_.min_connections, options_.max_connections));
    }
}

PoolCoordinator::~PoolCoordinator() {
    close_all();
}

std::shared_ptr<PoolHandle> PoolCoordinator::current_handle(const std::string& role) const {
    const RoleSlot* s = find_slot(role);
    if (!s) {
        return nullptr;
    }
    return std::atomic_load_explicit(&s->active, std::memory_order_acquire);
}

std::shared_ptr<PoolHandle> PoolCoordinator::adopt(const std::string& role,
                                                   const Credential& credential) {
    RoleSlot& s = slot(role);
    std::lock_guard adopt_lock(s.adopt_mutex);

    auto previous = std::atomic_load_explicit(&s.active, std::memory_order_acquire);
    if (previous && !credential.lease_id.empty()
        && previous->credential().lease_id == credential.lease_id) {
        return previous;
    }

    std::shared_ptr<IConnectionPool> pool;
    try {
        pool = factory_->build(credential, options_);
    } catch (const std::exception& e) {
        throw ValidationError(std::format("Role '{}': pool build failed: {}", role, e.what()));
    }
    if (!pool) {
        throw ValidationError(std::format("Role '{}': pool factory returned no pool", role));
    }

    bool valid = false;
    std::string detail = "probe failed";
    try {
        valid = factory_->validate(*pool, options_.health_check_query);
    } catch (const std::exception& e) {
        detail = e.what();
    }
    if (!valid) {
        factory_->close(*pool);
        throw ValidationError(std::format("Role '{}': new pool failed validation ({}); keeping {} pool",
            role, detail, previous ? "current" : "no"));
    }

    auto handle = std::make_shared<PoolHandle>(std::move(pool), credential, factory_);
    std::atomic_store_explicit(&s.active, handle, std::memory_order_release);

    prune_retired(s);
    if (previous) {
        previous->begin_drain();
        if (previous->state() != HandleState::RETIRED) {
            s.draining.push_back(std::move(previous));
        }
    }

    utils::log::info(std::format("Role '{}': adopted pool for lease {} ({}s)",
        role, credential.lease_id, credential.lease_duration.count()));
    return handle;
}

BorrowedConnection PoolCoordinator::borrow(const std::string& role,
                                           std::chrono::milliseconds timeout) {
    // A swap can land between the load and try_borrow; reload until an
    // ACTIVE handle accepts the borrow
    for (;;) {
        auto handle = current_handle(role);
        if (!handle) {
            throw ValidationError(std::format("Role '{}': no active pool", role));
        }
        if (!handle->try_borrow()) {
            continue;
        }

        std::unique_ptr<PooledConnection> conn;
        try {
            conn = handle->pool().acquire(timeout);
        } catch (const std::exception&) {
            handle->end_borrow();
            throw;
        }
        if (!conn) {
            handle->end_borrow();
            throw PoolTimeoutError(std::format("Role '{}': no connection available within {}ms",
                role, timeout.count()));
        }
        return BorrowedConnection(std::move(handle), std::move(conn));
    }
}

size_t PoolCoordinator::draining_count(const std::string& role) const {
    RoleSlot* s = find_slot(role);
    if (!s) {
        return 0;
    }
    std::lock_guard adopt_lock(s->adopt_mutex);
    return static_cast<size_t>(std::count_if(s->draining.begin(), s->draining.end(),
        [](const auto& h) { return h->state() == HandleState::DRAINING; }));
}

void PoolCoordinator::close_all() {
    std::vector<RoleSlot*> all;
    {
        std::lock_guard lock(slots_mutex_);
        all.reserve(slots_.size());
        for (auto& [_, s] : slots_) {
            all.push_back(s.get());
        }
    }

    for (RoleSlot* s : all) {
        std::lock_guard adopt_lock(s->adopt_mutex);
        auto active = std::atomic_exchange_explicit(
            &s->active, std::shared_ptr<PoolHandle>{}, std::memory_order_acq_rel);
        if (active) {
            active->begin_drain();
            if (active->state() != HandleState::RETIRED) {
                s->draining.push_back(std::move(active));
            }
        }
        prune_retired(*s);
    }
}

PoolCoordinator::RoleSlot& PoolCoordinator::slot(const std::string& role) {
    std::lock_guard lock(slots_mutex_);
    auto& s = slots_[role];
    if (!s) {
        s = std::make_unique<RoleSlot>();
    }
    return *s;
}

PoolCoordinator::RoleSlot* PoolCoordinator::find_slot(const std::string& role) const {
    std::lock_guard lock(slots_mutex_);
    const auto it = slots_.find(role);
    return it == slots_.end() ? nullptr : it->second.get();
}

void PoolCoordinator::prune_retired(RoleSlot& slot) {
    std::erase_if(slot.draining, [](const auto& h) {
        return h->state() == HandleState::RETIRED;
    });
}

} // namespace vaultagent
