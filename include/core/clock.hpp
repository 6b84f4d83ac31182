#pragma once

#include "core/types.hpp"

#include <memory>

namespace vaultagent {

/**
 * @brief Time source for TTL and lease arithmetic
 *
 * Components take a shared IClock so tests can drive simulated time.
 */
class IClock {
public:
    virtual ~IClock() = default;

    [[nodiscard]] virtual TimePoint now() const = 0;
};

class SteadyClock : public IClock {
public:
    [[nodiscard]] TimePoint now() const override { return Clock::now(); }

    static std::shared_ptr<IClock> shared() {
        static const auto clock = std::make_shared<SteadyClock>();
        return clock;
    }
};

} // namespace vaultagent
