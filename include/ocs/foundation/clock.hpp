#pragma once

/// @file clock.hpp
/// @brief Injectable time source for every expiry decision.

#include <chrono>
#include <cstdint>
#include <memory>

namespace ocs::foundation {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

/// Single trusted time source.
///
/// The authorization server reads "now" only through this interface so that
/// issuance, expiry checks and introspection agree on one clock and tests
/// can step time deterministically.
class IClock {
public:
    virtual ~IClock() = default;

    [[nodiscard]] virtual Timestamp now() const = 0;
};

/// Wall clock backed by std::chrono::system_clock.
class SystemClock final : public IClock {
public:
    [[nodiscard]] Timestamp now() const override { return Clock::now(); }

    /// Shared process-wide instance.
    static std::shared_ptr<IClock> shared() {
        static auto inst = std::make_shared<SystemClock>();
        return inst;
    }
};

/// Seconds since the Unix epoch, truncated.
inline int64_t toEpochSeconds(Timestamp tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

inline Timestamp fromEpochSeconds(int64_t secs) {
    return Timestamp(std::chrono::seconds(secs));
}

} // namespace ocs::foundation
