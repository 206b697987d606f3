#pragma once

/// @file clock.hpp
/// @brief Wall-clock abstraction so expiry and lock windows can be tested.

#include <chrono>
#include <memory>
#include <mutex>

namespace oas::foundation {

/// Source of the current wall-clock time.
///
/// Implementations must be thread-safe.
class IClock {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    virtual ~IClock() = default;

    [[nodiscard]] virtual TimePoint now() const = 0;
};

/// Clock backed by std::chrono::system_clock.
class SystemClock : public IClock {
public:
    [[nodiscard]] TimePoint now() const override { return std::chrono::system_clock::now(); }

    /// Shared process-wide instance.
    static std::shared_ptr<IClock> shared() {
        static auto inst = std::make_shared<SystemClock>();
        return inst;
    }
};

/// Manually advanced clock for tests.
///
/// Example:
/// @code
///   auto clock = std::make_shared<ManualClock>();
///   clock->advance(std::chrono::minutes{31});
/// @endcode
class ManualClock : public IClock {
public:
    ManualClock() : now_(std::chrono::system_clock::now()) {}
    explicit ManualClock(TimePoint start) : now_(start) {}

    [[nodiscard]] TimePoint now() const override {
        std::lock_guard lock(mutex_);
        return now_;
    }

    void set(TimePoint tp) {
        std::lock_guard lock(mutex_);
        now_ = tp;
    }

    template <typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> delta) {
        std::lock_guard lock(mutex_);
        now_ += std::chrono::duration_cast<std::chrono::system_clock::duration>(delta);
    }

private:
    mutable std::mutex mutex_;
    TimePoint now_;
};

} // namespace oas::foundation
