#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>

namespace sv::stream
{

// Lock-free gate between text arrival and display updates. An update is
// eligible once `interval` has elapsed since the previous one; otherwise the
// request is recorded in the dirty flag for a later flush.
//
// Every path that grants an update clears the dirty flag before returning, so
// the caller must take its content snapshot afterwards. A request racing with
// an update then re-arms the flag instead of being lost.
class DebounceScheduler
{
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    static constexpr std::chrono::milliseconds kDefaultInterval{16};

    explicit DebounceScheduler(std::chrono::nanoseconds interval = kDefaultInterval,
                               NowFn now = {});

    // True when the caller should update now; false when deferred (dirty).
    bool requestUpdate() noexcept;
    // Unconditional grant used by forced updates.
    void beginUpdate() noexcept;
    // Grants an update only if something is pending.
    bool beginFlush() noexcept;

    void markDirty() noexcept;
    bool dirty() const noexcept { return dirty_.load(std::memory_order_acquire); }
    bool eligible() const noexcept;

    std::chrono::nanoseconds interval() const noexcept { return std::chrono::nanoseconds(intervalNanos_); }
    std::chrono::nanoseconds sinceLastUpdate() const noexcept;

private:
    static constexpr std::int64_t kNever = INT64_MIN;

    std::int64_t nowNanos() const noexcept;
    void stamp(std::int64_t now) noexcept;

    std::int64_t intervalNanos_;
    NowFn now_;
    std::atomic<std::int64_t> lastUpdateNanos_{kNever};
    std::atomic<bool> dirty_{false};
};

} // namespace sv::stream
