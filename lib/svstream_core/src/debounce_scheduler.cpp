#include "sv/stream/debounce_scheduler.hpp"

#include <utility>

namespace sv::stream
{

DebounceScheduler::DebounceScheduler(std::chrono::nanoseconds interval, NowFn now)
    : intervalNanos_(interval.count() < 0 ? 0 : interval.count()),
      now_(std::move(now))
{
}

bool DebounceScheduler::requestUpdate() noexcept
{
    std::int64_t now = nowNanos();
    std::int64_t last = lastUpdateNanos_.load(std::memory_order_acquire);
    if (last != kNever && now - last < intervalNanos_)
    {
        markDirty();
        return false;
    }

    // Two requesters may see the same expired slot; only one wins it.
    if (!lastUpdateNanos_.compare_exchange_strong(last, now, std::memory_order_acq_rel))
    {
        markDirty();
        return false;
    }

    dirty_.store(false, std::memory_order_release);
    return true;
}

void DebounceScheduler::beginUpdate() noexcept
{
    stamp(nowNanos());
}

bool DebounceScheduler::beginFlush() noexcept
{
    if (!dirty_.load(std::memory_order_acquire))
        return false;
    stamp(nowNanos());
    return true;
}

void DebounceScheduler::markDirty() noexcept
{
    dirty_.store(true, std::memory_order_release);
}

bool DebounceScheduler::eligible() const noexcept
{
    std::int64_t last = lastUpdateNanos_.load(std::memory_order_acquire);
    return last == kNever || nowNanos() - last >= intervalNanos_;
}

std::chrono::nanoseconds DebounceScheduler::sinceLastUpdate() const noexcept
{
    std::int64_t last = lastUpdateNanos_.load(std::memory_order_acquire);
    if (last == kNever)
        return std::chrono::nanoseconds::max();
    return std::chrono::nanoseconds(nowNanos() - last);
}

std::int64_t DebounceScheduler::nowNanos() const noexcept
{
    Clock::time_point now = now_ ? now_() : Clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
}

void DebounceScheduler::stamp(std::int64_t now) noexcept
{
    lastUpdateNanos_.store(now, std::memory_order_release);
    dirty_.store(false, std::memory_order_release);
}

} // namespace sv::stream
