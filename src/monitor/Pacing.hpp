#pragma once

#include <atomic>
#include <chrono>
#include <functional>

namespace seatwatch
{

using WaitTickCallback = std::function<void(std::chrono::milliseconds remaining)>;

// Sleeps for duration in slices, checking cancel_token between slices.
// Returns true when the full duration elapsed, false when cancelled.
// on_tick runs before each slice with the time still left.
bool waitUnlessCancelled(std::chrono::milliseconds duration, const std::atomic<bool>& cancel_token,
                         std::chrono::milliseconds slice = std::chrono::milliseconds(50),
                         const WaitTickCallback& on_tick = nullptr);

} // namespace seatwatch
