#include "Pacing.hpp"

#include <algorithm>
#include <thread>

namespace seatwatch
{

namespace
{
// Far below the steady_clock range, so now() + duration cannot overflow.
constexpr std::chrono::hours kMaxWait{ 24 * 365 * 10 };
} // namespace

bool waitUnlessCancelled(std::chrono::milliseconds duration, const std::atomic<bool>& cancel_token,
                         std::chrono::milliseconds slice, const WaitTickCallback& on_tick)
{
    using clock = std::chrono::steady_clock;

    if (slice <= std::chrono::milliseconds::zero())
        slice = std::chrono::milliseconds(1);

    if (duration > kMaxWait)
        duration = kMaxWait;

    const auto deadline = clock::now() + duration;
    while (true)
    {
        if (cancel_token.load())
            return false;

        const auto now = clock::now();
        if (now >= deadline)
            return true;

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (on_tick)
            on_tick(remaining);

        std::this_thread::sleep_for(std::min<clock::duration>(slice, deadline - now));
    }
}

} // namespace seatwatch
