#include <utility>

#include "core/reconnect_scheduler.hpp"
#include "util/log.hpp"

namespace core
{

ReconnectScheduler::ReconnectScheduler(bus::IEventLoop &loop) : loop_(loop) {}

TimerHandle ReconnectScheduler::arm(const std::string        &device,
                                    std::chrono::milliseconds delay,
                                    Callback                  cb)
{
    const TimerHandle h     = next_handle_++;
    auto              timer = loop_.add_oneshot(delay, [this, h] { fire(h); });
    if (!timer)
    {
        LOG_ERROR("[SCHED] cannot arm %lldms timer for %s", (long long)delay.count(),
                  device.c_str());
        return INVALID_TIMER;
    }

    pending_.emplace(h, Entry{device, std::move(cb), std::move(timer)});
    LOG_DEBUG("[SCHED] armed #%llu for %s in %lldms", (unsigned long long)h, device.c_str(),
              (long long)delay.count());
    return h;
}

void ReconnectScheduler::cancel(TimerHandle h)
{
    auto it = pending_.find(h);
    if (it == pending_.end())
        return;
    LOG_DEBUG("[SCHED] cancelled #%llu for %s", (unsigned long long)h,
              it->second.device.c_str());
    // dropping the timer disarms it
    pending_.erase(it);
}

std::size_t ReconnectScheduler::pending_count(const std::string &device) const
{
    std::size_t n = 0;
    for (const auto &kv : pending_)
    {
        if (kv.second.device == device)
            ++n;
    }
    return n;
}

void ReconnectScheduler::fire(TimerHandle h)
{
    auto it = pending_.find(h);
    if (it == pending_.end())
        return;

    // No longer pending once the callback runs; the timer object outlives the call.
    Entry e = std::move(it->second);
    pending_.erase(it);

    LOG_DEBUG("[SCHED] fired #%llu for %s", (unsigned long long)h, e.device.c_str());
    if (e.cb)
        e.cb(e.device);
}

}  // namespace core
