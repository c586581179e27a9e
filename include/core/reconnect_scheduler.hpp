#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

#include "bus/ievent_loop.hpp"
#include "core/device_state_store.hpp"

namespace core
{

inline constexpr TimerHandle INVALID_TIMER = 0;

// One-shot delayed callbacks on the event loop, one handle per arm().
// It does not know which handle "belongs" to a device; callers cancel the old handle
// before arming a new one.
class ReconnectScheduler
{
  public:
    using Callback = std::function<void(const std::string &device)>;

    explicit ReconnectScheduler(bus::IEventLoop &loop);

    // Returns INVALID_TIMER if the loop refused the timer.
    TimerHandle arm(const std::string &device, std::chrono::milliseconds delay, Callback cb);

    // Idempotent; unknown, fired or cancelled handles are ignored.
    void cancel(TimerHandle h);

    bool        is_pending(TimerHandle h) const { return pending_.count(h) != 0; }
    std::size_t pending_count() const { return pending_.size(); }
    std::size_t pending_count(const std::string &device) const;

  private:
    void fire(TimerHandle h);

    struct Entry
    {
        std::string                  device;
        Callback                     cb;
        std::unique_ptr<bus::ITimer> timer;
    };

    bus::IEventLoop                       &loop_;
    TimerHandle                            next_handle_{1};
    std::unordered_map<TimerHandle, Entry> pending_;
};

}  // namespace core
