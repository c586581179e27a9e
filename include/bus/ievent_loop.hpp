#pragma once
#include <chrono>
#include <functional>
#include <memory>

namespace bus
{

using Clock = std::chrono::steady_clock;

// Armed one-shot timer. Destroying it disarms; it may be destroyed from inside its own
// callback.
struct ITimer
{
    virtual ~ITimer() = default;
};

struct IEventLoop
{
    virtual Clock::time_point now() const = 0;

    // Runs fn once after delay. Returns nullptr if the timer could not be created.
    virtual std::unique_ptr<ITimer> add_oneshot(std::chrono::milliseconds delay,
                                                std::function<void()>     fn) = 0;

    virtual ~IEventLoop() = default;
};

}  // namespace bus
