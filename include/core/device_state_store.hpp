#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

#include "bus/ievent_loop.hpp"

namespace core
{

using TimerHandle = std::uint64_t;  // issued by ReconnectScheduler, 0 is never valid

struct DeviceRecord
{
    std::optional<bus::Clock::time_point> last_connect;   // last observed Connected=true
    std::optional<TimerHandle>            pending_timer;  // armed reconnect, at most one
};

// Per-device transient state keyed by D-Bus object path.
// Only touched from loop-thread handlers, so no locking.
class DeviceStateStore
{
  public:
    DeviceRecord       *find(const std::string &device);
    const DeviceRecord *find(const std::string &device) const;
    DeviceRecord       &get_or_create(const std::string &device);

    // Returns true if a record was removed.
    bool erase(const std::string &device);

    bool        contains(const std::string &device) const { return find(device) != nullptr; }
    std::size_t size() const { return records_.size(); }

  private:
    std::unordered_map<std::string, DeviceRecord> records_;
};

}  // namespace core
