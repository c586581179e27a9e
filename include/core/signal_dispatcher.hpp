#pragma once
#include <chrono>
#include <string>

#include "bus/idevice_bus.hpp"
#include "bus/ievent_loop.hpp"
#include "core/device_state_store.hpp"
#include "core/reconnect_procedure.hpp"
#include "core/reconnect_scheduler.hpp"

namespace core
{

// Classifies Device1.Connected transitions and arms at most one reconnect per device.
class SignalDispatcher
{
  public:
    SignalDispatcher(DeviceStateStore         &store,
                     ReconnectScheduler       &sched,
                     ReconnectProcedure       &proc,
                     const bus::IEventLoop    &loop,
                     std::chrono::milliseconds window);

    void on_property_change(const std::string      &device,
                            const std::string      &iface,
                            const bus::PropertyMap &changed);

    std::chrono::milliseconds window() const { return window_; }

  private:
    void on_connected(const std::string &device);
    void on_disconnected(const std::string &device);
    void cancel_pending(DeviceRecord &rec);

    DeviceStateStore         &store_;
    ReconnectScheduler       &sched_;
    ReconnectProcedure       &proc_;
    const bus::IEventLoop    &loop_;
    std::chrono::milliseconds window_;
};

}  // namespace core
