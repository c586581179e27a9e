#pragma once
#include <chrono>

#include "bus/idevice_bus.hpp"
#include "bus/ievent_loop.hpp"
#include "core/device_state_store.hpp"
#include "core/reconnect_procedure.hpp"
#include "core/reconnect_scheduler.hpp"
#include "core/signal_dispatcher.hpp"

namespace app
{

// Owns the reconnect state machine for one bus connection.
class ReconnectService
{
  public:
    ReconnectService(bus::IDeviceBus &bus, bus::IEventLoop &loop,
                     std::chrono::milliseconds window);

    void on_property_change(const bus::PropertyChange &c);

    const core::DeviceStateStore   &store() const { return store_; }
    const core::ReconnectScheduler &scheduler() const { return sched_; }

  private:
    core::DeviceStateStore   store_;
    core::ReconnectScheduler sched_;
    core::ReconnectProcedure proc_;
    core::SignalDispatcher   dispatcher_;
};

}  // namespace app
