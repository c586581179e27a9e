#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "bus/idevice_bus.hpp"
#include "bus/ievent_loop.hpp"

namespace bus
{

/* ======================================================================
 * BluezBus — system bus + sd-event loop
 *
 *  start(on_change)
 *    └─ sd_bus_open_system, sd_event_default, sd_bus_attach_event
 *    └─ match PropertiesChanged from org.bluez on any path ──▶ on_change
 *    └─ SIGINT/SIGTERM sources exit the loop
 *  run()
 *    └─ sd_event_loop until SIGINT/SIGTERM
 *
 *  get_device_flags   Properties.GetAll(Device1), blocking
 *  connect_async      Device1.Connect, reply dispatched by the loop
 *  add_oneshot        CLOCK_MONOTONIC time source
 *
 *  Everything runs on the thread that calls run().
 * ====================================================================== */
class BluezBus final : public IDeviceBus, public IEventLoop
{
  public:
    BluezBus();
    ~BluezBus() override;

    bool start(OnPropertyChange on_change);
    // Returns the loop's exit code; <0 on failure.
    int  run();

    bool get_device_flags(const std::string &path, DeviceFlags &out, BusError &err) override;
    bool connect_async(const std::string &path, OnConnectDone done, BusError &err) override;

    Clock::time_point       now() const override;
    std::unique_ptr<ITimer> add_oneshot(std::chrono::milliseconds delay,
                                        std::function<void()>     fn) override;

    void deliver_property_change(const PropertyChange &c);

  private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace bus
