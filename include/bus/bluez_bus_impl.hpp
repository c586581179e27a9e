// include/bus/bluez_bus_impl.hpp
#pragma once
#include <functional>
#include <string>

#include <systemd/sd-bus.h>
#include <systemd/sd-event.h>

#include "bus/bluez_bus.hpp"

namespace bus
{

struct BluezBus::Impl
{
    sd_bus   *bus   = nullptr;
    sd_event *event = nullptr;

    sd_bus_slot     *props_slot   = nullptr;  // PropertiesChanged match
    sd_event_source *sigint_src   = nullptr;
    sd_event_source *sigterm_src  = nullptr;
    bool             bus_attached = false;

    OnPropertyChange on_change;
    std::string      unique_name;  // our bus unique name (debug)
};

// In-flight Device1.Connect; freed by the slot's destroy callback
struct ConnectCall
{
    std::string   path;
    OnConnectDone done;
};

// One-shot CLOCK_MONOTONIC timer
struct SdEventTimer final : public ITimer
{
    sd_event_source      *src = nullptr;
    std::function<void()> fn;

    ~SdEventTimer() override;
};

}  // namespace bus
