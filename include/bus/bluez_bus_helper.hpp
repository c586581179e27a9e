// include/bus/bluez_bus_helper.hpp
#pragma once
#include <cstdint>

#include <systemd/sd-bus.h>
#include <systemd/sd-event.h>

namespace bus
{

// sd-bus / sd-event callbacks
int  bluez_on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int  bluez_on_connect_reply(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
void bluez_free_connect_call(void *userdata);
int  bluez_on_timer(sd_event_source *s, uint64_t usec, void *userdata);

}  // namespace bus
