#include <cstring>
#include <functional>
#include <optional>
#include <string>

// clang-format off
#include "bus/bluez_bus.hpp"
#include "bus/bluez_bus_helper.hpp"
#include "bus/bluez_bus_impl.hpp"
#include "bus/bluez_dbus_util.hpp"
#include "util/log.hpp"
// clang-format on

namespace bus
{

int bluez_on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret_error*/)
{
    auto *self = static_cast<BluezBus *>(userdata);

    PropertyChange c;
    int            r = read_props_changed(m, c);
    if (r < 0)
    {
        const char *path = sd_bus_message_get_path(m);
        LOG_WARN("[BLUEZ] malformed PropertiesChanged on %s: %s", path ? path : "?",
                 strerror(-r));
        return 0;
    }

    self->deliver_property_change(c);
    return 0;
}

int bluez_on_connect_reply(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *call = static_cast<ConnectCall *>(userdata);

    std::optional<BusError> err;
    if (sd_bus_message_is_method_error(m, nullptr))
    {
        const sd_bus_error *e = sd_bus_message_get_error(m);
        err                   = BusError{(e && e->name) ? e->name : "unknown",
                       (e && e->message) ? e->message : "no message"};
    }

    LOG_DEBUG("[BLUEZ] Connect() reply for %s: %s", call->path.c_str(),
              err ? err->name.c_str() : "ok");
    if (call->done)
        call->done(err);
    return 1;
}

void bluez_free_connect_call(void *userdata)
{
    delete static_cast<ConnectCall *>(userdata);
}

int bluez_on_timer(sd_event_source * /*s*/, uint64_t /*usec*/, void *userdata)
{
    auto *t = static_cast<SdEventTimer *>(userdata);
    // fn may destroy t
    std::function<void()> fn = t->fn;
    if (fn)
        fn();
    return 0;
}

}  // namespace bus
