#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <ctime>
#include <memory>
#include <string>
#include <utility>

// clang-format off
#include "bus/bluez_bus.hpp"
#include "bus/bluez_bus_impl.hpp"
#include "bus/bluez_bus_helper.hpp"
#include "bus/bluez_dbus_util.hpp"
#include "bus/device_props.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"
// clang-format on

#include <systemd/sd-bus.h>
#include <systemd/sd-event.h>

namespace
{

inline void unref_slot(sd_bus_slot *&s)
{
    if (s)
    {
        sd_bus_slot_unref(s);
        s = nullptr;
    }
}

inline void unref_source(sd_event_source *&s)
{
    if (s)
    {
        sd_event_source_set_enabled(s, SD_EVENT_OFF);
        sd_event_source_unref(s);
        s = nullptr;
    }
}

inline bus::BusError to_bus_error(const sd_bus_error &e, int r)
{
    return bus::BusError{e.name ? e.name : "org.freedesktop.DBus.Error.Failed",
                         e.message ? e.message : strerror(-r)};
}

}  // namespace

namespace bus
{

SdEventTimer::~SdEventTimer()
{
    unref_source(src);
}

BluezBus::BluezBus() : impl_(std::make_unique<Impl>()) {}

BluezBus::~BluezBus()
{
    unref_slot(impl_->props_slot);
    unref_source(impl_->sigint_src);
    unref_source(impl_->sigterm_src);
    if (impl_->bus)
    {
        if (impl_->bus_attached)
            sd_bus_detach_event(impl_->bus);
        // pending Connect() slots are released here, freeing their ConnectCall
        impl_->bus = sd_bus_flush_close_unref(impl_->bus);
    }
    if (impl_->event)
        impl_->event = sd_event_unref(impl_->event);
}

// ======================================================================
// Function: BluezBus::start
// - In: callback for every decoded PropertiesChanged from org.bluez
// - Out: true when the bus is attached to the loop and the match is live
// - Note: the match has no path filter so every adapter is covered
// ======================================================================
bool BluezBus::start(OnPropertyChange on_change)
{
    impl_->on_change = std::move(on_change);

    int r = sd_bus_open_system(&impl_->bus);
    if (r < 0 || !impl_->bus)
    {
        LOG_ERROR("[BLUEZ] failed to connect system bus: %s", strerror(-r));
        return false;
    }

    r = sd_event_default(&impl_->event);
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ] failed to create event loop: %s", strerror(-r));
        return false;
    }

    r = sd_bus_attach_event(impl_->bus, impl_->event, SD_EVENT_PRIORITY_NORMAL);
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ] failed to attach bus to event loop: %s", strerror(-r));
        return false;
    }
    impl_->bus_attached = true;

    const char *name = nullptr;
    if (sd_bus_get_unique_name(impl_->bus, &name) >= 0 && name)
        impl_->unique_name = name;

    r = sd_bus_match_signal(impl_->bus, &impl_->props_slot, constants::BLUEZ_SERVICE.data(),
                            nullptr, constants::PROPERTIES_IFACE.data(), "PropertiesChanged",
                            bluez_on_props_changed, this);
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ] subscribe to PropertiesChanged failed: %s", strerror(-r));
        return false;
    }

    // sd-event only sees signals that are blocked
    sigset_t ss;
    sigemptyset(&ss);
    sigaddset(&ss, SIGINT);
    sigaddset(&ss, SIGTERM);
    if (sigprocmask(SIG_BLOCK, &ss, nullptr) < 0)
    {
        LOG_ERROR("[BLUEZ] sigprocmask failed: %s", strerror(errno));
        return false;
    }
    // null handler: exit the loop
    r = sd_event_add_signal(impl_->event, &impl_->sigint_src, SIGINT, nullptr, nullptr);
    if (r >= 0)
        r = sd_event_add_signal(impl_->event, &impl_->sigterm_src, SIGTERM, nullptr, nullptr);
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ] cannot watch SIGINT/SIGTERM: %s", strerror(-r));
        return false;
    }

    LOG_INFO("[BLUEZ] watching %s PropertiesChanged as %s", constants::DEVICE_IFACE.data(),
             impl_->unique_name.empty() ? "?" : impl_->unique_name.c_str());
    return true;
}

int BluezBus::run()
{
    if (!impl_->event)
        return -ENOTCONN;
    int r = sd_event_loop(impl_->event);
    if (r < 0)
        LOG_ERROR("[BLUEZ] event loop failed: %s", strerror(-r));
    return r;
}

void BluezBus::deliver_property_change(const PropertyChange &c)
{
    if (impl_->on_change)
        impl_->on_change(c);
}

// ======================================================================
// Function: BluezBus::get_device_flags
// - In: Device1 object path
// - Out: Connected/Trusted, or err filled from the D-Bus error
// - Note: blocks the loop for one round trip (sd-bus default timeout)
// ======================================================================
bool BluezBus::get_device_flags(const std::string &path, DeviceFlags &out, BusError &err)
{
    if (!impl_->bus)
    {
        err = BusError{"org.freedesktop.DBus.Error.Disconnected", "bus not started"};
        return false;
    }

    sd_bus_error    e{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(impl_->bus, constants::BLUEZ_SERVICE.data(), path.c_str(),
                               constants::PROPERTIES_IFACE.data(), "GetAll", &e, &rep, "s",
                               constants::DEVICE_IFACE.data());
    if (r < 0)
    {
        err = to_bus_error(e, r);
        if (rep)
            sd_bus_message_unref(rep);
        sd_bus_error_free(&e);
        return false;
    }
    sd_bus_error_free(&e);

    PropertyMap props;
    r = read_prop_dict(rep, props);
    sd_bus_message_unref(rep);
    if (r < 0)
    {
        err = BusError{"org.freedesktop.DBus.Error.InvalidArgs",
                       std::string("malformed GetAll reply: ") + strerror(-r)};
        return false;
    }

    return flags_from_props(props, out, err);
}

bool BluezBus::connect_async(const std::string &path, OnConnectDone done, BusError &err)
{
    if (!impl_->bus)
    {
        err = BusError{"org.freedesktop.DBus.Error.Disconnected", "bus not started"};
        return false;
    }

    auto         call = std::make_unique<ConnectCall>(ConnectCall{path, std::move(done)});
    sd_bus_slot *slot = nullptr;
    int r = sd_bus_call_method_async(impl_->bus, &slot, constants::BLUEZ_SERVICE.data(),
                                     path.c_str(), constants::DEVICE_IFACE.data(), "Connect",
                                     bluez_on_connect_reply, call.get(), "");
    if (r < 0)
    {
        err = BusError{"org.freedesktop.DBus.Error.Failed", strerror(-r)};
        return false;
    }

    r = sd_bus_slot_set_destroy_callback(slot, bluez_free_connect_call);
    if (r < 0)
    {
        // drops the pending call; call is still ours
        sd_bus_slot_unref(slot);
        err = BusError{"org.freedesktop.DBus.Error.Failed", strerror(-r)};
        return false;
    }
    // the destroy callback owns call from here, after the reply or when the bus goes away
    call.release();

    r = sd_bus_slot_set_floating(slot, 1);
    if (r < 0)
    {
        // slot stays bound to us; dropping it cancels the call and frees call
        sd_bus_slot_unref(slot);
        err = BusError{"org.freedesktop.DBus.Error.Failed", strerror(-r)};
        return false;
    }
    sd_bus_slot_unref(slot);

    LOG_DEBUG("[BLUEZ] Connect() submitted to %s", path.c_str());
    return true;
}

Clock::time_point BluezBus::now() const
{
    return Clock::now();
}

// ======================================================================
// Function: BluezBus::add_oneshot
// - In: delay, callback
// - Out: armed timer, nullptr when the loop is not running
// - Note: deadline is taken from steady_clock (CLOCK_MONOTONIC), the same
//         clock now() reports, so it never fires before now() + delay
// ======================================================================
std::unique_ptr<ITimer> BluezBus::add_oneshot(std::chrono::milliseconds delay,
                                              std::function<void()>     fn)
{
    if (!impl_->event)
        return nullptr;

    using namespace std::chrono;
    const uint64_t deadline_us =
        (uint64_t)duration_cast<microseconds>(Clock::now().time_since_epoch()).count() +
        (uint64_t)duration_cast<microseconds>(delay).count();

    auto t = std::make_unique<SdEventTimer>();
    t->fn  = std::move(fn);
    // 1ms accuracy, sd-event's default slack is 250ms
    int r = sd_event_add_time(impl_->event, &t->src, CLOCK_MONOTONIC, deadline_us, 1000,
                              bluez_on_timer, t.get());
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ] sd_event_add_time failed: %s", strerror(-r));
        return nullptr;
    }
    return t;
}

}  // namespace bus
