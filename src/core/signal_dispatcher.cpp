#include <string>
#include <variant>

#include "core/signal_dispatcher.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace core
{

SignalDispatcher::SignalDispatcher(DeviceStateStore         &store,
                                   ReconnectScheduler       &sched,
                                   ReconnectProcedure       &proc,
                                   const bus::IEventLoop    &loop,
                                   std::chrono::milliseconds window)
    : store_(store), sched_(sched), proc_(proc), loop_(loop), window_(window)
{
}

void SignalDispatcher::on_property_change(const std::string      &device,
                                          const std::string      &iface,
                                          const bus::PropertyMap &changed)
{
    if (iface != constants::DEVICE_IFACE)
        return;

    auto it = changed.find(std::string(constants::PROP_CONNECTED));
    if (it == changed.end())
        return;

    const bool *connected = std::get_if<bool>(&it->second);
    if (!connected)
    {
        LOG_WARN("[DISPATCH] %s: Connected is not a boolean, ignored", device.c_str());
        return;
    }

    LOG_DEBUG("[DISPATCH] %s Connected=%s", device.c_str(), *connected ? "true" : "false");
    if (*connected)
        on_connected(device);
    else
        on_disconnected(device);
}

void SignalDispatcher::on_connected(const std::string &device)
{
    DeviceRecord &rec = store_.get_or_create(device);
    cancel_pending(rec);
    rec.last_connect = loop_.now();
}

// ======================================================================
// Function: SignalDispatcher::on_disconnected
// - In: device that just reported Connected=false
// - Out: either one freshly armed reconnect, or no record at all
// - Note: a drop inside the window re-arms (the old timer is cancelled
//         first), so the attempt runs one window after the latest drop
// ======================================================================
void SignalDispatcher::on_disconnected(const std::string &device)
{
    DeviceRecord *rec = store_.find(device);
    const auto    now = loop_.now();

    const bool flaky = rec && rec->last_connect && (now - *rec->last_connect) < window_;
    if (!flaky)
    {
        if (rec)
        {
            cancel_pending(*rec);
            store_.erase(device);
        }
        LOG_DEBUG("[DISPATCH] %s disconnected normally", device.c_str());
        return;
    }

    cancel_pending(*rec);
    const auto since =
        std::chrono::duration_cast<std::chrono::milliseconds>(now - *rec->last_connect);
    const TimerHandle h = sched_.arm(device, window_, [this](const std::string &dev) {
        const AttemptResult r = proc_.run(dev);
        LOG_DEBUG("[DISPATCH] attempt for %s: %s", dev.c_str(), attempt_result_name(r));
    });
    if (h == INVALID_TIMER)
    {
        LOG_ERROR("[DISPATCH] %s dropped after %lldms but no reconnect could be scheduled",
                  device.c_str(), (long long)since.count());
        store_.erase(device);
        return;
    }
    rec->pending_timer = h;
    LOG_DEBUG("[DISPATCH] %s dropped %lldms after connecting, reconnect in %lldms",
              device.c_str(), (long long)since.count(), (long long)window_.count());
}

void SignalDispatcher::cancel_pending(DeviceRecord &rec)
{
    if (!rec.pending_timer)
        return;
    sched_.cancel(*rec.pending_timer);
    rec.pending_timer.reset();
}

}  // namespace core
