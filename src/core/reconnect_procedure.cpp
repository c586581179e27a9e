#include <string>

#include "core/reconnect_procedure.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace core
{

const char *attempt_result_name(AttemptResult r)
{
    switch (r)
    {
        case AttemptResult::QueryFailed:
            return "query-failed";
        case AttemptResult::AlreadyConnected:
            return "already-connected";
        case AttemptResult::NotTrusted:
            return "not-trusted";
        case AttemptResult::ConnectSubmitFailed:
            return "connect-submit-failed";
        case AttemptResult::ConnectSubmitted:
            return "connect-submitted";
    }
    return "?";
}

ReconnectProcedure::ReconnectProcedure(DeviceStateStore &store, bus::IDeviceBus &bus)
    : store_(store), bus_(bus)
{
}

// ======================================================================
// Function: ReconnectProcedure::run
// - In: device path whose debounce timer just fired
// - Out: what the attempt did; Connect completion is reported later
// - Note: the record is gone before any bus call, so notifications that
//         arrive during the attempt start from a clean slate
// ======================================================================
AttemptResult ReconnectProcedure::run(const std::string &device)
{
    store_.erase(device);

    bus::DeviceFlags flags{};
    bus::BusError    err{};
    if (!bus_.get_device_flags(device, flags, err))
    {
        if (err.name == constants::ERR_UNKNOWN_OBJECT)
            LOG_WARN("[RECONNECT] %s vanished before reconnect: %s: %s", device.c_str(),
                     err.name.c_str(), err.message.c_str());
        else
            LOG_ERROR("[RECONNECT] reading flags of %s failed: %s: %s", device.c_str(),
                      err.name.c_str(), err.message.c_str());
        return AttemptResult::QueryFailed;
    }

    if (flags.connected)
    {
        LOG_DEBUG("[RECONNECT] %s is connected again, nothing to do", device.c_str());
        return AttemptResult::AlreadyConnected;
    }
    if (!flags.trusted)
    {
        LOG_DEBUG("[RECONNECT] %s is not trusted, skipping", device.c_str());
        return AttemptResult::NotTrusted;
    }

    LOG_INFO("[RECONNECT] %s dropped right after connecting, reconnecting", device.c_str());
    const std::string dev = device;
    if (!bus_.connect_async(
            device, [dev](const std::optional<bus::BusError> &e) { on_connect_done(dev, e); },
            err))
    {
        LOG_ERROR("[RECONNECT] submit Connect() to %s failed: %s: %s", device.c_str(),
                  err.name.c_str(), err.message.c_str());
        return AttemptResult::ConnectSubmitFailed;
    }
    return AttemptResult::ConnectSubmitted;
}

void ReconnectProcedure::on_connect_done(const std::string                  &device,
                                         const std::optional<bus::BusError> &err)
{
    if (!err)
    {
        LOG_INFO("[RECONNECT] %s reconnected", device.c_str());
        return;
    }

    const char *ename = err->name.empty() ? "unknown" : err->name.c_str();
    const char *emsg  = err->message.empty() ? "no message" : err->message.c_str();
    if (err->name == constants::ERR_ALREADY_CONNECTED)
    {
        LOG_INFO("[RECONNECT] %s was already connected", device.c_str());
    }
    else if (err->name == constants::ERR_IN_PROGRESS || err->name == constants::ERR_NO_REPLY)
    {
        LOG_WARN("[RECONNECT] Connect() to %s in progress/timed out: %s: %s", device.c_str(),
                 ename, emsg);
    }
    else
    {
        LOG_ERROR("[RECONNECT] Connect() to %s failed: %s: %s", device.c_str(), ename, emsg);
    }
}

}  // namespace core
