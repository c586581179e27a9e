#pragma once
#include <optional>
#include <string>

#include "bus/idevice_bus.hpp"
#include "core/device_state_store.hpp"

namespace core
{

enum class AttemptResult
{
    QueryFailed,
    AlreadyConnected,
    NotTrusted,
    ConnectSubmitFailed,
    ConnectSubmitted
};

const char *attempt_result_name(AttemptResult r);

// Body of a fired reconnect timer.
class ReconnectProcedure
{
  public:
    ReconnectProcedure(DeviceStateStore &store, bus::IDeviceBus &bus);

    // Drops the device record first, then re-reads flags and maybe submits Connect.
    AttemptResult run(const std::string &device);

  private:
    static void on_connect_done(const std::string                  &device,
                                const std::optional<bus::BusError> &err);

    DeviceStateStore &store_;
    bus::IDeviceBus  &bus_;
};

}  // namespace core
