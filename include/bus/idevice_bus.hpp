#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace bus
{

// Subset of D-Bus variant payloads we decode; everything else is skipped.
using PropertyValue = std::variant<bool, std::int64_t, std::string>;
using PropertyMap   = std::unordered_map<std::string, PropertyValue>;

struct PropertyChange
{
    std::string              path;   // object path of the emitter
    std::string              iface;  // interface whose properties changed
    PropertyMap              changed;
    std::vector<std::string> invalidated;
};

struct DeviceFlags
{
    bool connected = false;
    bool trusted   = false;
};

struct BusError
{
    std::string name;     // e.g. "org.bluez.Error.Failed"
    std::string message;  // human readable
};

using OnPropertyChange = std::function<void(const PropertyChange &)>;
// nullopt on success
using OnConnectDone = std::function<void(const std::optional<BusError> &)>;

struct IDeviceBus
{
    // Blocking property read of Device1 on `path`. Fills err and returns false on failure.
    virtual bool get_device_flags(const std::string &path, DeviceFlags &out, BusError &err) = 0;

    // Submits Device1.Connect and returns immediately. `done` runs later on the loop,
    // never from inside this call. Returns false (with err) if nothing was submitted.
    virtual bool connect_async(const std::string &path, OnConnectDone done, BusError &err) = 0;

    virtual ~IDeviceBus() = default;
};

}  // namespace bus
