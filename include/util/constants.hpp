#pragma once
#include <chrono>
#include <string_view>

namespace constants
{
// BlueZ / D-Bus names
inline constexpr std::string_view BLUEZ_SERVICE    = "org.bluez";
inline constexpr std::string_view DEVICE_IFACE     = "org.bluez.Device1";
inline constexpr std::string_view PROPERTIES_IFACE = "org.freedesktop.DBus.Properties";

// Device1 properties
inline constexpr std::string_view PROP_CONNECTED = "Connected";
inline constexpr std::string_view PROP_TRUSTED   = "Trusted";

// Error names
inline constexpr std::string_view ERR_ALREADY_CONNECTED = "org.bluez.Error.AlreadyConnected";
inline constexpr std::string_view ERR_IN_PROGRESS       = "org.bluez.Error.InProgress";
inline constexpr std::string_view ERR_NO_REPLY          = "org.freedesktop.DBus.Error.NoReply";
inline constexpr std::string_view ERR_UNKNOWN_OBJECT = "org.freedesktop.DBus.Error.UnknownObject";
inline constexpr std::string_view ERR_MISSING_PROPERTY = "btreconnect.Error.MissingProperty";

// A disconnect this soon after a connect is treated as a dropped link
inline constexpr std::chrono::milliseconds DEBOUNCE_WINDOW{3000};
inline constexpr std::chrono::milliseconds DEBOUNCE_WINDOW_MIN{100};
inline constexpr std::chrono::milliseconds DEBOUNCE_WINDOW_MAX{60000};

}  // namespace constants
