#include <string>
#include <string_view>
#include <variant>

#include "bus/device_props.hpp"
#include "util/constants.hpp"

namespace
{

// false if absent or of another type
bool find_bool(const bus::PropertyMap &props, std::string_view key, bool &out)
{
    auto it = props.find(std::string(key));
    if (it == props.end())
        return false;
    const bool *b = std::get_if<bool>(&it->second);
    if (!b)
        return false;
    out = *b;
    return true;
}

}  // namespace

namespace bus
{

bool flags_from_props(const PropertyMap &props, DeviceFlags &out, BusError &err)
{
    DeviceFlags flags{};
    if (!find_bool(props, constants::PROP_CONNECTED, flags.connected) ||
        !find_bool(props, constants::PROP_TRUSTED, flags.trusted))
    {
        err = BusError{std::string(constants::ERR_MISSING_PROPERTY),
                       "Device1 reply lacks boolean Connected/Trusted"};
        return false;
    }
    out = flags;
    return true;
}

}  // namespace bus
