#pragma once
#include "bus/idevice_bus.hpp"

namespace bus
{

// Pulls Connected/Trusted out of a Device1 GetAll reply. Both must be present as
// booleans, otherwise err is btreconnect.Error.MissingProperty and false is returned.
bool flags_from_props(const PropertyMap &props, DeviceFlags &out, BusError &err);

}  // namespace bus
