#include "core/device_state_store.hpp"

namespace core
{

DeviceRecord *DeviceStateStore::find(const std::string &device)
{
    auto it = records_.find(device);
    return it == records_.end() ? nullptr : &it->second;
}

const DeviceRecord *DeviceStateStore::find(const std::string &device) const
{
    auto it = records_.find(device);
    return it == records_.end() ? nullptr : &it->second;
}

DeviceRecord &DeviceStateStore::get_or_create(const std::string &device)
{
    return records_[device];
}

bool DeviceStateStore::erase(const std::string &device)
{
    return records_.erase(device) > 0;
}

}  // namespace core
