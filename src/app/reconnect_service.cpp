#include "app/reconnect_service.hpp"

namespace app
{

ReconnectService::ReconnectService(bus::IDeviceBus          &bus,
                                   bus::IEventLoop          &loop,
                                   std::chrono::milliseconds window)
    : sched_(loop), proc_(store_, bus), dispatcher_(store_, sched_, proc_, loop, window)
{
}

void ReconnectService::on_property_change(const bus::PropertyChange &c)
{
    dispatcher_.on_property_change(c.path, c.iface, c.changed);
}

}  // namespace app
