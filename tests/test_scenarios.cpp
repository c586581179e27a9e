// End-to-end behaviour of the reconnect service against the fake bus/loop.
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "app/reconnect_service.hpp"
#include "fake_bus.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

using namespace std::chrono_literals;

namespace
{
const std::string DEV = "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF";

struct Scenario : public ::testing::Test
{
    fake::FakeEventLoop   loop;
    fake::FakeDeviceBus   devbus;
    app::ReconnectService svc{devbus, loop, constants::DEBOUNCE_WINDOW};

    void SetUp() override { btreconnect::set_log_level(btreconnect::Level::Info); }

    void notify(bool connected, const std::string &dev = DEV)
    {
        bus::PropertyChange c;
        c.path    = dev;
        c.iface   = std::string(constants::DEVICE_IFACE);
        c.changed = fake::connected_prop(connected);
        svc.on_property_change(c);
    }

    // jump to absolute virtual time t
    void at(std::chrono::milliseconds t) { loop.advance(t - loop.elapsed()); }
};
}  // namespace

TEST_F(Scenario, FlakyDeviceIsReconnectedOneWindowAfterDrop)
{
    devbus.flags[DEV] = bus::DeviceFlags{false, true};

    at(0ms);
    notify(true);
    at(1000ms);
    notify(false);
    EXPECT_EQ(svc.scheduler().pending_count(DEV), 1u);

    at(3999ms);
    EXPECT_TRUE(devbus.queries.empty());

    at(4000ms);
    ASSERT_EQ(devbus.queries.size(), 1u);
    ASSERT_EQ(devbus.connects.size(), 1u);
    EXPECT_EQ(devbus.connects[0], DEV);
    EXPECT_FALSE(svc.store().contains(DEV));
    EXPECT_EQ(svc.scheduler().pending_count(), 0u);

    testing::internal::CaptureStdout();
    devbus.complete(0);
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_NE(out.find("reconnected"), std::string::npos);
    EXPECT_FALSE(svc.store().contains(DEV));
}

TEST_F(Scenario, StableSessionDropIsLeftAlone)
{
    devbus.flags[DEV] = bus::DeviceFlags{false, true};

    at(0ms);
    notify(true);
    at(10000ms);
    notify(false);

    EXPECT_EQ(svc.scheduler().pending_count(), 0u);
    EXPECT_FALSE(svc.store().contains(DEV));
    at(60000ms);
    EXPECT_TRUE(devbus.queries.empty());
    EXPECT_TRUE(devbus.connects.empty());
}

TEST_F(Scenario, DeviceThatComesBackByItselfIsNotTouched)
{
    devbus.flags[DEV] = bus::DeviceFlags{false, true};

    at(0ms);
    notify(true);
    at(500ms);
    notify(false);
    at(2000ms);
    notify(true);
    at(20000ms);

    EXPECT_TRUE(devbus.queries.empty());
    EXPECT_TRUE(svc.store().contains(DEV));
}

TEST_F(Scenario, ReconnectedByOtherPathBeforeTimer)
{
    // the Connected=true signal got lost, but the query sees the device connected
    devbus.flags[DEV] = bus::DeviceFlags{true, true};

    at(0ms);
    notify(true);
    at(1000ms);
    notify(false);
    at(4000ms);

    EXPECT_EQ(devbus.queries.size(), 1u);
    EXPECT_TRUE(devbus.connects.empty());
    EXPECT_FALSE(svc.store().contains(DEV));
}

TEST_F(Scenario, FailedAttemptIsNotRetried)
{
    devbus.flags[DEV] = bus::DeviceFlags{false, true};

    at(0ms);
    notify(true);
    at(1000ms);
    notify(false);
    at(4000ms);
    ASSERT_EQ(devbus.connects.size(), 1u);

    testing::internal::CaptureStderr();
    devbus.complete(0, bus::BusError{"org.bluez.Error.Failed", "Host is down"});
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("Host is down"), std::string::npos);

    at(60000ms);
    EXPECT_EQ(devbus.connects.size(), 1u);
    EXPECT_EQ(svc.scheduler().pending_count(), 0u);
    EXPECT_FALSE(svc.store().contains(DEV));
}

TEST_F(Scenario, SecondFlapAfterAttemptStartsFreshCycle)
{
    devbus.flags[DEV] = bus::DeviceFlags{false, true};

    at(0ms);
    notify(true);
    at(1000ms);
    notify(false);
    at(4000ms);
    ASSERT_EQ(devbus.connects.size(), 1u);

    // the reconnect works, and the device drops again right away
    at(4500ms);
    notify(true);
    at(5000ms);
    notify(false);
    devbus.complete(0);

    at(7999ms);
    EXPECT_EQ(devbus.connects.size(), 1u);
    at(8000ms);
    EXPECT_EQ(devbus.connects.size(), 2u);
    EXPECT_FALSE(svc.store().contains(DEV));
}

TEST_F(Scenario, AtMostOnePendingAttemptPerDevice)
{
    const std::string other = "/org/bluez/hci1/dev_11_22_33_44_55_66";
    devbus.flags[DEV]       = bus::DeviceFlags{false, true};
    devbus.flags[other]     = bus::DeviceFlags{false, true};

    // a burst of flapping on two devices
    const std::vector<std::pair<int, bool>> events = {
        {0, true},    {100, false}, {200, false}, {300, true},  {400, false},
        {500, false}, {900, true},  {950, false}, {1000, true}, {1100, false},
    };
    for (const auto &ev : events)
    {
        at(std::chrono::milliseconds(ev.first));
        notify(ev.second);
        notify(ev.second, other);
        EXPECT_LE(svc.scheduler().pending_count(DEV), 1u);
        EXPECT_LE(svc.scheduler().pending_count(other), 1u);
    }
    EXPECT_EQ(svc.scheduler().pending_count(), 2u);

    at(4100ms);
    EXPECT_EQ(devbus.connects.size(), 2u);
    EXPECT_EQ(svc.scheduler().pending_count(), 0u);
    EXPECT_EQ(svc.store().size(), 0u);
}

TEST_F(Scenario, UntrustedFlakyDeviceNeverGetsConnect)
{
    devbus.flags[DEV] = bus::DeviceFlags{false, false};

    at(0ms);
    notify(true);
    at(200ms);
    notify(false);
    at(10000ms);

    EXPECT_EQ(devbus.queries.size(), 1u);
    EXPECT_TRUE(devbus.connects.empty());
}

TEST_F(Scenario, IrrelevantSignalsChangeNothing)
{
    bus::PropertyChange c;
    c.path    = DEV;
    c.iface   = "org.bluez.Battery1";
    c.changed = bus::PropertyMap{{"Percentage", std::int64_t{80}}};
    svc.on_property_change(c);

    c.iface       = std::string(constants::DEVICE_IFACE);
    c.changed     = bus::PropertyMap{{"RSSI", std::int64_t{-70}}};
    c.invalidated = {"Connected"};
    svc.on_property_change(c);

    EXPECT_EQ(svc.store().size(), 0u);
    EXPECT_EQ(svc.scheduler().pending_count(), 0u);
}
