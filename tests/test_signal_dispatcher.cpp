#include <gtest/gtest.h>
#include <string>

#include "core/device_state_store.hpp"
#include "core/reconnect_procedure.hpp"
#include "core/reconnect_scheduler.hpp"
#include "core/signal_dispatcher.hpp"
#include "fake_bus.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

using namespace std::chrono_literals;

namespace
{
const std::string DEV    = "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF";
const std::string DEVICE = std::string(constants::DEVICE_IFACE);

struct Dispatcher : public ::testing::Test
{
    fake::FakeEventLoop      loop;
    fake::FakeDeviceBus      devbus;
    core::DeviceStateStore   store;
    core::ReconnectScheduler sched{loop};
    core::ReconnectProcedure proc{store, devbus};
    core::SignalDispatcher   disp{store, sched, proc, loop, 3000ms};

    void SetUp() override
    {
        btreconnect::set_log_level(btreconnect::Level::Info);
        devbus.flags[DEV] = bus::DeviceFlags{false, true};
    }

    void connected(bool v, const std::string &dev = DEV)
    {
        disp.on_property_change(dev, DEVICE, fake::connected_prop(v));
    }
};
}  // namespace

TEST_F(Dispatcher, IgnoresOtherInterfaces)
{
    disp.on_property_change(DEV, "org.bluez.MediaControl1", fake::connected_prop(true));
    disp.on_property_change(DEV, "org.bluez.Adapter1", fake::connected_prop(false));
    EXPECT_EQ(store.size(), 0u);
    EXPECT_EQ(sched.pending_count(), 0u);
}

TEST_F(Dispatcher, IgnoresChangesWithoutConnected)
{
    bus::PropertyMap changed{{"RSSI", std::int64_t{-60}}, {"ServicesResolved", true}};
    disp.on_property_change(DEV, DEVICE, changed);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(Dispatcher, NonBooleanConnectedIsIgnoredWithWarning)
{
    bus::PropertyMap changed{{"Connected", std::string("yes")}};

    testing::internal::CaptureStderr();
    disp.on_property_change(DEV, DEVICE, changed);
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(store.size(), 0u);
    EXPECT_NE(err.find("not a boolean"), std::string::npos);
}

TEST_F(Dispatcher, ConnectRecordsTimestamp)
{
    connected(true);
    const auto *rec = store.find(DEV);
    ASSERT_NE(rec, nullptr);
    ASSERT_TRUE(rec->last_connect.has_value());
    EXPECT_EQ(*rec->last_connect, loop.now());
    EXPECT_FALSE(rec->pending_timer.has_value());

    loop.advance(5000ms);
    connected(true);
    EXPECT_EQ(*store.find(DEV)->last_connect, loop.now());
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(Dispatcher, QuickDropArmsOneReconnect)
{
    connected(true);
    loop.advance(1000ms);
    connected(false);

    const auto *rec = store.find(DEV);
    ASSERT_NE(rec, nullptr);
    ASSERT_TRUE(rec->pending_timer.has_value());
    EXPECT_TRUE(sched.is_pending(*rec->pending_timer));
    EXPECT_EQ(sched.pending_count(DEV), 1u);
}

TEST_F(Dispatcher, DropExactlyAtWindowIsNormal)
{
    connected(true);
    loop.advance(3000ms);
    connected(false);

    EXPECT_FALSE(store.contains(DEV));
    EXPECT_EQ(sched.pending_count(), 0u);
}

TEST_F(Dispatcher, DropWithoutKnownConnectIsNormal)
{
    connected(false);
    EXPECT_EQ(store.size(), 0u);
    EXPECT_EQ(sched.pending_count(), 0u);
    loop.advance(10000ms);
    EXPECT_TRUE(devbus.queries.empty());
}

TEST_F(Dispatcher, RepeatedDropReplacesPendingTimer)
{
    connected(true);
    loop.advance(500ms);
    connected(false);
    const auto first = *store.find(DEV)->pending_timer;

    loop.advance(1000ms);
    connected(false);  // still within the window of the same connect
    const auto second = *store.find(DEV)->pending_timer;

    EXPECT_NE(first, second);
    EXPECT_FALSE(sched.is_pending(first));
    EXPECT_EQ(sched.pending_count(DEV), 1u);

    // runs one window after the latest drop
    loop.advance(2999ms);
    EXPECT_TRUE(devbus.queries.empty());
    loop.advance(1ms);
    ASSERT_EQ(devbus.queries.size(), 1u);
}

TEST_F(Dispatcher, ConnectWhilePendingCancelsReconnect)
{
    connected(true);
    loop.advance(1000ms);
    connected(false);
    const auto h = *store.find(DEV)->pending_timer;

    loop.advance(1000ms);
    connected(true);
    EXPECT_FALSE(sched.is_pending(h));
    EXPECT_FALSE(store.find(DEV)->pending_timer.has_value());
    EXPECT_EQ(*store.find(DEV)->last_connect, loop.now());

    loop.advance(10000ms);
    EXPECT_TRUE(devbus.queries.empty());
    EXPECT_TRUE(devbus.connects.empty());
}

TEST_F(Dispatcher, StableDropAfterPendingClearsEverything)
{
    connected(true);
    loop.advance(1000ms);
    connected(false);
    loop.advance(2500ms);  // 3.5s after the connect, timer still pending
    connected(false);

    EXPECT_FALSE(store.contains(DEV));
    EXPECT_EQ(sched.pending_count(), 0u);
    loop.advance(10000ms);
    EXPECT_TRUE(devbus.queries.empty());
}

TEST_F(Dispatcher, ArmFailureLeavesNoRecord)
{
    connected(true);
    loop.advance(100ms);
    loop.refuse_timers = true;

    testing::internal::CaptureStderr();
    connected(false);
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_FALSE(store.contains(DEV));
    EXPECT_EQ(sched.pending_count(), 0u);
    EXPECT_NE(err.find("no reconnect could be scheduled"), std::string::npos);
}

TEST_F(Dispatcher, VerboseLogShowsConnectedValue)
{
    btreconnect::set_log_level(btreconnect::Level::Debug);
    connected(true);

    testing::internal::CaptureStdout();
    connected(false);
    std::string out = testing::internal::GetCapturedStdout();

    EXPECT_NE(out.find("Connected=false"), std::string::npos);
    EXPECT_NE(out.find(DEV), std::string::npos);
    btreconnect::set_log_level(btreconnect::Level::Info);
}

TEST_F(Dispatcher, QuietUnlessVerbose)
{
    testing::internal::CaptureStdout();
    connected(true);
    connected(false);
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_TRUE(out.empty());
}

TEST_F(Dispatcher, DevicesAreTrackedIndependently)
{
    const std::string other = "/org/bluez/hci1/dev_11_22_33_44_55_66";
    connected(true);
    connected(true, other);
    loop.advance(1000ms);
    connected(false);
    loop.advance(3000ms);
    connected(false, other);  // 4s after its connect: normal

    EXPECT_FALSE(store.contains(other));
    EXPECT_EQ(sched.pending_count(other), 0u);
    // DEV's reconnect fired at t=4s
    ASSERT_EQ(devbus.queries.size(), 1u);
    EXPECT_EQ(devbus.queries[0], DEV);
}
