#include <cstdio>
#include <string>

#include "app/daemon_config.hpp"
#include "app/reconnect_service.hpp"
#include "bus/bluez_bus.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

int main(int argc, char **argv)
{
    app::DaemonConfig cfg;
    app::load_config_from_env(cfg);

    std::string err;
    switch (app::parse_args(argc, argv, cfg, err))
    {
        case app::ParseResult::Help:
            app::print_usage(stdout, argv[0]);
            return exitc::ok;
        case app::ParseResult::BadArgs:
            std::fprintf(stderr, "error: %s\n", err.c_str());
            app::print_usage(stderr, argv[0]);
            return exitc::bad_args;
        case app::ParseResult::Run:
            break;
    }
    app::apply_logging(cfg);

    LOG_INFO("Config: window=%lldms verbose=%s log_level=%s",
             (long long)cfg.debounce_window.count(), cfg.verbose ? "yes" : "no",
             cfg.log_level.c_str());

    // bus outlives the service: the service's timers are sources on the bus' loop
    bus::BluezBus         bluez;
    app::ReconnectService svc(bluez, bluez, cfg.debounce_window);

    if (!bluez.start([&svc](const bus::PropertyChange &c) { svc.on_property_change(c); }))
    {
        LOG_ERROR("cannot start BlueZ watcher");
        return exitc::bus_error;
    }

    int r = bluez.run();
    if (r < 0)
        return exitc::bus_error;

    LOG_INFO("Shutting down (%zu device(s) tracked, %zu reconnect(s) pending)",
             svc.store().size(), svc.scheduler().pending_count());
    return exitc::ok;
}
