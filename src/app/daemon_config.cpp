#include <cctype>
#include <cstdlib>
#include <string>

#include "app/daemon_config.hpp"
#include "util/log.hpp"

namespace app
{

static std::string to_lower(std::string s)
{
    for (auto &c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static bool is_truthy(const char *v)
{
    const std::string s = to_lower(v ? v : "");
    return s == "1" || s == "true" || s == "yes" || s == "on";
}

bool parse_window_ms(const char *s, std::chrono::milliseconds &out)
{
    if (!s || !*s)
        return false;
    char         *p = nullptr;
    unsigned long v = std::strtoul(s, &p, 10);
    if (!p || *p != '\0' || s[0] == '-')
        return false;
    if (v < (unsigned long)constants::DEBOUNCE_WINDOW_MIN.count() ||
        v > (unsigned long)constants::DEBOUNCE_WINDOW_MAX.count())
        return false;
    out = std::chrono::milliseconds(v);
    return true;
}

void load_config_from_env(DaemonConfig &cfg)
{
    if (const char *e = std::getenv("BTRECONNECT_LOG_LEVEL"); e && *e)
        cfg.log_level = to_lower(e);

    if (const char *e = std::getenv("BTRECONNECT_VERBOSE"); e && *e)
        cfg.verbose = is_truthy(e);

    if (const char *e = std::getenv("BTRECONNECT_DEBOUNCE_MS"))
    {
        std::chrono::milliseconds w{};
        if (parse_window_ms(e, w))
        {
            cfg.debounce_window = w;
            LOG_INFO("Using debounce window %lldms (from BTRECONNECT_DEBOUNCE_MS)",
                     (long long)w.count());
        }
        else
        {
            LOG_WARN("Ignoring invalid BTRECONNECT_DEBOUNCE_MS='%s' (expect %lld..%lld)", e,
                     (long long)constants::DEBOUNCE_WINDOW_MIN.count(),
                     (long long)constants::DEBOUNCE_WINDOW_MAX.count());
        }
    }
}

void print_usage(std::FILE *out, const char *prog)
{
    std::fprintf(out,
                 "Usage:\n"
                 "  %s [options]\n"
                 "\n"
                 "Reconnects Bluetooth devices that drop their link right after connecting.\n"
                 "\n"
                 "Options:\n"
                 "  -v, --verbose       log every connection change and decision\n"
                 "  -w, --window <ms>   debounce window in ms (default %lld)\n"
                 "  -h, --help          show this help\n"
                 "\n"
                 "Environment:\n"
                 "  BTRECONNECT_LOG_LEVEL    debug|info|warn|error\n"
                 "  BTRECONNECT_VERBOSE      1 to enable verbose logging\n"
                 "  BTRECONNECT_DEBOUNCE_MS  debounce window in ms\n",
                 prog ? prog : "btreconnectd", (long long)constants::DEBOUNCE_WINDOW.count());
}

ParseResult parse_args(int argc, char **argv, DaemonConfig &cfg, std::string &err)
{
    for (int i = 1; i < argc; ++i)
    {
        const std::string a = argv[i];
        if (a == "-h" || a == "--help")
            return ParseResult::Help;
        if (a == "-v" || a == "--verbose")
        {
            cfg.verbose = true;
            continue;
        }
        if (a == "-w" || a == "--window")
        {
            if (i + 1 >= argc)
            {
                err = a + " needs a value";
                return ParseResult::BadArgs;
            }
            std::chrono::milliseconds w{};
            if (!parse_window_ms(argv[++i], w))
            {
                err = "invalid window: " + std::string(argv[i]);
                return ParseResult::BadArgs;
            }
            cfg.debounce_window = w;
            continue;
        }
        err = "unknown option: " + a;
        return ParseResult::BadArgs;
    }
    return ParseResult::Run;
}

void apply_logging(const DaemonConfig &cfg)
{
    if (cfg.verbose)
        btreconnect::set_log_level(btreconnect::Level::Debug);
    else
        btreconnect::set_log_level_by_name(cfg.log_level.c_str());
}

}  // namespace app
