#pragma once
#include <chrono>
#include <cstdio>
#include <string>

#include "util/constants.hpp"

namespace app
{

struct DaemonConfig
{
    std::chrono::milliseconds debounce_window = constants::DEBOUNCE_WINDOW;
    bool                      verbose         = false;
    std::string               log_level       = "info";
};

enum class ParseResult
{
    Run,
    Help,
    BadArgs
};

// BTRECONNECT_LOG_LEVEL, BTRECONNECT_VERBOSE, BTRECONNECT_DEBOUNCE_MS.
// Invalid values are logged and left at their previous setting.
void load_config_from_env(DaemonConfig &cfg);

// Command line overrides the environment. On BadArgs, err says why.
ParseResult parse_args(int argc, char **argv, DaemonConfig &cfg, std::string &err);

// Parses a debounce window in milliseconds within the allowed range.
bool parse_window_ms(const char *s, std::chrono::milliseconds &out);

void print_usage(std::FILE *out, const char *prog);

// verbose wins over log_level
void apply_logging(const DaemonConfig &cfg);

}  // namespace app
