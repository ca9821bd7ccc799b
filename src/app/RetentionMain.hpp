#pragma once

#include <optional>
#include <string>

namespace sw::app
{

struct CliOptions
{
    bool dry_run = false;
    bool clear_cache = false;
    bool cache_stats = false;
    bool show_version = false;
    bool show_help = false;
};

// nullopt (with error set) for an unknown argument.
std::optional<CliOptions> parse_cli(int argc, char *argv[], std::string &error);

std::string usage_text();

// One retention pass. Exit codes: 0 success, 1 configuration or run
// failure, 2 another instance holds the run lock.
int retention_main(int argc, char *argv[]);

} // namespace sw::app
