#pragma once

#include "unitsync/core/result.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace unitsync::config {

using Duration = std::chrono::steady_clock::duration;

/**
 * @brief Daemon settings, from defaults, an optional JSON file and the command line
 */
struct Config {
    std::filesystem::path source_dir{"."};
    std::filesystem::path dest_dir{"/etc/systemd/system"};
    Duration resync_interval = std::chrono::hours(1);
    Duration retry_interval = std::chrono::seconds(1);
    Duration timeout = std::chrono::seconds(10);   ///< Budget for one service manager call
    std::string systemctl = "systemctl";
    std::string log_level = "info";
};

/**
 * @brief Parsed command line
 */
struct Options {
    Config config;
    std::filesystem::path config_file; ///< Empty when --config was not given
    bool once = false;                 ///< Run one pass and exit
    bool help = false;
};

/**
 * @brief Parse a duration such as "1h", "1h30m", "1.5s" or "250ms"
 *
 * Units: ns, us, ms, s, m, h. A bare "0" is accepted.
 */
Result<Duration> parse_duration(std::string_view text);

/// Render a duration in the same grammar parse_duration accepts
std::string format_duration(Duration duration);

/**
 * @brief Overlay the settings of a JSON object on @p config
 *
 * Keys: src, dest, resync, retry, timeout, systemctl, log_level. Durations are strings.
 */
Result<void> apply_json(const std::string& text, Config& config);

/**
 * @brief Read @p path and apply it with apply_json
 */
Result<void> load_config_file(const std::filesystem::path& path, Config& config);

/**
 * @brief Parse the command line
 *
 * A --config file is applied first and explicit flags override it, whatever their
 * order. Flags take the forms `--name value`, `--name=value`, `-name value`.
 */
Result<Options> parse_command_line(const std::vector<std::string>& args);

Result<Options> parse_command_line(int argc, char* argv[]);

std::string usage(const std::string& program);

} // namespace unitsync::config
