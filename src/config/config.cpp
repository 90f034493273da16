#include "unitsync/config/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <optional>
#include <set>
#include <sstream>
#include <system_error>

namespace unitsync::config {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

struct Flag {
    std::string name;
    std::string value;
};

const std::set<std::string>& value_flags() {
    static const std::set<std::string> flags = {
        "src", "dest", "resync", "retry", "timeout", "systemctl", "log-level", "config"};
    return flags;
}

Result<void> config_error(const std::string& message) {
    return Fail<void>(ErrorKind::Config, {}, message);
}

std::optional<long double> unit_scale(std::string_view unit) {
    if (unit == "ns") return 1.0L;
    if (unit == "us") return 1e3L;
    if (unit == "ms") return 1e6L;
    if (unit == "s") return 1e9L;
    if (unit == "m") return 60e9L;
    if (unit == "h") return 3600e9L;
    return std::nullopt;
}

// Shared by flags and JSON keys; JSON uses '_' where flags use '-'
Result<void> apply_setting(const std::string& key, const std::string& value, Config& config) {
    auto set_duration = [&](Duration& target) -> Result<void> {
        auto parsed = parse_duration(value);
        if (parsed.is_error()) {
            return Fail<void>(ErrorKind::Config, {}, key + ": " + parsed.error().message);
        }
        target = parsed.value();
        return Ok();
    };

    if (key == "src") {
        config.source_dir = value;
    } else if (key == "dest") {
        config.dest_dir = value;
    } else if (key == "resync") {
        return set_duration(config.resync_interval);
    } else if (key == "retry") {
        return set_duration(config.retry_interval);
    } else if (key == "timeout") {
        return set_duration(config.timeout);
    } else if (key == "systemctl") {
        config.systemctl = value;
    } else if (key == "log_level" || key == "log-level") {
        // from_str maps every unknown name to off
        if (spdlog::level::from_str(value) == spdlog::level::off && value != "off") {
            return config_error(key + ": unknown log level \"" + value + "\"");
        }
        config.log_level = value;
    } else {
        return config_error("unknown setting \"" + key + "\"");
    }
    return Ok();
}

} // namespace

Result<Duration> parse_duration(std::string_view text) {
    const std::string original(text);
    auto invalid = [&original](const std::string& why) {
        return Fail<Duration>(ErrorKind::Config, {}, "invalid duration \"" + original + "\": " + why);
    };

    if (text.empty()) {
        return invalid("empty value");
    }
    if (text == "0") {
        return Ok(Duration::zero());
    }
    if (text.front() == '-') {
        return invalid("negative durations are not allowed");
    }
    if (text.front() == '+') {
        text.remove_prefix(1);
    }
    if (text.empty()) {
        return invalid("missing number");
    }

    long double total_ns = 0;
    while (!text.empty()) {
        std::size_t digits = 0;
        while (digits < text.size() &&
               (std::isdigit(static_cast<unsigned char>(text[digits])) || text[digits] == '.')) {
            ++digits;
        }
        const std::string number(text.substr(0, digits));
        if (number.empty() || number == "." || std::count(number.begin(), number.end(), '.') > 1) {
            return invalid("expected a number");
        }
        text.remove_prefix(digits);

        std::size_t letters = 0;
        while (letters < text.size() && std::isalpha(static_cast<unsigned char>(text[letters]))) {
            ++letters;
        }
        if (letters == 0) {
            return invalid("missing unit after " + number);
        }
        const auto unit = text.substr(0, letters);
        const auto scale = unit_scale(unit);
        if (!scale) {
            return invalid("unknown unit \"" + std::string(unit) + "\"");
        }
        text.remove_prefix(letters);

        total_ns += std::strtold(number.c_str(), nullptr) * *scale;
    }

    if (total_ns > static_cast<long double>(std::numeric_limits<std::int64_t>::max())) {
        return invalid("out of range");
    }

    const std::chrono::nanoseconds ns(std::llround(total_ns));
    return Ok(std::chrono::duration_cast<Duration>(ns));
}

std::string format_duration(Duration duration) {
    using namespace std::chrono;
    const auto ns = duration_cast<nanoseconds>(duration).count();
    if (ns == 0) {
        return "0s";
    }

    struct Unit {
        std::int64_t size;
        const char* suffix;
    };
    static const Unit units[] = {
        {3600'000'000'000LL, "h"}, {60'000'000'000LL, "m"}, {1'000'000'000LL, "s"},
        {1'000'000LL, "ms"},       {1'000LL, "us"},         {1LL, "ns"}};

    for (const auto& unit : units) {
        if (ns % unit.size == 0) {
            return std::to_string(ns / unit.size) + unit.suffix;
        }
    }
    return std::to_string(ns) + "ns";
}

Result<void> apply_json(const std::string& text, Config& config) {
    const auto document = json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return config_error("configuration is not valid JSON");
    }
    if (!document.is_object()) {
        return config_error("configuration must be a JSON object");
    }

    static const std::set<std::string> known_keys = {
        "src", "dest", "resync", "retry", "timeout", "systemctl", "log_level"};

    for (auto it = document.begin(); it != document.end(); ++it) {
        if (known_keys.count(it.key()) == 0) {
            spdlog::warn("ignoring unknown configuration key \"{}\"", it.key());
            continue;
        }
        if (!it.value().is_string()) {
            return config_error("configuration key \"" + it.key() + "\" must be a string");
        }
        auto applied = apply_setting(it.key(), it.value().get<std::string>(), config);
        if (applied.is_error()) {
            return applied;
        }
    }

    return Ok();
}

Result<void> load_config_file(const fs::path& path, Config& config) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Fail<void>(ErrorKind::Config, {}, "cannot open configuration file " + path.string(),
                          std::error_code(errno, std::generic_category()));
    }

    std::ostringstream buffer;
    buffer << input.rdbuf();

    auto applied = apply_json(buffer.str(), config);
    if (applied.is_error()) {
        auto error = applied.error();
        error.message = path.string() + ": " + error.message;
        return Err<void>(std::move(error));
    }

    spdlog::debug("loaded configuration from {}", path.string());
    return Ok();
}

Result<Options> parse_command_line(const std::vector<std::string>& args) {
    Options options;
    std::vector<Flag> flags;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg.size() < 2 || arg[0] != '-') {
            return Fail<Options>(ErrorKind::Config, {}, "unexpected argument \"" + arg + "\"");
        }

        std::string name = arg.substr(arg[1] == '-' ? 2 : 1);
        std::optional<std::string> inline_value;
        if (const auto eq = name.find('='); eq != std::string::npos) {
            inline_value = name.substr(eq + 1);
            name = name.substr(0, eq);
        }

        if (name == "help" || name == "h") {
            options.help = true;
            continue;
        }
        if (name == "once") {
            if (inline_value) {
                return Fail<Options>(ErrorKind::Config, {}, "flag -once takes no value");
            }
            options.once = true;
            continue;
        }
        if (value_flags().count(name) == 0) {
            return Fail<Options>(ErrorKind::Config, {}, "unknown flag \"" + arg + "\"");
        }

        std::string value;
        if (inline_value) {
            value = *inline_value;
        } else if (i + 1 < args.size()) {
            value = args[++i];
        } else {
            return Fail<Options>(ErrorKind::Config, {}, "flag -" + name + " needs a value");
        }

        if (name == "config") {
            options.config_file = value;
        } else {
            flags.push_back({name, value});
        }
    }

    if (options.help) {
        return Ok(std::move(options));
    }

    if (!options.config_file.empty()) {
        auto loaded = load_config_file(options.config_file, options.config);
        if (loaded.is_error()) {
            return loaded.forward_error<Options>();
        }
    }

    for (const auto& flag : flags) {
        auto applied = apply_setting(flag.name, flag.value, options.config);
        if (applied.is_error()) {
            return applied.forward_error<Options>();
        }
    }

    return Ok(std::move(options));
}

Result<Options> parse_command_line(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_command_line(args);
}

std::string usage(const std::string& program) {
    const Config defaults{};
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "\n"
        << "Keeps the service manager in line with a directory of unit files.\n"
        << "\n"
        << "Options:\n"
        << "  --src DIR          directory containing your unit files (default "
        << defaults.source_dir.string() << ")\n"
        << "  --dest DIR         systemd's unit file directory (default " << defaults.dest_dir.string() << ")\n"
        << "  --resync DURATION  how often to check for unit file consistency (default "
        << format_duration(defaults.resync_interval) << ")\n"
        << "  --retry DURATION   how often to retry failed operations (default "
        << format_duration(defaults.retry_interval) << ")\n"
        << "  --timeout DURATION timeout for systemctl operations (default "
        << format_duration(defaults.timeout) << ")\n"
        << "  --systemctl PATH   systemctl executable (default " << defaults.systemctl << ")\n"
        << "  --log-level LEVEL  trace, debug, info, warn, err, critical or off (default "
        << defaults.log_level << ")\n"
        << "  --config FILE      JSON file with the settings above; flags take precedence\n"
        << "  --once             run a single reconciliation pass and exit\n"
        << "  --help             show this message\n";
    return oss.str();
}

} // namespace unitsync::config
