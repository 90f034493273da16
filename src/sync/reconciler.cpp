#include "unitsync/sync/reconciler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>
#include <unordered_set>
#include <system_error>

namespace unitsync::sync {
namespace fs = std::filesystem;

Reconciler::Reconciler(fs::path source_dir, fs::path dest_dir, control::ServiceControl& control)
    : source_dir_(std::move(source_dir)), dest_dir_(std::move(dest_dir)), control_(control) {}

PassReport Reconciler::reconcile(ReconcileState& state) {
    PassReport report;

    auto units = list_units();
    if (units.is_error()) {
        spdlog::error("error while listing unit files: {}", units.error().to_string());
        record_failure(report, units.error());
        return report;
    }

    // Units still present in the source directory; everything else in the state is retired
    std::unordered_set<std::string> desired;
    for (const auto& unit : units.value()) {
        auto applied = apply_unit(unit, state, report);
        if (applied.is_error()) {
            record_failure(report, applied.error());
            desired.insert(unit);
        } else if (applied.value()) {
            desired.insert(unit);
        }
    }

    std::vector<std::string> removed;
    for (const auto& [unit, _] : state) {
        if (desired.count(unit) > 0) {
            continue;
        }
        // A regular file that appeared after listing is left to the next pass
        std::error_code ec;
        const bool regular = fs::is_regular_file(source_dir_ / unit, ec);
        if (!regular && (!ec || ec == std::errc::no_such_file_or_directory)) {
            removed.push_back(unit);
        }
    }
    std::sort(removed.begin(), removed.end());

    for (const auto& unit : removed) {
        if (auto retired = retire_unit(unit, state, report); retired.is_error()) {
            record_failure(report, retired.error());
        }
    }

    return report;
}

Result<std::vector<std::string>> Reconciler::list_units() const {
    std::error_code ec;
    fs::directory_iterator it(source_dir_, ec);
    if (ec) {
        return Fail<std::vector<std::string>>(ErrorKind::Listing, {},
                                              "cannot list " + source_dir_.string(), ec);
    }

    std::vector<std::string> units;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        const auto name = it->path().filename().string();
        if (is_editor_artifact(name)) {
            continue;
        }

        // Entries that cannot be stat'ed (dangling links, loops) are left to fingerprint_file
        std::error_code type_ec;
        const auto status = it->status(type_ec);
        if (!type_ec && status.type() != fs::file_type::not_found && !fs::is_regular_file(status)) {
            spdlog::debug("skipping {}: not a regular file", name);
            continue;
        }
        units.push_back(name);
    }
    if (ec) {
        return Fail<std::vector<std::string>>(ErrorKind::Listing, {},
                                              "cannot list " + source_dir_.string(), ec);
    }

    std::sort(units.begin(), units.end());
    return Ok(std::move(units));
}

Result<bool> Reconciler::apply_unit(const std::string& unit, ReconcileState& state, PassReport& report) {
    const auto source = source_dir_ / unit;
    const auto target = dest_dir_ / unit;

    auto desired = fingerprint_file(source, unit);
    if (desired.is_error()) {
        if (desired.error().is_not_found()) {
            // Removed after listing; the cleanup sweep takes care of it
            spdlog::debug("unit file {} vanished before it was read", unit);
            return Ok(false);
        }
        spdlog::error("error reading unit file \"{}\": {}", unit, desired.error().to_string());
        return desired.forward_error<bool>();
    }
    const auto& checksum = desired.value();

    std::optional<Fingerprint> current;
    if (auto installed = fingerprint_file(target, unit); installed.is_ok()) {
        current = installed.value();
    } else if (!installed.error().is_not_found()) {
        spdlog::error("error reading current unit file \"{}\": {}", unit, installed.error().to_string());
        return installed.forward_error<bool>();
    }

    if (current != checksum) {
        if (auto copied = copy_unit_file(source, target, unit); copied.is_error()) {
            spdlog::error("error while copying unit file \"{}\": {}", unit, copied.error().to_string());
            return copied.forward_error<bool>();
        }
        ++report.units_written;
        spdlog::info("wrote unit: {}", unit);
    }

    const auto known = state.find(unit);
    const bool recorded = known != state.end();
    // A recorded fingerprint that differs means an earlier restart did not go through
    const bool stale = recorded && known->second != checksum;

    // Unchanged or first sight: make sure it runs
    if ((!current || *current == checksum) && !stale) {
        auto started = control_.ensure_running(unit);
        if (started.is_error()) {
            spdlog::error("error while ensuring unit \"{}\" is running: {}", unit, started.error().to_string());
            return started.forward_error<bool>();
        }
        if (started.value()) {
            ++report.units_started;
            spdlog::info("started unit: {}", unit);
        }
        state[unit] = checksum;
        return Ok(true);
    }

    // The installed copy was replaced; restart unless this content was already applied
    if (recorded && !stale) {
        spdlog::debug("unit {} already runs fingerprint {}", unit, checksum);
        return Ok(true);
    }

    if (auto restarted = control_.restart(unit); restarted.is_error()) {
        spdlog::error("error while restarting unit \"{}\": {}", unit, restarted.error().to_string());
        return restarted.forward_error<bool>();
    }
    ++report.units_restarted;
    spdlog::info("restarted unit: {}", unit);
    state[unit] = checksum;
    return Ok(true);
}

Result<void> Reconciler::retire_unit(const std::string& unit, ReconcileState& state, PassReport& report) {
    auto stopped = control_.ensure_stopped(unit);
    if (stopped.is_error()) {
        spdlog::error("error while stopping unit \"{}\": {}", unit, stopped.error().to_string());
        return stopped.forward_error<void>();
    }
    if (stopped.value()) {
        ++report.units_stopped;
        spdlog::info("stopped unit: {}", unit);
    }

    if (auto removed = remove_unit_file(dest_dir_ / unit, unit); removed.is_error()) {
        spdlog::error("error while removing unit \"{}\": {}", unit, removed.error().to_string());
        return removed;
    }
    ++report.units_removed;
    spdlog::info("removed unit: {}", unit);

    state.erase(unit);
    return Ok();
}

void Reconciler::record_failure(PassReport& report, Error error) {
    report.converged = false;
    report.errors.push_back(std::move(error));
}

} // namespace unitsync::sync
