#pragma once

#include "unitsync/control/service_control.hpp"
#include "unitsync/core/result.hpp"
#include "unitsync/sync/unit_file.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace unitsync::sync {

/**
 * @brief Last applied fingerprint per unit
 *
 * Owned by the caller and handed to every pass. Only the reconciler mutates it, and
 * only from the loop thread.
 */
using ReconcileState = std::unordered_map<std::string, Fingerprint>;

/**
 * @brief Outcome of one reconciliation pass
 */
struct PassReport {
    bool converged = true;     ///< Every processed unit succeeded
    std::vector<Error> errors; ///< Failures in the order they happened

    std::size_t units_written = 0;   ///< Destination records (re)written
    std::size_t units_started = 0;   ///< ensure_running calls that started a unit
    std::size_t units_restarted = 0;
    std::size_t units_stopped = 0;   ///< ensure_stopped calls that stopped a unit
    std::size_t units_removed = 0;   ///< Units retired from the state

    /// Service manager actions that changed something
    std::size_t control_actions() const noexcept {
        return units_started + units_restarted + units_stopped;
    }
};

/**
 * @brief Drives the service manager until it matches the source directory
 *
 * One call to reconcile() is one pass: copy changed unit files to the destination
 * directory, start new units, restart changed ones, and stop and remove units whose
 * file disappeared from the source directory. A failing unit never blocks the
 * others; its state entry is left stale so the next pass retries it.
 */
class Reconciler {
public:
    Reconciler(std::filesystem::path source_dir,
               std::filesystem::path dest_dir,
               control::ServiceControl& control);

    PassReport reconcile(ReconcileState& state);

    const std::filesystem::path& source_dir() const noexcept { return source_dir_; }
    const std::filesystem::path& dest_dir() const noexcept { return dest_dir_; }

private:
    Result<std::vector<std::string>> list_units() const;

    /// Converge one listed unit. Ok(false) means its source vanished after listing.
    Result<bool> apply_unit(const std::string& unit, ReconcileState& state, PassReport& report);

    Result<void> retire_unit(const std::string& unit, ReconcileState& state, PassReport& report);

    static void record_failure(PassReport& report, Error error);

    std::filesystem::path source_dir_;
    std::filesystem::path dest_dir_;
    control::ServiceControl& control_;
};

} // namespace unitsync::sync
