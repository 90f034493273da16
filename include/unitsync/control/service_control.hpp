#pragma once

#include "unitsync/core/result.hpp"

#include <string>

namespace unitsync::control {

/**
 * @brief Operations the reconciler needs from the service manager
 *
 * Each call is bounded by its own timeout. Failures are reported as
 * ErrorKind::ControlInterface and are never retried here; the next
 * reconciliation pass retries them.
 */
class ServiceControl {
public:
    virtual ~ServiceControl() = default;

    /**
     * @brief Start @p unit unless it is already active
     * @return true when a start was issued
     */
    virtual Result<bool> ensure_running(const std::string& unit) = 0;

    /**
     * @brief Stop @p unit unless it is already inactive
     * @return true when a stop was issued
     */
    virtual Result<bool> ensure_stopped(const std::string& unit) = 0;

    /**
     * @brief Reload manager configuration, then restart @p unit
     */
    virtual Result<void> restart(const std::string& unit) = 0;
};

} // namespace unitsync::control
