#pragma once

#include "unitsync/control/service_control.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace unitsync::control {

/**
 * @brief ServiceControl backed by the `systemctl` command
 *
 * Every operation runs one or more systemctl invocations that share a single
 * deadline of `timeout` from the start of the operation. A command still running
 * at the deadline is killed and the operation fails.
 */
class SystemctlControl : public ServiceControl {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @param timeout Budget for one operation
     * @param executable Command name looked up in PATH, or a path containing '/'
     */
    explicit SystemctlControl(Clock::duration timeout, std::string executable = "systemctl");

    Result<bool> ensure_running(const std::string& unit) override;
    Result<bool> ensure_stopped(const std::string& unit) override;
    Result<void> restart(const std::string& unit) override;

    Clock::duration timeout() const noexcept { return timeout_; }
    const std::string& executable() const noexcept { return executable_; }

private:
    struct CommandOutput {
        int exit_code = -1;
        std::string output; ///< stdout followed by stderr
    };

    Result<bool> is_active(const std::string& unit, Clock::time_point deadline);

    Result<void> exec(const std::string& unit, const std::vector<std::string>& args,
                      Clock::time_point deadline);

    Result<CommandOutput> run(const std::string& unit, const std::vector<std::string>& args,
                              Clock::time_point deadline);

    Clock::duration timeout_;
    std::string executable_;
};

} // namespace unitsync::control
