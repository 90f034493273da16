#include "unitsync/control/systemctl.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>
#include <spdlog/spdlog.h>

#include <future>
#include <system_error>

namespace unitsync::control {
namespace bp = boost::process;

namespace {

std::string join_args(const std::vector<std::string>& args) {
    std::string joined;
    for (const auto& arg : args) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += arg;
    }
    return joined;
}

std::string trim_trailing_whitespace(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
        text.pop_back();
    }
    return text;
}

} // namespace

SystemctlControl::SystemctlControl(Clock::duration timeout, std::string executable)
    : timeout_(timeout), executable_(std::move(executable)) {}

Result<bool> SystemctlControl::ensure_running(const std::string& unit) {
    const auto deadline = Clock::now() + timeout_;

    auto active = is_active(unit, deadline);
    if (active.is_error()) {
        return active.forward_error<bool>();
    }
    if (active.value()) {
        return Ok(false);
    }

    auto started = exec(unit, {"start", unit}, deadline);
    if (started.is_error()) {
        return started.forward_error<bool>();
    }
    return Ok(true);
}

Result<bool> SystemctlControl::ensure_stopped(const std::string& unit) {
    const auto deadline = Clock::now() + timeout_;

    auto active = is_active(unit, deadline);
    if (active.is_error()) {
        return active.forward_error<bool>();
    }
    if (!active.value()) {
        return Ok(false);
    }

    auto stopped = exec(unit, {"stop", unit}, deadline);
    if (stopped.is_error()) {
        return stopped.forward_error<bool>();
    }
    return Ok(true);
}

Result<void> SystemctlControl::restart(const std::string& unit) {
    const auto deadline = Clock::now() + timeout_;

    if (auto reload = exec(unit, {"daemon-reload"}, deadline); reload.is_error()) {
        return reload;
    }
    return exec(unit, {"restart", unit}, deadline);
}

Result<bool> SystemctlControl::is_active(const std::string& unit, Clock::time_point deadline) {
    auto result = run(unit, {"is-active", "--quiet", unit}, deadline);
    if (result.is_error()) {
        return result.forward_error<bool>();
    }
    return Ok(result.value().exit_code == 0);
}

Result<void> SystemctlControl::exec(const std::string& unit, const std::vector<std::string>& args,
                                    Clock::time_point deadline) {
    auto result = run(unit, args, deadline);
    if (result.is_error()) {
        return result.forward_error<void>();
    }

    const auto& command = result.value();
    if (command.exit_code == 0) {
        return Ok();
    }
    if (!command.output.empty()) {
        return Fail<void>(ErrorKind::ControlInterface, unit,
                          "systemctl error msg: " + trim_trailing_whitespace(command.output));
    }
    return Fail<void>(ErrorKind::ControlInterface, unit,
                      "systemctl " + join_args(args) + " exited with status " + std::to_string(command.exit_code));
}

Result<SystemctlControl::CommandOutput> SystemctlControl::run(const std::string& unit,
                                                              const std::vector<std::string>& args,
                                                              Clock::time_point deadline) {
    const auto remaining = deadline - Clock::now();
    if (remaining <= Clock::duration::zero()) {
        return Fail<CommandOutput>(ErrorKind::ControlInterface, unit,
                                   "deadline exceeded before systemctl " + join_args(args),
                                   std::make_error_code(std::errc::timed_out));
    }

    boost::filesystem::path program;
    if (executable_.find('/') != std::string::npos) {
        program = executable_;
    } else {
        program = bp::search_path(executable_);
    }
    if (program.empty()) {
        return Fail<CommandOutput>(ErrorKind::ControlInterface, unit, executable_ + " not found in PATH",
                                   std::make_error_code(std::errc::no_such_file_or_directory));
    }

    spdlog::debug("running {} {}", program.string(), join_args(args));

    boost::asio::io_context io;
    std::future<std::string> out;
    std::future<std::string> err;
    std::error_code launch_ec;

    bp::child child(bp::exe = program,
                    bp::args = args,
                    bp::std_in.close(),
                    bp::std_out > out,
                    bp::std_err > err,
                    io,
                    launch_ec);
    if (launch_ec) {
        return Fail<CommandOutput>(ErrorKind::ControlInterface, unit,
                                   "failed to launch " + program.string(), launch_ec);
    }

    // The context runs out of work once both pipes reach EOF, i.e. when the child exits
    io.run_for(remaining);
    if (!io.stopped()) {
        std::error_code kill_ec;
        child.terminate(kill_ec);
        if (kill_ec) {
            spdlog::warn("failed to kill timed out systemctl for {}: {}", unit, kill_ec.message());
        }
        const auto budget = std::chrono::duration_cast<std::chrono::milliseconds>(timeout_);
        return Fail<CommandOutput>(ErrorKind::ControlInterface, unit,
                                   "systemctl " + join_args(args) + " timed out after " +
                                       std::to_string(budget.count()) + "ms",
                                   std::make_error_code(std::errc::timed_out));
    }

    std::error_code wait_ec;
    child.wait(wait_ec);
    if (wait_ec) {
        return Fail<CommandOutput>(ErrorKind::ControlInterface, unit,
                                   "failed to wait for systemctl " + join_args(args), wait_ec);
    }

    CommandOutput command;
    command.exit_code = child.exit_code();
    try {
        command.output = out.get() + err.get();
    } catch (const std::exception& e) {
        return Fail<CommandOutput>(ErrorKind::ControlInterface, unit,
                                   std::string("failed to read systemctl output: ") + e.what());
    }
    return Ok(std::move(command));
}

} // namespace unitsync::control
