#include "unitsync/config/config.hpp"
#include "unitsync/control/systemctl.hpp"
#include "unitsync/sync/reconciler.hpp"
#include "unitsync/watch/inotify_watcher.hpp"
#include "unitsync/watch/scheduler.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <system_error>

namespace asio = boost::asio;
namespace fs = std::filesystem;

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    const std::string program = argc > 0 ? fs::path(argv[0]).filename().string() : "unitsyncd";

    auto parsed = unitsync::config::parse_command_line(argc, argv);
    if (parsed.is_error()) {
        std::cerr << parsed.error().to_string() << "\n\n" << unitsync::config::usage(program);
        return 2;
    }
    const auto& options = parsed.value();
    if (options.help) {
        std::cout << unitsync::config::usage(program);
        return 0;
    }

    const auto& config = options.config;
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    std::error_code ec;
    fs::create_directories(config.source_dir, ec);
    if (ec) {
        spdlog::critical("cannot create source directory {}: {}", config.source_dir.string(), ec.message());
        return 1;
    }

    unitsync::control::SystemctlControl control(config.timeout, config.systemctl);
    unitsync::sync::Reconciler reconciler(config.source_dir, config.dest_dir, control);
    unitsync::sync::ReconcileState state;

    if (options.once) {
        const auto report = reconciler.reconcile(state);
        spdlog::info("single pass {}: {} written, {} started, {} restarted, {} stopped",
                     report.converged ? "converged" : "failed",
                     report.units_written, report.units_started, report.units_restarted, report.units_stopped);
        return report.converged ? 0 : 1;
    }

    asio::io_context io_context;

    unitsync::watch::InotifyWatcher watcher(io_context);
    auto opened = watcher.open(config.source_dir);
    if (opened.is_error()) {
        spdlog::critical("{}", opened.error().to_string());
        return 1;
    }

    unitsync::watch::Scheduler scheduler(
        io_context,
        watcher,
        [&reconciler, &state]() {
            return reconciler.reconcile(state).converged;
        },
        config.resync_interval,
        config.retry_interval);

    asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&scheduler](const boost::system::error_code& error, int signal_number) {
        if (!error) {
            spdlog::info("received signal {}, shutting down", signal_number);
            scheduler.stop();
        }
    });

    spdlog::info("syncing units from {} to {} (resync {}, retry {}, timeout {})",
                 config.source_dir.string(), config.dest_dir.string(),
                 unitsync::config::format_duration(config.resync_interval),
                 unitsync::config::format_duration(config.retry_interval),
                 unitsync::config::format_duration(config.timeout));

    std::optional<unitsync::Result<void>> outcome;
    scheduler.start([&outcome, &signals](unitsync::Result<void> result) {
        outcome = std::move(result);
        boost::system::error_code ignored;
        signals.cancel(ignored);
    });

    io_context.run();

    if (outcome && outcome->is_error()) {
        spdlog::critical("{}", outcome->error().to_string());
        return 1;
    }
    return 0;
}
