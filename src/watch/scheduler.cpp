#include "unitsync/watch/scheduler.hpp"

#include <boost/asio/error.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <optional>
#include <system_error>

namespace unitsync::watch {

namespace {

long long to_millis(Scheduler::Clock::duration d) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

} // namespace

Scheduler::Scheduler(asio::io_context& io_context,
                     ChangeSource& source,
                     PassFunction pass,
                     Clock::duration resync_interval,
                     Clock::duration retry_interval)
    : io_context_(io_context),
      timer_(io_context),
      source_(source),
      pass_(std::move(pass)),
      resync_interval_(resync_interval),
      retry_interval_(retry_interval) {}

void Scheduler::start(CompletionHandler on_complete) {
    if (running_) {
        return;
    }
    running_ = true;
    on_complete_ = std::move(on_complete);

    arm(Clock::duration::zero());
    wait_for_changes();
}

Result<void> Scheduler::run() {
    std::optional<Result<void>> outcome;
    start([&outcome](Result<void> result) {
        outcome = std::move(result);
    });

    io_context_.run();

    if (!outcome) {
        return Fail<void>(ErrorKind::Fatal, {}, "event loop stopped before the scheduler finished");
    }
    return *outcome;
}

void Scheduler::stop() {
    finish(Ok());
}

void Scheduler::arm(Clock::duration delay) {
    const auto generation = ++generation_;
    timer_.expires_after(delay);
    timer_.async_wait([this, generation](const boost::system::error_code& ec) {
        on_timer(generation, ec);
    });
}

void Scheduler::on_timer(std::uint64_t generation, const boost::system::error_code& ec) {
    if (ec == asio::error::operation_aborted || generation != generation_ || !running_) {
        return;
    }

    ++passes_;
    const bool converged = pass_();
    const auto next = converged ? resync_interval_ : retry_interval_;
    spdlog::debug("pass {} {}, next pass in {}ms", passes_, converged ? "converged" : "failed", to_millis(next));

    // The pass may have stopped us
    if (running_) {
        arm(next);
    }
}

void Scheduler::wait_for_changes() {
    source_.async_next([this](const boost::system::error_code& ec, std::vector<ChangeEvent> events) {
        on_changes(ec, events);
    });
}

void Scheduler::on_changes(const boost::system::error_code& ec, const std::vector<ChangeEvent>& events) {
    if (!running_) {
        return;
    }

    if (ec == asio::error::operation_aborted) {
        spdlog::info("change notifications closed");
        finish(Ok());
        return;
    }
    if (ec) {
        finish(Fail<void>(ErrorKind::Fatal, {}, "watcher error: " + ec.message(),
                          std::error_code(ec.value(), std::system_category())));
        return;
    }

    const bool relevant = std::any_of(events.begin(), events.end(), [](const ChangeEvent& event) {
        return triggers_reconcile(event.kind);
    });
    if (relevant) {
        for (const auto& event : events) {
            spdlog::debug("change notification: {} {}", to_string(event.kind), event.name);
        }
        arm(Clock::duration::zero());
    }

    wait_for_changes();
}

void Scheduler::finish(Result<void> result) {
    if (!running_) {
        return;
    }
    running_ = false;

    timer_.cancel();
    source_.close();

    auto on_complete = std::move(on_complete_);
    on_complete_ = nullptr;
    if (on_complete) {
        on_complete(std::move(result));
    }
}

} // namespace unitsync::watch
