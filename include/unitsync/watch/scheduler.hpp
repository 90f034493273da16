#pragma once

#include "unitsync/core/result.hpp"
#include "unitsync/watch/change_source.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace unitsync::watch {

namespace asio = boost::asio;

/**
 * @brief Decides when to run a reconciliation pass
 *
 * Exactly one pass is pending at any time, held by a single-shot timer. The first
 * pass fires immediately; a relevant change notification re-arms the timer to fire
 * now, so a burst of file events collapses into one pass. After each pass the timer
 * is re-armed with the resync interval if the pass converged, the retry interval
 * otherwise.
 *
 * Everything runs on the io_context thread: a pass always completes before the next
 * timer or notification is looked at.
 */
class Scheduler {
public:
    using Clock = std::chrono::steady_clock;

    /// Runs one pass and reports whether it converged
    using PassFunction = std::function<bool()>;

    using CompletionHandler = std::function<void(Result<void>)>;

    Scheduler(asio::io_context& io_context,
              ChangeSource& source,
              PassFunction pass,
              Clock::duration resync_interval,
              Clock::duration retry_interval);

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Arm the first pass and start listening for changes
     *
     * @p on_complete is invoked once: with Ok when the change source closes or
     * stop() is called, with an ErrorKind::Fatal error when the source fails.
     */
    void start(CompletionHandler on_complete);

    /**
     * @brief start() and run the io_context until the scheduler completes
     */
    Result<void> run();

    /// Close the change source and cancel the pending pass
    void stop();

    bool running() const noexcept { return running_; }

    std::size_t passes() const noexcept { return passes_; }

private:
    void arm(Clock::duration delay);
    void on_timer(std::uint64_t generation, const boost::system::error_code& ec);
    void wait_for_changes();
    void on_changes(const boost::system::error_code& ec, const std::vector<ChangeEvent>& events);
    void finish(Result<void> result);

    asio::io_context& io_context_;
    asio::steady_timer timer_;
    ChangeSource& source_;
    PassFunction pass_;
    Clock::duration resync_interval_;
    Clock::duration retry_interval_;
    CompletionHandler on_complete_;

    std::uint64_t generation_ = 0; ///< Bumped on every re-arm so stale timer completions are ignored
    std::size_t passes_ = 0;
    bool running_ = false;
};

} // namespace unitsync::watch
