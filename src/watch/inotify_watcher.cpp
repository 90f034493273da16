#include "unitsync/watch/inotify_watcher.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <sys/inotify.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

namespace unitsync::watch {

namespace {

constexpr std::uint32_t kWatchMask = IN_CREATE | IN_MODIFY | IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO |
                                     IN_ATTRIB | IN_DELETE_SELF | IN_MOVE_SELF;

} // namespace

InotifyWatcher::InotifyWatcher(asio::io_context& io_context)
    : descriptor_(io_context) {}

InotifyWatcher::~InotifyWatcher() {
    close();
}

Result<void> InotifyWatcher::open(const std::filesystem::path& directory) {
    if (descriptor_.is_open()) {
        return Fail<void>(ErrorKind::Fatal, {}, "already watching " + directory_.string());
    }

    const int fd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd == -1) {
        return Fail<void>(ErrorKind::Fatal, {}, "failed to initialize inotify",
                          std::error_code(errno, std::generic_category()));
    }

    if (::inotify_add_watch(fd, directory.c_str(), kWatchMask) == -1) {
        const std::error_code ec(errno, std::generic_category());
        ::close(fd);
        return Fail<void>(ErrorKind::Fatal, {}, "failed to watch " + directory.string(), ec);
    }

    boost::system::error_code ec;
    descriptor_.assign(fd, ec);
    if (ec) {
        ::close(fd);
        return Fail<void>(ErrorKind::Fatal, {}, "failed to register inotify descriptor",
                          std::error_code(ec.value(), std::system_category()));
    }

    directory_ = directory;
    spdlog::debug("watching {} for unit file changes", directory_.string());
    return Ok();
}

void InotifyWatcher::async_next(ChangeHandler handler) {
    if (!descriptor_.is_open()) {
        asio::post(descriptor_.get_executor(), [handler = std::move(handler)]() {
            handler(asio::error::operation_aborted, {});
        });
        return;
    }

    descriptor_.async_read_some(
        asio::buffer(buffer_),
        [this, handler = std::move(handler)](const boost::system::error_code& ec, std::size_t bytes) {
            if (ec) {
                handler(ec, {});
                return;
            }
            handler(ec, parse(bytes));
        });
}

void InotifyWatcher::close() {
    if (!descriptor_.is_open()) {
        return;
    }
    boost::system::error_code ec;
    descriptor_.close(ec);
    if (ec) {
        spdlog::warn("error closing inotify descriptor: {}", ec.message());
    }
}

ChangeKind InotifyWatcher::classify(std::uint32_t mask) noexcept {
    if (mask & IN_Q_OVERFLOW) {
        return ChangeKind::Overflow;
    }
    if (mask & (IN_CREATE | IN_MOVED_TO)) {
        return ChangeKind::Create;
    }
    if (mask & IN_MODIFY) {
        return ChangeKind::Write;
    }
    if (mask & (IN_DELETE | IN_DELETE_SELF)) {
        return ChangeKind::Remove;
    }
    if (mask & (IN_MOVED_FROM | IN_MOVE_SELF)) {
        return ChangeKind::Rename;
    }
    if (mask & IN_ATTRIB) {
        return ChangeKind::Attribute;
    }
    return ChangeKind::Other;
}

std::vector<ChangeEvent> InotifyWatcher::parse(std::size_t bytes) const {
    std::vector<ChangeEvent> events;

    // The kernel only hands out whole records
    std::size_t offset = 0;
    while (offset + sizeof(inotify_event) <= bytes) {
        const auto* raw = reinterpret_cast<const inotify_event*>(buffer_.data() + offset);

        ChangeEvent event;
        event.kind = classify(raw->mask);
        if (raw->len > 0) {
            event.name.assign(raw->name, ::strnlen(raw->name, raw->len));
        }
        if (raw->mask & IN_IGNORED) {
            spdlog::warn("watch on {} was removed by the kernel", directory_.string());
        }
        events.push_back(std::move(event));

        offset += sizeof(inotify_event) + raw->len;
    }

    return events;
}

} // namespace unitsync::watch
