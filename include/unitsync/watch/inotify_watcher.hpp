#pragma once

#include "unitsync/core/result.hpp"
#include "unitsync/watch/change_source.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include <array>
#include <cstdint>
#include <filesystem>

namespace unitsync::watch {

namespace asio = boost::asio;

/**
 * @brief ChangeSource over a Linux inotify descriptor
 *
 * Watches a single directory (not recursive). The descriptor is driven by the
 * io_context, so events are delivered on the thread running it.
 */
class InotifyWatcher : public ChangeSource {
public:
    explicit InotifyWatcher(asio::io_context& io_context);
    ~InotifyWatcher() override;

    InotifyWatcher(const InotifyWatcher&) = delete;
    InotifyWatcher& operator=(const InotifyWatcher&) = delete;

    /**
     * @brief Initialise inotify and start watching @p directory
     */
    Result<void> open(const std::filesystem::path& directory);

    void async_next(ChangeHandler handler) override;

    void close() override;

    bool is_open() const { return descriptor_.is_open(); }

    const std::filesystem::path& directory() const noexcept { return directory_; }

    /// Translate an inotify mask into a change kind
    static ChangeKind classify(std::uint32_t mask) noexcept;

private:
    std::vector<ChangeEvent> parse(std::size_t bytes) const;

    asio::posix::stream_descriptor descriptor_;
    std::filesystem::path directory_;
    alignas(8) std::array<char, 64 * 1024> buffer_{};
};

} // namespace unitsync::watch
