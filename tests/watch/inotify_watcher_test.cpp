#include "unitsync/watch/inotify_watcher.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include <sys/inotify.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
namespace asio = boost::asio;
using namespace std::chrono_literals;
using unitsync::ErrorKind;
using namespace unitsync::watch;

namespace {

fs::path create_temp_dir(const std::string& prefix) {
    static std::atomic<uint64_t> counter{0};
    const auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto dir = fs::temp_directory_path() /
               fs::path(prefix + std::to_string(timestamp) + "_" + std::to_string(counter.fetch_add(1)));
    fs::create_directories(dir);
    return dir;
}

bool contains(const std::vector<ChangeEvent>& events, ChangeKind kind, const std::string& name) {
    return std::any_of(events.begin(), events.end(), [&](const ChangeEvent& event) {
        return event.kind == kind && event.name == name;
    });
}

} // namespace

class InotifyWatcherTest : public ::testing::Test {
protected:
    void SetUp() override { dir_ = create_temp_dir("unitsync_inotify_"); }

    void TearDown() override { fs::remove_all(dir_); }

    // Collects events until one matching @p kind arrives or the deadline passes
    std::vector<ChangeEvent> collect_until(InotifyWatcher& watcher, ChangeKind kind, const std::string& name) {
        std::vector<ChangeEvent> seen;
        std::function<void()> next;
        next = [&]() {
            watcher.async_next([&](const boost::system::error_code& ec, std::vector<ChangeEvent> events) {
                if (ec) {
                    return;
                }
                seen.insert(seen.end(), events.begin(), events.end());
                if (!contains(seen, kind, name)) {
                    next();
                }
            });
        };
        next();
        io_context_.run_for(2s);
        io_context_.restart();
        return seen;
    }

    asio::io_context io_context_;
    fs::path dir_;
};

TEST(InotifyClassifyTest, MapsMasksToKinds) {
    EXPECT_EQ(InotifyWatcher::classify(IN_CREATE), ChangeKind::Create);
    EXPECT_EQ(InotifyWatcher::classify(IN_MOVED_TO), ChangeKind::Create);
    EXPECT_EQ(InotifyWatcher::classify(IN_MODIFY), ChangeKind::Write);
    EXPECT_EQ(InotifyWatcher::classify(IN_DELETE), ChangeKind::Remove);
    EXPECT_EQ(InotifyWatcher::classify(IN_DELETE_SELF), ChangeKind::Remove);
    EXPECT_EQ(InotifyWatcher::classify(IN_MOVED_FROM), ChangeKind::Rename);
    EXPECT_EQ(InotifyWatcher::classify(IN_MOVE_SELF), ChangeKind::Rename);
    EXPECT_EQ(InotifyWatcher::classify(IN_ATTRIB), ChangeKind::Attribute);
    EXPECT_EQ(InotifyWatcher::classify(IN_Q_OVERFLOW), ChangeKind::Overflow);
    EXPECT_EQ(InotifyWatcher::classify(IN_IGNORED), ChangeKind::Other);
    EXPECT_EQ(InotifyWatcher::classify(IN_CREATE | IN_ISDIR), ChangeKind::Create);
}

TEST(ChangeKindTest, OnlyContentChangesTriggerReconcile) {
    EXPECT_TRUE(triggers_reconcile(ChangeKind::Create));
    EXPECT_TRUE(triggers_reconcile(ChangeKind::Write));
    EXPECT_TRUE(triggers_reconcile(ChangeKind::Remove));
    EXPECT_TRUE(triggers_reconcile(ChangeKind::Rename));
    EXPECT_TRUE(triggers_reconcile(ChangeKind::Overflow));
    EXPECT_FALSE(triggers_reconcile(ChangeKind::Attribute));
    EXPECT_FALSE(triggers_reconcile(ChangeKind::Other));
    EXPECT_STREQ(to_string(ChangeKind::Overflow), "overflow");
}

TEST_F(InotifyWatcherTest, OpenMissingDirectoryFails) {
    InotifyWatcher watcher(io_context_);

    auto opened = watcher.open(dir_ / "missing");
    ASSERT_TRUE(opened.is_error());
    EXPECT_EQ(opened.error().kind, ErrorKind::Fatal);
    EXPECT_EQ(opened.error().cause, std::errc::no_such_file_or_directory);
    EXPECT_FALSE(watcher.is_open());
}

TEST_F(InotifyWatcherTest, OpenTwiceFails) {
    InotifyWatcher watcher(io_context_);
    ASSERT_TRUE(watcher.open(dir_).is_ok());
    EXPECT_TRUE(watcher.open(dir_).is_error());
    EXPECT_EQ(watcher.directory(), dir_);
}

TEST_F(InotifyWatcherTest, ReportsCreatedFile) {
    InotifyWatcher watcher(io_context_);
    ASSERT_TRUE(watcher.open(dir_).is_ok());

    {
        std::ofstream unit(dir_ / "a.service");
        unit << "[Unit]\n";
    }

    auto events = collect_until(watcher, ChangeKind::Create, "a.service");
    EXPECT_TRUE(contains(events, ChangeKind::Create, "a.service"));
}

TEST_F(InotifyWatcherTest, ReportsRemovedAndRenamedFiles) {
    {
        std::ofstream unit(dir_ / "a.service");
        unit << "[Unit]\n";
    }
    {
        std::ofstream unit(dir_ / "b.service");
        unit << "[Unit]\n";
    }

    InotifyWatcher watcher(io_context_);
    ASSERT_TRUE(watcher.open(dir_).is_ok());

    fs::remove(dir_ / "a.service");
    auto removed = collect_until(watcher, ChangeKind::Remove, "a.service");
    EXPECT_TRUE(contains(removed, ChangeKind::Remove, "a.service"));

    fs::rename(dir_ / "b.service", dir_ / "c.service");
    auto renamed = collect_until(watcher, ChangeKind::Create, "c.service");
    EXPECT_TRUE(contains(renamed, ChangeKind::Rename, "b.service"));
    EXPECT_TRUE(contains(renamed, ChangeKind::Create, "c.service"));
}

TEST_F(InotifyWatcherTest, CloseAbortsPendingWait) {
    InotifyWatcher watcher(io_context_);
    ASSERT_TRUE(watcher.open(dir_).is_ok());

    std::optional<boost::system::error_code> result;
    watcher.async_next([&](const boost::system::error_code& ec, std::vector<ChangeEvent>) {
        result = ec;
    });
    watcher.close();
    EXPECT_FALSE(watcher.is_open());

    io_context_.run_for(1s);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, asio::error::operation_aborted);

    // Waiting on a closed watcher aborts as well
    result.reset();
    io_context_.restart();
    watcher.async_next([&](const boost::system::error_code& ec, std::vector<ChangeEvent>) {
        result = ec;
    });
    io_context_.run_for(1s);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, asio::error::operation_aborted);
}
