#include "unitsync/sync/unit_file.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using unitsync::ErrorKind;
using namespace unitsync::sync;

namespace {

fs::path create_temp_dir(const std::string& prefix) {
    static std::atomic<uint64_t> counter{0};
    const auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto dir = fs::temp_directory_path() /
               fs::path(prefix + std::to_string(timestamp) + "_" + std::to_string(counter.fetch_add(1)));
    fs::create_directories(dir);
    return dir;
}

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << content;
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

} // namespace

class UnitFileTest : public ::testing::Test {
protected:
    void SetUp() override { dir_ = create_temp_dir("unitsync_unit_file_"); }

    void TearDown() override { fs::remove_all(dir_); }

    fs::path dir_;
};

TEST(FingerprintTest, MatchesKnownSha256Digests) {
    auto abc = fingerprint_bytes("abc");
    ASSERT_TRUE(abc.is_ok()) << abc.error().to_string();
    EXPECT_EQ(abc.value(), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    auto empty = fingerprint_bytes("");
    ASSERT_TRUE(empty.is_ok()) << empty.error().to_string();
    EXPECT_EQ(empty.value(), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(UnitFileTest, FileFingerprintMatchesBytesFingerprint) {
    // Larger than one read chunk
    std::string content(10000, 'u');
    content += "[Unit]\nDescription=test\n";
    write_file(dir_ / "big.service", content);

    auto result = fingerprint_file(dir_ / "big.service", "big.service");
    ASSERT_TRUE(result.is_ok());
    auto expected = fingerprint_bytes(content);
    ASSERT_TRUE(expected.is_ok());
    EXPECT_EQ(result.value(), expected.value());
}

TEST_F(UnitFileTest, MissingFileIsNotFound) {
    auto result = fingerprint_file(dir_ / "absent.service", "absent.service");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Read);
    EXPECT_EQ(result.error().unit, "absent.service");
    EXPECT_TRUE(result.error().is_not_found());
}

TEST_F(UnitFileTest, DirectoryIsReadErrorButNotNotFound) {
    fs::create_directories(dir_ / "a.service");

    auto result = fingerprint_file(dir_ / "a.service", "a.service");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Read);
    EXPECT_FALSE(result.error().is_not_found());
}

TEST_F(UnitFileTest, CopyPreservesBytesAndLeavesNoStagingFile) {
    const char raw[] = "line one\n\0\x01\xff binary\n";
    const std::string content(raw, sizeof(raw) - 1);
    write_file(dir_ / "src.service", content);
    write_file(dir_ / "dest.service", "previous content that is longer than the new one");

    auto copied = copy_unit_file(dir_ / "src.service", dir_ / "dest.service", "dest.service");
    ASSERT_TRUE(copied.is_ok());
    EXPECT_EQ(read_file(dir_ / "dest.service"), content);

    std::size_t entries = 0;
    for (const auto& entry : fs::directory_iterator(dir_)) {
        (void)entry;
        ++entries;
    }
    EXPECT_EQ(entries, 2u);
}

TEST_F(UnitFileTest, CopyEmptyFile) {
    write_file(dir_ / "empty.service", "");

    auto copied = copy_unit_file(dir_ / "empty.service", dir_ / "copy.service", "copy.service");
    ASSERT_TRUE(copied.is_ok());
    ASSERT_TRUE(fs::exists(dir_ / "copy.service"));
    EXPECT_EQ(fs::file_size(dir_ / "copy.service"), 0u);
}

TEST_F(UnitFileTest, CopyIntoMissingDirectoryFails) {
    write_file(dir_ / "a.service", "X");

    auto copied = copy_unit_file(dir_ / "a.service", dir_ / "missing" / "a.service", "a.service");
    ASSERT_TRUE(copied.is_error());
    EXPECT_EQ(copied.error().kind, ErrorKind::Copy);
    EXPECT_EQ(copied.error().unit, "a.service");
}

TEST_F(UnitFileTest, RemoveMissingFileSucceeds) {
    EXPECT_TRUE(remove_unit_file(dir_ / "never-existed.service", "never-existed.service").is_ok());

    write_file(dir_ / "a.service", "X");
    EXPECT_TRUE(remove_unit_file(dir_ / "a.service", "a.service").is_ok());
    EXPECT_FALSE(fs::exists(dir_ / "a.service"));
}

TEST(EditorArtifactTest, RecognizesSwapAndBackupFiles) {
    EXPECT_TRUE(is_editor_artifact(".a.service.swp"));
    EXPECT_TRUE(is_editor_artifact("a.service~"));
    EXPECT_TRUE(is_editor_artifact("~"));

    EXPECT_FALSE(is_editor_artifact("a.service"));
    EXPECT_FALSE(is_editor_artifact("swp.service"));
    EXPECT_FALSE(is_editor_artifact("a.swp.timer"));
    EXPECT_FALSE(is_editor_artifact(""));
}
