#include "ingest/device/device_scanner.hpp"

#include <gtest/gtest.h>

#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using ingest::device::DeviceScanner;
using ingest::device::ExtensionFilter;
using ingest::device::ScanOptions;

namespace {

class EmptyEnumerator : public ingest::device::DeviceEnumerator {
public:
    ingest::Result<std::vector<ingest::Device>> list_devices() override {
        return ingest::Ok(std::vector<ingest::Device>{});
    }
};

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    fs::path dir = fs::temp_directory_path() / ("ingest_scan_test_" + std::to_string(counter.fetch_add(1)));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

DeviceScanner make_scanner() {
    return DeviceScanner(std::make_shared<EmptyEnumerator>());
}

std::vector<std::string> names(const ingest::device::ScanResult& result) {
    std::vector<std::string> out;
    for (const auto& file : result.files) {
        out.push_back(file.path.filename().string());
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace

TEST(FileScanTest, FindsNestedRegularFiles) {
    const auto root = create_temp_dir();
    write_file(root / "DCIM" / "100CANON" / "IMG_0001.JPG", "1234");
    write_file(root / "DCIM" / "100CANON" / "IMG_0002.JPG", "123456");
    write_file(root / "PRIVATE" / "M4ROOT" / "CLIP" / "C0001.MP4", "12345678");

    const auto scanner = make_scanner();
    auto result = scanner.scan(root);
    ASSERT_TRUE(result.is_ok()) << result.error().message;

    EXPECT_EQ(result.value().file_count, 3u);
    EXPECT_EQ(result.value().total_size, 18u);
    EXPECT_EQ(names(result.value()), (std::vector<std::string>{"C0001.MP4", "IMG_0001.JPG", "IMG_0002.JPG"}));
    EXPECT_FALSE(result.value().cancelled);

    fs::remove_all(root);
}

TEST(FileScanTest, SymlinkCycleTerminates) {
    const auto root = create_temp_dir();
    write_file(root / "a" / "photo.jpg", "x");
    fs::create_directory_symlink(root, root / "a" / "loop");
    fs::create_directory_symlink(root / "a", root / "a" / "self");
    fs::create_symlink(root / "a" / "photo.jpg", root / "link.jpg");

    const auto scanner = make_scanner();
    auto result = scanner.scan(root);
    ASSERT_TRUE(result.is_ok());

    EXPECT_EQ(result.value().file_count, 1u);
    EXPECT_EQ(result.value().skipped_symlinks, 3u);

    fs::remove_all(root);
}

TEST(FileScanTest, HardLinkCountedOnce) {
    const auto root = create_temp_dir();
    write_file(root / "original.mov", "0123456789");
    fs::create_hard_link(root / "original.mov", root / "alias.mov");

    const auto scanner = make_scanner();
    auto result = scanner.scan(root);
    ASSERT_TRUE(result.is_ok());

    EXPECT_EQ(result.value().file_count, 1u);
    EXPECT_EQ(result.value().total_size, 10u);
    EXPECT_EQ(result.value().skipped_duplicates, 1u);

    fs::remove_all(root);
}

TEST(FileScanTest, ExtensionFilterKeepsMedia) {
    const auto root = create_temp_dir();
    write_file(root / "a.MP4", "1");
    write_file(root / "b.jpg", "2");
    write_file(root / "c.wav", "3");
    write_file(root / "notes.txt", "4");

    ingest::IngestConfig config;
    config.transfer_only_media_files = true;

    ScanOptions options;
    options.filter = ExtensionFilter::from_config(config);

    const auto scanner = make_scanner();
    auto result = scanner.scan(root, options);
    ASSERT_TRUE(result.is_ok());

    EXPECT_EQ(result.value().file_count, 3u);
    EXPECT_EQ(result.value().filtered_out, 1u);
    EXPECT_EQ(names(result.value()), (std::vector<std::string>{"a.MP4", "b.jpg", "c.wav"}));

    fs::remove_all(root);
}

TEST(FileScanTest, DisabledFilterAcceptsEverything) {
    ExtensionFilter filter{false, {".jpg"}};
    EXPECT_TRUE(filter.matches("notes.txt"));
    EXPECT_TRUE(filter.matches("Makefile"));

    filter.enabled = true;
    EXPECT_TRUE(filter.matches("IMG.JPG"));
    EXPECT_FALSE(filter.matches("notes.txt"));
    EXPECT_FALSE(filter.matches("Makefile"));
}

TEST(FileScanTest, SkipsSpecialFiles) {
    const auto root = create_temp_dir();
    write_file(root / "clip.mp4", "x");
    ASSERT_EQ(::mkfifo((root / "pipe").c_str(), 0600), 0);

    const auto scanner = make_scanner();
    auto result = scanner.scan(root);
    ASSERT_TRUE(result.is_ok());

    EXPECT_EQ(result.value().file_count, 1u);
    EXPECT_EQ(result.value().skipped_special, 1u);

    fs::remove_all(root);
}

TEST(FileScanTest, UnreadableDirectoryIsCountedAndSkipped) {
    const auto root = create_temp_dir();
    write_file(root / "IMG_0001.JPG", "1234");
    write_file(root / "DCIM" / "IMG_0002.JPG", "56");
    write_file(root / "locked" / "IMG_0003.JPG", "789");
    fs::permissions(root / "locked", fs::perms::none);

    if (::access((root / "locked").c_str(), R_OK) == 0) {
        fs::permissions(root / "locked", fs::perms::owner_all);
        fs::remove_all(root);
        GTEST_SKIP() << "directory permissions are not enforced for this user";
    }

    const auto scanner = make_scanner();
    auto result = scanner.scan(root);
    fs::permissions(root / "locked", fs::perms::owner_all);
    ASSERT_TRUE(result.is_ok()) << result.error().message;

    EXPECT_GE(result.value().errors, 1u);
    EXPECT_EQ(names(result.value()), (std::vector<std::string>{"IMG_0001.JPG", "IMG_0002.JPG"}));
    EXPECT_EQ(result.value().total_size, 6u);

    fs::remove_all(root);
}

TEST(FileScanTest, RootMustBeADirectory) {
    const auto root = create_temp_dir();
    write_file(root / "file.jpg", "x");

    const auto scanner = make_scanner();

    auto missing = scanner.scan(root / "absent");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, ingest::ErrorCode::NotFound);

    auto not_dir = scanner.scan(root / "file.jpg");
    ASSERT_TRUE(not_dir.is_error());
    EXPECT_EQ(not_dir.error().code, ingest::ErrorCode::Validation);

    fs::remove_all(root);
}

TEST(FileScanTest, CancelledScanReturnsPartialResult) {
    const auto root = create_temp_dir();
    write_file(root / "a" / "1.jpg", "x");

    std::atomic<bool> cancel{true};
    ScanOptions options;
    options.cancel = &cancel;

    const auto scanner = make_scanner();
    auto result = scanner.scan(root, options);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().cancelled);
    EXPECT_EQ(result.value().file_count, 0u);

    fs::remove_all(root);
}
