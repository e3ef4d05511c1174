#include "ingest/transfer/manifest.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    fs::path dir = fs::temp_directory_path() / ("ingest_manifest_test_" + std::to_string(counter.fetch_add(1)));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::vector<std::string> read_lines(const fs::path& path) {
    std::ifstream input(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(input, line)) {
        lines.push_back(line);
    }
    return lines;
}

ingest::FileTransferRecord record(const fs::path& destination, ingest::FileStatus status, std::uint64_t size) {
    ingest::FileTransferRecord r;
    r.source_path = "/media/card/" + destination.filename().string();
    r.destination_path = destination.string();
    r.file_name = destination.filename().string();
    r.size_bytes = size;
    r.status = status;
    return r;
}

} // namespace

TEST(ManifestTest, PathIsNamedAfterSession) {
    EXPECT_EQ(ingest::transfer::manifest_path_for("/backup", "ses_1"), fs::path("/backup/ingest_ses_1.manifest"));
}

TEST(ManifestTest, ListsCompleteFilesOnly) {
    const auto dir = create_temp_dir();

    ingest::TransferSession session;
    session.id = "ses_42";
    session.device_name = "SanDisk Extreme";
    session.source_root = "/media/card";
    session.destination_root = dir.string();

    auto verified = record(dir / "2024-03-15" / "a.mov", ingest::FileStatus::Complete, 2048);
    verified.checksum = "00000000deadbeef";
    verified.checksum_verified = true;
    session.files.push_back(verified);
    session.files.push_back(record(dir / "b.jpg", ingest::FileStatus::Complete, 10));
    session.files.push_back(record(dir / "c.jpg", ingest::FileStatus::Error, 20));
    session.files.push_back(record(dir / "d.jpg", ingest::FileStatus::Skipped, 30));

    auto written = ingest::transfer::write_manifest(session);
    ASSERT_TRUE(written.is_ok()) << written.error().message;
    EXPECT_EQ(written.value(), dir / "ingest_ses_42.manifest");
    EXPECT_FALSE(fs::exists(dir / "ingest_ses_42.manifest.tmp"));

    const auto lines = read_lines(written.value());
    ASSERT_EQ(lines.size(), 8u);
    EXPECT_EQ(lines[0], "# ingest manifest");
    EXPECT_EQ(lines[1], "# session: ses_42");
    EXPECT_EQ(lines[2], "# device: SanDisk Extreme");
    EXPECT_EQ(lines[3], "# source: /media/card");
    EXPECT_EQ(lines[4].rfind("# generated: ", 0), 0u);
    EXPECT_EQ(lines[5], "# checksum: fnv1a64");
    EXPECT_EQ(lines[6], "2024-03-15/a.mov\t00000000deadbeef\t2048");
    EXPECT_EQ(lines[7], "b.jpg\t-\t10");

    fs::remove_all(dir);
}

TEST(ManifestTest, MissingDestinationFails) {
    ingest::TransferSession session;
    session.id = "ses_x";
    session.destination_root = "/nonexistent/ingest/manifest";

    auto written = ingest::transfer::write_manifest(session);
    ASSERT_TRUE(written.is_error());
    EXPECT_EQ(written.error().code, ingest::ErrorCode::Io);
}
