#include "ingest/core/config.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    fs::path dir = fs::temp_directory_path() / ("ingest_config_test_" + std::to_string(counter.fetch_add(1)));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

} // namespace

TEST(IngestConfigTest, DefaultsAreValid) {
    ingest::IngestConfig config;
    EXPECT_TRUE(ingest::validate_config(config).is_ok());
    EXPECT_EQ(config.conflict_policy, ingest::ConflictPolicy::Ask);
    EXPECT_FALSE(config.transfer_only_media_files);
    EXPECT_TRUE(config.verify_checksums);
    EXPECT_EQ(config.buffer_tiers.size(), 4u);
    EXPECT_FALSE(config.media_extensions.empty());
}

TEST(IngestConfigTest, SelectTierByFileSize) {
    const auto tiers = ingest::default_buffer_tiers();
    EXPECT_EQ(ingest::select_tier(tiers, 0).name, "small");
    EXPECT_EQ(ingest::select_tier(tiers, 100 * ingest::kMiB - 1).name, "small");
    EXPECT_EQ(ingest::select_tier(tiers, 100 * ingest::kMiB).name, "medium");
    EXPECT_EQ(ingest::select_tier(tiers, 2 * ingest::kGiB).name, "large");
    EXPECT_EQ(ingest::select_tier(tiers, 50 * ingest::kGiB).name, "xlarge");
}

TEST(IngestConfigTest, PartialDocumentKeepsDefaults) {
    const json document = {
        {"conflict_policy", "rename"},
        {"max_concurrency", 2},
        {"path", {{"create_date_folders", true}}},
        {"retry", {{"max_attempts", 5}}},
    };

    auto config = ingest::config_from_json(document);
    ASSERT_TRUE(config.is_ok()) << config.error().message;
    EXPECT_EQ(config.value().conflict_policy, ingest::ConflictPolicy::Rename);
    EXPECT_EQ(config.value().max_concurrency, 2u);
    EXPECT_TRUE(config.value().path.create_date_folders);
    EXPECT_EQ(config.value().path.date_folder_format, "%Y/%m/%d");
    EXPECT_EQ(config.value().retry.max_attempts, 5u);
    EXPECT_EQ(config.value().retry.initial_delay, std::chrono::milliseconds(2000));
}

TEST(IngestConfigTest, RejectsOutOfRangeValues) {
    ingest::IngestConfig config;
    config.max_concurrency = 11;
    EXPECT_TRUE(ingest::validate_config(config).is_error());

    config = ingest::IngestConfig{};
    config.buffer_tiers[0].buffer_size = 512;
    EXPECT_TRUE(ingest::validate_config(config).is_error());

    config = ingest::IngestConfig{};
    config.buffer_tiers[1].max_file_size = config.buffer_tiers[0].max_file_size;
    EXPECT_TRUE(ingest::validate_config(config).is_error());

    config = ingest::IngestConfig{};
    config.media_extensions = {"mp4"};
    EXPECT_TRUE(ingest::validate_config(config).is_error());
}

TEST(IngestConfigTest, UnknownPolicyIsRejected) {
    auto config = ingest::config_from_json(json{{"conflict_policy", "merge"}});
    ASSERT_TRUE(config.is_error());
    EXPECT_EQ(config.error().code, ingest::ErrorCode::Validation);
}

TEST(IngestConfigTest, NonObjectDocumentIsRejected) {
    EXPECT_TRUE(ingest::config_from_json(json::array()).is_error());
}

TEST(IngestConfigTest, SaveThenLoad) {
    const auto dir = create_temp_dir();
    const fs::path file = dir / "ingest.json";

    ingest::IngestConfig config;
    config.conflict_policy = ingest::ConflictPolicy::Skip;
    config.generate_manifest = true;
    config.path.keep_folder_structure = true;
    config.orphan_max_age = std::chrono::hours(6);

    ASSERT_TRUE(ingest::save_config(config, file).is_ok());

    auto loaded = ingest::load_config(file);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error().message;
    EXPECT_EQ(loaded.value().conflict_policy, ingest::ConflictPolicy::Skip);
    EXPECT_TRUE(loaded.value().generate_manifest);
    EXPECT_TRUE(loaded.value().path.keep_folder_structure);
    EXPECT_EQ(loaded.value().orphan_max_age, std::chrono::hours(6));
    EXPECT_EQ(loaded.value().buffer_tiers.size(), config.buffer_tiers.size());

    fs::remove_all(dir);
}

TEST(IngestConfigTest, MissingFileIsNotFound) {
    const auto dir = create_temp_dir();
    auto loaded = ingest::load_config(dir / "absent.json");
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error().code, ingest::ErrorCode::NotFound);
    fs::remove_all(dir);
}

TEST(IngestConfigTest, MalformedFileIsValidationError) {
    const auto dir = create_temp_dir();
    const fs::path file = dir / "broken.json";
    {
        std::ofstream out(file);
        out << "{ \"max_concurrency\": ";
    }
    auto loaded = ingest::load_config(file);
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error().code, ingest::ErrorCode::Validation);
    fs::remove_all(dir);
}
