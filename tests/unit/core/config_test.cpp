// GpuBind Core Tests
// config_test.cpp - Tests for JSON-backed configuration

#include <gtest/gtest.h>

#include <gpubind/core/config.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace gpubind::core {
namespace {

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;

    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "gpubind_config_test";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override { std::filesystem::remove_all(test_dir_); }
};

TEST_F(ConfigTest, DefaultsSelectHostBackend) {
    Config config;
    auto device = config.device_settings();
    EXPECT_EQ(device.backend, "host");
    EXPECT_EQ(device.mapping_mode, "direct");
    EXPECT_EQ(config.logging_settings().level, "info");
    EXPECT_FALSE(config.is_dirty());
}

TEST_F(ConfigTest, MissingOrMistypedKeysReturnFallback) {
    Config config;
    EXPECT_EQ(config.get("device", "missing", 7), 7);
    EXPECT_DOUBLE_EQ(config.get("nowhere", "missing", 1.5), 1.5);
    EXPECT_FALSE(config.has("nowhere", "missing"));

    // backend is a string, not an integer
    EXPECT_FALSE(config.find<int>(config_section::DEVICE, config_key::BACKEND).has_value());
    EXPECT_EQ(config.get(config_section::DEVICE, config_key::BACKEND, 3), 3);
}

TEST_F(ConfigTest, LoadFromStringMergesOverDefaults) {
    Config config;
    ASSERT_TRUE(config.load_from_string(R"({"device": {"mapping_mode": "staged"}, "limits": {"max_buffers": 64}})"));

    EXPECT_EQ(config.device_settings().mapping_mode, "staged");
    EXPECT_EQ(config.device_settings().backend, "host");
    EXPECT_EQ(config.get("limits", "max_buffers", 0), 64);
}

TEST_F(ConfigTest, LoadFromStringRejectsInvalidJson) {
    Config config;
    EXPECT_FALSE(config.load_from_string("{ not json"));
    EXPECT_FALSE(config.load_from_string("[1, 2]"));
    EXPECT_EQ(config.device_settings().backend, "host");
}

TEST_F(ConfigTest, LoggingCategoriesAreRead) {
    Config config;
    ASSERT_TRUE(config.load_from_string(
        R"({"logging": {"level": "warn", "categories": {"command": "trace", "buffer": 3}}})"));

    auto logging = config.logging_settings();
    EXPECT_EQ(logging.level, "warn");
    ASSERT_EQ(logging.category_levels.size(), 1u);
    EXPECT_EQ(logging.category_levels.at("command"), "trace");
}

TEST_F(ConfigTest, SettersMarkDirtyAndNotify) {
    Config config;
    std::vector<std::string> changed;
    config.set_change_callback([&](std::string_view section, std::string_view key) {
        changed.push_back(std::string(section) + "." + std::string(key));
    });

    config.set(config_section::DEVICE, config_key::LABEL, "offscreen");
    config.set("limits", "max_buffers", 64);

    EXPECT_TRUE(config.is_dirty());
    ASSERT_EQ(changed.size(), 2u);
    EXPECT_EQ(changed[0], "device.label");
    EXPECT_EQ(changed[1], "limits.max_buffers");
    EXPECT_EQ(config.get("limits", "max_buffers", 0), 64);
    EXPECT_EQ(config.device_settings().label, "offscreen");

    config.mark_clean();
    EXPECT_FALSE(config.is_dirty());
}

TEST_F(ConfigTest, DeviceSettingsWriteBack) {
    Config config;
    DeviceSettings settings;
    settings.mapping_mode = "staged";
    settings.label = "compute";
    config.set_device_settings(settings);

    auto read = config.device_settings();
    EXPECT_EQ(read.backend, "host");
    EXPECT_EQ(read.mapping_mode, "staged");
    EXPECT_EQ(read.label, "compute");
}

TEST_F(ConfigTest, RemoveKeyAndSection) {
    Config config;
    config.set("features", "timestamps", true);
    EXPECT_TRUE(config.has_section("features"));
    EXPECT_TRUE(config.get("features", "timestamps", false));

    EXPECT_TRUE(config.remove("features", "timestamps"));
    EXPECT_FALSE(config.has("features", "timestamps"));
    EXPECT_FALSE(config.remove("features", "timestamps"));

    EXPECT_TRUE(config.remove_section(config_section::LOGGING));
    EXPECT_FALSE(config.has_section(config_section::LOGGING));
    EXPECT_FALSE(config.remove_section(config_section::LOGGING));
}

TEST_F(ConfigTest, SaveAndLoadKeepUnknownSections) {
    auto path = test_dir_ / "gpubind.json";

    Config written;
    written.set(config_section::DEVICE, config_key::MAPPING_MODE, "staged");
    written.set("application", "timeout", 2.5);
    ASSERT_TRUE(written.save(path));

    Config loaded;
    ASSERT_TRUE(loaded.load(path));
    EXPECT_EQ(loaded.device_settings().mapping_mode, "staged");
    EXPECT_DOUBLE_EQ(loaded.get("application", "timeout", 0.0), 2.5);
    EXPECT_EQ(loaded.path(), path);
    EXPECT_FALSE(loaded.is_dirty());
}

TEST_F(ConfigTest, LoadOrCreateDefaultWritesFile) {
    auto path = test_dir_ / "nested" / "gpubind.json";
    ASSERT_FALSE(std::filesystem::exists(path));

    Config config;
    EXPECT_TRUE(config.load_or_create_default(path));
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(config.device_settings().backend, "host");

    config.set(config_section::DEVICE, config_key::LABEL, "saved");
    EXPECT_TRUE(config.save());

    Config reloaded;
    EXPECT_TRUE(reloaded.load_or_create_default(path));
    EXPECT_EQ(reloaded.device_settings().label, "saved");
}

TEST_F(ConfigTest, SaveWithoutPathFails) {
    Config config;
    EXPECT_FALSE(config.save());
}

TEST_F(ConfigTest, LoadFailsForMissingOrBrokenFile) {
    Config config;
    EXPECT_FALSE(config.load(test_dir_ / "missing.json"));

    auto broken = test_dir_ / "broken.json";
    std::ofstream(broken) << "{\"device\": ";
    EXPECT_FALSE(config.load(broken));
    EXPECT_TRUE(config.path().empty());
}

}  // namespace
}  // namespace gpubind::core
