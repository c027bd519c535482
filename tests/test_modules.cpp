#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "modules/config_module.hpp"
#include "modules/config_validator.hpp"
#include "modules/frame_exporter.hpp"

using namespace experanto::modules;

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <png.h>

class ConfigModuleTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_file_ = "test_probe_config_" + std::to_string(std::rand()) + ".json";
    }

    void TearDown() override {
        std::remove(test_file_.c_str());
    }

    std::string test_file_;
};

TEST_F(ConfigModuleTest, CreateDefaultWhenFileMissing) {
    ConfigModule config;
    auto result = config.load_or_create_config(test_file_);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->recordings.size(), 2u);
    EXPECT_DOUBLE_EQ(result->times.step, 0.1);
    EXPECT_EQ(result->print_limit, 5);
    EXPECT_TRUE(result->export_dir.empty());

    // Default written to disk
    EXPECT_TRUE(std::filesystem::exists(test_file_));
}

TEST_F(ConfigModuleTest, ParseValidConfig) {
    nlohmann::json j = {
        {"recordings", {"data/screen", "data/eye_tracker"}},
        {"times", {{"start", 1.0}, {"stop", 2.0}, {"step", 0.25}}},
        {"export_dir", "frames"},
        {"print_limit", 3}
    };
    std::ofstream out(test_file_);
    out << j.dump();
    out.close();

    ConfigModule config;
    auto result = config.load_or_create_config(test_file_);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->recordings.size(), 2u);
    EXPECT_EQ(result->recordings[1], "data/eye_tracker");
    EXPECT_DOUBLE_EQ(result->times.start, 1.0);
    EXPECT_DOUBLE_EQ(result->times.step, 0.25);
    EXPECT_EQ(result->export_dir, "frames");
    EXPECT_EQ(result->print_limit, 3);

    EXPECT_THAT(ConfigModule::query_times(result->times), ::testing::ElementsAre(1.0, 1.25, 1.5, 1.75));
}

TEST_F(ConfigModuleTest, ExplicitTimeValues) {
    nlohmann::json j = {
        {"recordings", {"data/screen"}},
        {"times", {{"values", {0.5, 0.25, 3.0}}}}
    };
    std::ofstream out(test_file_);
    out << j.dump();
    out.close();

    ConfigModule config;
    auto result = config.load_or_create_config(test_file_);
    ASSERT_TRUE(result.has_value());
    EXPECT_THAT(ConfigModule::query_times(result->times), ::testing::ElementsAre(0.5, 0.25, 3.0));
}

TEST_F(ConfigModuleTest, HandleCorruptedJson) {
    std::ofstream out(test_file_);
    out << "{ invalid_json: ";
    out.close();

    ConfigModule config;
    auto result = config.load_or_create_config(test_file_);
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ConfigError::ParseError);
}

TEST_F(ConfigModuleTest, WrongValueTypeIsParseError) {
    std::ofstream out(test_file_);
    out << R"({"recordings": ["a"], "print_limit": "many"})";
    out.close();

    ConfigModule config;
    auto result = config.load_or_create_config(test_file_);
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ConfigError::ParseError);
}

TEST(QueryTimesTest, GridIsHalfOpen) {
    TimeGridConfig grid{0.0, 1.0, 0.1, {}};
    auto times = ConfigModule::query_times(grid);
    ASSERT_EQ(times.size(), 10u);
    EXPECT_DOUBLE_EQ(times.front(), 0.0);
    EXPECT_NEAR(times.back(), 0.9, 1e-12);
}

TEST(QueryTimesTest, DegenerateGridIsEmpty) {
    EXPECT_TRUE(ConfigModule::query_times({1.0, 1.0, 0.1, {}}).empty());
    EXPECT_TRUE(ConfigModule::query_times({0.0, 1.0, 0.0, {}}).empty());
}

TEST(ConfigValidatorTest, ValidConfigPasses) {
    ProbeConfig config;
    config.recordings = {"data/screen", "data/sequence"};
    auto errors = ConfigValidator::validate(config);
    EXPECT_TRUE(errors.empty());
}

TEST(ConfigValidatorTest, NoRecordings) {
    ProbeConfig config;
    auto errors = ConfigValidator::validate(config);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("No recordings"), std::string::npos);
}

TEST(ConfigValidatorTest, DuplicateRecording) {
    ProbeConfig config;
    config.recordings = {"data/screen", "data/screen"};
    auto errors = ConfigValidator::validate(config);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("duplicate recording"), std::string::npos);
}

TEST(ConfigValidatorTest, BadGrid) {
    ProbeConfig config;
    config.recordings = {"data/screen"};
    config.times.step = -0.1;
    config.times.start = 5.0;
    config.times.stop = 1.0;
    auto errors = ConfigValidator::validate(config);
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_NE(errors[0].find("step must be positive"), std::string::npos);
    EXPECT_NE(errors[1].find("before times.start"), std::string::npos);
}

TEST(ConfigValidatorTest, GridIgnoredWithExplicitValues) {
    ProbeConfig config;
    config.recordings = {"data/screen"};
    config.times.step = 0.0;
    config.times.values = {1.0};
    EXPECT_TRUE(ConfigValidator::validate(config).empty());
}

TEST(ConfigValidatorTest, NegativePrintLimit) {
    ProbeConfig config;
    config.recordings = {"data/screen"};
    config.print_limit = -1;
    auto errors = ConfigValidator::validate(config);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("print_limit"), std::string::npos);
}

class FrameExporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_file_ = "test_frame_" + std::to_string(std::rand()) + ".png";
    }

    void TearDown() override {
        std::remove(test_file_.c_str());
    }

    bool has_png_signature() const {
        unsigned char sig[8] = {};
        std::ifstream in(test_file_, std::ios::binary);
        in.read(reinterpret_cast<char*>(sig), 8);
        return in.gcount() == 8 && png_sig_cmp(sig, 0, 8) == 0;
    }

    std::string test_file_;
};

TEST_F(FrameExporterTest, WritesGrayFrame) {
    std::vector<double> frame = {0.0, 64.0, 128.0, 255.0, 300.0, -5.0};
    auto result = FrameExporter::save_png(test_file_, frame.data(), {2, 3});
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(has_png_signature());
}

TEST_F(FrameExporterTest, WritesRgbFrame) {
    std::vector<double> frame(2 * 2 * 3, 100.0);
    auto result = FrameExporter::save_png(test_file_, frame.data(), {2, 2, 3});
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(has_png_signature());
}

TEST_F(FrameExporterTest, UnsupportedShapes) {
    std::vector<double> frame(16, 0.0);
    auto vector_frame = FrameExporter::save_png(test_file_, frame.data(), {16});
    EXPECT_FALSE(vector_frame.has_value());
    EXPECT_EQ(vector_frame.error(), MediaError::UnsupportedFormat);

    auto two_channels = FrameExporter::save_png(test_file_, frame.data(), {2, 4, 2});
    EXPECT_FALSE(two_channels.has_value());
    EXPECT_EQ(two_channels.error(), MediaError::UnsupportedFormat);
}

TEST_F(FrameExporterTest, UnwritablePath) {
    std::vector<double> frame(4, 0.0);
    auto result = FrameExporter::save_png("/nonexistent_dir/frame.png", frame.data(), {2, 2});
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), MediaError::FileNotFound);
}
