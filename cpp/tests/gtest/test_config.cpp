// =============================================================================
// Configuration Tests
// =============================================================================

#include <gtest/gtest.h>
#include "babbler/config.hpp"
#include "babbler/generative/generation_config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace babbler;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::getInstance().clear();
        set_log_output(log_);
        temp_config_path_ = "babbler_test_config.env";
    }

    void TearDown() override {
        Config::getInstance().clear();
        unsetenv("BB_SAMPLE_COUNT");
        set_log_output(std::cerr);
        set_log_level(LogLevel::INFO);
        if (std::filesystem::exists(temp_config_path_)) {
            std::filesystem::remove(temp_config_path_);
        }
    }

    void write_config(const std::string& contents) {
        std::ofstream file(temp_config_path_);
        file << contents;
    }

    std::ostringstream log_;
    std::string temp_config_path_;
};

TEST_F(ConfigTest, DefaultsWithoutSettings) {
    generative::GenerationConfig config = generative::load_generation_config();
    EXPECT_EQ(config.order, 4);
    EXPECT_EQ(config.sentence_length, 50u);
    EXPECT_EQ(config.effective_max_length(), 100u);
    EXPECT_DOUBLE_EQ(config.alpha, 2.0);
    EXPECT_DOUBLE_EQ(config.beta, 1.5);
    EXPECT_EQ(config.sample_count, 1000u);
    EXPECT_EQ(config.num_threads, 1u);
}

TEST_F(ConfigTest, LoadsKeyValueFile) {
    write_config(
        "# generation\n"
        "chain.order = 3\n"
        "generate.sentence_length=20\n"
        "; scoring\n"
        "generate.alpha = 1.25\n"
        "generate.max_length = 35\n");

    ASSERT_TRUE(Config::getInstance().load(temp_config_path_));

    generative::GenerationConfig config = generative::load_generation_config();
    EXPECT_EQ(config.order, 3);
    EXPECT_EQ(config.sentence_length, 20u);
    EXPECT_EQ(config.effective_max_length(), 35u);
    EXPECT_DOUBLE_EQ(config.alpha, 1.25);
    EXPECT_DOUBLE_EQ(config.beta, 1.5);
}

TEST_F(ConfigTest, EnvironmentIsRead) {
    setenv("BB_SAMPLE_COUNT", "250", 1);
    ASSERT_TRUE(Config::getInstance().load());
    EXPECT_EQ(generative::load_generation_config().sample_count, 250u);
}

TEST_F(ConfigTest, FileOverridesEnvironment) {
    setenv("BB_SAMPLE_COUNT", "250", 1);
    write_config("generate.sample_count=75\n");
    ASSERT_TRUE(Config::getInstance().load(temp_config_path_));
    EXPECT_EQ(generative::load_generation_config().sample_count, 75u);
}

TEST_F(ConfigTest, RejectsInvalidGenerationValues) {
    Config& config = Config::getInstance();

    config.set("generate.sentence_length", "0");
    EXPECT_FALSE(config.validate());

    config.clear();
    config.set("generate.sample_count", "12.5");
    EXPECT_FALSE(config.validate());

    config.clear();
    config.set("generate.alpha", "-1");
    EXPECT_FALSE(config.validate());

    config.clear();
    config.set("generate.beta", "inf");
    EXPECT_FALSE(config.validate());

    config.clear();
    config.set("generate.max_length", "0");
    config.set("generate.alpha", "0.5");
    EXPECT_TRUE(config.validate());
}

TEST_F(ConfigTest, UnknownLogLevelFallsBackToInfo) {
    Config& config = Config::getInstance();
    config.set("log.level", "chatty");
    EXPECT_TRUE(config.validate());
    EXPECT_EQ(config.get<std::string>("log.level"), "info");
    EXPECT_NE(log_.str().find("Unknown log level"), std::string::npos);
}

TEST_F(ConfigTest, TypedGetFallsBackOnParseFailure) {
    Config& config = Config::getInstance();
    config.set("generate.alpha", "abc");
    EXPECT_DOUBLE_EQ(config.get<double>("generate.alpha", 3.0), 3.0);
    config.set("flag", "Yes");
    EXPECT_TRUE(config.get<bool>("flag"));
}

TEST_F(ConfigTest, LoggerRespectsLevel) {
    set_log_level(LogLevel::WARN);
    LOG_INFO("hidden message");
    LOG_WARN("visible message");
    EXPECT_EQ(log_.str().find("hidden message"), std::string::npos);
    EXPECT_NE(log_.str().find("visible message"), std::string::npos);
    EXPECT_NE(log_.str().find("WARN"), std::string::npos);
}
