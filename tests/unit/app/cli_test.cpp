#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include "pacsim/app/cli.hpp"

using namespace pacsim::app;
using pacsim::foundation::ConfigManager;
using pacsim::foundation::ErrorCode;
using pacsim::game::Direction;

// --- parseArgs ---

TEST(ParseArgsTest, Defaults) {
    const char* argv[] = {"pacsim"};
    auto result = parseArgs(1, argv);
    ASSERT_TRUE(result.hasValue());

    const auto& options = result.value();
    EXPECT_TRUE(options.configPath.empty());
    EXPECT_EQ(options.frames, 3600u);
    EXPECT_TRUE(options.script.empty());
    EXPECT_FALSE(options.realtime);
    EXPECT_EQ(options.tickRate, 60u);
}

TEST(ParseArgsTest, AllOptions) {
    const char* argv[] = {"pacsim",  "--config",    "game.yaml", "--frames", "120",
                          "--script", "lUrd",       "--tick-rate", "30",     "--realtime"};
    auto result = parseArgs(10, argv);
    ASSERT_TRUE(result.hasValue());

    const auto& options = result.value();
    EXPECT_EQ(options.configPath, std::filesystem::path("game.yaml"));
    EXPECT_EQ(options.frames, 120u);
    EXPECT_EQ(options.script, (std::vector<Direction>{Direction::Left, Direction::Up,
                                                      Direction::Right, Direction::Down}));
    EXPECT_EQ(options.tickRate, 30u);
    EXPECT_TRUE(options.realtime);
}

TEST(ParseArgsTest, RejectsUnknownFlag) {
    const char* argv[] = {"pacsim", "--speed", "3"};
    auto result = parseArgs(3, argv);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST(ParseArgsTest, RejectsMissingValue) {
    const char* argv[] = {"pacsim", "--frames"};
    EXPECT_TRUE(parseArgs(2, argv).hasError());
}

TEST(ParseArgsTest, RejectsBadNumbers) {
    const char* frames[] = {"pacsim", "--frames", "12x"};
    EXPECT_TRUE(parseArgs(3, frames).hasError());

    const char* rate[] = {"pacsim", "--tick-rate", "0"};
    EXPECT_TRUE(parseArgs(3, rate).hasError());
}

TEST(ParseArgsTest, RejectsBadScript) {
    const char* argv[] = {"pacsim", "--script", "UDX"};
    auto result = parseArgs(3, argv);
    ASSERT_TRUE(result.hasError());
    EXPECT_NE(result.error().message().find("'X'"), std::string_view::npos);
}

// --- parseScript ---

TEST(ParseScriptTest, EmptyScript) {
    auto result = parseScript("");
    ASSERT_TRUE(result.hasValue());
    EXPECT_TRUE(result.value().empty());
}

// --- loadConfig ---

class LoadConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("PACSIM_CONFIG_PATH");
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tmpDir_ = std::filesystem::temp_directory_path() /
                  (std::string("pacsim_test_") + info->name());
        std::filesystem::create_directories(tmpDir_);
    }

    void TearDown() override {
        unsetenv("PACSIM_CONFIG_PATH");
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    std::filesystem::path writeYaml(const std::string& name, const std::string& content) {
        auto path = tmpDir_ / name;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    std::filesystem::path tmpDir_;
};

TEST_F(LoadConfigTest, EmptyPathKeepsDefaults) {
    ConfigManager config;
    EXPECT_TRUE(loadConfig(config, {}).hasValue());
    EXPECT_EQ(config.size(), 0u);
}

TEST_F(LoadConfigTest, LoadsGivenFile) {
    auto path = writeYaml("a.yaml", "score:\n  pellet: 11\n");
    ConfigManager config;
    ASSERT_TRUE(loadConfig(config, path).hasValue());
    EXPECT_EQ(config.get<int>("score.pellet").valueOr(0), 11);
}

TEST_F(LoadConfigTest, EnvironmentOverridesPath) {
    auto given = writeYaml("given.yaml", "score:\n  pellet: 11\n");
    auto env = writeYaml("env.yaml", "score:\n  pellet: 22\n");
    setenv("PACSIM_CONFIG_PATH", env.c_str(), 1);

    ConfigManager config;
    ASSERT_TRUE(loadConfig(config, given).hasValue());
    EXPECT_EQ(config.get<int>("score.pellet").valueOr(0), 22);
}

TEST_F(LoadConfigTest, MissingFileFails) {
    ConfigManager config;
    auto result = loadConfig(config, tmpDir_ / "absent.yaml");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}
