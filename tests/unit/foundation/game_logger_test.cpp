#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "pacsim/foundation/error_code.hpp"
#include "pacsim/foundation/game_logger.hpp"
#include "support/mock_logger.hpp"

using namespace pacsim::foundation;
using kcenon::common::interfaces::GlobalLoggerRegistry;
using kcenon::common::interfaces::log_level;
using pacsim::testing::MockLogger;

// ---------------------------------------------------------------------------
// Test fixture: registers a MockLogger as the default logger
// ---------------------------------------------------------------------------

class GameLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        mockLogger_ = std::make_shared<MockLogger>();
        registry.set_default_logger(mockLogger_);
    }

    void TearDown() override {
        GlobalLoggerRegistry::instance().clear();
    }

    std::shared_ptr<MockLogger> mockLogger_;
};

// ---------------------------------------------------------------------------
// LogCategory / LogLevel helpers
// ---------------------------------------------------------------------------

TEST(LogCategoryTest, AllCategoryNamesAreValid) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::ECS), "ECS");
    EXPECT_EQ(logCategoryName(LogCategory::Input), "Input");
    EXPECT_EQ(logCategoryName(LogCategory::AI), "AI");
    EXPECT_EQ(logCategoryName(LogCategory::Movement), "Movement");
    EXPECT_EQ(logCategoryName(LogCategory::Gameplay), "Gameplay");
    EXPECT_EQ(logCategoryName(LogCategory::Config), "Config");
    EXPECT_EQ(logCategoryName(static_cast<LogCategory>(42)), "Unknown");
}

TEST(LogLevelTest, AllLevelNamesAreValid) {
    EXPECT_EQ(logLevelName(LogLevel::Trace), "TRACE");
    EXPECT_EQ(logLevelName(LogLevel::Debug), "DEBUG");
    EXPECT_EQ(logLevelName(LogLevel::Info), "INFO");
    EXPECT_EQ(logLevelName(LogLevel::Warning), "WARNING");
    EXPECT_EQ(logLevelName(LogLevel::Error), "ERROR");
    EXPECT_EQ(logLevelName(LogLevel::Critical), "CRITICAL");
    EXPECT_EQ(logLevelName(LogLevel::Off), "OFF");
}

// ---------------------------------------------------------------------------
// Construction and level control
// ---------------------------------------------------------------------------

TEST(GameLoggerBasicTest, MoveConstructionKeepsLevels) {
    GameLogger a;
    a.setCategoryLevel(LogCategory::Movement, LogLevel::Error);
    GameLogger b(std::move(a));
    EXPECT_EQ(b.getCategoryLevel(LogCategory::Movement), LogLevel::Error);
}

TEST(GameLoggerBasicTest, DefaultCategoryLevels) {
    GameLogger logger;
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::ECS), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Input), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::AI), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Movement), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Gameplay), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Config), LogLevel::Info);
}

TEST(GameLoggerBasicTest, IsEnabledRespectsDefaultLevels) {
    GameLogger logger;
    EXPECT_FALSE(logger.isEnabled(LogLevel::Debug, LogCategory::Core));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Info, LogCategory::Core));

    EXPECT_TRUE(logger.isEnabled(LogLevel::Debug, LogCategory::Gameplay));
    EXPECT_FALSE(logger.isEnabled(LogLevel::Trace, LogCategory::Gameplay));
}

TEST(GameLoggerBasicTest, SetCategoryLevelChangesFiltering) {
    GameLogger logger;
    logger.setCategoryLevel(LogCategory::Core, LogLevel::Trace);
    EXPECT_TRUE(logger.isEnabled(LogLevel::Trace, LogCategory::Core));

    logger.setCategoryLevel(LogCategory::Core, LogLevel::Error);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Warning, LogCategory::Core));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Error, LogCategory::Core));
}

TEST(GameLoggerBasicTest, OffDisablesEverything) {
    GameLogger logger;
    logger.setCategoryLevel(LogCategory::AI, LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, LogCategory::AI));
    EXPECT_FALSE(logger.isEnabled(LogLevel::Off, LogCategory::Core));
}

TEST(GameLoggerBasicTest, InvalidCategoryReturnsOff) {
    GameLogger logger;
    auto invalid = static_cast<LogCategory>(99);
    EXPECT_EQ(logger.getCategoryLevel(invalid), LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, invalid));
}

// ---------------------------------------------------------------------------
// Routing to the kcenon registry
// ---------------------------------------------------------------------------

TEST_F(GameLoggerTest, LogFormatsMessageWithCategory) {
    GameLogger logger;
    logger.log(LogLevel::Info, LogCategory::Core, "session initialised");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::info);
    EXPECT_EQ(records[0].message, "[Core] session initialised");
}

TEST_F(GameLoggerTest, LogFiltersMessagesBelowLevel) {
    GameLogger logger;
    logger.setCategoryLevel(LogCategory::Movement, LogLevel::Warning);
    logger.log(LogLevel::Info, LogCategory::Movement, "tunnel wrap");

    EXPECT_TRUE(mockLogger_->records().empty());
}

TEST_F(GameLoggerTest, LevelsMapOntoRegistryLevels) {
    GameLogger logger;
    logger.setCategoryLevel(LogCategory::Core, LogLevel::Trace);

    logger.log(LogLevel::Trace, LogCategory::Core, "trace");
    logger.log(LogLevel::Debug, LogCategory::Core, "debug");
    logger.log(LogLevel::Warning, LogCategory::Core, "warn");
    logger.log(LogLevel::Critical, LogCategory::Core, "critical");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 4u);
    EXPECT_EQ(records[0].level, log_level::trace);
    EXPECT_EQ(records[1].level, log_level::debug);
    EXPECT_EQ(records[2].level, log_level::warning);
    EXPECT_EQ(records[3].level, log_level::critical);
}

TEST_F(GameLoggerTest, LogWithContextIncludesFields) {
    GameLogger logger;

    LogContext ctx;
    ctx.entityId = 17;
    ctx.extra["points"] = "400";

    logger.logWithContext(LogLevel::Debug, LogCategory::Gameplay, "ghost eaten", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    const auto& msg = records[0].message;
    EXPECT_EQ(msg.rfind("[Gameplay] ghost eaten {", 0), 0u);
    EXPECT_NE(msg.find("entity_id=17"), std::string::npos);
    EXPECT_NE(msg.find("points=400"), std::string::npos);
}

TEST_F(GameLoggerTest, LogWithEmptyContextOmitsBraces) {
    GameLogger logger;
    LogContext ctx;
    logger.logWithContext(LogLevel::Info, LogCategory::Core, "no context", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Core] no context");
}

TEST_F(GameLoggerTest, FlushDelegatesToLogger) {
    GameLogger logger;
    auto result = logger.flush();
    EXPECT_TRUE(result.hasValue());
    EXPECT_TRUE(mockLogger_->wasFlushed());
}

// ---------------------------------------------------------------------------
// PACSIM_LOG macros
// ---------------------------------------------------------------------------

TEST(GameLoggerSingletonTest, InstanceReturnsSameObject) {
    EXPECT_EQ(&GameLogger::instance(), &GameLogger::instance());
}

TEST_F(GameLoggerTest, MacroLogsWhenEnabled) {
    GameLogger::instance().setCategoryLevel(LogCategory::Input, LogLevel::Debug);

    PACSIM_LOG_DEBUG(LogCategory::Input, "macro test");

    EXPECT_TRUE(mockLogger_->contains("[Input] macro test"));
    GameLogger::instance().setCategoryLevel(LogCategory::Input, LogLevel::Info);
}

TEST_F(GameLoggerTest, MacroSkipsWhenDisabled) {
    GameLogger::instance().setCategoryLevel(LogCategory::Input, LogLevel::Error);

    PACSIM_LOG_WARN(LogCategory::Input, "should not appear");

    EXPECT_TRUE(mockLogger_->records().empty());
    GameLogger::instance().setCategoryLevel(LogCategory::Input, LogLevel::Info);
}

TEST_F(GameLoggerTest, ConcurrentLoggingIsSafe) {
    GameLogger logger;

    constexpr int kThreads = 4;
    constexpr int kMessagesPerThread = 100;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t] {
            for (int i = 0; i < kMessagesPerThread; ++i) {
                logger.log(LogLevel::Info, LogCategory::Core,
                           "thread " + std::to_string(t) + " msg " + std::to_string(i));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(mockLogger_->logCount(), static_cast<std::size_t>(kThreads * kMessagesPerThread));
}
