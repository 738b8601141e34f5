#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "nre/foundation/engine_logger.hpp"
#include "nre/foundation/error_code.hpp"

// kcenon headers for test infrastructure (mock logger registration)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

using namespace nre::foundation;
using kcenon::common::interfaces::GlobalLoggerRegistry;
using kcenon::common::interfaces::ILogger;
using kcenon::common::interfaces::log_level;

// ---------------------------------------------------------------------------
// MockLogger: captures log messages for assertion
// ---------------------------------------------------------------------------

struct LogRecord {
    log_level level;
    std::string message;
};

class MockLogger : public ILogger {
public:
    kcenon::common::VoidResult log(log_level level,
                                    const std::string& message) override {
        std::lock_guard lock(mutex_);
        records_.push_back({level, message});
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(
        const kcenon::common::interfaces::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(log_level level) const override {
        return level >= minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult set_level(log_level level) override {
        minLevel_.store(level, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    log_level get_level() const override {
        return minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult flush() override {
        flushed_.store(true, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    std::vector<LogRecord> records() const {
        std::lock_guard lock(mutex_);
        return records_;
    }

    bool wasFlushed() const {
        return flushed_.load(std::memory_order_acquire);
    }

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
    std::atomic<log_level> minLevel_{log_level::trace};
    std::atomic<bool> flushed_{false};
};

class EngineLoggerTest : public ::testing::Test {
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
// Names and defaults
// ---------------------------------------------------------------------------

TEST(LogCategoryTest, AllCategoryNamesAreValid) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::Ingest), "Ingest");
    EXPECT_EQ(logCategoryName(LogCategory::Ranking), "Ranking");
    EXPECT_EQ(logCategoryName(LogCategory::Teams), "Teams");
    EXPECT_EQ(logCategoryName(LogCategory::Config), "Config");
    EXPECT_EQ(logCategoryName(LogCategory::Thread), "Thread");
    EXPECT_EQ(logCategoryName(static_cast<LogCategory>(42)), "Unknown");
    EXPECT_EQ(kLogCategoryCount, 6u);
}

TEST(LogLevelTest, LevelNames) {
    EXPECT_EQ(logLevelName(LogLevel::Trace), "TRACE");
    EXPECT_EQ(logLevelName(LogLevel::Warning), "WARNING");
    EXPECT_EQ(logLevelName(LogLevel::Off), "OFF");
}

TEST(EngineLoggerBasicTest, DefaultCategoryLevels) {
    EngineLogger logger;
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Ingest), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Ranking), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Teams), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Config), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Thread), LogLevel::Warning);
}

TEST(EngineLoggerBasicTest, SetCategoryLevelChangesFiltering) {
    EngineLogger logger;
    EXPECT_FALSE(logger.isEnabled(LogLevel::Debug, LogCategory::Ranking));

    logger.setCategoryLevel(LogCategory::Ranking, LogLevel::Debug);
    EXPECT_TRUE(logger.isEnabled(LogLevel::Debug, LogCategory::Ranking));

    logger.setCategoryLevel(LogCategory::Ranking, LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, LogCategory::Ranking));
}

TEST(EngineLoggerBasicTest, OffLevelIsNeverEnabled) {
    EngineLogger logger;
    logger.setCategoryLevel(LogCategory::Core, LogLevel::Trace);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Off, LogCategory::Core));
}

TEST(EngineLoggerBasicTest, InvalidCategoryReturnsOff) {
    EngineLogger logger;
    auto invalid = static_cast<LogCategory>(99);
    EXPECT_EQ(logger.getCategoryLevel(invalid), LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, invalid));
}

// ---------------------------------------------------------------------------
// Output
// ---------------------------------------------------------------------------

TEST_F(EngineLoggerTest, LogFormatsMessageWithCategory) {
    EngineLogger logger;
    logger.log(LogLevel::Info, LogCategory::Ranking, "ranked 3 of 4 nations");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::info);
    EXPECT_EQ(records[0].message, "[Ranking] ranked 3 of 4 nations");
}

TEST_F(EngineLoggerTest, LogFiltersMessagesBelowLevel) {
    EngineLogger logger;
    logger.log(LogLevel::Debug, LogCategory::Teams, "filtered");
    logger.log(LogLevel::Info, LogCategory::Thread, "filtered too");
    EXPECT_TRUE(mockLogger_->records().empty());
}

TEST_F(EngineLoggerTest, ContextFieldsAreSorted) {
    EngineLogger logger;

    LogContext ctx;
    ctx.gameMode = "Duel";
    ctx.nation = "US";
    ctx.extra["k"] = "76.5";
    ctx.extra["cf"] = "153";

    logger.logWithContext(LogLevel::Warning, LogCategory::Ranking, "slice", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::warning);
    EXPECT_EQ(records[0].message, "[Ranking] slice {mode=Duel, nation=US, cf=153, k=76.5}");
}

TEST_F(EngineLoggerTest, NamedCategoryLoggerTakesPrecedence) {
    auto rankingLogger = std::make_shared<MockLogger>();
    (void)GlobalLoggerRegistry::instance().register_logger("nre.Ranking", rankingLogger);

    EngineLogger logger;
    logger.log(LogLevel::Info, LogCategory::Ranking, "to named");
    logger.log(LogLevel::Info, LogCategory::Core, "to default");

    ASSERT_EQ(rankingLogger->records().size(), 1u);
    EXPECT_EQ(rankingLogger->records()[0].message, "[Ranking] to named");
    ASSERT_EQ(mockLogger_->records().size(), 1u);
    EXPECT_EQ(mockLogger_->records()[0].message, "[Core] to default");
}

TEST_F(EngineLoggerTest, MacrosUseProcessLogger) {
    NRE_LOG_WARN(LogCategory::Ingest, "skipped 2 records");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Ingest] skipped 2 records");
}

TEST_F(EngineLoggerTest, FlushReachesDefaultLogger) {
    EngineLogger logger;
    EXPECT_TRUE(logger.flush().hasValue());
    EXPECT_TRUE(mockLogger_->wasFlushed());
}
