#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "pecs/ecs/event_bus.hpp"
#include "pecs/foundation/error_code.hpp"
#include "pecs/foundation/game_logger.hpp"

// kcenon headers for test infrastructure (mock logger registration)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

using namespace pecs::foundation;
using kcenon::common::interfaces::log_level;
using kcenon::common::interfaces::ILogger;
using kcenon::common::interfaces::GlobalLoggerRegistry;

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

    // Test helpers
    std::vector<LogRecord> records() const {
        std::lock_guard lock(mutex_);
        return records_;
    }

    bool contains(std::string_view fragment) const {
        std::lock_guard lock(mutex_);
        for (const auto& r : records_) {
            if (r.message.find(fragment) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    bool wasFlushed() const {
        return flushed_.load(std::memory_order_acquire);
    }

    void reset() {
        std::lock_guard lock(mutex_);
        records_.clear();
        flushed_.store(false, std::memory_order_relaxed);
    }

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
    std::atomic<log_level> minLevel_{log_level::trace};
    std::atomic<bool> flushed_{false};
};

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
    EXPECT_EQ(logCategoryName(LogCategory::Events), "Events");
    EXPECT_EQ(logCategoryName(LogCategory::Spatial), "Spatial");
    EXPECT_EQ(logCategoryName(LogCategory::Physics), "Physics");
    EXPECT_EQ(logCategoryName(LogCategory::Collision), "Collision");
    EXPECT_EQ(logCategoryName(LogCategory::Template), "Template");
    EXPECT_EQ(logCategoryName(LogCategory::Serialization), "Serialization");
}

TEST(LogLevelTest, ParseLogLevel) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("WARN"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("Off"), LogLevel::Off);
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
}

// ---------------------------------------------------------------------------
// Default category levels
// ---------------------------------------------------------------------------

TEST(GameLoggerBasicTest, DefaultCategoryLevels) {
    GameLogger logger;
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Events), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Physics), LogLevel::Warning);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Serialization), LogLevel::Info);
}

TEST(GameLoggerBasicTest, SetCategoryLevelChangesFiltering) {
    GameLogger logger;
    logger.setCategoryLevel(LogCategory::Core, LogLevel::Trace);
    EXPECT_TRUE(logger.isEnabled(LogLevel::Trace, LogCategory::Core));

    logger.setCategoryLevel(LogCategory::Core, LogLevel::Error);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Warning, LogCategory::Core));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Error, LogCategory::Core));
}

TEST(GameLoggerBasicTest, SetAllCategoryLevels) {
    GameLogger logger;
    logger.setAllCategoryLevels(LogLevel::Error);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Warning, LogCategory::Collision));
    EXPECT_FALSE(logger.isEnabled(LogLevel::Info, LogCategory::ECS));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Critical, LogCategory::Physics));
}

TEST(GameLoggerBasicTest, InvalidCategoryReturnsOff) {
    GameLogger logger;
    auto invalid = static_cast<LogCategory>(99);
    EXPECT_EQ(logger.getCategoryLevel(invalid), LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, invalid));
}

// ---------------------------------------------------------------------------
// Logging through the registry
// ---------------------------------------------------------------------------

TEST_F(GameLoggerTest, LogFormatsMessageWithCategory) {
    GameLogger logger;
    logger.log(LogLevel::Info, LogCategory::Spatial, "grid rebuilt");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::info);
    EXPECT_EQ(records[0].message, "[Spatial] grid rebuilt");
}

TEST_F(GameLoggerTest, LogFiltersMessagesBelowLevel) {
    GameLogger logger;
    logger.log(LogLevel::Debug, LogCategory::Physics, "should be filtered");
    EXPECT_TRUE(mockLogger_->records().empty());
}

TEST_F(GameLoggerTest, LogWithContextIncludesFields) {
    GameLogger logger;

    LogContext ctx;
    ctx.entityId = EntityId(100);
    ctx.systemName = "PhysicsSystem";
    ctx.eventType = "collision";
    ctx.extra["pairs"] = "3";

    logger.logWithContext(LogLevel::Error, LogCategory::Events, "listener failed", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);

    const auto& msg = records[0].message;
    EXPECT_NE(msg.find("[Events] listener failed"), std::string::npos);
    EXPECT_NE(msg.find("entity_id=100"), std::string::npos);
    EXPECT_NE(msg.find("system=PhysicsSystem"), std::string::npos);
    EXPECT_NE(msg.find("event=collision"), std::string::npos);
    EXPECT_NE(msg.find("pairs=3"), std::string::npos);
}

TEST_F(GameLoggerTest, LogWithEmptyContextOmitsBraces) {
    GameLogger logger;
    LogContext ctx;
    logger.logWithContext(LogLevel::Info, LogCategory::Core, "No context", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Core] No context");
}

TEST_F(GameLoggerTest, FlushDelegatesToLogger) {
    GameLogger logger;
    auto result = logger.flush();
    EXPECT_TRUE(result.hasValue());
    EXPECT_TRUE(mockLogger_->wasFlushed());
}

TEST(GameLoggerSingletonTest, InstanceReturnsSameObject) {
    auto& a = GameLogger::instance();
    auto& b = GameLogger::instance();
    EXPECT_EQ(&a, &b);
}

// ---------------------------------------------------------------------------
// PECS_LOG macros
// ---------------------------------------------------------------------------

TEST_F(GameLoggerTest, MacroLogsWhenEnabled) {
    GameLogger::instance().setCategoryLevel(LogCategory::Template, LogLevel::Debug);

    PECS_LOG_DEBUG(LogCategory::Template, "macro test");

    EXPECT_TRUE(mockLogger_->contains("macro test"));
    GameLogger::instance().setCategoryLevel(LogCategory::Template, LogLevel::Info);
}

TEST_F(GameLoggerTest, MacroSkipsWhenDisabled) {
    GameLogger::instance().setCategoryLevel(LogCategory::Core, LogLevel::Error);
    mockLogger_->reset();

    PECS_LOG_WARN(LogCategory::Core, "should not appear");

    EXPECT_TRUE(mockLogger_->records().empty());
    GameLogger::instance().setCategoryLevel(LogCategory::Core, LogLevel::Info);
}

// ---------------------------------------------------------------------------
// Runtime call sites
// ---------------------------------------------------------------------------

TEST_F(GameLoggerTest, ThrowingListenerIsLoggedUnderEvents) {
    pecs::ecs::EventBus bus;
    bus.On("boom", [](const pecs::ecs::EventData&, double) {
        throw std::runtime_error("listener exploded");
    });
    bus.Emit("boom");
    bus.ProcessEvents();

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::error);
    EXPECT_NE(records[0].message.find("[Events]"), std::string::npos);
    EXPECT_NE(records[0].message.find("listener exploded"), std::string::npos);
    EXPECT_NE(records[0].message.find("event=boom"), std::string::npos);
}
