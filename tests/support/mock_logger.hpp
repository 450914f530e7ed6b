#pragma once

/// @file mock_logger.hpp
/// @brief kcenon ILogger test double that records every line.

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

namespace ocs::test {

using kcenon::common::interfaces::log_level;

struct LogRecord {
    log_level level;
    std::string message;
};

class MockLogger : public kcenon::common::interfaces::ILogger {
public:
    kcenon::common::VoidResult log(log_level level,
                                    const std::string& message) override {
        std::lock_guard lock(mutex_);
        records_.push_back({level, message});
        logCount_.fetch_add(1, std::memory_order_relaxed);
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

    /// True if any recorded line contains every fragment.
    bool contains(std::initializer_list<std::string_view> fragments) const {
        std::lock_guard lock(mutex_);
        return std::any_of(records_.begin(), records_.end(), [&](const LogRecord& r) {
            return std::all_of(fragments.begin(), fragments.end(), [&](std::string_view f) {
                return r.message.find(f) != std::string::npos;
            });
        });
    }

    std::size_t logCount() const {
        return logCount_.load(std::memory_order_relaxed);
    }

    bool wasFlushed() const {
        return flushed_.load(std::memory_order_acquire);
    }

    void reset() {
        std::lock_guard lock(mutex_);
        records_.clear();
        logCount_.store(0, std::memory_order_relaxed);
        flushed_.store(false, std::memory_order_relaxed);
    }

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
    std::atomic<std::size_t> logCount_{0};
    std::atomic<log_level> minLevel_{log_level::trace};
    std::atomic<bool> flushed_{false};
};

/// Installs a MockLogger as the kcenon default logger for one test.
class ScopedMockLogger {
public:
    ScopedMockLogger() : logger_(std::make_shared<MockLogger>()) {
        auto& registry = kcenon::common::interfaces::GlobalLoggerRegistry::instance();
        registry.clear();
        registry.set_default_logger(logger_);
    }

    ~ScopedMockLogger() {
        kcenon::common::interfaces::GlobalLoggerRegistry::instance().clear();
    }

    ScopedMockLogger(const ScopedMockLogger&) = delete;
    ScopedMockLogger& operator=(const ScopedMockLogger&) = delete;

    MockLogger& operator*() const { return *logger_; }
    MockLogger* operator->() const { return logger_.get(); }
    std::shared_ptr<MockLogger> get() const { return logger_; }

private:
    std::shared_ptr<MockLogger> logger_;
};

}  // namespace ocs::test
