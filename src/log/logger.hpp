#pragma once

#include <atomic>
#include <chrono>
#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/core.h>
#include <memory>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace orderkv::log {

    enum class Level { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Fatal = 5, Off = 6 };

    struct LogConfig {
        Level level = Level::Info;
        bool console_output = true; // Must not be modified after init()
        std::string file_path = ""; // empty for no file output
    };

    // Accepts trace|debug|info|warn|error|fatal|off, case-insensitive
    auto parse_level(std::string_view text) -> std::optional<Level>;

    // Overlays ORDERKV_LOG_LEVEL and ORDERKV_LOG_FILE on top of `base`.
    // An unparsable level is ignored and `base.level` kept.
    auto config_from_env(LogConfig base = {}) -> LogConfig;

    class Logger {
      public:
        static auto instance() -> Logger &;

        Logger(const Logger &) = delete;
        Logger &operator=(const Logger &) = delete;

        void init(const LogConfig &config);
        void shutdown();

        template <typename... Args>
        void log(Level level, const std::source_location &loc,
                 fmt::format_string<Args...> format_str, Args &&...args) {
            if (level < current_level_.load(std::memory_order_relaxed))
                return;

            try {
                std::string msg = fmt::format(format_str, std::forward<Args>(args)...);
                enqueue_log(level, loc, std::move(msg));

            } catch (const std::exception &e) {
                enqueue_log(Level::Error, loc, fmt::format("LOG FORMAT ERROR: {}", e.what()));
            }
        }

        void set_level(Level level) {
            current_level_.store(level, std::memory_order_relaxed);
        }

        [[nodiscard]] auto level() const -> Level {
            return current_level_.load(std::memory_order_relaxed);
        }

        bool is_initialized() const {
            return static_cast<bool>(impl_);
        }

      private:
        Logger() = default;
        ~Logger();

        struct LogEntry {
            Level level;
            std::string file_name;
            int line;
            std::string message;
            std::chrono::system_clock::time_point timestamp;
        };

        void enqueue_log(Level level, const std::source_location &loc, std::string &&msg);
        void worker_loop();
        void write_entry(const LogEntry &entry);

        struct Impl;
        std::shared_ptr<Impl> impl_;
        std::atomic<Level> current_level_{Level::Info};
        bool console_output_ = true;
    };
} // namespace orderkv::log

// Logging level guidance (default Level::Info)
// - Trace: per-key / per-range internals; usually off.
// - Debug: per-item decode failures, batch commits.
// - Info: lifecycle milestones of the embedding application.
// - Warn: capability refusals and rejected writes; the caller got an error back.
// - Error: backend failures.
// - Fatal: reserved for the embedding application.

#define ORDERKV_LOG_AT(lvl, ...)                                                                   \
    do {                                                                                           \
        auto &logger = ::orderkv::log::Logger::instance();                                         \
        if (logger.is_initialized()) {                                                             \
            logger.log(lvl, std::source_location::current(), __VA_ARGS__);                        \
        }                                                                                          \
    } while (0)

#define LOG_TRACE(...) ORDERKV_LOG_AT(::orderkv::log::Level::Trace, __VA_ARGS__)
#define LOG_DEBUG(...) ORDERKV_LOG_AT(::orderkv::log::Level::Debug, __VA_ARGS__)
#define LOG_INFO(...) ORDERKV_LOG_AT(::orderkv::log::Level::Info, __VA_ARGS__)
#define LOG_WARN(...) ORDERKV_LOG_AT(::orderkv::log::Level::Warn, __VA_ARGS__)
#define LOG_ERROR(...) ORDERKV_LOG_AT(::orderkv::log::Level::Error, __VA_ARGS__)
#define LOG_FATAL(...) ORDERKV_LOG_AT(::orderkv::log::Level::Fatal, __VA_ARGS__)
