// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

// logger_system integration requires common_system
#if defined(BUILD_WITH_LOGGER_SYSTEM) && defined(BUILD_WITH_COMMON_SYSTEM)
#define CLIPXFER_USE_LOGGER_SYSTEM 1
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace clipxfer {

/**
 * @brief Names the components log under
 */
struct log_category {
    static constexpr std::string_view sender = "clipxfer.sender";
    static constexpr std::string_view receiver = "clipxfer.receiver";
    static constexpr std::string_view session = "clipxfer.session";
    static constexpr std::string_view channel = "clipxfer.channel";
    static constexpr std::string_view archive = "clipxfer.archive";
};

/**
 * @brief Severity, in increasing order
 */
enum class log_level { trace, debug, info, warn, error, fatal };

inline std::string_view log_level_to_string(log_level level) {
    static constexpr std::array<std::string_view, 6> names{
        "TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
    auto index = static_cast<std::size_t>(level);
    return index < names.size() ? names[index] : std::string_view{"UNKNOWN"};
}

/**
 * @brief Where in a transfer a log record was emitted
 *
 * Rendered as `{file=... sha256=... part=i/n seq=i/n retries=r}` with
 * unset fields left out. The hash is cut to its first 12 characters.
 */
struct transfer_log_context {
    std::optional<std::string> filename;
    std::optional<std::string> content_hash;
    std::optional<uint32_t> part_index;
    std::optional<uint32_t> part_count;
    std::optional<uint64_t> sequence_index;
    std::optional<uint64_t> sequence_count;
    std::optional<uint64_t> retries;

    [[nodiscard]] auto to_string() const -> std::string {
        std::vector<std::string> fields;
        if (filename) {
            fields.push_back("file=" + *filename);
        }
        if (content_hash) {
            fields.push_back("sha256=" + content_hash->substr(0, 12));
        }
        if (part_index) {
            fields.push_back(position("part", *part_index, part_count));
        }
        if (sequence_index) {
            fields.push_back(position("seq", *sequence_index, sequence_count));
        }
        if (retries) {
            fields.push_back("retries=" + std::to_string(*retries));
        }

        std::string text = "{";
        for (std::size_t i = 0; i < fields.size(); ++i) {
            text += (i == 0 ? "" : " ") + fields[i];
        }
        return text + "}";
    }

private:
    template <typename Index, typename Count>
    static auto position(const char* name, Index index, const std::optional<Count>& count)
        -> std::string {
        auto text = std::string(name) + "=" + std::to_string(index);
        if (count) {
            text += "/" + std::to_string(*count);
        }
        return text;
    }
};

/**
 * @brief Process-wide logger used by every clipxfer component
 *
 * Records at or above the minimum level go to the optional callback and,
 * unless quiet, to kcenon logger_system when the library was built with
 * it or to stderr otherwise.
 */
class clipxfer_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view)>;

    clipxfer_logger() = default;

    clipxfer_logger(const clipxfer_logger&) = delete;
    clipxfer_logger& operator=(const clipxfer_logger&) = delete;

    /// Sets up the backend once; later calls do nothing
    void initialize() {
        if (initialized_.exchange(true)) {
            return;
        }
#ifdef CLIPXFER_USE_LOGGER_SYSTEM
        auto built = kcenon::logger::logger_builder()
            .with_async(false)
            .with_min_level(to_backend_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();
        if (built) {
            backend_ = std::move(built.value());
        }
#endif
    }

    void shutdown() {
#ifdef CLIPXFER_USE_LOGGER_SYSTEM
        if (backend_) {
            backend_->flush();
            backend_->stop();
            backend_.reset();
        }
#endif
        initialized_.store(false);
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#ifdef CLIPXFER_USE_LOGGER_SYSTEM
        if (backend_) {
            backend_->set_min_level(to_backend_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    /// Receives every enabled record; pass nullptr to remove
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    /// When set, records reach the callback only
    void set_quiet(bool quiet) { quiet_.store(quiet); }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return level >= min_level_.load();
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr,
             [[maybe_unused]] int line = 0,
             [[maybe_unused]] const char* function = nullptr) {
        if (!is_enabled(level)) {
            return;
        }

        std::string text(message);
        if (context != nullptr) {
            text += ' ' + context->to_string();
        }
        notify(level, category, text);
        if (quiet_.load()) {
            return;
        }

#ifdef CLIPXFER_USE_LOGGER_SYSTEM
        if (backend_) {
            auto tagged = "[" + std::string(category) + "] " + text;
            if (file != nullptr && function != nullptr && line > 0) {
                backend_->log(to_backend_level(level), tagged, file, line, function);
            } else {
                backend_->log(to_backend_level(level), tagged);
            }
            return;
        }
#endif
        write_stderr(level, category, text);
    }

    void flush() {
#ifdef CLIPXFER_USE_LOGGER_SYSTEM
        if (backend_) {
            backend_->flush();
        }
#endif
        std::cerr.flush();
    }

private:
    void notify(log_level level, std::string_view category, const std::string& text) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        if (callback_) {
            callback_(level, category, text);
        }
    }

    static void write_stderr(log_level level, std::string_view category, const std::string& text) {
        auto now = std::chrono::system_clock::now();
        auto seconds = std::chrono::system_clock::to_time_t(now);
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          now.time_since_epoch()).count() % 1000;
        std::tm local{};
        localtime_r(&seconds, &local);

        std::ostringstream line;
        line << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
             << std::setfill('0') << std::setw(3) << millis
             << " [" << log_level_to_string(level) << "] [" << category << "] " << text
             << '\n';

        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << line.str();
    }

#ifdef CLIPXFER_USE_LOGGER_SYSTEM
    static auto to_backend_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            case log_level::info: break;
        }
        return kcenon::logger::log_level::info;
    }

    std::unique_ptr<kcenon::logger::logger> backend_;
#endif

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> quiet_{false};
    std::mutex callback_mutex_;
    log_callback callback_;
};

inline clipxfer_logger& get_logger() {
    static clipxfer_logger instance;
    return instance;
}

#define CX_LOG(level, category, message) \
    ::clipxfer::get_logger().log((level), (category), (message), nullptr, __FILE__, __LINE__, __func__)
#define CX_LOG_CTX(level, category, message, context) \
    ::clipxfer::get_logger().log((level), (category), (message), &(context), __FILE__, __LINE__, __func__)

#define CX_LOG_TRACE(category, message) CX_LOG(::clipxfer::log_level::trace, category, message)
#define CX_LOG_DEBUG(category, message) CX_LOG(::clipxfer::log_level::debug, category, message)
#define CX_LOG_INFO(category, message) CX_LOG(::clipxfer::log_level::info, category, message)
#define CX_LOG_WARN(category, message) CX_LOG(::clipxfer::log_level::warn, category, message)
#define CX_LOG_ERROR(category, message) CX_LOG(::clipxfer::log_level::error, category, message)
#define CX_LOG_FATAL(category, message) CX_LOG(::clipxfer::log_level::fatal, category, message)

#define CX_LOG_DEBUG_CTX(category, message, ctx) \
    CX_LOG_CTX(::clipxfer::log_level::debug, category, message, ctx)
#define CX_LOG_INFO_CTX(category, message, ctx) \
    CX_LOG_CTX(::clipxfer::log_level::info, category, message, ctx)
#define CX_LOG_WARN_CTX(category, message, ctx) \
    CX_LOG_CTX(::clipxfer::log_level::warn, category, message, ctx)
#define CX_LOG_ERROR_CTX(category, message, ctx) \
    CX_LOG_CTX(::clipxfer::log_level::error, category, message, ctx)

}  // namespace clipxfer
