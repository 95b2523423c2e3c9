// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <atomic>
#include <chrono>
#include <cstdio>
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

#include "kcenon/object_transfer/config/feature_flags.h"

#if OBJ_TRANS_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::object_transfer {

/**
 * @brief Log categories for object transfer system
 */
struct log_category {
    static constexpr std::string_view upload = "object_transfer.upload";
    static constexpr std::string_view download = "object_transfer.download";
    static constexpr std::string_view retry = "object_transfer.retry";
    static constexpr std::string_view limiter = "object_transfer.limiter";
    static constexpr std::string_view manager = "object_transfer.manager";
    static constexpr std::string_view store = "object_transfer.store";
};

/**
 * @brief Log levels for object transfer system
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

namespace detail {

inline auto escape_json(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 8);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Structured context attached to a log record
 *
 * Only the fields that are set are rendered.
 */
struct transfer_log_context {
    std::string transfer_id;
    std::string object_key;
    std::string local_path;
    std::optional<uint64_t> total_bytes;
    std::optional<uint64_t> bytes_transferred;
    std::optional<uint32_t> part_number;
    std::optional<uint32_t> total_parts;
    std::optional<uint32_t> attempt;
    std::optional<std::string> upload_id;
    std::optional<double> rate_mbps;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, std::string_view value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!transfer_id.empty()) add_field("transfer_id", transfer_id);
        if (!object_key.empty()) add_field("object_key", object_key);
        if (!local_path.empty()) add_field("local_path", local_path);
        if (total_bytes) add_uint("total_bytes", *total_bytes);
        if (bytes_transferred) add_uint("bytes_transferred", *bytes_transferred);
        if (part_number) add_uint("part_number", *part_number);
        if (total_parts) add_uint("total_parts", *total_parts);
        if (attempt) add_uint("attempt", *attempt);
        if (upload_id) add_field("upload_id", *upload_id);
        if (rate_mbps) {
            if (!first) oss << ",";
            oss << std::fixed << std::setprecision(2) << "\"rate_mbps\":" << *rate_mbps;
            first = false;
        }
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (error_message) add_field("error_message", *error_message);

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Human readable single line
    json    ///< One JSON object per record
};

class object_transfer_logger;

object_transfer_logger& get_logger();

/**
 * @brief Logger shared by all engines of the process
 *
 * Records go to logger_system when it was found at build time and to
 * stderr otherwise. A callback can observe every record that passes the
 * level filter, independently of the backend.
 */
class object_transfer_logger {
public:
    using log_callback = std::function<void(
        log_level, std::string_view, std::string_view, const transfer_log_context*)>;

    object_transfer_logger() = default;
    ~object_transfer_logger() = default;

    object_transfer_logger(const object_transfer_logger&) = delete;
    object_transfer_logger& operator=(const object_transfer_logger&) = delete;

    /**
     * @brief Initialize the backend
     *
     * Safe to call multiple times. Called by transfer_manager::builder.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if OBJ_TRANS_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if OBJ_TRANS_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if OBJ_TRANS_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    /**
     * @brief Install a callback that sees every emitted record
     *
     * Pass an empty function to remove it.
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr,
             [[maybe_unused]] int line = 0,
             [[maybe_unused]] const char* function = nullptr) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        auto line_text = get_output_format() == log_output_format::json
                             ? format_json(level, category, message, context)
                             : format_text(level, category, message, context);

#if OBJ_TRANS_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), line_text, file, line, function);
            } else {
                logger_->log(to_logger_level(level), line_text);
            }
            return;
        }
#endif
        output_to_stderr(line_text);
    }

    void flush() {
#if OBJ_TRANS_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    static auto format_text(log_level level,
                            std::string_view category,
                            std::string_view message,
                            const transfer_log_context* context) -> std::string {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << log_level_to_string(level) << "] ["
            << category << "] " << message;
        if (context) {
            oss << " " << context->to_json();
        }
        return oss.str();
    }

    static auto format_json(log_level level,
                            std::string_view category,
                            std::string_view message,
                            const transfer_log_context* context) -> std::string {
        std::ostringstream oss;
        oss << "{\"timestamp\":\"" << get_timestamp() << "\""
            << ",\"level\":\"" << log_level_to_string(level) << "\""
            << ",\"category\":\"" << category << "\""
            << ",\"message\":\"" << detail::escape_json(message) << "\"";
        if (context) {
            auto ctx = context->to_json();
            if (ctx.size() > 2) {
                oss << "," << ctx.substr(1, ctx.size() - 2);
            }
        }
        oss << "}";
        return oss.str();
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

#if OBJ_TRANS_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    mutable std::mutex config_mutex_;
};

inline object_transfer_logger& get_logger() {
    static object_transfer_logger instance;
    return instance;
}

#define OT_LOG(level, category, message) \
    kcenon::object_transfer::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define OT_LOG_CTX(level, category, message, context) \
    kcenon::object_transfer::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define OT_LOG_TRACE(category, message) \
    OT_LOG(kcenon::object_transfer::log_level::trace, category, message)

#define OT_LOG_DEBUG(category, message) \
    OT_LOG(kcenon::object_transfer::log_level::debug, category, message)

#define OT_LOG_INFO(category, message) \
    OT_LOG(kcenon::object_transfer::log_level::info, category, message)

#define OT_LOG_WARN(category, message) \
    OT_LOG(kcenon::object_transfer::log_level::warn, category, message)

#define OT_LOG_ERROR(category, message) \
    OT_LOG(kcenon::object_transfer::log_level::error, category, message)

#define OT_LOG_DEBUG_CTX(category, message, ctx) \
    OT_LOG_CTX(kcenon::object_transfer::log_level::debug, category, message, ctx)

#define OT_LOG_INFO_CTX(category, message, ctx) \
    OT_LOG_CTX(kcenon::object_transfer::log_level::info, category, message, ctx)

#define OT_LOG_WARN_CTX(category, message, ctx) \
    OT_LOG_CTX(kcenon::object_transfer::log_level::warn, category, message, ctx)

#define OT_LOG_ERROR_CTX(category, message, ctx) \
    OT_LOG_CTX(kcenon::object_transfer::log_level::error, category, message, ctx)

}  // namespace kcenon::object_transfer
