// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include "../config/feature_flags.h"

#if IMAGE_UPLOAD_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::image_upload {

/**
 * @brief Log categories for the upload engine
 */
struct log_category {
    static constexpr std::string_view engine = "image_upload.engine";
    static constexpr std::string_view preflight = "image_upload.preflight";
    static constexpr std::string_view concurrency = "image_upload.concurrency";
    static constexpr std::string_view compression = "image_upload.compression";
    static constexpr std::string_view transfer = "image_upload.transfer";
    static constexpr std::string_view confirmation = "image_upload.confirmation";
};

/**
 * @brief Log levels for the upload engine
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

/**
 * @brief Convert log level to string
 */
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

inline auto escape_json_string(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
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
 * @brief Configuration for sensitive information masking
 *
 * Signed upload URLs carry their authorization in the query string and
 * confirmation tokens grant record creation, so both are masked by default.
 */
struct masking_config {
    bool mask_signed_urls = true;
    bool mask_tokens = true;
    bool mask_paths = false;
    bool mask_filenames = false;
    char mask_char = '*';
    size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, true, true, '*', 4};
    }

    static masking_config none() {
        return {false, false, false, false, '*', 4};
    }
};

/**
 * @brief Masks signed URLs, tokens and local paths in log output
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = {})
        : config_(config) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        std::string result = input;
        if (config_.mask_signed_urls) {
            result = mask_url_queries(result);
        }
        if (config_.mask_paths) {
            result = mask_local_paths(result);
        }
        return result;
    }

    /**
     * @brief Strip the query string of a URL, keeping scheme, host and path
     */
    [[nodiscard]] auto mask_url(const std::string& url) const -> std::string {
        if (!config_.mask_signed_urls) {
            return url;
        }
        auto query = url.find('?');
        if (query == std::string::npos) {
            return url;
        }
        return url.substr(0, query + 1) + std::string(3, config_.mask_char);
    }

    /**
     * @brief Keep the first visible_chars characters of a token
     */
    [[nodiscard]] auto mask_token(const std::string& token) const -> std::string {
        if (!config_.mask_tokens || token.size() <= config_.visible_chars) {
            return token;
        }
        return token.substr(0, config_.visible_chars) +
               std::string(token.size() - config_.visible_chars, config_.mask_char);
    }

    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }

        auto last_sep = path.find_last_of("/\\");
        std::string filename = last_sep == std::string::npos ? path : path.substr(last_sep + 1);
        if (config_.mask_filenames) {
            filename = mask_filename(filename);
        }
        if (last_sep == std::string::npos) {
            return filename;
        }
        return std::string(last_sep, config_.mask_char) + "/" + filename;
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = config;
    }

private:
    [[nodiscard]] auto mask_filename(const std::string& filename) const -> std::string {
        auto dot_pos = filename.find_last_of('.');
        std::string name = (dot_pos != std::string::npos && dot_pos > 0)
                               ? filename.substr(0, dot_pos)
                               : filename;
        std::string ext = name.size() == filename.size() ? "" : filename.substr(dot_pos);

        if (name.size() <= config_.visible_chars) {
            return filename;
        }
        return name.substr(0, config_.visible_chars) +
               std::string(name.size() - config_.visible_chars, config_.mask_char) + ext;
    }

    template <typename Replace>
    static auto replace_matches(const std::string& input, const std::regex& pattern,
                                Replace replace) -> std::string {
        std::string result;
        size_t last_pos = 0;
        for (std::sregex_iterator it(input.begin(), input.end(), pattern), end; it != end; ++it) {
            result += input.substr(last_pos, it->position() - last_pos);
            result += replace(it->str());
            last_pos = it->position() + it->length();
        }
        result += input.substr(last_pos);
        return result;
    }

    [[nodiscard]] auto mask_url_queries(const std::string& input) const -> std::string {
        static const std::regex url_pattern(R"(https?://[^\s"?]+\?[^\s"]*)");
        return replace_matches(input, url_pattern,
                               [this](const std::string& url) { return mask_url(url); });
    }

    [[nodiscard]] auto mask_local_paths(const std::string& input) const -> std::string {
        static const std::regex path_pattern(
            R"((?:^|\s)((?:\/[a-zA-Z0-9._-]+)+|(?:[a-zA-Z]:\\(?:[a-zA-Z0-9._-]+\\?)+)))");
        return replace_matches(input, path_pattern, [this](const std::string& match) {
            auto start = match.find_first_not_of(" \t");
            return match.substr(0, start) + mask_path(match.substr(start));
        });
    }

    masking_config config_;
};

/**
 * @brief Structured log context for a single upload task
 */
struct upload_log_context {
    std::string task_id;
    std::string filename;
    std::optional<std::string> container_id;
    std::optional<std::string> storage_path;
    std::optional<std::string> signed_url;
    std::optional<std::string> token;
    std::optional<uint64_t> original_size;
    std::optional<uint64_t> upload_size;
    std::optional<double> compression_ratio;
    std::optional<double> progress_percent;
    std::optional<uint32_t> concurrency;
    std::optional<uint32_t> attempt;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };
        auto add_double = [&](const char* name, double value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << std::fixed << std::setprecision(2) << value;
            first = false;
        };

        if (!task_id.empty()) add_field("task_id", task_id);
        if (!filename.empty()) add_field("filename", masker ? masker->mask_path(filename) : filename);
        if (container_id) add_field("container_id", *container_id);
        if (storage_path) add_field("storage_path", *storage_path);
        if (signed_url) add_field("signed_url", masker ? masker->mask_url(*signed_url) : *signed_url);
        if (token) add_field("token", masker ? masker->mask_token(*token) : *token);
        if (original_size) add_uint("original_size", *original_size);
        if (upload_size) add_uint("upload_size", *upload_size);
        if (compression_ratio) add_double("compression_ratio", *compression_ratio);
        if (progress_percent) add_double("progress_percent", *progress_percent);
        if (concurrency) add_uint("concurrency", *concurrency);
        if (attempt) add_uint("attempt", *attempt);
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (error_message) add_field("error_message", masker ? masker->mask(*error_message) : *error_message);

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<upload_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> std::string {
        std::ostringstream oss;
        oss << "{\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";
        oss << ",\"message\":\""
            << detail::escape_json_string(masker ? masker->mask(message) : message) << "\"";

        if (context) {
            std::string ctx_json = context->to_json(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{\"file\":\"" << detail::escape_json_string(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            if (function_name) {
                oss << ",\"function\":\"" << *function_name << "\"";
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Human-readable single line
    json    ///< One JSON object per line
};

/**
 * @brief Process-wide logger for the upload engine
 *
 * Routes messages to logger_system when it is compiled in and initialized,
 * otherwise writes to stderr. Registered callbacks see every enabled message.
 */
class upload_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const upload_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    upload_logger() = default;
    ~upload_logger() = default;

    upload_logger(const upload_logger&) = delete;
    upload_logger& operator=(const upload_logger&) = delete;

    /**
     * @brief Initialize the logger backend
     *
     * Safe to call multiple times. Called by upload_engine::builder::build().
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if IMAGE_UPLOAD_USE_LOGGER_SYSTEM
        auto built = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (built) {
            std::lock_guard<std::mutex> lock(backend_mutex_);
            logger_ = std::move(built.value());
        }
#endif
    }

    void shutdown() {
#if IMAGE_UPLOAD_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(backend_mutex_);
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
#if IMAGE_UPLOAD_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(backend_mutex_);
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

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(config);
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    /**
     * @brief Silence stderr output while keeping callbacks active
     *
     * Used by tests that only inspect callbacks.
     */
    void set_console_output(bool enabled) {
        console_output_.store(enabled);
    }

    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    void set_json_callback(json_log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        json_callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const upload_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {
        if (!is_enabled(level)) return;

        log_output_format format;
        sensitive_info_masker masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            masker = masker_;
        }

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        if (format == log_output_format::json) {
            structured_log_entry entry;
            entry.timestamp = iso8601_timestamp();
            entry.level = level;
            entry.category = std::string(category);
            entry.message = std::string(message);
            if (context) entry.context = *context;
            if (file) entry.source_file = file;
            if (line > 0) entry.source_line = line;
            if (function) entry.function_name = function;

            std::string json = entry.to_json(&masker);
            {
                std::lock_guard<std::mutex> lock(callback_mutex_);
                if (json_callback_) {
                    json_callback_(entry, json);
                }
            }
            emit(level, json, file, line, function);
            return;
        }

        std::ostringstream oss;
        oss << "[" << category << "] " << masker.mask(std::string(message));
        if (context) {
            oss << " " << context->to_json(&masker);
        }
        emit(level, oss.str(), file, line, function);
    }

    void flush() {
#if IMAGE_UPLOAD_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(backend_mutex_);
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void emit(log_level level, const std::string& line_text,
              [[maybe_unused]] const char* file,
              [[maybe_unused]] int line,
              [[maybe_unused]] const char* function) {
#if IMAGE_UPLOAD_USE_LOGGER_SYSTEM
        {
            std::lock_guard<std::mutex> lock(backend_mutex_);
            if (logger_) {
                if (file && line > 0 && function) {
                    logger_->log(to_logger_level(level), line_text, file, line, function);
                } else {
                    logger_->log(to_logger_level(level), line_text);
                }
                return;
            }
        }
#endif
        if (!console_output_.load()) {
            return;
        }

        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << local_timestamp() << " [" << log_level_to_string(level) << "] "
                  << line_text << "\n";
    }

#if IMAGE_UPLOAD_USE_LOGGER_SYSTEM
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
    std::mutex backend_mutex_;
#endif

    static auto iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
        return oss.str();
    }

    static auto local_timestamp() -> std::string {
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

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> console_output_{true};

    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline upload_logger& get_logger() {
    static upload_logger instance;
    return instance;
}

#define IU_LOG(level, category, message) \
    kcenon::image_upload::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define IU_LOG_CTX(level, category, message, context) \
    kcenon::image_upload::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define IU_LOG_TRACE(category, message) \
    IU_LOG(kcenon::image_upload::log_level::trace, category, message)

#define IU_LOG_DEBUG(category, message) \
    IU_LOG(kcenon::image_upload::log_level::debug, category, message)

#define IU_LOG_INFO(category, message) \
    IU_LOG(kcenon::image_upload::log_level::info, category, message)

#define IU_LOG_WARN(category, message) \
    IU_LOG(kcenon::image_upload::log_level::warn, category, message)

#define IU_LOG_ERROR(category, message) \
    IU_LOG(kcenon::image_upload::log_level::error, category, message)

#define IU_LOG_DEBUG_CTX(category, message, ctx) \
    IU_LOG_CTX(kcenon::image_upload::log_level::debug, category, message, ctx)

#define IU_LOG_INFO_CTX(category, message, ctx) \
    IU_LOG_CTX(kcenon::image_upload::log_level::info, category, message, ctx)

#define IU_LOG_WARN_CTX(category, message, ctx) \
    IU_LOG_CTX(kcenon::image_upload::log_level::warn, category, message, ctx)

#define IU_LOG_ERROR_CTX(category, message, ctx) \
    IU_LOG_CTX(kcenon::image_upload::log_level::error, category, message, ctx)

}  // namespace kcenon::image_upload
