// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <kcenon/p2p_convert/config/feature_flags.h>

#include <algorithm>
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

#if P2PC_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::p2p_convert {

/**
 * @brief Log categories for the p2p convert system
 */
struct log_category {
    static constexpr std::string_view sender = "p2p_convert.sender";
    static constexpr std::string_view receiver = "p2p_convert.receiver";
    static constexpr std::string_view transfer = "p2p_convert.transfer";
    static constexpr std::string_view chunk = "p2p_convert.chunk";
    static constexpr std::string_view retry = "p2p_convert.retry";
    static constexpr std::string_view registry = "p2p_convert.registry";
    static constexpr std::string_view reaper = "p2p_convert.reaper";
    static constexpr std::string_view progress = "p2p_convert.progress";
    static constexpr std::string_view transport = "p2p_convert.transport";
    static constexpr std::string_view conversion = "p2p_convert.conversion";
};

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
 */
struct masking_config {
    bool mask_filenames = false;
    bool mask_addresses = false;
    char mask_char = '*';
    std::size_t visible_chars = 4;

    static masking_config all_masked() { return {true, true, '*', 4}; }
    static masking_config none() { return {false, false, '*', 4}; }
};

/**
 * @brief Masks file names and peer addresses in structured log fields
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(config) {}

    /**
     * @brief Keep the first visible_chars of the stem and the extension
     */
    [[nodiscard]] auto mask_filename(const std::string& filename) const -> std::string {
        if (!config_.mask_filenames) {
            return filename;
        }

        auto dot_pos = filename.find_last_of('.');
        std::string stem = dot_pos == std::string::npos || dot_pos == 0
                               ? filename
                               : filename.substr(0, dot_pos);
        std::string ext = stem.size() == filename.size() ? "" : filename.substr(dot_pos);

        if (stem.size() <= config_.visible_chars) {
            return filename;
        }
        return stem.substr(0, config_.visible_chars) +
               std::string(stem.size() - config_.visible_chars, config_.mask_char) + ext;
    }

    /**
     * @brief Mask everything except the final segment, e.g. "*******.12:9000"
     */
    [[nodiscard]] auto mask_address(const std::string& address) const -> std::string {
        if (!config_.mask_addresses || address.empty()) {
            return address;
        }

        auto last_dot = address.find_last_of('.');
        if (last_dot == std::string::npos) {
            return std::string(address.size(), config_.mask_char);
        }
        return std::string(last_dot, config_.mask_char) + address.substr(last_dot);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& { return config_; }

    void set_config(masking_config config) { config_ = config; }

private:
    masking_config config_;
};

/**
 * @brief Structured log context for transfer operations
 */
struct transfer_log_context {
    std::string transfer_id;
    std::string filename;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> bytes_transferred;
    std::optional<uint64_t> chunk_index;
    std::optional<uint64_t> total_chunks;
    std::optional<double> progress_percent;
    std::optional<double> rate_kbps;
    std::optional<uint64_t> duration_ms;
    std::optional<uint32_t> attempt;
    std::optional<std::string> error_message;
    std::optional<std::string> peer_id;
    std::optional<std::string> peer_address;

    [[nodiscard]] auto to_json() const -> std::string { return to_json_with_masking(nullptr); }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << "{";

        bool first = true;
        auto separator = [&] {
            if (!first) oss << ",";
            first = false;
        };
        auto add_string = [&](const char* name, const std::string& value) {
            separator();
            oss << "\"" << name << "\":\"" << detail::escape_json(value) << "\"";
        };
        auto add_number = [&](const char* name, auto value) {
            separator();
            oss << "\"" << name << "\":" << value;
        };

        if (!transfer_id.empty()) add_string("transfer_id", transfer_id);
        if (!filename.empty()) {
            add_string("filename", masker ? masker->mask_filename(filename) : filename);
        }
        if (file_size) add_number("size", *file_size);
        if (bytes_transferred) add_number("bytes_transferred", *bytes_transferred);
        if (chunk_index) add_number("chunk_index", *chunk_index);
        if (total_chunks) add_number("total_chunks", *total_chunks);
        if (progress_percent) add_number("progress_percent", *progress_percent);
        if (rate_kbps) add_number("rate_kbps", *rate_kbps);
        if (duration_ms) add_number("duration_ms", *duration_ms);
        if (attempt) add_number("attempt", *attempt);
        if (error_message) add_string("error_message", *error_message);
        if (peer_id) add_string("peer_id", *peer_id);
        if (peer_address) {
            add_string("peer_address", masker ? masker->mask_address(*peer_address)
                                              : *peer_address);
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry with all metadata
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<transfer_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;

    [[nodiscard]] auto to_json() const -> std::string { return to_json_with_masking(nullptr); }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{\"timestamp\":\"" << timestamp << "\""
            << ",\"level\":\"" << log_level_to_string(level) << "\""
            << ",\"category\":\"" << category << "\""
            << ",\"message\":\"" << detail::escape_json(message) << "\"";

        if (context) {
            // Splice the context fields into this object
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{\"file\":\"" << detail::escape_json(*source_file) << "\"";
            if (source_line) oss << ",\"line\":" << *source_line;
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Builder class for creating structured log entries
 *
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::info)
 *     .with_category(log_category::sender)
 *     .with_message("Transfer completed")
 *     .with_transfer_id(id.to_string())
 *     .with_filename("report.pdf")
 *     .with_duration_ms(500)
 *     .build();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder() { entry_.timestamp = iso8601_now(); }

    auto with_level(log_level level) -> log_entry_builder& {
        entry_.level = level;
        return *this;
    }

    auto with_category(std::string_view category) -> log_entry_builder& {
        entry_.category = std::string(category);
        return *this;
    }

    auto with_message(std::string_view message) -> log_entry_builder& {
        entry_.message = std::string(message);
        return *this;
    }

    auto with_transfer_id(std::string_view id) -> log_entry_builder& {
        context().transfer_id = std::string(id);
        return *this;
    }

    auto with_filename(std::string_view filename) -> log_entry_builder& {
        context().filename = std::string(filename);
        return *this;
    }

    auto with_file_size(uint64_t size) -> log_entry_builder& {
        context().file_size = size;
        return *this;
    }

    auto with_duration_ms(uint64_t duration) -> log_entry_builder& {
        context().duration_ms = duration;
        return *this;
    }

    auto with_attempt(uint32_t attempt) -> log_entry_builder& {
        context().attempt = attempt;
        return *this;
    }

    auto with_error_message(std::string_view error) -> log_entry_builder& {
        context().error_message = std::string(error);
        return *this;
    }

    auto with_peer(std::string_view peer_id, std::string_view address) -> log_entry_builder& {
        context().peer_id = std::string(peer_id);
        context().peer_address = std::string(address);
        return *this;
    }

    auto with_source_location(const char* file, int line) -> log_entry_builder& {
        if (file) entry_.source_file = file;
        if (line > 0) entry_.source_line = line;
        return *this;
    }

    auto with_context(const transfer_log_context& ctx) -> log_entry_builder& {
        entry_.context = ctx;
        return *this;
    }

    [[nodiscard]] auto build() const -> structured_log_entry { return entry_; }

    [[nodiscard]] auto build_json() const -> std::string { return entry_.to_json(); }

private:
    auto context() -> transfer_log_context& {
        if (!entry_.context) {
            entry_.context = transfer_log_context{};
        }
        return *entry_.context;
    }

    [[nodiscard]] static auto iso8601_now() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
            << std::setw(3) << ms.count() << 'Z';
        return oss.str();
    }

    structured_log_entry entry_;
};

enum class log_output_format {
    text,
    json
};

/**
 * @brief Process-wide logger for the p2p convert system
 *
 * Forwards to logger_system when it is compiled in, otherwise writes to
 * stderr. A callback receives every record that passes the level filter,
 * which is how tests observe log output.
 */
class p2p_convert_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const transfer_log_context*)>;

    p2p_convert_logger() = default;
    ~p2p_convert_logger() = default;

    p2p_convert_logger(const p2p_convert_logger&) = delete;
    p2p_convert_logger& operator=(const p2p_convert_logger&) = delete;

    /**
     * @brief Initialize the logger backend
     *
     * Safe to call multiple times. Called by the sender and receiver
     * constructors.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if P2PC_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
                          .with_async(true)
                          .with_min_level(kcenon::logger::log_level::info)
                          .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
                          .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if P2PC_USE_LOGGER_SYSTEM
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
#if P2PC_USE_LOGGER_SYSTEM
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
             const char* file = nullptr,
             int line = 0) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        sensitive_info_masker masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            masker = masker_;
        }

        std::string rendered;
        if (format == log_output_format::json) {
            auto builder = log_entry_builder()
                               .with_level(level)
                               .with_category(category)
                               .with_message(message)
                               .with_source_location(file, line);
            if (context) {
                builder.with_context(*context);
            }
            rendered = builder.build().to_json_with_masking(&masker);
        } else {
            std::ostringstream oss;
            oss << "[" << category << "] " << message;
            if (context) {
                oss << " " << context->to_json_with_masking(&masker);
            }
            rendered = oss.str();
        }

        write(level, rendered, file, line);
    }

    void flush() {
#if P2PC_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void write(log_level level,
               const std::string& rendered,
               [[maybe_unused]] const char* file,
               [[maybe_unused]] int line) {
#if P2PC_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0) {
                logger_->log(to_logger_level(level), rendered, file, line, "");
            } else {
                logger_->log(to_logger_level(level), rendered);
            }
            return;
        }
#endif
        std::ostringstream oss;
        oss << local_timestamp() << " [" << log_level_to_string(level) << "] " << rendered;

        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << oss.str() << "\n";
    }

#if P2PC_USE_LOGGER_SYSTEM
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

    static auto local_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
            << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline p2p_convert_logger& get_logger() {
    static p2p_convert_logger instance;
    return instance;
}

// Logging macros for convenience
#define P2PC_LOG(level, category, message) \
    kcenon::p2p_convert::get_logger().log(level, category, message, nullptr, __FILE__, __LINE__)

#define P2PC_LOG_CTX(level, category, message, context) \
    kcenon::p2p_convert::get_logger().log(level, category, message, &context, __FILE__, __LINE__)

#define P2PC_LOG_TRACE(category, message) \
    P2PC_LOG(kcenon::p2p_convert::log_level::trace, category, message)

#define P2PC_LOG_DEBUG(category, message) \
    P2PC_LOG(kcenon::p2p_convert::log_level::debug, category, message)

#define P2PC_LOG_INFO(category, message) \
    P2PC_LOG(kcenon::p2p_convert::log_level::info, category, message)

#define P2PC_LOG_WARN(category, message) \
    P2PC_LOG(kcenon::p2p_convert::log_level::warn, category, message)

#define P2PC_LOG_ERROR(category, message) \
    P2PC_LOG(kcenon::p2p_convert::log_level::error, category, message)

#define P2PC_LOG_FATAL(category, message) \
    P2PC_LOG(kcenon::p2p_convert::log_level::fatal, category, message)

#define P2PC_LOG_DEBUG_CTX(category, message, ctx) \
    P2PC_LOG_CTX(kcenon::p2p_convert::log_level::debug, category, message, ctx)

#define P2PC_LOG_INFO_CTX(category, message, ctx) \
    P2PC_LOG_CTX(kcenon::p2p_convert::log_level::info, category, message, ctx)

#define P2PC_LOG_WARN_CTX(category, message, ctx) \
    P2PC_LOG_CTX(kcenon::p2p_convert::log_level::warn, category, message, ctx)

#define P2PC_LOG_ERROR_CTX(category, message, ctx) \
    P2PC_LOG_CTX(kcenon::p2p_convert::log_level::error, category, message, ctx)

}  // namespace kcenon::p2p_convert
