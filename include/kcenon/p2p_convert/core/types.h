/**
 * @file types.h
 * @brief Core type definitions for p2p_convert_system
 */

#ifndef KCENON_P2P_CONVERT_CORE_TYPES_H
#define KCENON_P2P_CONVERT_CORE_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kcenon::p2p_convert {

/**
 * @brief Error codes for peer transfer operations (-700 to -799)
 *
 * Error code ranges:
 * - -700 to -719: Network errors (retried)
 * - -720 to -739: Protocol errors
 * - -740 to -759: Resource errors (rejected before network activity)
 * - -760 to -769: Assembly errors
 * - -770 to -779: State errors
 * - -780 to -784: Cancellation
 * - -785 to -789: Conversion errors
 * - -790 to -799: Configuration and internal errors
 */
enum class error_code : int32_t {
    success = 0,

    // Network errors (-700 to -719)
    connection_failed = -700,
    connection_timeout = -701,
    connection_refused = -702,
    connection_lost = -703,
    stream_error = -704,
    send_failed = -705,
    receive_timeout = -706,
    attempt_timeout = -707,

    // Protocol errors (-720 to -739)
    invalid_frame = -720,
    frame_checksum_mismatch = -721,
    malformed_message = -722,
    unexpected_message = -723,
    protocol_mismatch = -724,
    transfer_id_mismatch = -725,
    transfer_rejected = -726,
    chunk_checksum_error = -727,

    // Resource errors (-740 to -759)
    capacity_exceeded = -740,
    file_too_large = -741,
    file_not_found = -742,
    file_read_error = -743,
    file_write_error = -744,

    // Assembly errors (-760 to -769)
    incomplete_transfer = -760,
    invalid_chunk_index = -761,
    chunk_sequence_error = -762,
    chunk_size_error = -763,
    unknown_transfer = -764,

    // State errors (-770 to -779)
    invalid_transition = -770,
    transfer_not_found = -771,
    transfer_already_exists = -772,
    retries_exhausted = -773,

    // Cancellation (-780 to -784)
    transfer_cancelled = -780,

    // Conversion errors (-785 to -789)
    conversion_failed = -785,
    unsupported_conversion = -786,

    // Configuration and internal errors (-790 to -799)
    invalid_configuration = -790,
    not_initialized = -791,
    already_initialized = -792,
    internal_error = -799,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::connection_refused:
            return "connection refused";
        case error_code::connection_lost:
            return "connection lost";
        case error_code::stream_error:
            return "stream error";
        case error_code::send_failed:
            return "send failed";
        case error_code::receive_timeout:
            return "receive timeout";
        case error_code::attempt_timeout:
            return "attempt timed out";
        case error_code::invalid_frame:
            return "invalid frame";
        case error_code::frame_checksum_mismatch:
            return "frame checksum mismatch";
        case error_code::malformed_message:
            return "malformed message";
        case error_code::unexpected_message:
            return "unexpected message";
        case error_code::protocol_mismatch:
            return "protocol mismatch";
        case error_code::transfer_id_mismatch:
            return "transfer id mismatch";
        case error_code::transfer_rejected:
            return "transfer rejected by peer";
        case error_code::chunk_checksum_error:
            return "chunk CRC32 verification failed";
        case error_code::capacity_exceeded:
            return "too many concurrent transfers";
        case error_code::file_too_large:
            return "file too large";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::incomplete_transfer:
            return "incomplete transfer";
        case error_code::invalid_chunk_index:
            return "invalid chunk index";
        case error_code::chunk_sequence_error:
            return "chunk sequence error";
        case error_code::chunk_size_error:
            return "chunk size error";
        case error_code::unknown_transfer:
            return "unknown transfer";
        case error_code::invalid_transition:
            return "invalid state transition";
        case error_code::transfer_not_found:
            return "transfer not found";
        case error_code::transfer_already_exists:
            return "transfer already exists";
        case error_code::retries_exhausted:
            return "retries exhausted";
        case error_code::transfer_cancelled:
            return "transfer cancelled";
        case error_code::conversion_failed:
            return "conversion failed";
        case error_code::unsupported_conversion:
            return "unsupported conversion";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::not_initialized:
            return "not initialized";
        case error_code::already_initialized:
            return "already initialized";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::p2p_convert

#endif  // KCENON_P2P_CONVERT_CORE_TYPES_H
