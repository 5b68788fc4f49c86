/**
 * @file types.h
 * @brief Core type definitions for image_upload_system
 */

#ifndef KCENON_IMAGE_UPLOAD_CORE_TYPES_H
#define KCENON_IMAGE_UPLOAD_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::image_upload {

/**
 * @brief Error codes for upload operations
 */
enum class error_code {
    success = 0,

    // Validation errors (-100 to -119)
    invalid_source = -100,
    empty_filename = -101,
    file_not_found = -102,
    file_read_error = -103,

    // Compression errors (-120 to -139), recovered locally by the engine
    compression_failed = -120,
    unsupported_image_format = -121,
    image_decode_failed = -122,
    image_encode_failed = -123,

    // Destination allocation errors (-140 to -159)
    allocation_failed = -140,
    allocation_rejected = -141,
    allocation_incomplete = -142,
    destination_expired = -143,

    // Transfer errors (-160 to -179)
    transfer_failed = -160,
    transfer_timeout = -161,
    transfer_rejected = -162,
    transfer_cancelled = -163,

    // Confirmation errors (-180 to -199)
    confirmation_failed = -180,
    confirmation_rejected = -181,

    // Configuration errors (-200 to -219)
    invalid_configuration = -200,
    invalid_concurrency_bounds = -201,
    missing_collaborator = -202,

    // Internal errors (-220 to -239)
    internal_error = -220,
    not_initialized = -221,
    engine_destroyed = -222,
    task_not_found = -223,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::invalid_source:
            return "invalid source";
        case error_code::empty_filename:
            return "empty filename";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_read_error:
            return "file read error";
        case error_code::compression_failed:
            return "compression failed";
        case error_code::unsupported_image_format:
            return "unsupported image format";
        case error_code::image_decode_failed:
            return "image decode failed";
        case error_code::image_encode_failed:
            return "image encode failed";
        case error_code::allocation_failed:
            return "destination allocation failed";
        case error_code::allocation_rejected:
            return "destination allocation rejected";
        case error_code::allocation_incomplete:
            return "destination allocation incomplete";
        case error_code::destination_expired:
            return "destination expired";
        case error_code::transfer_failed:
            return "transfer failed";
        case error_code::transfer_timeout:
            return "transfer timeout";
        case error_code::transfer_rejected:
            return "transfer rejected";
        case error_code::transfer_cancelled:
            return "transfer cancelled";
        case error_code::confirmation_failed:
            return "confirmation failed";
        case error_code::confirmation_rejected:
            return "confirmation rejected";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::invalid_concurrency_bounds:
            return "invalid concurrency bounds";
        case error_code::missing_collaborator:
            return "missing collaborator";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        case error_code::engine_destroyed:
            return "engine destroyed";
        case error_code::task_not_found:
            return "task not found";
        default:
            return "unknown error";
    }
}

/**
 * @brief Check whether an error code belongs to the configuration range
 */
[[nodiscard]] constexpr auto is_configuration_error(error_code code) -> bool {
    auto value = static_cast<int>(code);
    return value <= -200 && value > -220;
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
 * Holds either a value of type T or an error, in the manner of
 * std::expected (C++23).
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

}  // namespace kcenon::image_upload

#endif  // KCENON_IMAGE_UPLOAD_CORE_TYPES_H
