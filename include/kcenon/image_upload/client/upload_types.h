/**
 * @file upload_types.h
 * @brief Task, source and statistics types for the upload engine
 */

#ifndef KCENON_IMAGE_UPLOAD_CLIENT_UPLOAD_TYPES_H
#define KCENON_IMAGE_UPLOAD_CLIENT_UPLOAD_TYPES_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "kcenon/image_upload/core/types.h"

namespace kcenon::image_upload {

// Forward declaration
class upload_engine;

/**
 * @brief Per-task state
 *
 * PENDING -> COMPRESSING -> UPLOADING -> COMPLETED, or ERROR from any
 * non-terminal state. ERROR returns to PENDING only through retry_failed().
 */
enum class upload_status {
    pending,
    compressing,
    uploading,
    completed,
    error
};

[[nodiscard]] constexpr auto to_string(upload_status status) noexcept -> const char* {
    switch (status) {
        case upload_status::pending: return "pending";
        case upload_status::compressing: return "compressing";
        case upload_status::uploading: return "uploading";
        case upload_status::completed: return "completed";
        case upload_status::error: return "error";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_terminal_status(upload_status status) noexcept -> bool {
    return status == upload_status::completed || status == upload_status::error;
}

/**
 * @brief Mime type for a file name, from its extension
 * @return "application/octet-stream" for unknown extensions
 */
[[nodiscard]] auto mime_type_for(const std::filesystem::path& path) -> std::string;

/**
 * @brief Natural ordering of file names ("img2" < "img10"), case-insensitive
 */
[[nodiscard]] auto natural_less(std::string_view lhs, std::string_view rhs) -> bool;

/**
 * @brief Where a task's bytes come from
 *
 * File sources are read when the task is processed, not when it is added.
 * Copies share the in-memory payload.
 */
class upload_source {
public:
    /**
     * @brief Source backed by a file on disk
     * @param path File to upload
     * @param mime_type Override; inferred from the extension when unset
     */
    [[nodiscard]] static auto from_file(std::filesystem::path path,
                                        std::optional<std::string> mime_type = std::nullopt)
        -> upload_source;

    /**
     * @brief Source backed by bytes already in memory
     */
    [[nodiscard]] static auto from_memory(std::string filename,
                                          std::vector<std::byte> data,
                                          std::string mime_type) -> upload_source;

    [[nodiscard]] auto filename() const -> const std::string& { return filename_; }
    [[nodiscard]] auto mime_type() const -> const std::string& { return mime_type_; }
    [[nodiscard]] auto path() const -> const std::optional<std::filesystem::path>& {
        return path_;
    }
    [[nodiscard]] auto is_file() const noexcept -> bool { return path_.has_value(); }

    /**
     * @brief Size in bytes (0 if a file source cannot be stat'ed)
     */
    [[nodiscard]] auto size() const -> uint64_t;

    /**
     * @brief Check the source can be uploaded
     *
     * Rejects empty file names, missing files, empty payloads and non-image
     * mime types.
     */
    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Read the payload
     */
    [[nodiscard]] auto load() const -> result<std::vector<std::byte>>;

    /**
     * @brief Read at most max_bytes from the start of the payload
     */
    [[nodiscard]] auto read_head(std::size_t max_bytes) const -> result<std::vector<std::byte>>;

private:
    upload_source() = default;

    std::string filename_;
    std::string mime_type_;
    std::optional<std::filesystem::path> path_;
    std::shared_ptr<const std::vector<std::byte>> data_;
};

/**
 * @brief Bytes read from each JPEG when looking for its capture time
 */
inline constexpr std::size_t capture_date_scan_bytes = 128 * 1024;

/**
 * @brief Order sources by EXIF capture time
 *
 * JPEG sources whose EXIF carries DateTimeOriginal, DateTimeDigitized or
 * DateTime come first, oldest first. The rest follow in natural file name
 * order. Sources that cannot be read count as undated.
 */
void sort_by_capture_date(std::vector<upload_source>& sources);

/**
 * @brief Snapshot of one task
 *
 * Delivered through on_file_update and get_task(); never a live reference
 * into the engine.
 */
struct upload_task {
    std::string id;
    std::string filename;
    std::string mime_type;
    upload_status status = upload_status::pending;
    double progress = 0.0;                       ///< 0-100
    std::optional<std::string> error_message;
    std::optional<error_code> last_error;
    uint64_t original_size = 0;
    uint64_t compressed_size = 0;                ///< Bytes sent; 0 until known
    double compression_ratio = 1.0;              ///< original / compressed
    std::optional<std::string> storage_path;
    std::optional<std::string> image_id;         ///< Set once confirmed
    std::size_t attempts = 0;                    ///< Times the task was admitted
};

/**
 * @brief Handle to a task owned by an engine
 *
 * The handle refers to the engine that created it and must not outlive it.
 */
class upload_handle {
public:
    upload_handle() = default;
    upload_handle(std::string id, const upload_engine* engine);

    upload_handle(const upload_handle&) = default;
    upload_handle(upload_handle&&) noexcept = default;
    auto operator=(const upload_handle&) -> upload_handle& = default;
    auto operator=(upload_handle&&) noexcept -> upload_handle& = default;

    [[nodiscard]] auto get_id() const noexcept -> const std::string& { return id_; }
    [[nodiscard]] auto is_valid() const noexcept -> bool;

    /**
     * @brief Current status, or an error once the engine has been destroyed
     */
    [[nodiscard]] auto get_status() const -> result<upload_status>;

    /**
     * @brief Current snapshot of the task
     */
    [[nodiscard]] auto get_task() const -> result<upload_task>;

private:
    std::string id_;
    const upload_engine* engine_ = nullptr;
};

/**
 * @brief Aggregate view over an engine's tasks
 *
 * Computed on demand from the task registry.
 */
struct batch_stats {
    std::size_t total_files = 0;
    std::size_t pending = 0;
    std::size_t compressing = 0;
    std::size_t uploading = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;

    uint64_t total_bytes = 0;           ///< Original bytes across all tasks
    uint64_t total_upload_bytes = 0;    ///< Bytes to send; compressed size once known
    uint64_t uploaded_bytes = 0;        ///< Bytes sent by completed tasks
    uint64_t compression_savings = 0;   ///< Original minus compressed, completed tasks

    double average_speed = 0.0;         ///< Bytes per second since processing started
    std::optional<double> estimated_seconds_remaining;  ///< Unset until speed is known

    std::size_t current_concurrency = 0;
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] auto active() const noexcept -> std::size_t {
        return compressing + uploading;
    }

    [[nodiscard]] auto completion_percentage() const noexcept -> double {
        if (total_upload_bytes == 0) return 0.0;
        return static_cast<double>(uploaded_bytes) /
               static_cast<double>(total_upload_bytes) * 100.0;
    }

    [[nodiscard]] auto is_idle() const noexcept -> bool {
        return pending == 0 && active() == 0;
    }
};

using file_update_callback = std::function<void(const upload_task&)>;
using batch_complete_callback = std::function<void(std::size_t succeeded, std::size_t failed)>;
using all_complete_callback = std::function<void()>;
using stats_update_callback = std::function<void(const batch_stats&)>;

}  // namespace kcenon::image_upload

#endif  // KCENON_IMAGE_UPLOAD_CLIENT_UPLOAD_TYPES_H
