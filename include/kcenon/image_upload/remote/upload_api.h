/**
 * @file upload_api.h
 * @brief Interfaces to the remote services an upload depends on
 *
 * The upload engine talks to three collaborators:
 * - destination_allocator hands out pre-authorized write destinations
 * - blob_transport writes the payload to a destination
 * - upload_confirmer records finished uploads durably
 *
 * HTTP implementations live in http_upload_api.h; tests substitute fakes.
 */

#ifndef KCENON_IMAGE_UPLOAD_REMOTE_UPLOAD_API_H
#define KCENON_IMAGE_UPLOAD_REMOTE_UPLOAD_API_H

#include "kcenon/image_upload/core/types.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace kcenon::image_upload {

/**
 * @brief What the allocator needs to know about one file
 */
struct upload_descriptor {
    std::string local_id;   ///< Task identity; allocation is idempotent on it
    std::string filename;
    std::string mime_type;
    uint64_t file_size = 0;
};

/**
 * @brief Authorization to write exactly one object
 */
struct upload_destination {
    std::string local_id;
    std::string signed_url;
    std::string storage_path;
    std::string token;
    std::chrono::system_clock::time_point expires_at{};

    [[nodiscard]] auto is_expired(std::chrono::system_clock::time_point now =
                                      std::chrono::system_clock::now()) const -> bool {
        return now >= expires_at;
    }

    /**
     * @brief Whether the destination expires within the given margin
     */
    [[nodiscard]] auto expires_within(std::chrono::milliseconds margin,
                                      std::chrono::system_clock::time_point now =
                                          std::chrono::system_clock::now()) const -> bool {
        return now + margin >= expires_at;
    }

    [[nodiscard]] auto operator==(const upload_destination& other) const -> bool = default;
};

/**
 * @brief One finished upload to be recorded
 */
struct confirmation_record {
    std::string storage_path;
    std::string token;
    std::string original_filename;
    uint64_t file_size = 0;
    std::string mime_type;
    std::optional<uint32_t> width;
    std::optional<uint32_t> height;
};

/**
 * @brief Progress callback for a transfer (bytes sent, total bytes)
 */
using transfer_progress_callback = std::function<void(uint64_t, uint64_t)>;

/**
 * @brief Allocates upload destinations
 */
class destination_allocator {
public:
    virtual ~destination_allocator() = default;

    /**
     * @brief Allocate one destination per descriptor
     * @param container_id Container the objects will belong to
     * @param descriptors Files to allocate for
     * @return Destinations keyed by local_id (order not significant)
     *
     * Must be idempotent per local_id.
     */
    [[nodiscard]] virtual auto allocate(const std::string& container_id,
                                        const std::vector<upload_descriptor>& descriptors)
        -> result<std::vector<upload_destination>> = 0;

    /**
     * @brief Release destinations that will not be used
     *
     * Protocols whose reservations lapse on their own keep the default.
     */
    [[nodiscard]] virtual auto release(const std::string& container_id,
                                       const std::vector<upload_destination>& destinations)
        -> result<void> {
        (void)container_id;
        (void)destinations;
        return {};
    }
};

/**
 * @brief Writes payload bytes to a destination
 */
class blob_transport {
public:
    virtual ~blob_transport() = default;

    /**
     * @brief Upload the payload to destination.signed_url
     * @param destination Target destination
     * @param payload Bytes to write
     * @param content_type Mime type sent as Content-Type
     * @param on_progress Invoked for every observable chunk sent (may be empty)
     */
    [[nodiscard]] virtual auto put(const upload_destination& destination,
                                   std::span<const std::byte> payload,
                                   const std::string& content_type,
                                   const transfer_progress_callback& on_progress)
        -> result<void> = 0;
};

/**
 * @brief Creates durable records for finished uploads
 */
class upload_confirmer {
public:
    virtual ~upload_confirmer() = default;

    /**
     * @brief Record uploads in a container
     * @return Identifiers of the created (or already existing) records
     *
     * Repeating a call for the same (storage_path, token) must not create
     * duplicate records.
     */
    [[nodiscard]] virtual auto confirm(const std::string& container_id,
                                       const std::vector<confirmation_record>& uploads)
        -> result<std::vector<std::string>> = 0;
};

}  // namespace kcenon::image_upload

#endif  // KCENON_IMAGE_UPLOAD_REMOTE_UPLOAD_API_H
