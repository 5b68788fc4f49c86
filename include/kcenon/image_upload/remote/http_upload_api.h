/**
 * @file http_upload_api.h
 * @brief HTTP/JSON implementations of the remote upload interfaces
 *
 * Wire format (JSON over HTTP POST):
 *
 * Allocation request / response
 * @code
 * {"containerId":"g1","files":[{"localId":"t1","mimeType":"image/jpeg",
 *   "fileSize":1024,"originalFilename":"a.jpg"}]}
 * {"destinations":[{"localId":"t1","signedUrl":"https://...","storagePath":"g1/x.jpg",
 *   "token":"...","expiresAt":1767225600000}]}
 * @endcode
 *
 * Confirmation request / response
 * @code
 * {"containerId":"g1","uploads":[{"storagePath":"g1/x.jpg","token":"...",
 *   "originalFilename":"a.jpg","fileSize":1024,"mimeType":"image/jpeg",
 *   "width":800,"height":600}]}
 * {"imageIds":["img-1"]}
 * @endcode
 *
 * expiresAt is milliseconds since the Unix epoch.
 */

#ifndef KCENON_IMAGE_UPLOAD_REMOTE_HTTP_UPLOAD_API_H
#define KCENON_IMAGE_UPLOAD_REMOTE_HTTP_UPLOAD_API_H

#include "http_client.h"
#include "upload_api.h"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::image_upload {

/**
 * @brief Endpoints and policy for the HTTP upload API
 */
struct http_api_config {
    std::string allocation_url;
    std::string confirmation_url;
    std::optional<std::string> release_url;        ///< Unset: reservations lapse on expiry
    std::map<std::string, std::string> headers;    ///< Added to allocation/confirmation calls
    retry_policy retry;

    /// Validity assumed when the server omits expiresAt
    std::chrono::milliseconds default_validity{std::chrono::minutes(4)};
};

/**
 * @brief destination_allocator over HTTP
 */
class http_destination_allocator : public destination_allocator {
public:
    http_destination_allocator(std::shared_ptr<http_client_interface> client,
                               http_api_config config);

    [[nodiscard]] auto allocate(const std::string& container_id,
                                const std::vector<upload_descriptor>& descriptors)
        -> result<std::vector<upload_destination>> override;

    [[nodiscard]] auto release(const std::string& container_id,
                               const std::vector<upload_destination>& destinations)
        -> result<void> override;

private:
    std::shared_ptr<http_client_interface> client_;
    http_api_config config_;
};

/**
 * @brief blob_transport that PUTs the payload to the signed URL
 *
 * network_system sends the body in one call, so progress is reported at the
 * start and on completion.
 */
class http_blob_transport : public blob_transport {
public:
    http_blob_transport(std::shared_ptr<http_client_interface> client,
                        retry_policy retry = {});

    [[nodiscard]] auto put(const upload_destination& destination,
                           std::span<const std::byte> payload,
                           const std::string& content_type,
                           const transfer_progress_callback& on_progress)
        -> result<void> override;

private:
    std::shared_ptr<http_client_interface> client_;
    retry_policy retry_;
};

/**
 * @brief upload_confirmer over HTTP
 */
class http_upload_confirmer : public upload_confirmer {
public:
    http_upload_confirmer(std::shared_ptr<http_client_interface> client,
                          http_api_config config);

    [[nodiscard]] auto confirm(const std::string& container_id,
                               const std::vector<confirmation_record>& uploads)
        -> result<std::vector<std::string>> override;

private:
    std::shared_ptr<http_client_interface> client_;
    http_api_config config_;
};

namespace json {

/**
 * @brief Escape a string for embedding in a JSON document
 */
[[nodiscard]] auto escape(const std::string& input) -> std::string;

/**
 * @brief Extract a string member value from a flat JSON object
 */
[[nodiscard]] auto extract_string(const std::string& object, const std::string& key)
    -> std::optional<std::string>;

/**
 * @brief Extract an integer member value from a flat JSON object
 */
[[nodiscard]] auto extract_integer(const std::string& object, const std::string& key)
    -> std::optional<int64_t>;

/**
 * @brief Split the objects of a named array of flat objects
 */
[[nodiscard]] auto extract_object_array(const std::string& document, const std::string& key)
    -> std::vector<std::string>;

/**
 * @brief Extract the values of a named array of strings
 */
[[nodiscard]] auto extract_string_array(const std::string& document, const std::string& key)
    -> std::vector<std::string>;

}  // namespace json

}  // namespace kcenon::image_upload

#endif  // KCENON_IMAGE_UPLOAD_REMOTE_HTTP_UPLOAD_API_H
