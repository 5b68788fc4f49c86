/**
 * @file image_upload.h
 * @brief Main header for image_upload_system library
 * @version 0.1.0
 *
 * Include this header to access the upload engine, its collaborators and the
 * HTTP implementations of the remote interfaces.
 *
 * @code
 * #include <kcenon/image_upload/image_upload.h>
 *
 * using namespace kcenon::image_upload;
 *
 * auto http = make_http_client();
 * http_api_config api;
 * api.allocation_url = "https://api.example.com/uploads/allocate";
 * api.confirmation_url = "https://api.example.com/uploads/confirm";
 *
 * auto engine = upload_engine::builder()
 *     .with_container_id("gallery-42")
 *     .with_allocator(std::make_shared<http_destination_allocator>(http, api))
 *     .with_transport(std::make_shared<http_blob_transport>(http))
 *     .with_confirmer(std::make_shared<http_upload_confirmer>(http, api))
 *     .build();
 * @endcode
 */

#ifndef KCENON_IMAGE_UPLOAD_IMAGE_UPLOAD_H
#define KCENON_IMAGE_UPLOAD_IMAGE_UPLOAD_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/image_upload/core/types.h"
#include "kcenon/image_upload/core/concurrency_controller.h"
#include "kcenon/image_upload/core/exif_metadata.h"
#include "kcenon/image_upload/core/image_compressor.h"
#include "kcenon/image_upload/core/session_id.h"

// Remote interfaces
#include "kcenon/image_upload/remote/upload_api.h"
#include "kcenon/image_upload/remote/http_upload_api.h"

// Client
#include "kcenon/image_upload/client/upload_types.h"
#include "kcenon/image_upload/client/preflight_optimizer.h"
#include "kcenon/image_upload/client/confirmation_batcher.h"
#include "kcenon/image_upload/client/upload_engine.h"

// Adapters
#include "kcenon/image_upload/adapters/monitorable_adapter.h"
#include "kcenon/image_upload/adapters/thread_pool_adapter.h"

namespace kcenon::image_upload {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::image_upload

#endif  // KCENON_IMAGE_UPLOAD_IMAGE_UPLOAD_H
