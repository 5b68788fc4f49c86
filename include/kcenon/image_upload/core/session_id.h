/**
 * @file session_id.h
 * @brief Random identifiers for upload sessions
 */

#ifndef KCENON_IMAGE_UPLOAD_CORE_SESSION_ID_H
#define KCENON_IMAGE_UPLOAD_CORE_SESSION_ID_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "kcenon/image_upload/core/types.h"

namespace kcenon::image_upload {

/**
 * @brief RFC 4122 version 4 identifier
 *
 * Every engine draws one at build time; its task ids are
 * "<session>-<sequence>", so ids from independent engines never collide.
 */
struct session_id {
    std::array<uint8_t, 16> bytes{};

    /**
     * @brief Draw a new identifier from the OpenSSL CSPRNG
     */
    [[nodiscard]] static auto generate() -> result<session_id>;

    /**
     * @brief Canonical xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx form
     */
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] static auto from_string(std::string_view str) -> std::optional<session_id>;

    [[nodiscard]] auto operator==(const session_id& other) const -> bool = default;
};

}  // namespace kcenon::image_upload

#endif  // KCENON_IMAGE_UPLOAD_CORE_SESSION_ID_H
