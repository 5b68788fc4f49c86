/**
 * @file session_id.cpp
 * @brief Implementation of session_id generation and formatting
 */

#include "kcenon/image_upload/core/session_id.h"

#include <cctype>
#include <iomanip>
#include <sstream>

#include <openssl/rand.h>

namespace kcenon::image_upload {

auto session_id::generate() -> result<session_id> {
    session_id id;

    if (RAND_bytes(id.bytes.data(), static_cast<int>(id.bytes.size())) != 1) {
        return unexpected{error{error_code::internal_error,
            "Failed to generate session identifier"}};
    }

    // Version 4, RFC 4122 variant
    id.bytes[6] = static_cast<uint8_t>((id.bytes[6] & 0x0F) | 0x40);
    id.bytes[8] = static_cast<uint8_t>((id.bytes[8] & 0x3F) | 0x80);

    return id;
}

auto session_id::to_string() const -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

auto session_id::from_string(std::string_view str) -> std::optional<session_id> {
    if (str.size() != 36) {
        return std::nullopt;
    }

    session_id id;
    std::size_t index = 0;
    for (std::size_t i = 0; i < str.size();) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (str[i] != '-') {
                return std::nullopt;
            }
            ++i;
            continue;
        }
        if (!std::isxdigit(static_cast<unsigned char>(str[i])) ||
            !std::isxdigit(static_cast<unsigned char>(str[i + 1]))) {
            return std::nullopt;
        }
        id.bytes[index++] = static_cast<uint8_t>(
            std::stoi(std::string(str.substr(i, 2)), nullptr, 16));
        i += 2;
    }
    return id;
}

}  // namespace kcenon::image_upload
