/**
 * @file http_upload_api.cpp
 * @brief HTTP/JSON implementations of the remote upload interfaces
 */

#include "kcenon/image_upload/remote/http_upload_api.h"

#include <regex>
#include <sstream>

namespace kcenon::image_upload {

// ============================================================================
// JSON helpers
// ============================================================================

namespace json {

namespace {

void append_utf8(std::string& out, uint32_t code_point) {
    if (code_point < 0x80) {
        out += static_cast<char>(code_point);
    } else if (code_point < 0x800) {
        out += static_cast<char>(0xC0 | (code_point >> 6));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (code_point >> 12));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    }
}

auto unescape(const std::string& input) -> std::string {
    std::string out;
    out.reserve(input.size());
    for (std::size_t i = 0; i < input.size(); ++i) {
        if (input[i] != '\\' || i + 1 >= input.size()) {
            out += input[i];
            continue;
        }
        char next = input[++i];
        switch (next) {
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'u':
                if (i + 4 < input.size()) {
                    auto hex = input.substr(i + 1, 4);
                    if (hex.find_first_not_of("0123456789abcdefABCDEF") == std::string::npos) {
                        append_utf8(out, static_cast<uint32_t>(std::stoul(hex, nullptr, 16)));
                        i += 4;
                        break;
                    }
                }
                out += "\\u";
                break;
            default:
                out += next;  // \" \\ \/
        }
    }
    return out;
}

/**
 * @brief Position just past '[' of "key": [ or npos
 */
auto find_array(const std::string& document, const std::string& key) -> std::size_t {
    std::regex re("\"" + key + "\"\\s*:\\s*\\[");
    std::smatch match;
    if (!std::regex_search(document, match, re)) {
        return std::string::npos;
    }
    return static_cast<std::size_t>(match.position(0) + match.length(0));
}

/**
 * @brief Index of the closing quote of the string starting at open_quote
 */
auto skip_string(const std::string& text, std::size_t open_quote) -> std::size_t {
    for (std::size_t i = open_quote + 1; i < text.size(); ++i) {
        if (text[i] == '\\') {
            ++i;
        } else if (text[i] == '"') {
            return i;
        }
    }
    return std::string::npos;
}

}  // namespace

auto escape(const std::string& input) -> std::string {
    return detail::escape_json_string(input);
}

auto extract_string(const std::string& object, const std::string& key)
    -> std::optional<std::string> {
    std::regex re("\"" + key + "\"\\s*:\\s*\"((?:[^\"\\\\]|\\\\.)*)\"");
    std::smatch match;

    if (std::regex_search(object, match, re) && match.size() > 1) {
        return unescape(match[1].str());
    }
    return std::nullopt;
}

auto extract_integer(const std::string& object, const std::string& key)
    -> std::optional<int64_t> {
    std::regex re("\"" + key + "\"\\s*:\\s*(-?\\d+)");
    std::smatch match;

    if (std::regex_search(object, match, re) && match.size() > 1) {
        return std::stoll(match[1].str());
    }
    return std::nullopt;
}

auto extract_object_array(const std::string& document, const std::string& key)
    -> std::vector<std::string> {
    std::vector<std::string> objects;
    auto pos = find_array(document, key);
    if (pos == std::string::npos) {
        return objects;
    }

    int depth = 0;
    std::size_t start = 0;
    for (std::size_t i = pos; i < document.size(); ++i) {
        char c = document[i];
        if (c == '"') {
            i = skip_string(document, i);
            if (i == std::string::npos) break;
        } else if (c == '{') {
            if (depth++ == 0) start = i;
        } else if (c == '}') {
            if (--depth == 0) objects.push_back(document.substr(start, i - start + 1));
        } else if (c == ']' && depth == 0) {
            break;
        }
    }
    return objects;
}

auto extract_string_array(const std::string& document, const std::string& key)
    -> std::vector<std::string> {
    std::vector<std::string> values;
    auto pos = find_array(document, key);
    if (pos == std::string::npos) {
        return values;
    }

    for (std::size_t i = pos; i < document.size(); ++i) {
        if (document[i] == ']') {
            break;
        }
        if (document[i] == '"') {
            auto end = skip_string(document, i);
            if (end == std::string::npos) break;
            values.push_back(unescape(document.substr(i + 1, end - i - 1)));
            i = end;
        }
    }
    return values;
}

}  // namespace json

namespace {

auto json_headers(const std::map<std::string, std::string>& extra)
    -> std::map<std::string, std::string> {
    auto headers = extra;
    headers["Content-Type"] = "application/json";
    headers.emplace("Accept", "application/json");
    return headers;
}

auto describe_status(const http_response& response) -> std::string {
    auto body = response.get_body_string();
    if (body.size() > 200) {
        body = body.substr(0, 200) + "...";
    }
    return "HTTP " + std::to_string(response.status_code) + (body.empty() ? "" : ": " + body);
}

/**
 * @brief Map a transport failure or non-2xx status to a domain error
 */
auto to_domain_error(const result<http_response>& response, error_code failed,
                     error_code rejected, std::string_view operation) -> error {
    if (!response.has_value()) {
        return error{failed, std::string(operation) + ": " + response.error().message};
    }
    const auto& value = response.value();
    bool permanent = value.is_client_error() && value.status_code != 429;
    return error{permanent ? rejected : failed,
                 std::string(operation) + " failed with " + describe_status(value)};
}

auto to_epoch_ms(std::chrono::system_clock::time_point tp) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

auto parse_destination(const std::string& object, const std::string& fallback_id,
                       std::chrono::milliseconds default_validity)
    -> std::optional<upload_destination> {
    auto signed_url = json::extract_string(object, "signedUrl");
    auto storage_path = json::extract_string(object, "storagePath");
    if (!signed_url || !storage_path) {
        return std::nullopt;
    }

    upload_destination destination;
    destination.local_id = json::extract_string(object, "localId").value_or(fallback_id);
    destination.signed_url = *signed_url;
    destination.storage_path = *storage_path;
    destination.token = json::extract_string(object, "token").value_or("");

    if (auto expires = json::extract_integer(object, "expiresAt")) {
        destination.expires_at =
            std::chrono::system_clock::time_point(std::chrono::milliseconds(*expires));
    } else {
        destination.expires_at = std::chrono::system_clock::now() + default_validity;
    }
    return destination;
}

}  // namespace

// ============================================================================
// http_destination_allocator
// ============================================================================

http_destination_allocator::http_destination_allocator(
    std::shared_ptr<http_client_interface> client, http_api_config config)
    : client_(std::move(client)), config_(std::move(config)) {}

auto http_destination_allocator::allocate(const std::string& container_id,
                                          const std::vector<upload_descriptor>& descriptors)
    -> result<std::vector<upload_destination>> {
    if (descriptors.empty()) {
        return std::vector<upload_destination>{};
    }

    std::ostringstream body;
    body << "{\"containerId\":\"" << json::escape(container_id) << "\",\"files\":[";
    for (std::size_t i = 0; i < descriptors.size(); ++i) {
        const auto& d = descriptors[i];
        if (i > 0) body << ",";
        body << "{\"localId\":\"" << json::escape(d.local_id) << "\""
             << ",\"mimeType\":\"" << json::escape(d.mime_type) << "\""
             << ",\"fileSize\":" << d.file_size
             << ",\"originalFilename\":\"" << json::escape(d.filename) << "\"}";
    }
    body << "]}";

    auto headers = json_headers(config_.headers);
    auto payload = body.str();
    auto response = execute_with_retry(
        [&]() { return client_->post(config_.allocation_url, payload, headers); },
        config_.retry, "Destination allocation");

    if (!response.has_value() || !response.value().is_success()) {
        return unexpected{to_domain_error(response, error_code::allocation_failed,
                                          error_code::allocation_rejected,
                                          "Destination allocation")};
    }

    const auto document = response.value().get_body_string();
    std::vector<upload_destination> destinations;

    auto objects = json::extract_object_array(document, "destinations");
    if (objects.empty() && descriptors.size() == 1) {
        // Single-file endpoints answer with a bare destination object
        objects.push_back(document);
    }

    for (const auto& object : objects) {
        auto fallback_id = descriptors.size() == 1 ? descriptors.front().local_id : std::string{};
        if (auto destination = parse_destination(object, fallback_id, config_.default_validity)) {
            destinations.push_back(std::move(*destination));
        } else {
            IU_LOG_WARN(log_category::preflight,
                "Ignoring destination without signedUrl or storagePath");
        }
    }

    if (destinations.empty()) {
        return unexpected{error{error_code::allocation_incomplete,
            "Allocation response contained no usable destinations"}};
    }
    return destinations;
}

auto http_destination_allocator::release(const std::string& container_id,
                                         const std::vector<upload_destination>& destinations)
    -> result<void> {
    if (!config_.release_url || destinations.empty()) {
        return {};
    }

    std::ostringstream body;
    body << "{\"containerId\":\"" << json::escape(container_id) << "\",\"uploads\":[";
    for (std::size_t i = 0; i < destinations.size(); ++i) {
        if (i > 0) body << ",";
        body << "{\"storagePath\":\"" << json::escape(destinations[i].storage_path) << "\""
             << ",\"token\":\"" << json::escape(destinations[i].token) << "\"}";
    }
    body << "]}";

    auto headers = json_headers(config_.headers);
    auto payload = body.str();
    auto response = execute_with_retry(
        [&]() { return client_->post(*config_.release_url, payload, headers); },
        config_.retry, "Destination release");

    if (!response.has_value() || !response.value().is_success()) {
        return unexpected{to_domain_error(response, error_code::allocation_failed,
                                          error_code::allocation_rejected,
                                          "Destination release")};
    }
    return {};
}

// ============================================================================
// http_blob_transport
// ============================================================================

http_blob_transport::http_blob_transport(std::shared_ptr<http_client_interface> client,
                                         retry_policy retry)
    : client_(std::move(client)), retry_(retry) {}

auto http_blob_transport::put(const upload_destination& destination,
                              std::span<const std::byte> payload,
                              const std::string& content_type,
                              const transfer_progress_callback& on_progress)
    -> result<void> {
    if (destination.is_expired()) {
        return unexpected{error{error_code::destination_expired,
            "Destination for " + destination.storage_path + " has expired"}};
    }

    const auto total = static_cast<uint64_t>(payload.size());
    if (on_progress) {
        on_progress(0, total);
    }

    std::map<std::string, std::string> headers{
        {"Content-Type", content_type},
        {"Content-Length", std::to_string(total)},
    };

    auto response = execute_with_retry(
        [&]() { return client_->put(destination.signed_url, payload, headers); },
        retry_, "Transfer");

    if (!response.has_value() || !response.value().is_success()) {
        return unexpected{to_domain_error(response, error_code::transfer_failed,
                                          error_code::transfer_rejected, "Transfer")};
    }

    if (on_progress) {
        on_progress(total, total);
    }
    return {};
}

// ============================================================================
// http_upload_confirmer
// ============================================================================

http_upload_confirmer::http_upload_confirmer(std::shared_ptr<http_client_interface> client,
                                             http_api_config config)
    : client_(std::move(client)), config_(std::move(config)) {}

auto http_upload_confirmer::confirm(const std::string& container_id,
                                    const std::vector<confirmation_record>& uploads)
    -> result<std::vector<std::string>> {
    if (uploads.empty()) {
        return std::vector<std::string>{};
    }

    std::ostringstream body;
    body << "{\"containerId\":\"" << json::escape(container_id) << "\",\"uploads\":[";
    for (std::size_t i = 0; i < uploads.size(); ++i) {
        const auto& u = uploads[i];
        if (i > 0) body << ",";
        body << "{\"storagePath\":\"" << json::escape(u.storage_path) << "\""
             << ",\"token\":\"" << json::escape(u.token) << "\""
             << ",\"originalFilename\":\"" << json::escape(u.original_filename) << "\""
             << ",\"fileSize\":" << u.file_size
             << ",\"mimeType\":\"" << json::escape(u.mime_type) << "\"";
        if (u.width) body << ",\"width\":" << *u.width;
        if (u.height) body << ",\"height\":" << *u.height;
        body << "}";
    }
    body << "]}";

    auto headers = json_headers(config_.headers);
    auto payload = body.str();
    auto response = execute_with_retry(
        [&]() { return client_->post(config_.confirmation_url, payload, headers); },
        config_.retry, "Confirmation");

    if (!response.has_value() || !response.value().is_success()) {
        return unexpected{to_domain_error(response, error_code::confirmation_failed,
                                          error_code::confirmation_rejected, "Confirmation")};
    }

    return json::extract_string_array(response.value().get_body_string(), "imageIds");
}

}  // namespace kcenon::image_upload
