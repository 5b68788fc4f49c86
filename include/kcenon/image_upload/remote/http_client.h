/**
 * @file http_client.h
 * @brief HTTP client adapter used by the remote upload API
 *
 * Wraps the network_system HTTP client behind http_client_interface so the
 * allocation, transfer and confirmation calls can be exercised against a fake
 * in tests.
 */

#ifndef KCENON_IMAGE_UPLOAD_REMOTE_HTTP_CLIENT_H
#define KCENON_IMAGE_UPLOAD_REMOTE_HTTP_CLIENT_H

#include "kcenon/image_upload/core/logging.h"
#include "kcenon/image_upload/core/types.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::image_upload {

/**
 * @brief HTTP response
 */
struct http_response {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    [[nodiscard]] auto get_body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Get header value by key (case-insensitive)
     */
    [[nodiscard]] auto get_header(const std::string& key) const -> std::optional<std::string> {
        auto it = headers.find(key);
        if (it != headers.end()) {
            return it->second;
        }

        auto equals_ignore_case = [](const std::string& a, const std::string& b) {
            return a.size() == b.size() &&
                   std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
                       return std::tolower(x) == std::tolower(y);
                   });
        };
        for (const auto& [k, v] : headers) {
            if (equals_ignore_case(k, key)) {
                return v;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] auto is_success() const -> bool {
        return status_code >= 200 && status_code < 300;
    }

    [[nodiscard]] auto is_client_error() const -> bool {
        return status_code >= 400 && status_code < 500;
    }

    [[nodiscard]] auto is_server_error() const -> bool {
        return status_code >= 500 && status_code < 600;
    }
};

/**
 * @brief Minimal HTTP surface needed by the upload API
 */
class http_client_interface {
public:
    virtual ~http_client_interface() = default;

    [[nodiscard]] virtual auto post(const std::string& url,
                                    const std::string& body,
                                    const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;

    [[nodiscard]] virtual auto put(const std::string& url,
                                   std::span<const std::byte> body,
                                   const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;

    [[nodiscard]] virtual auto del(const std::string& url,
                                   const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;
};

/**
 * @brief Retry policy for remote calls
 */
struct retry_policy {
    std::size_t max_attempts = 3;
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    double backoff_multiplier = 2.0;
    bool use_jitter = true;
    bool retry_on_rate_limit = true;        ///< 429 and 503
    bool retry_on_connection_error = true;
    bool retry_on_server_error = true;      ///< other 5xx

    /**
     * @brief Single attempt, no retry
     */
    [[nodiscard]] static auto none() -> retry_policy {
        retry_policy policy;
        policy.max_attempts = 1;
        return policy;
    }
};

/**
 * @brief Exponential backoff delay before the next attempt
 * @param policy Retry policy
 * @param attempt Attempt that just failed (1-based)
 */
[[nodiscard]] auto calculate_retry_delay(const retry_policy& policy, std::size_t attempt)
    -> std::chrono::milliseconds;

/**
 * @brief Whether a response status is worth retrying under the policy
 */
[[nodiscard]] auto is_retryable_status(int status_code, const retry_policy& policy) -> bool;

/**
 * @brief Run a request with retries
 *
 * Connection failures and retryable statuses are retried up to
 * policy.max_attempts. The final response is returned even when its status
 * is not a success; the caller maps it to a domain error.
 */
template <typename RequestFunc>
[[nodiscard]] auto execute_with_retry(RequestFunc&& request_func,
                                      const retry_policy& policy,
                                      std::string_view operation) -> result<http_response> {
    std::size_t attempt = 0;

    while (true) {
        ++attempt;
        result<http_response> response = request_func();

        bool retry = false;
        if (!response.has_value()) {
            retry = policy.retry_on_connection_error;
        } else if (!response.value().is_success()) {
            retry = is_retryable_status(response.value().status_code, policy);
        }

        if (!retry || attempt >= policy.max_attempts) {
            return response;
        }

        auto delay = calculate_retry_delay(policy, attempt);
        IU_LOG_WARN(log_category::transfer,
            std::string(operation) + " attempt " + std::to_string(attempt) + " failed (" +
            (response.has_value() ? "HTTP " + std::to_string(response.value().status_code)
                                  : response.error().message) +
            "), retrying in " + std::to_string(delay.count()) + "ms");
        std::this_thread::sleep_for(delay);
    }
}

/**
 * @brief http_client_interface backed by network_system
 *
 * Without network_system every request fails with internal_error.
 *
 * @note Thread-safe for concurrent requests.
 */
class network_http_client : public http_client_interface {
public:
    /**
     * @brief Construct with a per-request timeout
     */
    explicit network_http_client(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    ~network_http_client() override;

    network_http_client(const network_http_client&) = delete;
    auto operator=(const network_http_client&) -> network_http_client& = delete;
    network_http_client(network_http_client&&) noexcept;
    auto operator=(network_http_client&&) noexcept -> network_http_client&;

    [[nodiscard]] auto post(const std::string& url,
                            const std::string& body,
                            const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    [[nodiscard]] auto put(const std::string& url,
                           std::span<const std::byte> body,
                           const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    [[nodiscard]] auto del(const std::string& url,
                           const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    /**
     * @brief Whether network_system is compiled in
     */
    [[nodiscard]] auto is_available() const noexcept -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Create the default HTTP client
 */
[[nodiscard]] auto make_http_client(
    std::chrono::milliseconds timeout = std::chrono::milliseconds(30000))
    -> std::shared_ptr<http_client_interface>;

}  // namespace kcenon::image_upload

#endif  // KCENON_IMAGE_UPLOAD_REMOTE_HTTP_CLIENT_H
