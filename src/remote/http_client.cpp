/**
 * @file http_client.cpp
 * @brief network_system HTTP client adapter
 */

#include "kcenon/image_upload/remote/http_client.h"

#include <random>

#include "kcenon/image_upload/config/feature_flags.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace kcenon::image_upload {

#if !KCENON_WITH_NETWORK_SYSTEM
namespace {

auto unavailable() -> result<http_response> {
    return unexpected{error{error_code::internal_error,
        "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}};
}

}  // namespace
#endif

// ============================================================================
// Implementation
// ============================================================================

struct network_http_client::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif
    bool available = false;

    explicit impl(std::chrono::milliseconds timeout) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
        available = true;
#else
        (void)timeout;
#endif
    }

#if KCENON_WITH_NETWORK_SYSTEM
    static auto convert_response(const kcenon::network::internal::http_response& resp)
        -> http_response {
        http_response converted;
        converted.status_code = resp.status_code;
        converted.headers = resp.headers;
        converted.body = std::vector<uint8_t>(resp.body.begin(), resp.body.end());
        return converted;
    }

    template <typename Response>
    static auto finish(Response&& response, const char* method) -> result<http_response> {
        if (response.is_err()) {
            return unexpected{error{error_code::transfer_failed,
                std::string("HTTP ") + method + " request failed"}};
        }
        return convert_response(response.value());
    }
#endif
};

// ============================================================================
// Constructor / Destructor
// ============================================================================

network_http_client::network_http_client(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

network_http_client::~network_http_client() = default;

network_http_client::network_http_client(network_http_client&&) noexcept = default;
auto network_http_client::operator=(network_http_client&&) noexcept
    -> network_http_client& = default;

// ============================================================================
// HTTP Operations
// ============================================================================

auto network_http_client::post(const std::string& url,
                               const std::string& body,
                               const std::map<std::string, std::string>& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    return impl::finish(impl_->client->post(url, body, headers), "POST");
#else
    (void)url;
    (void)body;
    (void)headers;
    return unavailable();
#endif
}

auto network_http_client::put(const std::string& url,
                              std::span<const std::byte> body,
                              const std::map<std::string, std::string>& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    std::string payload(reinterpret_cast<const char*>(body.data()), body.size());
    return impl::finish(impl_->client->put(url, payload, headers), "PUT");
#else
    (void)url;
    (void)body;
    (void)headers;
    return unavailable();
#endif
}

auto network_http_client::del(const std::string& url,
                              const std::map<std::string, std::string>& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    return impl::finish(impl_->client->del(url, headers), "DELETE");
#else
    (void)url;
    (void)headers;
    return unavailable();
#endif
}

auto network_http_client::is_available() const noexcept -> bool {
    return impl_->available;
}

// ============================================================================
// Retry helpers
// ============================================================================

auto calculate_retry_delay(const retry_policy& policy, std::size_t attempt)
    -> std::chrono::milliseconds {
    auto delay = static_cast<double>(policy.initial_delay.count());

    for (std::size_t i = 1; i < attempt; ++i) {
        delay *= policy.backoff_multiplier;
    }

    delay = std::min(delay, static_cast<double>(policy.max_delay.count()));

    if (policy.use_jitter) {
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_real_distribution<> dis(0.5, 1.5);
        delay *= dis(gen);
    }

    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

auto is_retryable_status(int status_code, const retry_policy& policy) -> bool {
    if (policy.retry_on_rate_limit && (status_code == 429 || status_code == 503)) {
        return true;
    }
    if (policy.retry_on_server_error && status_code >= 500 && status_code < 600) {
        return true;
    }
    return false;
}

auto make_http_client(std::chrono::milliseconds timeout)
    -> std::shared_ptr<http_client_interface> {
    return std::make_shared<network_http_client>(timeout);
}

}  // namespace kcenon::image_upload
