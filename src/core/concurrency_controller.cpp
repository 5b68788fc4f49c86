/**
 * @file concurrency_controller.cpp
 * @brief Implementation of adaptive concurrency control
 */

#include "kcenon/image_upload/core/concurrency_controller.h"
#include "kcenon/image_upload/core/logging.h"

#include <algorithm>
#include <cmath>
#include <deque>
#include <mutex>
#include <numeric>
#include <optional>
#include <thread>

namespace kcenon::image_upload {

namespace {

using clock_type = std::chrono::steady_clock;

/**
 * @brief One upload outcome in the rolling history
 */
struct outcome_sample {
    bool success;
    uint64_t bytes;
    std::chrono::milliseconds duration;
};

auto normalize(concurrency_config cfg) -> concurrency_config {
    cfg.min_concurrency = std::max<std::size_t>(cfg.min_concurrency, 1);

    if (cfg.cap_to_hardware) {
        auto cores = static_cast<std::size_t>(std::thread::hardware_concurrency());
        if (cores > 0) {
            cfg.max_concurrency =
                std::min(cfg.max_concurrency, cores * std::max<std::size_t>(cfg.hardware_multiplier, 1));
        }
    }

    cfg.max_concurrency = std::max(cfg.max_concurrency, cfg.min_concurrency);
    cfg.initial_concurrency =
        std::clamp(cfg.initial_concurrency, cfg.min_concurrency, cfg.max_concurrency);
    cfg.sample_window = std::max<std::size_t>(cfg.sample_window, 1);
    cfg.min_samples = std::clamp<std::size_t>(cfg.min_samples, 1, cfg.sample_window);
    cfg.speed_window = std::clamp<std::size_t>(cfg.speed_window, 1, cfg.sample_window);
    return cfg;
}

}  // namespace

struct adaptive_concurrency_controller::impl {
    concurrency_config cfg;

    mutable std::mutex mutex;
    std::size_t concurrency;
    std::deque<outcome_sample> samples;
    std::deque<double> speeds;  // bytes/sec of successful samples
    std::optional<clock_type::time_point> last_increase;
    std::optional<clock_type::time_point> last_decrease;

    explicit impl(concurrency_config c)
        : cfg(normalize(std::move(c))), concurrency(cfg.initial_concurrency) {}

    [[nodiscard]] auto success_rate() const -> double {
        if (samples.empty()) {
            return 1.0;
        }
        auto ok = std::count_if(samples.begin(), samples.end(),
                                [](const outcome_sample& s) { return s.success; });
        return static_cast<double>(ok) / static_cast<double>(samples.size());
    }

    [[nodiscard]] auto average_of(std::deque<double>::const_iterator first,
                                  std::deque<double>::const_iterator last) const -> double {
        auto count = std::distance(first, last);
        if (count <= 0) {
            return 0.0;
        }
        return std::accumulate(first, last, 0.0) / static_cast<double>(count);
    }

    [[nodiscard]] auto within_cooldown(const std::optional<clock_type::time_point>& since,
                                       clock_type::time_point now) const -> bool {
        return since && (now - *since) < cfg.cooldown;
    }

    /// Growth waits out the cooldown after any adjustment
    [[nodiscard]] auto growth_blocked(clock_type::time_point now) const -> bool {
        return within_cooldown(last_increase, now) || within_cooldown(last_decrease, now);
    }

    /// Only a decrease opens the window in which further failures are absorbed
    [[nodiscard]] auto shrink_absorbed(clock_type::time_point now) const -> bool {
        return within_cooldown(last_decrease, now);
    }

    void apply(std::size_t next, clock_type::time_point now, std::string_view reason) {
        next = std::clamp(next, cfg.min_concurrency, cfg.max_concurrency);
        if (next > concurrency) {
            last_increase = now;
        } else {
            last_decrease = now;
        }
        if (next == concurrency) {
            return;
        }
        IU_LOG_DEBUG(log_category::concurrency,
            "Concurrency " + std::to_string(concurrency) + " -> " +
            std::to_string(next) + " (" + std::string(reason) + ")");
        concurrency = next;
    }

    [[nodiscard]] auto decreased() const -> std::size_t {
        auto scaled = static_cast<std::size_t>(
            std::floor(static_cast<double>(concurrency) * cfg.decrease_factor));
        // A decrease above min sheds at least one slot
        if (scaled >= concurrency && concurrency > 0) {
            scaled = concurrency - 1;
        }
        return std::max(scaled, cfg.min_concurrency);
    }

    void on_failure(clock_type::time_point now) {
        // Failures right after a decrease belong to the burst already acted on
        if (shrink_absorbed(now)) {
            return;
        }
        apply(decreased(), now, "upload failure");
    }

    void on_success(clock_type::time_point now) {
        if (samples.size() < cfg.min_samples) {
            return;
        }

        auto rate = success_rate();
        if (rate < cfg.decrease_success_rate) {
            if (!shrink_absorbed(now)) {
                apply(decreased(), now, "low success rate");
            }
            return;
        }

        if (speeds.size() < cfg.speed_window) {
            return;
        }

        auto window = static_cast<std::ptrdiff_t>(cfg.speed_window);
        double older = average_of(speeds.cbegin(), speeds.cbegin() + window);
        double recent = average_of(speeds.cend() - window, speeds.cend());
        if (older <= 0.0) {
            return;
        }

        double trend = recent / older;
        if (trend < cfg.sharp_drop_threshold) {
            if (!shrink_absorbed(now)) {
                apply(decreased(), now, "throughput drop");
            }
            return;
        }

        if (growth_blocked(now)) {
            return;
        }
        if (rate >= cfg.increase_success_rate && trend >= cfg.regression_threshold &&
            concurrency < cfg.max_concurrency) {
            apply(concurrency + cfg.increase_step, now, "stable throughput");
        }
    }
};

adaptive_concurrency_controller::adaptive_concurrency_controller(concurrency_config config)
    : impl_(std::make_unique<impl>(std::move(config))) {}

adaptive_concurrency_controller::~adaptive_concurrency_controller() = default;

adaptive_concurrency_controller::adaptive_concurrency_controller(
    adaptive_concurrency_controller&&) noexcept = default;

auto adaptive_concurrency_controller::operator=(adaptive_concurrency_controller&&) noexcept
    -> adaptive_concurrency_controller& = default;

auto adaptive_concurrency_controller::validate(const concurrency_config& config)
    -> result<void> {
    if (config.min_concurrency < 1) {
        return unexpected{error{error_code::invalid_concurrency_bounds,
            "min_concurrency must be at least 1"}};
    }
    if (config.min_concurrency > config.max_concurrency) {
        return unexpected{error{error_code::invalid_concurrency_bounds,
            "min_concurrency (" + std::to_string(config.min_concurrency) +
            ") exceeds max_concurrency (" + std::to_string(config.max_concurrency) + ")"}};
    }
    if (config.initial_concurrency < config.min_concurrency ||
        config.initial_concurrency > config.max_concurrency) {
        return unexpected{error{error_code::invalid_concurrency_bounds,
            "initial_concurrency must lie within [min_concurrency, max_concurrency]"}};
    }
    if (config.sample_window == 0 || config.min_samples == 0 || config.speed_window == 0 ||
        config.min_samples > config.sample_window || config.speed_window > config.sample_window) {
        return unexpected{error{error_code::invalid_configuration,
            "sample windows must be non-zero and fit within sample_window"}};
    }
    if (config.increase_step == 0) {
        return unexpected{error{error_code::invalid_configuration,
            "increase_step must be at least 1"}};
    }
    if (!(config.decrease_factor > 0.0 && config.decrease_factor < 1.0)) {
        return unexpected{error{error_code::invalid_configuration,
            "decrease_factor must lie in (0, 1)"}};
    }
    if (!(config.sharp_drop_threshold > 0.0 && config.sharp_drop_threshold < 1.0) ||
        !(config.regression_threshold > 0.0 && config.regression_threshold <= 1.0)) {
        return unexpected{error{error_code::invalid_configuration,
            "throughput thresholds must lie in (0, 1]"}};
    }
    if (config.decrease_success_rate < 0.0 || config.decrease_success_rate > 1.0 ||
        config.increase_success_rate < 0.0 || config.increase_success_rate > 1.0) {
        return unexpected{error{error_code::invalid_configuration,
            "success rate thresholds must lie in [0, 1]"}};
    }
    if (config.cooldown.count() < 0) {
        return unexpected{error{error_code::invalid_configuration,
            "cooldown must not be negative"}};
    }
    return {};
}

void adaptive_concurrency_controller::reset() {
    std::lock_guard lock(impl_->mutex);
    impl_->concurrency = impl_->cfg.initial_concurrency;
    impl_->samples.clear();
    impl_->speeds.clear();
    impl_->last_increase.reset();
    impl_->last_decrease.reset();
}

auto adaptive_concurrency_controller::get_concurrency() const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->concurrency;
}

void adaptive_concurrency_controller::record_upload(bool success, uint64_t bytes,
                                                    std::chrono::milliseconds duration) {
    auto now = clock_type::now();
    std::lock_guard lock(impl_->mutex);

    impl_->samples.push_back({success, success ? bytes : 0, duration});
    while (impl_->samples.size() > impl_->cfg.sample_window) {
        impl_->samples.pop_front();
    }

    if (success && duration.count() > 0) {
        impl_->speeds.push_back(static_cast<double>(bytes) * 1000.0 /
                                static_cast<double>(duration.count()));
        while (impl_->speeds.size() > impl_->cfg.sample_window) {
            impl_->speeds.pop_front();
        }
    }

    if (success) {
        impl_->on_success(now);
    } else {
        impl_->on_failure(now);
    }
}

auto adaptive_concurrency_controller::get_metrics() const -> concurrency_metrics {
    std::lock_guard lock(impl_->mutex);

    concurrency_metrics metrics;
    metrics.current_concurrency = impl_->concurrency;
    metrics.sample_count = impl_->samples.size();
    metrics.success_rate = impl_->success_rate();
    metrics.recent_errors = static_cast<std::size_t>(
        std::count_if(impl_->samples.begin(), impl_->samples.end(),
                      [](const outcome_sample& s) { return !s.success; }));
    metrics.average_speed = impl_->average_of(impl_->speeds.cbegin(), impl_->speeds.cend());
    return metrics;
}

auto adaptive_concurrency_controller::config() const -> const concurrency_config& {
    return impl_->cfg;
}

}  // namespace kcenon::image_upload
