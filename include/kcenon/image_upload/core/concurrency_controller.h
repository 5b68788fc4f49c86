/**
 * @file concurrency_controller.h
 * @brief Adaptive concurrency control for parallel uploads
 *
 * Decides how many transfers may run at once from a rolling window of
 * observed outcomes. Growth is additive and shrinkage is multiplicative, so a
 * single burst of congestion is shed quickly while transient noise does not
 * cause oscillation.
 */

#ifndef KCENON_IMAGE_UPLOAD_CORE_CONCURRENCY_CONTROLLER_H
#define KCENON_IMAGE_UPLOAD_CORE_CONCURRENCY_CONTROLLER_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

#include "types.h"

namespace kcenon::image_upload {

/**
 * @brief Tuning parameters for adaptive_concurrency_controller
 */
struct concurrency_config {
    std::size_t min_concurrency = 3;
    std::size_t max_concurrency = 20;
    std::size_t initial_concurrency = 8;   ///< Value applied by reset()

    std::size_t sample_window = 20;        ///< Outcomes kept in the rolling history
    std::size_t min_samples = 5;           ///< No adjustment below this many samples
    std::size_t speed_window = 5;          ///< Samples averaged for the throughput trend

    /// Growth is held for this long after any adjustment. Failures within it
    /// after a decrease are absorbed; a failure after an increase still shrinks.
    std::chrono::milliseconds cooldown{2000};

    std::size_t increase_step = 2;
    double increase_success_rate = 1.0;    ///< Success rate required to grow
    double decrease_success_rate = 0.8;    ///< Success rate below which to shrink
    double decrease_factor = 0.6;          ///< Multiplier applied when shrinking
    double regression_threshold = 0.9;     ///< recent/older speed needed to grow
    double sharp_drop_threshold = 0.7;     ///< recent/older speed that forces a shrink

    /// Limit max_concurrency to hardware_multiplier * hardware threads
    bool cap_to_hardware = false;
    std::size_t hardware_multiplier = 3;
};

/**
 * @brief Point-in-time view of the controller
 */
struct concurrency_metrics {
    std::size_t current_concurrency = 0;
    double average_speed = 0.0;     ///< bytes/sec over successful samples
    double success_rate = 1.0;      ///< fraction of successful samples in the window
    std::size_t recent_errors = 0;  ///< failed samples in the window
    std::size_t sample_count = 0;
};

/**
 * @brief AIMD-style controller for the number of simultaneous transfers
 *
 * Thread-safe. get_concurrency() never leaves [min_concurrency,
 * max_concurrency], and a run of failures never raises it.
 *
 * @code
 * adaptive_concurrency_controller controller;
 * controller.reset();
 *
 * controller.record_upload(true, 1024 * 1024, std::chrono::milliseconds(350));
 * auto slots = controller.get_concurrency();
 * @endcode
 */
class adaptive_concurrency_controller {
public:
    /**
     * @brief Construct with configuration
     *
     * Out-of-range values are normalized; use validate() first to reject them.
     */
    explicit adaptive_concurrency_controller(concurrency_config config = {});

    ~adaptive_concurrency_controller();

    adaptive_concurrency_controller(const adaptive_concurrency_controller&) = delete;
    auto operator=(const adaptive_concurrency_controller&)
        -> adaptive_concurrency_controller& = delete;
    adaptive_concurrency_controller(adaptive_concurrency_controller&&) noexcept;
    auto operator=(adaptive_concurrency_controller&&) noexcept
        -> adaptive_concurrency_controller&;

    /**
     * @brief Check a configuration for inconsistent bounds or factors
     * @return invalid_concurrency_bounds or invalid_configuration on failure
     */
    [[nodiscard]] static auto validate(const concurrency_config& config) -> result<void>;

    /**
     * @brief Return to the starting concurrency and clear the history
     */
    void reset();

    [[nodiscard]] auto get_concurrency() const -> std::size_t;

    /**
     * @brief Append an outcome sample and adjust concurrency if due
     * @param success Whether the upload succeeded
     * @param bytes Bytes transferred (0 for failures)
     * @param duration Time spent on the upload
     */
    void record_upload(bool success, uint64_t bytes, std::chrono::milliseconds duration);

    [[nodiscard]] auto get_metrics() const -> concurrency_metrics;

    [[nodiscard]] auto config() const -> const concurrency_config&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::image_upload

#endif  // KCENON_IMAGE_UPLOAD_CORE_CONCURRENCY_CONTROLLER_H
