// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file monitorable_adapter.h
 * @brief IMonitorable adapter for the upload engine
 *
 * Exposes batch statistics and adaptive concurrency state through
 * common::interfaces::IMonitorable so an engine can be registered with the
 * kcenon monitoring ecosystem.
 */

#pragma once

#include <memory>
#include <string>

#include "../config/feature_flags.h"
#include "../core/types.h"

#if KCENON_WITH_COMMON_SYSTEM
#include <kcenon/common/interfaces/monitoring_interface.h>
#endif

namespace kcenon::image_upload {

// Forward declaration
class upload_engine;

}  // namespace kcenon::image_upload

namespace kcenon::image_upload::adapters {

#if KCENON_WITH_COMMON_SYSTEM

/**
 * @brief Makes upload_engine observable through IMonitorable
 *
 * Holds the engine weakly; once the engine is gone, get_monitoring_data()
 * fails and health_check() reports unhealthy.
 *
 * Health is degraded when more than half of the finished tasks failed, or
 * when the controller's recent success rate is below 80%.
 *
 * @code
 * auto engine = std::make_shared<upload_engine>(std::move(built.value()));
 * auto monitorable = upload_engine_monitorable::create(engine, "gallery_uploader");
 *
 * auto data = monitorable->get_monitoring_data();
 * if (data.is_ok()) {
 *     for (const auto& metric : data.value().metrics) {
 *         std::cout << metric.name << ": " << metric.value << "\n";
 *     }
 * }
 * @endcode
 *
 * @note Thread-safe.
 */
class upload_engine_monitorable : public common::interfaces::IMonitorable {
public:
    [[nodiscard]] static std::shared_ptr<upload_engine_monitorable> create(
        std::shared_ptr<upload_engine> engine,
        const std::string& name = "image_upload_engine");

    explicit upload_engine_monitorable(std::shared_ptr<upload_engine> engine,
                                       const std::string& name = "image_upload_engine");

    ~upload_engine_monitorable() override;

    // Non-copyable
    upload_engine_monitorable(const upload_engine_monitorable&) = delete;
    upload_engine_monitorable& operator=(const upload_engine_monitorable&) = delete;

    // =========================================================================
    // IMonitorable interface implementation
    // =========================================================================

    /**
     * @brief Task counts, byte totals, throughput and concurrency
     */
    common::Result<common::interfaces::metrics_snapshot> get_monitoring_data() override;

    common::Result<common::interfaces::health_check_result> health_check() override;

    [[nodiscard]] std::string get_component_name() const override;

    // =========================================================================
    // Additional methods
    // =========================================================================

    [[nodiscard]] bool is_engine_available() const;

private:
    std::weak_ptr<upload_engine> engine_;
    std::string component_name_;
};

#else  // !KCENON_WITH_COMMON_SYSTEM

/**
 * @brief Stub engine monitorable when common_system is not available
 */
class upload_engine_monitorable {
public:
    static std::shared_ptr<upload_engine_monitorable> create(
        std::shared_ptr<upload_engine> /* engine */,
        const std::string& name = "image_upload_engine") {
        return std::make_shared<upload_engine_monitorable>(name);
    }

    explicit upload_engine_monitorable(const std::string& name = "image_upload_engine")
        : component_name_(name) {}

    [[nodiscard]] std::string get_component_name() const { return component_name_; }
    [[nodiscard]] bool is_engine_available() const { return false; }

private:
    std::string component_name_;
};

#endif  // KCENON_WITH_COMMON_SYSTEM

}  // namespace kcenon::image_upload::adapters
