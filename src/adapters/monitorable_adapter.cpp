// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#include <kcenon/image_upload/adapters/monitorable_adapter.h>
#include <kcenon/image_upload/client/upload_engine.h>

#include <chrono>

namespace kcenon::image_upload::adapters {

#if KCENON_WITH_COMMON_SYSTEM

namespace {

void add_metric(common::interfaces::metrics_snapshot& snapshot, const std::string& name,
                double value, common::interfaces::metric_type type) {
    snapshot.metrics.emplace_back("image_upload." + name, value, type);
}

}  // namespace

std::shared_ptr<upload_engine_monitorable> upload_engine_monitorable::create(
    std::shared_ptr<upload_engine> engine, const std::string& name) {
    return std::make_shared<upload_engine_monitorable>(std::move(engine), name);
}

upload_engine_monitorable::upload_engine_monitorable(std::shared_ptr<upload_engine> engine,
                                                     const std::string& name)
    : engine_(engine)
    , component_name_(name) {}

upload_engine_monitorable::~upload_engine_monitorable() = default;

common::Result<common::interfaces::metrics_snapshot> upload_engine_monitorable::get_monitoring_data() {
    common::interfaces::metrics_snapshot snapshot;
    snapshot.source_id = component_name_;
    snapshot.capture_time = std::chrono::system_clock::now();

    auto engine = engine_.lock();
    if (!engine) {
        return common::make_error<common::interfaces::metrics_snapshot>(
            common::error_codes::NOT_INITIALIZED,
            "Engine reference is not available");
    }

    using common::interfaces::metric_type;
    auto stats = engine->get_stats();
    auto concurrency = engine->get_concurrency_metrics();
    auto preflight = engine->get_preflight_stats();

    // Task state (gauges)
    add_metric(snapshot, "tasks_total", static_cast<double>(stats.total_files), metric_type::gauge);
    add_metric(snapshot, "tasks_pending", static_cast<double>(stats.pending), metric_type::gauge);
    add_metric(snapshot, "tasks_active", static_cast<double>(stats.active()), metric_type::gauge);
    add_metric(snapshot, "tasks_completed", static_cast<double>(stats.completed),
               metric_type::gauge);
    add_metric(snapshot, "tasks_failed", static_cast<double>(stats.failed), metric_type::gauge);

    // Byte volume (counters)
    add_metric(snapshot, "bytes_total", static_cast<double>(stats.total_bytes),
               metric_type::counter);
    add_metric(snapshot, "bytes_uploaded", static_cast<double>(stats.uploaded_bytes),
               metric_type::counter);
    add_metric(snapshot, "compression_savings_bytes",
               static_cast<double>(stats.compression_savings), metric_type::counter);

    // Throughput and concurrency (gauges)
    add_metric(snapshot, "average_speed_bps", stats.average_speed, metric_type::gauge);
    add_metric(snapshot, "estimated_seconds_remaining",
               stats.estimated_seconds_remaining.value_or(0.0), metric_type::gauge);
    add_metric(snapshot, "concurrency", static_cast<double>(concurrency.current_concurrency),
               metric_type::gauge);
    add_metric(snapshot, "success_rate", concurrency.success_rate, metric_type::gauge);
    add_metric(snapshot, "recent_errors", static_cast<double>(concurrency.recent_errors),
               metric_type::gauge);

    // Prefetch cache (gauges)
    add_metric(snapshot, "preflight_cached", static_cast<double>(preflight.cached),
               metric_type::gauge);
    add_metric(snapshot, "preflight_pending", static_cast<double>(preflight.pending),
               metric_type::gauge);

    return snapshot;
}

common::Result<common::interfaces::health_check_result> upload_engine_monitorable::health_check() {
    common::interfaces::health_check_result result;
    result.timestamp = std::chrono::system_clock::now();

    auto start_time = std::chrono::steady_clock::now();

    auto engine = engine_.lock();
    if (!engine || engine->is_destroyed()) {
        result.status = common::interfaces::health_status::unhealthy;
        result.message = engine ? "Engine has been destroyed" : "Engine reference is not available";
        result.check_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        return result;
    }

    auto stats = engine->get_stats();
    auto concurrency = engine->get_concurrency_metrics();
    const auto finished = stats.completed + stats.failed;

    result.status = common::interfaces::health_status::healthy;
    result.message = "Engine is operational";

    if (finished > 0 && stats.failed * 2 > finished) {
        result.status = common::interfaces::health_status::degraded;
        result.message = "More than half of finished uploads failed";
    } else if (concurrency.recent_errors > 0 && concurrency.success_rate < 0.8) {
        result.status = common::interfaces::health_status::degraded;
        result.message = "Recent upload success rate below 80%";
    }

    result.metadata["processing"] = engine->is_processing() ? "true" : "false";
    result.metadata["completed"] = std::to_string(stats.completed);
    result.metadata["failed"] = std::to_string(stats.failed);
    result.metadata["concurrency"] = std::to_string(concurrency.current_concurrency);
    result.metadata["success_rate"] = std::to_string(concurrency.success_rate);
    result.metadata["container_id"] = engine->container_id();
    result.metadata["component_name"] = component_name_;

    result.check_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    return result;
}

std::string upload_engine_monitorable::get_component_name() const {
    return component_name_;
}

bool upload_engine_monitorable::is_engine_available() const {
    return !engine_.expired();
}

#endif  // KCENON_WITH_COMMON_SYSTEM

}  // namespace kcenon::image_upload::adapters
