/**
 * @file upload_engine.cpp
 * @brief Implementation of the adaptive parallel upload engine
 */

#include "kcenon/image_upload/client/upload_engine.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <future>
#include <mutex>
#include <thread>
#include <unordered_map>

#include "kcenon/image_upload/core/logging.h"
#include "kcenon/image_upload/core/session_id.h"

namespace kcenon::image_upload {

namespace {

/**
 * @brief Validation failures happen before any remote call and are not
 *        network outcomes
 */
auto is_validation_error(error_code code) -> bool {
    auto value = static_cast<int>(code);
    return value <= -100 && value > -120;
}

/**
 * @brief Registry entry for one task
 *
 * snapshot is guarded by the engine mutex; source is immutable.
 */
struct task_record {
    upload_task snapshot;
    upload_source source;

    explicit task_record(upload_source src) : source(std::move(src)) {}
};

}  // namespace

// ============================================================================
// Implementation
// ============================================================================

struct upload_engine::impl {
    upload_engine_config config;
    std::string session;
    image_compressor compressor;
    adaptive_concurrency_controller controller;
    std::unique_ptr<preflight_optimizer> preflight;
    std::unique_ptr<confirmation_batcher> confirmations;
    std::shared_ptr<adapters::upload_worker_pool_interface> pool;
    std::atomic<uint64_t> next_sequence{0};

    mutable std::mutex mutex;
    std::condition_variable work_cv;   ///< Dispatcher: slot freed or work enqueued
    std::condition_variable idle_cv;   ///< wait_for_completion
    std::unordered_map<std::string, std::shared_ptr<task_record>> tasks;
    std::vector<std::string> order;
    std::deque<std::string> pending;
    std::size_t active = 0;    ///< Slots held by admitted tasks
    std::size_t running = 0;   ///< Admitted tasks a worker has picked up
    bool processing = false;
    bool paused = false;
    bool notifying = false;   ///< Drain callbacks running outside the lock
    bool stopping = false;
    bool destroyed = false;
    std::chrono::steady_clock::time_point started_at{};
    std::chrono::steady_clock::time_point finished_at{};
    std::vector<std::future<void>> in_flight;
    std::thread dispatcher;

    mutable std::mutex callback_mutex;
    file_update_callback file_update_cb;
    batch_complete_callback batch_complete_cb;
    all_complete_callback all_complete_cb;
    stats_update_callback stats_update_cb;

    impl(upload_engine_config cfg, std::string session_str)
        : config(std::move(cfg)),
          session(std::move(session_str)),
          compressor(config.compression),
          controller(config.concurrency) {
        preflight = std::make_unique<preflight_optimizer>(
            config.allocator, config.container_id, config.preflight);
        confirmations = std::make_unique<confirmation_batcher>(
            config.confirmer, config.container_id, config.confirmation,
            [this](std::size_t waiting) {
                std::lock_guard lock(mutex);
                return waiting >= running;
            });
        pool = config.worker_pool
                   ? config.worker_pool
                   : adapters::worker_pool_factory::create(
                         controller.config().max_concurrency, "upload_pool");
        dispatcher = std::thread([this] { dispatch_loop(); });
    }

    ~impl() { shutdown(); }

    // ------------------------------------------------------------------------
    // Callbacks
    // ------------------------------------------------------------------------

    template <typename Callback>
    auto load_callback(const Callback& member) const -> Callback {
        std::lock_guard lock(callback_mutex);
        return member;
    }

    void publish(const std::optional<upload_task>& snapshot) {
        if (!snapshot) {
            return;
        }
        auto callback = load_callback(file_update_cb);
        if (!callback) {
            return;
        }
        try {
            callback(*snapshot);
        } catch (const std::exception& e) {
            IU_LOG_ERROR(log_category::engine,
                "File update subscriber threw for " + snapshot->filename + ": " + e.what());
        } catch (...) {
            IU_LOG_ERROR(log_category::engine,
                "File update subscriber threw a non-standard exception for " +
                snapshot->filename);
        }
    }

    void publish_stats() {
        auto callback = load_callback(stats_update_cb);
        if (!callback) {
            return;
        }
        try {
            callback(compute_stats());
        } catch (const std::exception& e) {
            IU_LOG_ERROR(log_category::engine,
                std::string("Stats subscriber threw: ") + e.what());
        } catch (...) {
            IU_LOG_ERROR(log_category::engine,
                "Stats subscriber threw a non-standard exception");
        }
    }

    /**
     * @brief Apply a change to a task that is still registered
     * @return The updated snapshot, or nullopt if destroy() removed the task
     */
    template <typename Mutator>
    auto update_task(const std::shared_ptr<task_record>& record, Mutator mutate)
        -> std::optional<upload_task> {
        std::lock_guard lock(mutex);
        auto it = tasks.find(record->snapshot.id);
        if (it == tasks.end() || it->second != record) {
            return std::nullopt;
        }
        mutate(record->snapshot);
        return record->snapshot;
    }

    // ------------------------------------------------------------------------
    // Admission
    // ------------------------------------------------------------------------

    // Caller holds mutex
    auto admissible() const -> bool {
        return !paused && !pending.empty() && active < controller.get_concurrency();
    }

    // Caller holds mutex
    auto drained() const -> bool {
        return pending.empty() && active == 0;
    }

    // Caller holds mutex
    void start_processing() {
        if (processing || destroyed) {
            return;
        }
        processing = true;
        controller.reset();
        started_at = std::chrono::steady_clock::now();
        IU_LOG_DEBUG(log_category::engine,
            "Starting admission at concurrency " +
            std::to_string(controller.get_concurrency()));
    }

    void dispatch_loop() {
        std::unique_lock lock(mutex);
        while (true) {
            work_cv.wait(lock, [this] {
                return stopping || (processing && (admissible() || drained()));
            });
            if (stopping) {
                return;
            }

            if (drained()) {
                finish_drain(lock);
                continue;
            }

            while (admissible()) {
                auto id = std::move(pending.front());
                pending.pop_front();

                auto it = tasks.find(id);
                if (it == tasks.end() || it->second->snapshot.status != upload_status::pending) {
                    continue;
                }

                auto record = it->second;
                ++active;
                ++record->snapshot.attempts;

                std::erase_if(in_flight, [](const std::future<void>& f) {
                    return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
                });
                in_flight.push_back(pool->submit_to_stage(
                    [this, record]() { process(record); }, adapters::stage::upload));
            }
        }
    }

    void finish_drain(std::unique_lock<std::mutex>& lock) {
        processing = false;
        finished_at = std::chrono::steady_clock::now();

        if (destroyed) {
            idle_cv.notify_all();
            return;
        }

        std::size_t succeeded = 0;
        std::size_t failed = 0;
        for (const auto& [id, record] : tasks) {
            if (record->snapshot.status == upload_status::completed) {
                ++succeeded;
            } else if (record->snapshot.status == upload_status::error) {
                ++failed;
            }
        }
        notifying = true;
        lock.unlock();

        IU_LOG_INFO(log_category::engine,
            "Batch drained: " + std::to_string(succeeded) + " completed, " +
            std::to_string(failed) + " failed");

        try {
            if (auto callback = load_callback(batch_complete_cb)) {
                callback(succeeded, failed);
            }
            if (auto callback = load_callback(all_complete_cb)) {
                callback();
            }
        } catch (const std::exception& e) {
            IU_LOG_ERROR(log_category::engine,
                std::string("Completion callback threw: ") + e.what());
        } catch (...) {
            IU_LOG_ERROR(log_category::engine,
                "Completion callback threw a non-standard exception");
        }

        lock.lock();
        notifying = false;
        idle_cv.notify_all();
    }

    // ------------------------------------------------------------------------
    // Per-task processing
    // ------------------------------------------------------------------------

    /**
     * @brief Gives an admitted task's slot back when processing ends
     */
    class slot_release {
    public:
        explicit slot_release(impl& owner) : owner_(owner) {
            std::lock_guard lock(owner_.mutex);
            ++owner_.running;
        }

        ~slot_release() {
            {
                std::lock_guard lock(owner_.mutex);
                --owner_.running;
                --owner_.active;
            }
            owner_.work_cv.notify_all();
            owner_.confirmations->poke();
        }

        slot_release(const slot_release&) = delete;
        auto operator=(const slot_release&) -> slot_release& = delete;

    private:
        impl& owner_;
    };

    void process(const std::shared_ptr<task_record>& record) {
        slot_release slot(*this);
        const auto started = std::chrono::steady_clock::now();
        uint64_t bytes_sent = 0;

        result<void> outcome;
        try {
            outcome = run_pipeline(record, bytes_sent);
        } catch (const std::exception& e) {
            outcome = unexpected{error{error_code::internal_error,
                std::string("Unexpected exception: ") + e.what()}};
        } catch (...) {
            outcome = unexpected{error{error_code::internal_error,
                "Unexpected non-standard exception"}};
        }

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        if (outcome.has_value()) {
            controller.record_upload(true, bytes_sent, elapsed);
            publish_stats();
            return;
        }

        const auto& err = outcome.error();
        bool failed = false;
        auto snapshot = update_task(record, [&](upload_task& task) {
            if (is_terminal_status(task.status)) {
                return;
            }
            task.status = upload_status::error;
            task.error_message = err.message;
            task.last_error = err.code;
            failed = true;
        });
        if (!snapshot.has_value() || failed) {
            if (!is_validation_error(err.code)) {
                controller.record_upload(false, 0, elapsed);
            }

            upload_log_context ctx;
            ctx.task_id = record->snapshot.id;
            ctx.filename = record->source.filename();
            ctx.container_id = config.container_id;
            ctx.duration_ms = static_cast<uint64_t>(elapsed.count());
            ctx.error_message = err.message;
            IU_LOG_WARN_CTX(log_category::engine,
                std::string("Upload failed (") + to_string(err.code) + ")", ctx);
        }

        if (failed) {
            publish(snapshot);
        }
        publish_stats();
    }

    auto run_pipeline(const std::shared_ptr<task_record>& record, uint64_t& bytes_sent)
        -> result<void> {
        const auto& source = record->source;

        auto valid = source.validate();
        if (!valid.has_value()) {
            return valid;
        }

        publish(update_task(record, [](upload_task& task) {
            task.status = upload_status::compressing;
            task.progress = 0.0;
        }));

        auto loaded = source.load();
        if (!loaded.has_value()) {
            return unexpected{loaded.error()};
        }
        auto original = std::move(loaded.value());
        const auto original_size = static_cast<uint64_t>(original.size());

        std::vector<std::byte> payload;
        std::string content_type = source.mime_type();
        double ratio = 1.0;
        std::optional<uint32_t> width;
        std::optional<uint32_t> height;

        if (config.compression_enabled) {
            auto compressed = compressor.compress(original, source.mime_type(),
                                                  config.compression);
            if (compressed.has_value()) {
                auto& out = compressed.value();
                if (out.width > 0 && out.height > 0) {
                    width = out.width;
                    height = out.height;
                }
                if (out.transcoded) {
                    payload = std::move(out.data);
                    content_type = out.mime_type;
                    ratio = out.compression_ratio;
                }
            } else {
                IU_LOG_WARN(log_category::compression,
                    "Compression failed for " + source.filename() +
                    ", uploading original: " + compressed.error().message);
            }
        }
        if (payload.empty()) {
            payload = std::move(original);
        }
        const auto upload_size = static_cast<uint64_t>(payload.size());

        update_task(record, [&](upload_task& task) {
            task.original_size = original_size;
            task.compressed_size = upload_size;
            task.compression_ratio = ratio;
            task.mime_type = content_type;
        });

        upload_descriptor descriptor{record->snapshot.id, source.filename(), content_type,
                                     upload_size};
        auto destination = preflight->get_signed_url(descriptor);
        if (!destination.has_value()) {
            return unexpected{destination.error()};
        }
        const auto& dest = destination.value();

        publish(update_task(record, [&](upload_task& task) {
            task.status = upload_status::uploading;
            task.progress = 0.0;
            task.storage_path = dest.storage_path;
        }));

        auto put = config.transport->put(
            dest, payload, content_type,
            [this, &record](uint64_t sent, uint64_t total) { report_progress(record, sent, total); });
        if (!put.has_value()) {
            return put;
        }

        confirmation_record confirmation{dest.storage_path, dest.token, source.filename(),
                                         upload_size, content_type, width, height};
        auto confirmed = confirmations->confirm(std::move(confirmation));
        if (!confirmed.has_value()) {
            return unexpected{error{confirmed.error().code,
                "Confirm failed: " + confirmed.error().message}};
        }

        bytes_sent = upload_size;
        publish(update_task(record, [&](upload_task& task) {
            task.status = upload_status::completed;
            task.progress = 100.0;
            task.error_message.reset();
            task.last_error.reset();
            if (!confirmed.value().empty()) {
                task.image_id = confirmed.value();
            }
        }));

        upload_log_context ctx;
        ctx.task_id = record->snapshot.id;
        ctx.filename = source.filename();
        ctx.container_id = config.container_id;
        ctx.storage_path = dest.storage_path;
        ctx.signed_url = dest.signed_url;
        ctx.original_size = original_size;
        ctx.upload_size = upload_size;
        ctx.compression_ratio = ratio;
        IU_LOG_DEBUG_CTX(log_category::engine, "Upload completed", ctx);
        return {};
    }

    void report_progress(const std::shared_ptr<task_record>& record, uint64_t sent,
                         uint64_t total) {
        double percent = total > 0 ? static_cast<double>(sent) * 100.0 /
                                         static_cast<double>(total)
                                   : 100.0;
        percent = std::clamp(percent, 0.0, 100.0);

        bool changed = false;
        auto snapshot = update_task(record, [&](upload_task& task) {
            if (task.status == upload_status::uploading && percent > task.progress) {
                task.progress = percent;
                changed = true;
            }
        });
        if (changed) {
            publish(snapshot);
        }
    }

    // ------------------------------------------------------------------------
    // Statistics
    // ------------------------------------------------------------------------

    auto compute_stats() const -> batch_stats {
        batch_stats stats;
        double remaining_bytes = 0.0;
        std::chrono::steady_clock::time_point start;
        std::chrono::steady_clock::time_point end;
        {
            std::lock_guard lock(mutex);
            for (const auto& id : order) {
                auto it = tasks.find(id);
                if (it == tasks.end()) {
                    continue;
                }
                const auto& task = it->second->snapshot;
                const auto upload_size =
                    task.compressed_size > 0 ? task.compressed_size : task.original_size;

                ++stats.total_files;
                stats.total_bytes += task.original_size;
                stats.total_upload_bytes += upload_size;

                switch (task.status) {
                    case upload_status::pending: ++stats.pending; break;
                    case upload_status::compressing: ++stats.compressing; break;
                    case upload_status::uploading: ++stats.uploading; break;
                    case upload_status::completed: ++stats.completed; break;
                    case upload_status::error: ++stats.failed; break;
                }

                if (task.status == upload_status::completed) {
                    stats.uploaded_bytes += upload_size;
                    if (task.original_size > upload_size) {
                        stats.compression_savings += task.original_size - upload_size;
                    }
                } else if (task.status == upload_status::uploading) {
                    auto partial = static_cast<double>(upload_size) * task.progress / 100.0;
                    stats.uploaded_bytes += static_cast<uint64_t>(partial);
                    remaining_bytes += static_cast<double>(upload_size) - partial;
                } else if (task.status != upload_status::error) {
                    remaining_bytes += static_cast<double>(upload_size);
                }
            }
            start = started_at;
            end = processing ? std::chrono::steady_clock::now() : finished_at;
        }

        stats.current_concurrency = controller.get_concurrency();
        if (start.time_since_epoch().count() != 0 && end > start) {
            stats.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
        }

        const auto seconds = static_cast<double>(stats.elapsed.count()) / 1000.0;
        if (seconds > 0.0 && stats.uploaded_bytes > 0) {
            stats.average_speed = static_cast<double>(stats.uploaded_bytes) / seconds;
            stats.estimated_seconds_remaining = remaining_bytes / stats.average_speed;
        }
        return stats;
    }

    // ------------------------------------------------------------------------
    // Cancellation and teardown
    // ------------------------------------------------------------------------

    auto cancel_pending() -> std::size_t {
        std::vector<upload_task> cancelled;
        {
            std::lock_guard lock(mutex);
            for (const auto& id : pending) {
                auto it = tasks.find(id);
                if (it == tasks.end() || it->second->snapshot.status != upload_status::pending) {
                    continue;
                }
                auto& task = it->second->snapshot;
                task.status = upload_status::error;
                task.error_message = "Cancelled before upload started";
                task.last_error = error_code::transfer_cancelled;
                cancelled.push_back(task);
            }
            pending.clear();
        }
        work_cv.notify_all();

        preflight->clear();

        if (!cancelled.empty()) {
            IU_LOG_INFO(log_category::engine,
                "Cancelled " + std::to_string(cancelled.size()) + " pending task(s)");
        }
        for (const auto& task : cancelled) {
            publish(task);
        }
        return cancelled.size();
    }

    void shutdown() {
        {
            std::lock_guard lock(mutex);
            stopping = true;
        }
        work_cv.notify_all();
        if (dispatcher.joinable()) {
            dispatcher.join();
        }

        std::vector<std::future<void>> running;
        {
            std::lock_guard lock(mutex);
            running = std::move(in_flight);
        }
        for (auto& future : running) {
            if (future.valid()) {
                future.wait();
            }
        }
    }
};

// ============================================================================
// Builder
// ============================================================================

upload_engine::builder::builder() = default;

auto upload_engine::builder::with_container_id(std::string container_id) -> builder& {
    config_.container_id = std::move(container_id);
    return *this;
}

auto upload_engine::builder::with_allocator(std::shared_ptr<destination_allocator> allocator)
    -> builder& {
    config_.allocator = std::move(allocator);
    return *this;
}

auto upload_engine::builder::with_transport(std::shared_ptr<blob_transport> transport)
    -> builder& {
    config_.transport = std::move(transport);
    return *this;
}

auto upload_engine::builder::with_confirmer(std::shared_ptr<upload_confirmer> confirmer)
    -> builder& {
    config_.confirmer = std::move(confirmer);
    return *this;
}

auto upload_engine::builder::with_compression(bool enable) -> builder& {
    config_.compression_enabled = enable;
    return *this;
}

auto upload_engine::builder::with_compression_options(const compression_options& options)
    -> builder& {
    config_.compression = options;
    return *this;
}

auto upload_engine::builder::with_concurrency(const concurrency_config& config) -> builder& {
    config_.concurrency = config;
    return *this;
}

auto upload_engine::builder::with_preflight(const preflight_config& config) -> builder& {
    config_.preflight = config;
    return *this;
}

auto upload_engine::builder::with_worker_pool(
    std::shared_ptr<adapters::upload_worker_pool_interface> pool) -> builder& {
    config_.worker_pool = std::move(pool);
    return *this;
}

auto upload_engine::builder::with_natural_sort(bool enable) -> builder& {
    config_.natural_sort = enable;
    return *this;
}

auto upload_engine::builder::with_capture_date_sort(bool enable) -> builder& {
    config_.capture_date_sort = enable;
    return *this;
}

auto upload_engine::builder::with_confirmation_batching(std::size_t batch_size,
                                                        std::chrono::milliseconds linger)
    -> builder& {
    config_.confirmation.batch_size = batch_size;
    config_.confirmation.linger = linger;
    return *this;
}

auto upload_engine::builder::build() -> result<upload_engine> {
    if (config_.container_id.empty()) {
        return unexpected{error{error_code::invalid_configuration,
                               "Container id must not be empty"}};
    }
    if (!config_.allocator || !config_.transport || !config_.confirmer) {
        return unexpected{error{error_code::missing_collaborator,
                               "Allocator, transport and confirmer are required"}};
    }

    auto bounds = adaptive_concurrency_controller::validate(config_.concurrency);
    if (!bounds.has_value()) {
        return unexpected{bounds.error()};
    }

    const auto& compression = config_.compression;
    if (compression.quality <= 0.0 || compression.quality > 1.0) {
        return unexpected{error{error_code::invalid_configuration,
                               "Compression quality must be in (0, 1]"}};
    }
    if (compression.max_dimension && *compression.max_dimension == 0) {
        return unexpected{error{error_code::invalid_configuration,
                               "Maximum dimension must be positive"}};
    }
    if (config_.preflight.prefetch_concurrency == 0 || config_.preflight.batch_size == 0) {
        return unexpected{error{error_code::invalid_configuration,
                               "Prefetch concurrency and batch size must be positive"}};
    }

    if (config_.confirmation.batch_size == 0 || config_.confirmation.linger.count() < 0) {
        return unexpected{error{error_code::invalid_configuration,
                               "Confirmation batch size must be positive and linger non-negative"}};
    }

    auto session = image_upload::session_id::generate();
    if (!session.has_value()) {
        return unexpected{session.error()};
    }

    return upload_engine{std::move(config_), session.value().to_string()};
}

// ============================================================================
// upload_engine
// ============================================================================

upload_engine::upload_engine(upload_engine_config config, std::string session)
    : impl_(std::make_unique<impl>(std::move(config), std::move(session))) {
    // Initialize logger (safe to call multiple times)
    get_logger().initialize();

    IU_LOG_INFO(log_category::engine,
        "Upload engine " + impl_->session + " created for container " +
        impl_->config.container_id);
}

upload_engine::upload_engine(upload_engine&&) noexcept = default;
auto upload_engine::operator=(upload_engine&&) noexcept -> upload_engine& = default;

upload_engine::~upload_engine() {
    if (impl_) {
        destroy();
    }
}

auto upload_engine::add_files(std::vector<upload_source> sources)
    -> std::vector<upload_handle> {
    if (impl_->config.capture_date_sort) {
        sort_by_capture_date(sources);
    } else if (impl_->config.natural_sort) {
        std::stable_sort(sources.begin(), sources.end(),
                         [](const upload_source& a, const upload_source& b) {
                             return natural_less(a.filename(), b.filename());
                         });
    }

    std::vector<upload_handle> handles;
    std::vector<upload_descriptor> descriptors;
    handles.reserve(sources.size());
    descriptors.reserve(sources.size());

    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->destroyed) {
            IU_LOG_ERROR(log_category::engine, "add_files called on a destroyed engine");
            return handles;
        }

        for (auto& source : sources) {
            auto record = std::make_shared<task_record>(std::move(source));
            auto& task = record->snapshot;
            task.id = impl_->session + "-" + std::to_string(++impl_->next_sequence);
            task.filename = record->source.filename();
            task.mime_type = record->source.mime_type();
            task.original_size = record->source.size();

            descriptors.push_back(
                upload_descriptor{task.id, task.filename, task.mime_type, task.original_size});
            handles.emplace_back(task.id, this);

            impl_->order.push_back(task.id);
            impl_->pending.push_back(task.id);
            impl_->tasks.emplace(task.id, std::move(record));
        }

        if (!handles.empty()) {
            impl_->start_processing();
        }
    }

    if (handles.empty()) {
        return handles;
    }

    IU_LOG_INFO(log_category::engine,
        "Queued " + std::to_string(handles.size()) + " file(s)");

    impl_->preflight->queue_for_prefetch(descriptors);
    impl_->work_cv.notify_all();
    return handles;
}

auto upload_engine::add_file(upload_source source) -> upload_handle {
    std::vector<upload_source> sources;
    sources.push_back(std::move(source));
    auto handles = add_files(std::move(sources));
    return handles.empty() ? upload_handle{} : handles.front();
}

auto upload_engine::get_stats() const -> batch_stats {
    return impl_->compute_stats();
}

auto upload_engine::get_task(const std::string& id) const -> result<upload_task> {
    std::lock_guard lock(impl_->mutex);
    if (impl_->destroyed) {
        return unexpected{error{error_code::engine_destroyed, "Engine has been destroyed"}};
    }
    auto it = impl_->tasks.find(id);
    if (it == impl_->tasks.end()) {
        return unexpected{error{error_code::task_not_found, "Unknown task: " + id}};
    }
    return it->second->snapshot;
}

auto upload_engine::get_tasks() const -> std::vector<upload_task> {
    std::lock_guard lock(impl_->mutex);
    std::vector<upload_task> snapshots;
    snapshots.reserve(impl_->order.size());
    for (const auto& id : impl_->order) {
        auto it = impl_->tasks.find(id);
        if (it != impl_->tasks.end()) {
            snapshots.push_back(it->second->snapshot);
        }
    }
    return snapshots;
}

auto upload_engine::retry_failed() -> std::size_t {
    std::vector<upload_task> reset;
    std::vector<upload_descriptor> descriptors;
    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->destroyed) {
            return 0;
        }
        for (const auto& id : impl_->order) {
            auto it = impl_->tasks.find(id);
            if (it == impl_->tasks.end() || it->second->snapshot.status != upload_status::error) {
                continue;
            }
            auto& task = it->second->snapshot;
            task.status = upload_status::pending;
            task.progress = 0.0;
            task.error_message.reset();
            task.last_error.reset();
            impl_->pending.push_back(id);

            reset.push_back(task);
            descriptors.push_back(
                upload_descriptor{task.id, task.filename, task.mime_type, task.original_size});
        }
        if (!reset.empty()) {
            impl_->start_processing();
        }
    }

    if (reset.empty()) {
        return 0;
    }

    IU_LOG_INFO(log_category::engine,
        "Retrying " + std::to_string(reset.size()) + " failed task(s)");

    impl_->preflight->queue_for_prefetch(descriptors);
    for (const auto& task : reset) {
        impl_->publish(task);
    }
    impl_->work_cv.notify_all();
    return reset.size();
}

auto upload_engine::cancel() -> std::size_t {
    return impl_->cancel_pending();
}

void upload_engine::pause() {
    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->paused || impl_->destroyed) {
            return;
        }
        impl_->paused = true;
    }
    IU_LOG_INFO(log_category::engine, "Admission paused");
}

void upload_engine::resume() {
    {
        std::lock_guard lock(impl_->mutex);
        if (!impl_->paused) {
            return;
        }
        impl_->paused = false;
    }
    IU_LOG_INFO(log_category::engine, "Admission resumed");
    impl_->work_cv.notify_all();
}

auto upload_engine::is_paused() const -> bool {
    std::lock_guard lock(impl_->mutex);
    return impl_->paused;
}

void upload_engine::destroy() {
    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->destroyed) {
            return;
        }
    }

    impl_->cancel_pending();

    {
        std::lock_guard lock(impl_->mutex);
        impl_->destroyed = true;
        impl_->tasks.clear();
        impl_->order.clear();
        impl_->pending.clear();
    }
    impl_->preflight->clear();
    impl_->work_cv.notify_all();
    impl_->idle_cv.notify_all();

    IU_LOG_INFO(log_category::engine, "Upload engine " + impl_->session + " destroyed");
}

auto upload_engine::is_destroyed() const -> bool {
    std::lock_guard lock(impl_->mutex);
    return impl_->destroyed;
}

auto upload_engine::is_processing() const -> bool {
    std::lock_guard lock(impl_->mutex);
    return impl_->processing;
}

auto upload_engine::wait_for_completion(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock lock(impl_->mutex);
    return impl_->idle_cv.wait_for(lock, timeout, [this] {
        return !impl_->processing && !impl_->notifying && impl_->pending.empty() &&
               impl_->active == 0;
    });
}

void upload_engine::on_file_update(file_update_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->file_update_cb = std::move(callback);
}

void upload_engine::on_batch_complete(batch_complete_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->batch_complete_cb = std::move(callback);
}

void upload_engine::on_all_complete(all_complete_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->all_complete_cb = std::move(callback);
}

void upload_engine::on_stats_update(stats_update_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->stats_update_cb = std::move(callback);
}

auto upload_engine::container_id() const -> const std::string& {
    return impl_->config.container_id;
}

auto upload_engine::get_session_id() const -> const std::string& {
    return impl_->session;
}

auto upload_engine::get_concurrency_metrics() const -> concurrency_metrics {
    return impl_->controller.get_metrics();
}

auto upload_engine::get_preflight_stats() const -> preflight_stats {
    return impl_->preflight->stats();
}

auto upload_engine::get_compression_stats() const -> image_compression_stats {
    return impl_->compressor.stats();
}

}  // namespace kcenon::image_upload
