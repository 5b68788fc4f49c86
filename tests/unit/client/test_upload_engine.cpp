/**
 * @file test_upload_engine.cpp
 * @brief Unit tests for the upload engine
 */

#include <gtest/gtest.h>

#include <span>
#include <stdexcept>

#include "integration/test_fixtures.h"

namespace kcenon::image_upload::test {

using namespace std::chrono_literals;

namespace {

auto find_task(const std::vector<upload_task>& tasks, const std::string& filename)
    -> const upload_task* {
    for (const auto& task : tasks) {
        if (task.filename == filename) {
            return &task;
        }
    }
    return nullptr;
}

/**
 * @brief Transport that throws a non-std::exception for matching paths
 */
class int_throwing_transport : public fake_transport {
public:
    explicit int_throwing_transport(std::string fragment) : fragment_(std::move(fragment)) {}

    auto put(const upload_destination& destination, std::span<const std::byte> payload,
             const std::string& content_type, const transfer_progress_callback& on_progress)
        -> result<void> override {
        if (destination.storage_path.find(fragment_) != std::string::npos) {
            throw 42;
        }
        return fake_transport::put(destination, payload, content_type, on_progress);
    }

private:
    std::string fragment_;
};

}  // namespace

class UploadEngineTest : public EngineFixture {
protected:
    /**
     * @brief Exactly one admitted task at a time
     */
    static auto serial_concurrency() -> concurrency_config {
        concurrency_config config;
        config.min_concurrency = 1;
        config.max_concurrency = 1;
        config.initial_concurrency = 1;
        return config;
    }

    /**
     * @brief A fixed number of admitted tasks
     */
    static auto fixed_concurrency(std::size_t slots) -> concurrency_config {
        concurrency_config config;
        config.min_concurrency = slots;
        config.max_concurrency = slots;
        config.initial_concurrency = slots;
        return config;
    }

    static auto dated_jpeg(const std::string& name, const std::string& capture_time)
        -> upload_source {
        return upload_source::from_memory(
            name, make_jpeg(16, 16, 90, 7, {make_exif_segment(1, capture_time)}), "image/jpeg");
    }

    /**
     * @brief One descriptor per allocation call
     */
    static auto single_batch_preflight() -> preflight_config {
        auto config = fast_preflight();
        config.batch_size = 1;
        return config;
    }
};

// =============================================================================
// Builder Tests
// =============================================================================

TEST_F(UploadEngineTest, BuildWithFakes) {
    auto built = base_builder().build();

    ASSERT_TRUE(built.has_value()) << built.error().message;
    EXPECT_EQ(built.value().container_id(), "gallery-1");
    EXPECT_FALSE(built.value().get_session_id().empty());
    EXPECT_FALSE(built.value().is_processing());
    EXPECT_FALSE(built.value().is_destroyed());
    EXPECT_EQ(built.value().get_concurrency_metrics().current_concurrency, 4u);
}

TEST_F(UploadEngineTest, BuildRejectsEmptyContainer) {
    auto built = base_builder().with_container_id("").build();

    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, error_code::invalid_configuration);
}

TEST_F(UploadEngineTest, BuildRejectsMissingCollaborator) {
    auto built = base_builder().with_transport(nullptr).build();

    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, error_code::missing_collaborator);
}

TEST_F(UploadEngineTest, BuildRejectsInvalidConcurrency) {
    auto config = fast_concurrency();
    config.min_concurrency = 10;
    config.max_concurrency = 5;

    auto built = base_builder().with_concurrency(config).build();

    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, error_code::invalid_concurrency_bounds);
}

TEST_F(UploadEngineTest, BuildRejectsInvalidCompression) {
    compression_options options;
    options.quality = 0.0;
    auto zero_quality = base_builder().with_compression_options(options).build();
    ASSERT_FALSE(zero_quality.has_value());
    EXPECT_EQ(zero_quality.error().code, error_code::invalid_configuration);

    options = compression_options{};
    options.max_dimension = 0;
    auto zero_dimension = base_builder().with_compression_options(options).build();
    ASSERT_FALSE(zero_dimension.has_value());
    EXPECT_EQ(zero_dimension.error().code, error_code::invalid_configuration);
}

TEST_F(UploadEngineTest, BuildRejectsEmptyPrefetchBatch) {
    auto config = fast_preflight();
    config.batch_size = 0;

    auto built = base_builder().with_preflight(config).build();

    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, error_code::invalid_configuration);
}

TEST_F(UploadEngineTest, BuildRejectsEmptyConfirmationBatch) {
    auto built = base_builder().with_confirmation_batching(0, 100ms).build();

    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, error_code::invalid_configuration);
}

// =============================================================================
// Batch Scenarios
// =============================================================================

TEST_F(UploadEngineTest, UploadsBatchWithoutCompression) {
    build_engine(base_builder().with_compression(false).with_preflight(single_batch_preflight()));

    std::atomic<int> all_complete{0};
    engine_->on_all_complete([&]() { ++all_complete; });

    std::vector<upload_source> sources;
    sources.push_back(memory_source("a.jpg", 1024 * 1024));
    sources.push_back(memory_source("b.jpg", 2 * 1024 * 1024));
    sources.push_back(memory_source("c.jpg", 512 * 1024));
    auto handles = engine_->add_files(std::move(sources));
    ASSERT_EQ(handles.size(), 3u);

    ASSERT_TRUE(engine_->wait_for_completion(30s));

    EXPECT_EQ(allocator_->calls(), 3u);
    EXPECT_EQ(transport_->count(), 3u);
    EXPECT_EQ(confirmer_->confirmed().size(), 3u);
    EXPECT_EQ(confirmer_->last_container(), "gallery-1");
    EXPECT_EQ(all_complete.load(), 1);

    auto stats = engine_->get_stats();
    EXPECT_EQ(stats.completed, 3u);
    EXPECT_EQ(stats.failed, 0u);
    EXPECT_EQ(stats.total_bytes, 3584u * 1024u);
    EXPECT_EQ(stats.uploaded_bytes, stats.total_bytes);
    EXPECT_EQ(stats.compression_savings, 0u);
    EXPECT_DOUBLE_EQ(stats.completion_percentage(), 100.0);
    EXPECT_TRUE(stats.is_idle());

    for (const auto& handle : handles) {
        auto task = handle.get_task();
        ASSERT_TRUE(task.has_value()) << task.error().message;
        EXPECT_EQ(task.value().status, upload_status::completed);
        EXPECT_DOUBLE_EQ(task.value().progress, 100.0);
        EXPECT_DOUBLE_EQ(task.value().compression_ratio, 1.0);
        EXPECT_EQ(task.value().compressed_size, task.value().original_size);
        EXPECT_TRUE(task.value().image_id.has_value());
        EXPECT_TRUE(task.value().storage_path.has_value());
        EXPECT_EQ(task.value().attempts, 1u);
    }
}

TEST_F(UploadEngineTest, FailedTransferDoesNotAbortBatch) {
    transport_->fail_path("b.jpg");
    build_engine();

    std::mutex mutex;
    std::vector<std::pair<std::size_t, std::size_t>> batches;
    engine_->on_batch_complete([&](std::size_t succeeded, std::size_t failed) {
        std::lock_guard lock(mutex);
        batches.emplace_back(succeeded, failed);
    });

    engine_->add_files({memory_source("a.jpg", 4096), memory_source("b.jpg", 4096),
                        memory_source("c.jpg", 4096)});
    ASSERT_TRUE(engine_->wait_for_completion(30s));

    ASSERT_EQ(batches.size(), 1u);
    EXPECT_EQ(batches[0], std::make_pair(std::size_t{2}, std::size_t{1}));

    auto tasks = engine_->get_tasks();
    ASSERT_EQ(tasks.size(), 3u);
    EXPECT_EQ(find_task(tasks, "a.jpg")->status, upload_status::completed);
    EXPECT_EQ(find_task(tasks, "c.jpg")->status, upload_status::completed);

    const auto* failed = find_task(tasks, "b.jpg");
    ASSERT_NE(failed, nullptr);
    EXPECT_EQ(failed->status, upload_status::error);
    ASSERT_TRUE(failed->error_message.has_value());
    EXPECT_NE(failed->error_message->find("HTTP 500"), std::string::npos);
    EXPECT_EQ(failed->last_error.value_or(error_code::success), error_code::transfer_failed);
    EXPECT_FALSE(failed->image_id.has_value());
    EXPECT_EQ(confirmer_->confirmed().size(), 2u);
}

TEST_F(UploadEngineTest, CorruptImageUploadsOriginal) {
    compression_options options;
    options.min_input_size = 0;
    build_engine(base_builder().with_compression_options(options));

    auto original = make_corrupt_jpeg(64 * 1024);
    auto handle = engine_->add_file(upload_source::from_memory("broken.jpg", original,
                                                               "image/jpeg"));
    ASSERT_TRUE(engine_->wait_for_completion(30s));

    auto task = handle.get_task();
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task.value().status, upload_status::completed);
    EXPECT_DOUBLE_EQ(task.value().compression_ratio, 1.0);
    EXPECT_EQ(task.value().compressed_size, original.size());

    auto records = transport_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].payload, original);
    EXPECT_EQ(records[0].content_type, "image/jpeg");
    EXPECT_EQ(engine_->get_compression_stats().images_failed, 1u);
}

TEST_F(UploadEngineTest, CompressesLargeJpeg) {
    compression_options options;
    options.min_input_size = 0;
    options.quality = 0.5;
    options.max_dimension = 256;
    build_engine(base_builder().with_compression_options(options));

    auto original = make_jpeg(640, 480);
    auto handle = engine_->add_file(upload_source::from_memory("photo.jpg", original,
                                                               "image/jpeg"));
    ASSERT_TRUE(engine_->wait_for_completion(30s));

    auto task = handle.get_task();
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task.value().status, upload_status::completed);
    EXPECT_EQ(task.value().original_size, original.size());
    EXPECT_LT(task.value().compressed_size, task.value().original_size);
    EXPECT_GT(task.value().compression_ratio, 1.0);

    auto confirmed = confirmer_->confirmed();
    ASSERT_EQ(confirmed.size(), 1u);
    EXPECT_EQ(confirmed[0].width.value_or(0), 256u);
    EXPECT_EQ(confirmed[0].height.value_or(0), 192u);
    EXPECT_EQ(confirmed[0].file_size, task.value().compressed_size);
    EXPECT_EQ(confirmed[0].original_filename, "photo.jpg");

    auto stats = engine_->get_stats();
    EXPECT_EQ(stats.compression_savings, original.size() - task.value().compressed_size);
}

// =============================================================================
// Allocation and Confirmation Failures
// =============================================================================

TEST_F(UploadEngineTest, AllocationFailureIsRetryable) {
    allocator_->fail_next(1000);
    build_engine();

    engine_->add_files({memory_source("a.jpg", 2048), memory_source("b.jpg", 2048)});
    ASSERT_TRUE(engine_->wait_for_completion(30s));

    for (const auto& task : engine_->get_tasks()) {
        EXPECT_EQ(task.status, upload_status::error);
        EXPECT_EQ(task.last_error.value_or(error_code::success), error_code::allocation_failed);
    }
    EXPECT_EQ(transport_->count(), 0u);

    allocator_->fail_next(0);
    EXPECT_EQ(engine_->retry_failed(), 2u);
    ASSERT_TRUE(engine_->wait_for_completion(30s));

    EXPECT_EQ(engine_->get_stats().completed, 2u);
}

TEST_F(UploadEngineTest, ConfirmationFailureIsRetryableWithoutDuplicates) {
    confirmer_->set_fail(true);
    build_engine();

    auto handle = engine_->add_file(memory_source("a.jpg", 2048));
    ASSERT_TRUE(engine_->wait_for_completion(30s));
    EXPECT_EQ(handle.get_status().value(), upload_status::error);
    EXPECT_EQ(handle.get_task().value().last_error.value_or(error_code::success),
              error_code::confirmation_failed);

    confirmer_->set_fail(false);
    EXPECT_EQ(engine_->retry_failed(), 1u);
    ASSERT_TRUE(engine_->wait_for_completion(30s));

    EXPECT_EQ(handle.get_status().value(), upload_status::completed);
    EXPECT_EQ(confirmer_->confirmed().size(), 1u);
    EXPECT_EQ(allocator_->issued_for(handle.get_id()), 1u);
}

// =============================================================================
// Retry and Cancel Tests
// =============================================================================

TEST_F(UploadEngineTest, RetryFailedRequeuesOnlyFailedTasks) {
    transport_->fail_path("b.jpg");
    build_engine();

    std::mutex mutex;
    std::vector<std::pair<std::size_t, std::size_t>> batches;
    engine_->on_batch_complete([&](std::size_t succeeded, std::size_t failed) {
        std::lock_guard lock(mutex);
        batches.emplace_back(succeeded, failed);
    });

    auto handles = engine_->add_files({memory_source("a.jpg", 4096),
                                       memory_source("b.jpg", 4096)});
    ASSERT_TRUE(engine_->wait_for_completion(30s));
    EXPECT_EQ(engine_->retry_failed(), 1u);
    ASSERT_TRUE(engine_->wait_for_completion(30s));
    EXPECT_EQ(handles[1].get_status().value(), upload_status::error);

    transport_->clear_failures();
    EXPECT_EQ(engine_->retry_failed(), 1u);
    ASSERT_TRUE(engine_->wait_for_completion(30s));

    auto retried = handles[1].get_task();
    ASSERT_TRUE(retried.has_value());
    EXPECT_EQ(retried.value().status, upload_status::completed);
    EXPECT_EQ(retried.value().attempts, 3u);
    EXPECT_FALSE(retried.value().error_message.has_value());

    EXPECT_EQ(handles[0].get_task().value().attempts, 1u);
    EXPECT_EQ(engine_->retry_failed(), 0u);

    std::lock_guard lock(mutex);
    ASSERT_EQ(batches.size(), 3u);
    EXPECT_EQ(batches.back(), std::make_pair(std::size_t{2}, std::size_t{0}));
}

TEST_F(UploadEngineTest, CancelStopsAdmissionOnly) {
    transport_->set_delay(200ms);
    build_engine(base_builder().with_concurrency(serial_concurrency()));

    auto handles = engine_->add_files({memory_source("a.jpg", 1024), memory_source("b.jpg", 1024),
                                       memory_source("c.jpg", 1024), memory_source("d.jpg", 1024)});
    ASSERT_TRUE(wait_until([&] {
        return handles[0].get_status().value() == upload_status::uploading;
    }));

    EXPECT_EQ(engine_->cancel(), 3u);
    ASSERT_TRUE(engine_->wait_for_completion(30s));

    EXPECT_EQ(handles[0].get_status().value(), upload_status::completed);
    for (std::size_t i = 1; i < handles.size(); ++i) {
        auto task = handles[i].get_task();
        ASSERT_TRUE(task.has_value());
        EXPECT_EQ(task.value().status, upload_status::error);
        EXPECT_EQ(task.value().last_error.value_or(error_code::success),
                  error_code::transfer_cancelled);
        EXPECT_EQ(task.value().attempts, 0u);
    }
    EXPECT_EQ(transport_->count(), 1u);

    transport_->set_delay(0ms);
    EXPECT_EQ(engine_->retry_failed(), 3u);
    ASSERT_TRUE(engine_->wait_for_completion(30s));
    EXPECT_EQ(engine_->get_stats().completed, 4u);
}

TEST_F(UploadEngineTest, AdmissionIsFifo) {
    build_engine(base_builder().with_concurrency(serial_concurrency()));

    engine_->add_files({memory_source("z.jpg", 512), memory_source("a.jpg", 512),
                        memory_source("m.jpg", 512)});
    ASSERT_TRUE(engine_->wait_for_completion(30s));

    auto records = transport_->records();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_NE(records[0].storage_path.find("z.jpg"), std::string::npos);
    EXPECT_NE(records[1].storage_path.find("a.jpg"), std::string::npos);
    EXPECT_NE(records[2].storage_path.find("m.jpg"), std::string::npos);
}

TEST_F(UploadEngineTest, NaturalSortOrdersBatch) {
    build_engine(base_builder().with_natural_sort(true).with_concurrency(serial_concurrency()));

    engine_->add_files({memory_source("img10.jpg", 512), memory_source("img2.jpg", 512),
                        memory_source("IMG1.jpg", 512)});
    ASSERT_TRUE(engine_->wait_for_completion(30s));

    auto tasks = engine_->get_tasks();
    ASSERT_EQ(tasks.size(), 3u);
    EXPECT_EQ(tasks[0].filename, "IMG1.jpg");
    EXPECT_EQ(tasks[1].filename, "img2.jpg");
    EXPECT_EQ(tasks[2].filename, "img10.jpg");

    auto records = transport_->records();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_NE(records[0].storage_path.find("IMG1.jpg"), std::string::npos);
}

TEST_F(UploadEngineTest, CaptureDateSortOrdersBatch) {
    build_engine(base_builder()
                     .with_capture_date_sort(true)
                     .with_compression(false)
                     .with_concurrency(serial_concurrency()));

    std::vector<upload_source> sources;
    sources.push_back(memory_source("img10.jpg", 512));
    sources.push_back(dated_jpeg("late.jpg", "2023:06:01 09:30:00"));
    sources.push_back(memory_source("img2.jpg", 512));
    sources.push_back(dated_jpeg("early.jpg", "2019:12:31 23:59:59"));
    engine_->add_files(std::move(sources));
    ASSERT_TRUE(engine_->wait_for_completion(30s));

    auto tasks = engine_->get_tasks();
    ASSERT_EQ(tasks.size(), 4u);
    EXPECT_EQ(tasks[0].filename, "early.jpg");
    EXPECT_EQ(tasks[1].filename, "late.jpg");
    EXPECT_EQ(tasks[2].filename, "img2.jpg");
    EXPECT_EQ(tasks[3].filename, "img10.jpg");

    auto records = transport_->records();
    ASSERT_EQ(records.size(), 4u);
    EXPECT_NE(records[0].storage_path.find("early.jpg"), std::string::npos);
}

// =============================================================================
// Pause Tests
// =============================================================================

TEST_F(UploadEngineTest, PauseHoldsAdmissionUntilResume) {
    transport_->set_delay(100ms);
    build_engine(base_builder().with_concurrency(serial_concurrency()));

    auto handles = engine_->add_files({memory_source("a.jpg", 1024), memory_source("b.jpg", 1024),
                                       memory_source("c.jpg", 1024)});
    ASSERT_TRUE(wait_until([&] {
        return handles[0].get_status().value() == upload_status::uploading;
    }));

    engine_->pause();
    EXPECT_TRUE(engine_->is_paused());

    ASSERT_TRUE(wait_until([&] {
        return handles[0].get_status().value() == upload_status::completed;
    }));
    EXPECT_FALSE(engine_->wait_for_completion(200ms));
    EXPECT_EQ(handles[1].get_status().value(), upload_status::pending);
    EXPECT_EQ(handles[2].get_status().value(), upload_status::pending);
    EXPECT_EQ(transport_->count(), 1u);
    EXPECT_TRUE(engine_->is_processing());

    transport_->set_delay(0ms);
    engine_->resume();
    EXPECT_FALSE(engine_->is_paused());
    ASSERT_TRUE(engine_->wait_for_completion(30s));

    EXPECT_EQ(engine_->get_stats().completed, 3u);
    EXPECT_EQ(transport_->count(), 3u);
}

TEST_F(UploadEngineTest, DestroyWhilePausedCancelsQueue) {
    build_engine();
    engine_->pause();

    auto handles = engine_->add_files({memory_source("a.jpg", 1024), memory_source("b.jpg", 1024)});
    EXPECT_FALSE(engine_->wait_for_completion(100ms));
    EXPECT_EQ(transport_->count(), 0u);

    engine_->destroy();
    EXPECT_TRUE(engine_->wait_for_completion(30s));
}

// =============================================================================
// Confirmation Batching Tests
// =============================================================================

TEST_F(UploadEngineTest, ConfirmationsAreBatched) {
    transport_->set_delay(40ms);
    build_engine(base_builder()
                     .with_concurrency(fixed_concurrency(4))
                     .with_confirmation_batching(50, 5s));

    std::vector<upload_source> sources;
    for (int i = 0; i < 8; ++i) {
        sources.push_back(memory_source("img" + std::to_string(i) + ".jpg", 2048));
    }
    auto handles = engine_->add_files(std::move(sources));
    ASSERT_TRUE(engine_->wait_for_completion(30s));

    EXPECT_EQ(confirmer_->confirmed().size(), 8u);
    EXPECT_LT(confirmer_->calls(), 8u);

    std::set<std::string> ids;
    for (const auto& handle : handles) {
        auto task = handle.get_task().value();
        EXPECT_EQ(task.status, upload_status::completed);
        ASSERT_TRUE(task.image_id.has_value());
        ids.insert(*task.image_id);
    }
    EXPECT_EQ(ids.size(), 8u);
}

TEST_F(UploadEngineTest, ConfirmationBatchSizeBoundsEachCall) {
    transport_->set_delay(40ms);
    build_engine(base_builder()
                     .with_concurrency(fixed_concurrency(4))
                     .with_confirmation_batching(2, 5s));

    std::vector<upload_source> sources;
    for (int i = 0; i < 4; ++i) {
        sources.push_back(memory_source("img" + std::to_string(i) + ".jpg", 2048));
    }
    engine_->add_files(std::move(sources));
    ASSERT_TRUE(engine_->wait_for_completion(30s));

    EXPECT_EQ(confirmer_->confirmed().size(), 4u);
    EXPECT_GE(confirmer_->calls(), 2u);
}

TEST_F(UploadEngineTest, FailedConfirmationBatchFailsEveryTask) {
    confirmer_->set_fail(true);
    transport_->set_delay(40ms);
    build_engine(base_builder()
                     .with_concurrency(fixed_concurrency(4))
                     .with_confirmation_batching(50, 5s));

    auto handles = engine_->add_files({memory_source("a.jpg", 1024), memory_source("b.jpg", 1024),
                                       memory_source("c.jpg", 1024), memory_source("d.jpg", 1024)});
    ASSERT_TRUE(engine_->wait_for_completion(30s));

    for (const auto& handle : handles) {
        auto task = handle.get_task().value();
        EXPECT_EQ(task.status, upload_status::error);
        EXPECT_EQ(task.last_error.value_or(error_code::success), error_code::confirmation_failed);
        ASSERT_TRUE(task.error_message.has_value());
        EXPECT_EQ(task.error_message->rfind("Confirm failed", 0), 0u);
        EXPECT_FALSE(task.image_id.has_value());
    }
    EXPECT_EQ(engine_->get_stats().failed, 4u);
}

// =============================================================================
// Destroy Tests
// =============================================================================

TEST_F(UploadEngineTest, DestroyIsIdempotent) {
    build_engine();
    auto handle = engine_->add_file(memory_source("a.jpg", 1024));
    ASSERT_TRUE(engine_->wait_for_completion(30s));

    engine_->destroy();
    engine_->destroy();

    EXPECT_TRUE(engine_->is_destroyed());
    EXPECT_TRUE(engine_->add_files({memory_source("b.jpg", 1024)}).empty());
    EXPECT_FALSE(engine_->add_file(memory_source("c.jpg", 1024)).is_valid());
    EXPECT_EQ(engine_->retry_failed(), 0u);
    EXPECT_TRUE(engine_->get_tasks().empty());

    auto status = handle.get_status();
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().code, error_code::engine_destroyed);
}

TEST_F(UploadEngineTest, DestroyDuringTransferSuppressesCompletion) {
    transport_->set_delay(100ms);
    build_engine();

    std::atomic<int> all_complete{0};
    engine_->on_all_complete([&]() { ++all_complete; });

    engine_->add_files({memory_source("a.jpg", 1024), memory_source("b.jpg", 1024)});
    ASSERT_TRUE(wait_until([&] { return engine_->get_stats().active() > 0; }));

    engine_->destroy();
    EXPECT_TRUE(engine_->wait_for_completion(30s));
    engine_.reset();

    EXPECT_EQ(all_complete.load(), 0);
}

// =============================================================================
// Callback Tests
// =============================================================================

TEST_F(UploadEngineTest, FileUpdatesFollowLifecycle) {
    build_engine();

    std::mutex mutex;
    std::vector<upload_task> updates;
    engine_->on_file_update([&](const upload_task& task) {
        std::lock_guard lock(mutex);
        updates.push_back(task);
    });

    auto handle = engine_->add_file(memory_source("a.jpg", 8192));
    ASSERT_TRUE(engine_->wait_for_completion(30s));

    std::lock_guard lock(mutex);
    ASSERT_GE(updates.size(), 3u);
    EXPECT_EQ(updates.front().status, upload_status::compressing);
    EXPECT_EQ(updates.back().status, upload_status::completed);

    double last_progress = -1.0;
    bool saw_uploading = false;
    for (const auto& update : updates) {
        EXPECT_EQ(update.id, handle.get_id());
        if (update.status == upload_status::uploading) {
            saw_uploading = true;
            EXPECT_GE(update.progress, last_progress);
            last_progress = update.progress;
        }
    }
    EXPECT_TRUE(saw_uploading);
    EXPECT_DOUBLE_EQ(updates.back().progress, 100.0);
}

TEST_F(UploadEngineTest, AllTasksTerminalWhenAllComplete) {
    transport_->fail_path("fail_");
    build_engine();

    std::atomic<bool> all_terminal{false};
    std::atomic<int> calls{0};
    engine_->on_all_complete([&]() {
        ++calls;
        auto tasks = engine_->get_tasks();
        all_terminal = std::all_of(tasks.begin(), tasks.end(), [](const upload_task& task) {
            return is_terminal_status(task.status);
        });
    });

    std::vector<upload_source> sources;
    for (int i = 0; i < 12; ++i) {
        sources.push_back(memory_source((i % 4 == 0 ? "fail_" : "ok_") + std::to_string(i) + ".jpg",
                                        2048));
    }
    engine_->add_files(std::move(sources));
    ASSERT_TRUE(engine_->wait_for_completion(30s));

    EXPECT_EQ(calls.load(), 1);
    EXPECT_TRUE(all_terminal.load());
    EXPECT_EQ(engine_->get_stats().failed, 3u);
}

TEST_F(UploadEngineTest, StatsUpdatedPerFinishedTask) {
    transport_->set_delay(20ms);
    build_engine();

    std::atomic<int> updates{0};
    engine_->on_stats_update([&](const batch_stats&) { ++updates; });

    engine_->add_files({memory_source("a.jpg", 4096), memory_source("b.jpg", 4096),
                        memory_source("c.jpg", 4096)});
    ASSERT_TRUE(engine_->wait_for_completion(30s));

    EXPECT_EQ(updates.load(), 3);
    auto stats = engine_->get_stats();
    EXPECT_EQ(stats.total_files, 3u);
    EXPECT_GT(stats.elapsed.count(), 0);
    EXPECT_GT(stats.average_speed, 0.0);
    ASSERT_TRUE(stats.estimated_seconds_remaining.has_value());
    EXPECT_DOUBLE_EQ(*stats.estimated_seconds_remaining, 0.0);
}

TEST_F(UploadEngineTest, ThrowingFileSubscriberKeepsTaskCompleted) {
    build_engine();

    std::atomic<int> all_complete{0};
    engine_->on_file_update([](const upload_task&) {
        throw std::runtime_error("subscriber failure");
    });
    engine_->on_all_complete([&]() { ++all_complete; });

    auto handles = engine_->add_files({memory_source("a.jpg", 2048), memory_source("b.jpg", 2048)});
    ASSERT_TRUE(engine_->wait_for_completion(30s));

    for (const auto& handle : handles) {
        auto task = handle.get_task().value();
        EXPECT_EQ(task.status, upload_status::completed);
        EXPECT_FALSE(task.error_message.has_value());
        EXPECT_TRUE(task.image_id.has_value());
    }
    EXPECT_EQ(engine_->get_stats().failed, 0u);
    EXPECT_EQ(engine_->get_concurrency_metrics().recent_errors, 0u);
    EXPECT_EQ(confirmer_->confirmed().size(), 2u);
    EXPECT_EQ(all_complete.load(), 1);
}

TEST_F(UploadEngineTest, ThrowingStatsSubscriberDoesNotStallBatch) {
    build_engine();
    engine_->on_stats_update([](const batch_stats&) { throw 7; });

    engine_->add_files({memory_source("a.jpg", 2048), memory_source("b.jpg", 2048)});
    ASSERT_TRUE(engine_->wait_for_completion(30s));

    EXPECT_EQ(engine_->get_stats().completed, 2u);
}

TEST_F(UploadEngineTest, NonStandardExceptionEndsInInternalError) {
    transport_ = std::make_shared<int_throwing_transport>("bad.jpg");
    build_engine(base_builder().with_concurrency(serial_concurrency()));

    auto handles = engine_->add_files({memory_source("bad.jpg", 1024), memory_source("good.jpg", 1024)});
    ASSERT_TRUE(engine_->wait_for_completion(30s));

    auto bad = handles[0].get_task().value();
    EXPECT_EQ(bad.status, upload_status::error);
    EXPECT_EQ(bad.last_error.value_or(error_code::success), error_code::internal_error);
    EXPECT_EQ(handles[1].get_status().value(), upload_status::completed);
    EXPECT_TRUE(engine_->get_stats().is_idle());
    EXPECT_EQ(engine_->get_concurrency_metrics().recent_errors, 1u);
}

TEST_F(UploadEngineTest, TerminalEventsPrecedeAllComplete) {
    transport_->fail_path("a.jpg");
    build_engine();

    std::mutex mutex;
    std::vector<std::string> events;
    auto record = [&](std::string event) {
        std::lock_guard lock(mutex);
        events.push_back(std::move(event));
    };
    engine_->on_file_update([&](const upload_task& task) {
        if (task.status == upload_status::error) {
            record("error");
        }
    });
    engine_->on_stats_update([&](const batch_stats&) { record("stats"); });
    engine_->on_all_complete([&]() { record("all"); });

    engine_->add_file(memory_source("a.jpg", 1024));
    ASSERT_TRUE(engine_->wait_for_completion(30s));

    std::lock_guard lock(mutex);
    EXPECT_EQ(events, (std::vector<std::string>{"error", "stats", "all"}));
}

// =============================================================================
// Validation Tests
// =============================================================================

TEST_F(UploadEngineTest, InvalidSourceEndsInErrorWithoutControllerSample) {
    build_engine();

    auto empty = engine_->add_file(upload_source::from_memory("empty.jpg", {}, "image/jpeg"));
    auto missing = engine_->add_file(upload_source::from_file(test_dir_ / "missing.jpg"));
    ASSERT_TRUE(engine_->wait_for_completion(30s));

    EXPECT_EQ(empty.get_task().value().last_error.value_or(error_code::success),
              error_code::invalid_source);
    EXPECT_EQ(missing.get_task().value().last_error.value_or(error_code::success),
              error_code::file_not_found);
    EXPECT_EQ(engine_->get_concurrency_metrics().sample_count, 0u);
    EXPECT_EQ(transport_->count(), 0u);
}

TEST_F(UploadEngineTest, UploadsFileSource) {
    auto data = make_payload(3000);
    auto path = write_file("disk.png", data);
    build_engine();

    auto handle = engine_->add_file(upload_source::from_file(path));
    ASSERT_TRUE(engine_->wait_for_completion(30s));

    EXPECT_EQ(handle.get_status().value(), upload_status::completed);
    auto records = transport_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].payload, data);
    EXPECT_EQ(records[0].content_type, "image/png");
}

TEST_F(UploadEngineTest, UnknownTaskIsNotFound) {
    build_engine();

    auto task = engine_->get_task("no-such-task");

    ASSERT_FALSE(task.has_value());
    EXPECT_EQ(task.error().code, error_code::task_not_found);
}

TEST_F(UploadEngineTest, TaskIdsCarrySession) {
    build_engine();

    auto handles = engine_->add_files({memory_source("a.jpg", 64), memory_source("b.jpg", 64)});
    ASSERT_TRUE(engine_->wait_for_completion(30s));

    ASSERT_EQ(handles.size(), 2u);
    EXPECT_NE(handles[0].get_id(), handles[1].get_id());
    for (const auto& handle : handles) {
        EXPECT_EQ(handle.get_id().rfind(engine_->get_session_id() + "-", 0), 0u);
    }
}

// =============================================================================
// Isolation Tests
// =============================================================================

TEST_F(UploadEngineTest, EnginesAreIndependent) {
    build_engine();

    auto other_transport = std::make_shared<fake_transport>();
    auto other_confirmer = std::make_shared<fake_confirmer>();
    other_transport->fail_path("x.jpg");
    auto other = upload_engine::builder()
                     .with_container_id("gallery-2")
                     .with_allocator(allocator_)
                     .with_transport(other_transport)
                     .with_confirmer(other_confirmer)
                     .with_concurrency(fast_concurrency())
                     .with_preflight(fast_preflight())
                     .build();
    ASSERT_TRUE(other.has_value());

    engine_->add_files({memory_source("x.jpg", 1024), memory_source("y.jpg", 1024)});
    other.value().add_files({memory_source("x.jpg", 1024)});

    ASSERT_TRUE(engine_->wait_for_completion(30s));
    ASSERT_TRUE(other.value().wait_for_completion(30s));

    EXPECT_NE(engine_->get_session_id(), other.value().get_session_id());
    EXPECT_EQ(engine_->get_stats().completed, 2u);
    EXPECT_EQ(other.value().get_stats().failed, 1u);
    EXPECT_EQ(other.value().get_tasks().size(), 1u);
    EXPECT_EQ(transport_->count(), 2u);
    EXPECT_EQ(confirmer_->last_container(), "gallery-1");

    other.value().destroy();
    EXPECT_FALSE(engine_->is_destroyed());
    EXPECT_EQ(engine_->get_tasks().size(), 2u);
}

}  // namespace kcenon::image_upload::test
