/**
 * @file test_preflight_optimizer.cpp
 * @brief Unit tests for destination prefetching
 */

#include <gtest/gtest.h>

#include "integration/test_fixtures.h"

namespace kcenon::image_upload::test {

using namespace std::chrono_literals;

// =============================================================================
// Test Fixture
// =============================================================================

class PreflightOptimizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().set_console_output(false);
        allocator_ = std::make_shared<fake_allocator>();
        pool_ = std::make_shared<manual_worker_pool>();
    }

    void TearDown() override {
        if (pool_) {
            pool_->run_parked();
        }
        optimizer_.reset();
    }

    static auto test_config() -> preflight_config {
        preflight_config config;
        config.batch_size = 2;
        config.expiry_buffer = 60s;
        config.retry.max_attempts = 3;
        config.retry.initial_delay = 1ms;
        config.retry.max_delay = 5ms;
        config.retry.use_jitter = false;
        return config;
    }

    void create(preflight_config config = test_config()) {
        optimizer_ = std::make_unique<preflight_optimizer>(allocator_, "gallery-1", config, pool_);
    }

    static auto descriptor(const std::string& id) -> upload_descriptor {
        return upload_descriptor{id, id + ".jpg", "image/jpeg", 2048};
    }

    std::shared_ptr<fake_allocator> allocator_;
    std::shared_ptr<manual_worker_pool> pool_;
    std::unique_ptr<preflight_optimizer> optimizer_;
};

// =============================================================================
// Configuration Tests
// =============================================================================

TEST_F(PreflightOptimizerTest, NormalizesConfig) {
    preflight_config config;
    config.prefetch_concurrency = 0;
    config.batch_size = 0;
    config.retry.max_attempts = 0;

    create(config);

    EXPECT_EQ(optimizer_->config().prefetch_concurrency, 1u);
    EXPECT_EQ(optimizer_->config().batch_size, 1u);
    EXPECT_EQ(optimizer_->config().retry.max_attempts, 1u);
}

// =============================================================================
// Prefetch Tests
// =============================================================================

TEST_F(PreflightOptimizerTest, PrefetchBatchesDescriptors) {
    create();

    optimizer_->queue_for_prefetch({descriptor("t1"), descriptor("t2"), descriptor("t3")});

    EXPECT_EQ(pool_->submitted(adapters::stage::prefetch), 2u);
    EXPECT_EQ(optimizer_->stats().queued, 3u);
    EXPECT_EQ(allocator_->calls(), 0u);

    pool_->run_parked();

    EXPECT_EQ(allocator_->calls(), 2u);
    auto stats = optimizer_->stats();
    EXPECT_EQ(stats.cached, 3u);
    EXPECT_EQ(stats.pending, 0u);
    EXPECT_EQ(stats.queued, 0u);
}

TEST_F(PreflightOptimizerTest, RepeatedQueueingIsIgnored) {
    create();

    optimizer_->queue_for_prefetch({descriptor("t1")});
    optimizer_->queue_for_prefetch({descriptor("t1")});
    pool_->run_parked();

    EXPECT_EQ(pool_->submitted(adapters::stage::prefetch), 1u);
    EXPECT_EQ(allocator_->issued_for("t1"), 1u);
}

TEST_F(PreflightOptimizerTest, PrefetchedDestinationIsReusedWithoutNewCall) {
    create();
    optimizer_->queue_for_prefetch({descriptor("t1")});
    pool_->run_parked();

    auto first = optimizer_->get_signed_url(descriptor("t1"));
    auto second = optimizer_->get_signed_url(descriptor("t1"));

    ASSERT_TRUE(first.has_value()) << first.error().message;
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first.value(), second.value());
    EXPECT_EQ(first.value().local_id, "t1");
    EXPECT_EQ(first.value().storage_path, "gallery-1/t1/t1.jpg");
    EXPECT_EQ(allocator_->calls(), 1u);
}

// =============================================================================
// On-Demand Tests
// =============================================================================

TEST_F(PreflightOptimizerTest, AllocatesOnDemandWithoutPrefetch) {
    create();

    auto first = optimizer_->get_signed_url(descriptor("t1"));
    auto second = optimizer_->get_signed_url(descriptor("t1"));

    ASSERT_TRUE(first.has_value()) << first.error().message;
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first.value(), second.value());
    EXPECT_EQ(allocator_->calls(), 1u);
    EXPECT_EQ(optimizer_->stats().cached, 1u);
}

TEST_F(PreflightOptimizerTest, OnDemandTakesOverQueuedEntry) {
    create();
    optimizer_->queue_for_prefetch({descriptor("t1")});

    // Prefetch has not run yet; the request must not wait for it
    auto destination = optimizer_->get_signed_url(descriptor("t1"));
    ASSERT_TRUE(destination.has_value()) << destination.error().message;
    EXPECT_EQ(allocator_->calls(), 1u);

    pool_->run_parked();

    EXPECT_EQ(allocator_->calls(), 1u);
    EXPECT_EQ(allocator_->issued_for("t1"), 1u);

    auto again = optimizer_->get_signed_url(descriptor("t1"));
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again.value(), destination.value());
}

TEST_F(PreflightOptimizerTest, OnDemandFailureIsReportedAndRetryable) {
    create();
    allocator_->fail_next(1);

    auto failed = optimizer_->get_signed_url(descriptor("t1"));
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, error_code::allocation_failed);
    EXPECT_EQ(optimizer_->stats().pending, 0u);

    auto retried = optimizer_->get_signed_url(descriptor("t1"));
    ASSERT_TRUE(retried.has_value()) << retried.error().message;
    EXPECT_EQ(allocator_->calls(), 2u);
}

TEST_F(PreflightOptimizerTest, MissingDestinationIsIncomplete) {
    create();
    allocator_->omit("t1.jpg");

    auto result = optimizer_->get_signed_url(descriptor("t1"));

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::allocation_incomplete);
}

TEST_F(PreflightOptimizerTest, ConcurrentRequestsShareOneAllocation) {
    pool_.reset();
    allocator_->set_delay(50ms);
    optimizer_ = std::make_unique<preflight_optimizer>(allocator_, "gallery-1", test_config());

    std::vector<result<upload_destination>> results(4);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&, i]() { results[i] = optimizer_->get_signed_url(descriptor("t1")); });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (const auto& r : results) {
        ASSERT_TRUE(r.has_value()) << r.error().message;
        EXPECT_EQ(r.value(), results[0].value());
    }
    EXPECT_EQ(allocator_->issued_for("t1"), 1u);
}

// =============================================================================
// Retry Tests
// =============================================================================

TEST_F(PreflightOptimizerTest, FailedPrefetchIsRetried) {
    create();
    allocator_->fail_next(1);

    optimizer_->queue_for_prefetch({descriptor("t1"), descriptor("t2")});
    pool_->run_parked();

    EXPECT_EQ(allocator_->calls(), 2u);
    EXPECT_EQ(optimizer_->stats().cached, 2u);
}

TEST_F(PreflightOptimizerTest, ExhaustedPrefetchFallsBackToOnDemand) {
    create();
    allocator_->fail_next(3);

    optimizer_->queue_for_prefetch({descriptor("t1")});
    pool_->run_parked();

    EXPECT_EQ(allocator_->calls(), 3u);
    EXPECT_EQ(optimizer_->stats().queued, 1u);

    auto destination = optimizer_->get_signed_url(descriptor("t1"));
    ASSERT_TRUE(destination.has_value()) << destination.error().message;
    EXPECT_EQ(allocator_->calls(), 4u);
}

// =============================================================================
// Expiry Tests
// =============================================================================

TEST_F(PreflightOptimizerTest, NearExpiryDestinationIsRefreshed) {
    create();
    allocator_->set_validity(30s);
    optimizer_->queue_for_prefetch({descriptor("t1")});
    pool_->run_parked();
    ASSERT_EQ(allocator_->issued_for("t1"), 1u);

    allocator_->set_validity(10min);
    auto destination = optimizer_->get_signed_url(descriptor("t1"));

    ASSERT_TRUE(destination.has_value()) << destination.error().message;
    EXPECT_EQ(allocator_->issued_for("t1"), 2u);
    EXPECT_EQ(destination.value().token, "tok-t1-2");
    EXPECT_FALSE(destination.value().expires_within(60s));
}

// =============================================================================
// Clear Tests
// =============================================================================

TEST_F(PreflightOptimizerTest, ClearReleasesUnusedDestinations) {
    create();
    optimizer_->queue_for_prefetch({descriptor("t1"), descriptor("t2")});
    pool_->run_parked();
    ASSERT_TRUE(optimizer_->get_signed_url(descriptor("t1")).has_value());

    optimizer_->clear();

    auto released = allocator_->released();
    ASSERT_EQ(released.size(), 1u);
    EXPECT_EQ(released[0].local_id, "t2");

    auto stats = optimizer_->stats();
    EXPECT_EQ(stats.cached, 0u);
    EXPECT_EQ(stats.queued, 0u);
}

TEST_F(PreflightOptimizerTest, ClearDiscardsQueuedPrefetch) {
    create();
    optimizer_->queue_for_prefetch({descriptor("t1"), descriptor("t2")});

    optimizer_->clear();
    pool_->run_parked();

    EXPECT_EQ(allocator_->calls(), 0u);
    EXPECT_EQ(optimizer_->stats().cached, 0u);
}

TEST_F(PreflightOptimizerTest, DestinationsAfterClearAreFresh) {
    create();
    auto before = optimizer_->get_signed_url(descriptor("t1"));
    ASSERT_TRUE(before.has_value());

    optimizer_->clear();
    auto after = optimizer_->get_signed_url(descriptor("t1"));

    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(allocator_->issued_for("t1"), 2u);
    EXPECT_EQ(after.value().storage_path, before.value().storage_path);
    EXPECT_TRUE(allocator_->released().empty());
}

}  // namespace kcenon::image_upload::test
