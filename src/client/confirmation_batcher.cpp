/**
 * @file confirmation_batcher.cpp
 * @brief Batched upload confirmation
 */

#include "kcenon/image_upload/client/confirmation_batcher.h"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>
#include <vector>

#include "kcenon/image_upload/core/logging.h"

namespace kcenon::image_upload {

namespace {

struct waiting_record {
    confirmation_record record;
    bool queued = true;  ///< Not yet taken into a batch
    std::optional<result<std::string>> outcome;
};

}  // namespace

// ============================================================================
// Implementation
// ============================================================================

struct confirmation_batcher::impl {
    std::shared_ptr<upload_confirmer> confirmer;
    std::string container_id;
    confirmation_batch_config config;
    readiness_check ready;

    mutable std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::shared_ptr<waiting_record>> queue;
    bool sending = false;
    std::size_t batches = 0;

    // Caller holds mutex
    auto should_send(std::chrono::steady_clock::time_point deadline) const -> bool {
        if (queue.size() >= config.batch_size) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return true;
        }
        return ready && ready(queue.size());
    }

    auto call_confirmer(const std::vector<confirmation_record>& records)
        -> result<std::vector<std::string>> {
        try {
            return confirmer->confirm(container_id, records);
        } catch (const std::exception& e) {
            return unexpected{error{error_code::confirmation_failed,
                std::string("Confirmer threw: ") + e.what()}};
        } catch (...) {
            return unexpected{error{error_code::confirmation_failed,
                "Confirmer threw a non-standard exception"}};
        }
    }

    /**
     * @brief Send the oldest batch_size records; releases the lock around the call
     */
    void send(std::unique_lock<std::mutex>& lock) {
        sending = true;
        const auto count = std::min(config.batch_size, queue.size());
        std::vector<std::shared_ptr<waiting_record>> batch(queue.begin(),
                                                           queue.begin() + count);
        queue.erase(queue.begin(), queue.begin() + count);

        std::vector<confirmation_record> records;
        records.reserve(batch.size());
        for (auto& item : batch) {
            item->queued = false;
            records.push_back(item->record);
        }
        ++batches;
        lock.unlock();

        IU_LOG_DEBUG(log_category::confirmation,
            "Confirming batch of " + std::to_string(records.size()) + " upload(s)");

        auto confirmed = call_confirmer(records);
        if (!confirmed.has_value()) {
            IU_LOG_WARN(log_category::confirmation,
                "Confirmation of " + std::to_string(records.size()) +
                " upload(s) failed: " + confirmed.error().message);
        }

        lock.lock();
        for (std::size_t i = 0; i < batch.size(); ++i) {
            if (!confirmed.has_value()) {
                batch[i]->outcome = result<std::string>{unexpected{confirmed.error()}};
            } else if (i < confirmed.value().size()) {
                batch[i]->outcome = result<std::string>{confirmed.value()[i]};
            } else {
                batch[i]->outcome = result<std::string>{std::string{}};
            }
        }
        sending = false;
        cv.notify_all();
    }
};

confirmation_batcher::confirmation_batcher(std::shared_ptr<upload_confirmer> confirmer,
                                           std::string container_id,
                                           confirmation_batch_config config,
                                           readiness_check ready)
    : impl_(std::make_unique<impl>()) {
    impl_->confirmer = std::move(confirmer);
    impl_->container_id = std::move(container_id);
    impl_->config = config;
    impl_->ready = std::move(ready);
    if (impl_->config.batch_size == 0) {
        impl_->config.batch_size = 1;
    }
}

confirmation_batcher::~confirmation_batcher() = default;

auto confirmation_batcher::confirm(confirmation_record record) -> result<std::string> {
    auto item = std::make_shared<waiting_record>();
    item->record = std::move(record);

    const auto deadline = std::chrono::steady_clock::now() + impl_->config.linger;

    std::unique_lock lock(impl_->mutex);
    impl_->queue.push_back(item);
    impl_->cv.notify_all();

    while (!item->outcome) {
        if (item->queued && !impl_->sending && impl_->should_send(deadline)) {
            impl_->send(lock);
            continue;
        }
        if (item->queued && !impl_->sending) {
            impl_->cv.wait_until(lock, deadline);
        } else {
            impl_->cv.wait(lock);
        }
    }
    return std::move(*item->outcome);
}

void confirmation_batcher::poke() {
    {
        std::lock_guard lock(impl_->mutex);
    }
    impl_->cv.notify_all();
}

auto confirmation_batcher::batches_sent() const -> std::size_t {
    std::lock_guard lock(impl_->mutex);
    return impl_->batches;
}

auto confirmation_batcher::config() const -> const confirmation_batch_config& {
    return impl_->config;
}

}  // namespace kcenon::image_upload
