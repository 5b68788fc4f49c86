/**
 * @file test_fixtures.h
 * @brief Shared fixtures and in-process fakes for upload engine tests
 */

#ifndef KCENON_IMAGE_UPLOAD_TEST_FIXTURES_H
#define KCENON_IMAGE_UPLOAD_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <kcenon/image_upload/image_upload.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <jpeglib.h>

namespace kcenon::image_upload::test {

// =============================================================================
// Payload helpers
// =============================================================================

/**
 * @brief Pseudo-random bytes (fixed seed, incompressible)
 */
inline auto make_payload(std::size_t size, uint32_t seed = 42) -> std::vector<std::byte> {
    std::vector<std::byte> data(size);
    std::mt19937 gen(seed);
    std::uniform_int_distribution<> dis(0, 255);
    for (auto& b : data) {
        b = static_cast<std::byte>(dis(gen));
    }
    return data;
}

/**
 * @brief An APPn segment to embed in a test JPEG
 */
struct jpeg_marker {
    int code;
    std::vector<uint8_t> data;
};

/**
 * @brief Encode RGB pixels as JPEG, writing the given markers after SOI
 */
inline auto encode_test_jpeg(uint32_t width, uint32_t height, std::vector<uint8_t>& pixels,
                             int quality, const std::vector<jpeg_marker>& markers = {})
    -> std::vector<std::byte> {
    jpeg_compress_struct cinfo{};
    jpeg_error_mgr jerr{};
    cinfo.err = jpeg_std_error(&jerr);
    jpeg_create_compress(&cinfo);

    unsigned char* buffer = nullptr;
    unsigned long size = 0;
    jpeg_mem_dest(&cinfo, &buffer, &size);

    cinfo.image_width = width;
    cinfo.image_height = height;
    cinfo.input_components = 3;
    cinfo.in_color_space = JCS_RGB;
    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, quality, TRUE);
    if (!markers.empty()) {
        cinfo.write_JFIF_header = FALSE;
    }
    jpeg_start_compress(&cinfo, TRUE);

    for (const auto& marker : markers) {
        jpeg_write_marker(&cinfo, marker.code, marker.data.data(),
                          static_cast<unsigned int>(marker.data.size()));
    }
    while (cinfo.next_scanline < cinfo.image_height) {
        JSAMPROW row = &pixels[static_cast<std::size_t>(cinfo.next_scanline) * width * 3];
        jpeg_write_scanlines(&cinfo, &row, 1);
    }
    jpeg_finish_compress(&cinfo);
    jpeg_destroy_compress(&cinfo);

    std::vector<std::byte> out(reinterpret_cast<std::byte*>(buffer),
                               reinterpret_cast<std::byte*>(buffer) + size);
    std::free(buffer);
    return out;
}

/**
 * @brief Encode a noisy RGB image as JPEG at the given quality
 *
 * Noise keeps the output large at high quality, so recompression at a lower
 * quality reliably shrinks it.
 */
inline auto make_jpeg(uint32_t width, uint32_t height, int quality = 100,
                      uint32_t seed = 7, const std::vector<jpeg_marker>& markers = {})
    -> std::vector<std::byte> {
    std::vector<uint8_t> pixels(static_cast<std::size_t>(width) * height * 3);
    std::mt19937 gen(seed);
    std::uniform_int_distribution<> dis(0, 255);
    for (auto& p : pixels) {
        p = static_cast<uint8_t>(dis(gen));
    }
    return encode_test_jpeg(width, height, pixels, quality, markers);
}

/**
 * @brief Little-endian APP1 EXIF segment with an orientation tag
 * @param capture_time "YYYY:MM:DD HH:MM:SS" stored as DateTimeOriginal; empty for none
 */
inline auto make_exif_segment(uint16_t orientation, const std::string& capture_time = {})
    -> jpeg_marker {
    std::vector<uint8_t> data = {'E', 'x', 'i', 'f', 0, 0, 'I', 'I', 42, 0, 8, 0, 0, 0};
    auto put16 = [&](uint16_t v) {
        data.push_back(static_cast<uint8_t>(v & 0xFF));
        data.push_back(static_cast<uint8_t>(v >> 8));
    };
    auto put32 = [&](uint32_t v) {
        for (int i = 0; i < 4; ++i) {
            data.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
        }
    };

    const bool dated = !capture_time.empty();
    const uint16_t entries = dated ? 2 : 1;
    const uint32_t exif_ifd = 8 + 2 + 12u * entries + 4;

    put16(entries);
    put16(0x0112);  // Orientation, SHORT
    put16(3);
    put32(1);
    put16(orientation);
    put16(0);
    if (dated) {
        put16(0x8769);  // Exif IFD pointer, LONG
        put16(4);
        put32(1);
        put32(exif_ifd);
    }
    put32(0);  // no IFD1

    if (dated) {
        put16(1);
        put16(0x9003);  // DateTimeOriginal, ASCII[20]
        put16(2);
        put32(20);
        put32(exif_ifd + 2 + 12 + 4);
        put32(0);
        data.insert(data.end(), capture_time.begin(), capture_time.end());
        data.push_back(0);
    }
    return jpeg_marker{JPEG_APP0 + 1, std::move(data)};
}

/**
 * @brief Bytes that start like a JPEG but cannot be decoded
 */
inline auto make_corrupt_jpeg(std::size_t size) -> std::vector<std::byte> {
    auto data = make_payload(size, 99);
    data[0] = std::byte{0xFF};
    data[1] = std::byte{0xD8};
    data[2] = std::byte{0xFF};
    return data;
}

inline auto wait_until(const std::function<bool()>& predicate,
                       std::chrono::milliseconds timeout = std::chrono::seconds(10)) -> bool {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return predicate();
}

// =============================================================================
// Fake remote collaborators
// =============================================================================

/**
 * @brief In-memory destination allocator
 *
 * Storage paths are stable per local_id; each call issues a fresh token.
 */
class fake_allocator : public destination_allocator {
public:
    auto allocate(const std::string& container_id,
                  const std::vector<upload_descriptor>& descriptors)
        -> result<std::vector<upload_destination>> override {
        const auto delay = delay_.load();
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }

        std::lock_guard lock(mutex_);
        ++calls_;
        if (failures_remaining_ > 0) {
            --failures_remaining_;
            return unexpected{error{error_code::allocation_failed, "HTTP 503: unavailable"}};
        }

        std::vector<upload_destination> out;
        for (const auto& descriptor : descriptors) {
            if (omitted_.count(descriptor.filename) > 0) {
                continue;
            }
            auto issued = ++issued_per_id_[descriptor.local_id];
            ++allocated_;

            upload_destination destination;
            destination.local_id = descriptor.local_id;
            destination.storage_path = container_id + "/" + descriptor.local_id + "/" +
                                       descriptor.filename;
            destination.signed_url = "https://storage.test/" + destination.storage_path +
                                     "?sig=" + std::to_string(issued);
            destination.token = "tok-" + descriptor.local_id + "-" + std::to_string(issued);
            destination.expires_at = std::chrono::system_clock::now() + validity_;
            out.push_back(std::move(destination));
        }
        return out;
    }

    auto release(const std::string& container_id,
                 const std::vector<upload_destination>& destinations)
        -> result<void> override {
        (void)container_id;
        std::lock_guard lock(mutex_);
        released_.insert(released_.end(), destinations.begin(), destinations.end());
        return {};
    }

    void set_delay(std::chrono::milliseconds delay) { delay_ = delay; }

    void set_validity(std::chrono::milliseconds validity) {
        std::lock_guard lock(mutex_);
        validity_ = validity;
    }

    void fail_next(std::size_t count) {
        std::lock_guard lock(mutex_);
        failures_remaining_ = count;
    }

    /**
     * @brief Leave files with this name out of every response
     */
    void omit(const std::string& filename) {
        std::lock_guard lock(mutex_);
        omitted_.insert(filename);
    }

    auto calls() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return calls_;
    }

    auto allocated() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return allocated_;
    }

    auto issued_for(const std::string& local_id) const -> std::size_t {
        std::lock_guard lock(mutex_);
        auto it = issued_per_id_.find(local_id);
        return it == issued_per_id_.end() ? 0 : it->second;
    }

    auto released() const -> std::vector<upload_destination> {
        std::lock_guard lock(mutex_);
        return released_;
    }

private:
    mutable std::mutex mutex_;
    std::atomic<std::chrono::milliseconds> delay_{std::chrono::milliseconds(0)};
    std::chrono::milliseconds validity_{std::chrono::minutes(10)};
    std::size_t failures_remaining_ = 0;
    std::size_t calls_ = 0;
    std::size_t allocated_ = 0;
    std::set<std::string> omitted_;
    std::map<std::string, std::size_t> issued_per_id_;
    std::vector<upload_destination> released_;
};

/**
 * @brief Records PUTs and reports progress in four chunks
 */
class fake_transport : public blob_transport {
public:
    struct put_record {
        std::string storage_path;
        std::string content_type;
        std::size_t size = 0;
        std::vector<std::byte> payload;
    };

    auto put(const upload_destination& destination, std::span<const std::byte> payload,
             const std::string& content_type, const transfer_progress_callback& on_progress)
        -> result<void> override {
        auto now_active = ++active_;
        auto peak = peak_.load();
        while (now_active > peak && !peak_.compare_exchange_weak(peak, now_active)) {
        }

        const auto total = static_cast<uint64_t>(payload.size());
        const auto delay = delay_for(destination.storage_path);
        for (int chunk = 1; chunk <= 4; ++chunk) {
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay / 4);
            }
            if (on_progress) {
                on_progress(total * static_cast<uint64_t>(chunk) / 4, total);
            }
        }

        --active_;

        std::lock_guard lock(mutex_);
        for (const auto& fragment : failing_) {
            if (destination.storage_path.find(fragment) != std::string::npos) {
                return unexpected{error{error_code::transfer_failed, "HTTP 500: upstream error"}};
            }
        }
        records_.push_back(put_record{destination.storage_path, content_type, payload.size(),
                                      std::vector<std::byte>(payload.begin(), payload.end())});
        return {};
    }

    /**
     * @brief Fail every PUT whose storage path contains the fragment
     */
    void fail_path(const std::string& fragment) {
        std::lock_guard lock(mutex_);
        failing_.insert(fragment);
    }

    void clear_failures() {
        std::lock_guard lock(mutex_);
        failing_.clear();
    }

    void set_delay(std::chrono::milliseconds delay) {
        std::lock_guard lock(mutex_);
        delay_ = delay;
    }

    /**
     * @brief Per-file delay, matched on the storage path
     */
    void set_delay_for(const std::string& fragment, std::chrono::milliseconds delay) {
        std::lock_guard lock(mutex_);
        delays_[fragment] = delay;
    }

    auto records() const -> std::vector<put_record> {
        std::lock_guard lock(mutex_);
        return records_;
    }

    auto count() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return records_.size();
    }

    auto peak_concurrency() const -> std::size_t { return peak_.load(); }

private:
    auto delay_for(const std::string& storage_path) -> std::chrono::milliseconds {
        std::lock_guard lock(mutex_);
        for (const auto& [fragment, delay] : delays_) {
            if (storage_path.find(fragment) != std::string::npos) {
                return delay;
            }
        }
        return delay_;
    }

    mutable std::mutex mutex_;
    std::set<std::string> failing_;
    std::map<std::string, std::chrono::milliseconds> delays_;
    std::chrono::milliseconds delay_{0};
    std::vector<put_record> records_;
    std::atomic<std::size_t> active_{0};
    std::atomic<std::size_t> peak_{0};
};

/**
 * @brief Confirmer keyed on (storage_path, token), never duplicating records
 */
class fake_confirmer : public upload_confirmer {
public:
    auto confirm(const std::string& container_id,
                 const std::vector<confirmation_record>& uploads)
        -> result<std::vector<std::string>> override {
        std::lock_guard lock(mutex_);
        ++calls_;
        last_container_ = container_id;
        if (fail_) {
            return unexpected{error{error_code::confirmation_failed, "HTTP 500: database error"}};
        }

        std::vector<std::string> ids;
        for (const auto& upload : uploads) {
            auto key = upload.storage_path + "|" + upload.token;
            auto [it, inserted] =
                records_.try_emplace(key, "img-" + std::to_string(records_.size() + 1));
            if (inserted) {
                confirmed_.push_back(upload);
            }
            ids.push_back(it->second);
        }
        return ids;
    }

    void set_fail(bool fail) {
        std::lock_guard lock(mutex_);
        fail_ = fail;
    }

    auto calls() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return calls_;
    }

    auto confirmed() const -> std::vector<confirmation_record> {
        std::lock_guard lock(mutex_);
        return confirmed_;
    }

    auto last_container() const -> std::string {
        std::lock_guard lock(mutex_);
        return last_container_;
    }

private:
    mutable std::mutex mutex_;
    bool fail_ = false;
    std::size_t calls_ = 0;
    std::string last_container_;
    std::map<std::string, std::string> records_;
    std::vector<confirmation_record> confirmed_;
};

// =============================================================================
// Manual worker pool
// =============================================================================

/**
 * @brief Pool that parks every submission until run_parked()
 *
 * Lets a test decide exactly when prefetch work runs. Work submitted while
 * parked work is running is run in the same call.
 */
class manual_worker_pool : public adapters::upload_worker_pool_interface {
public:
    ~manual_worker_pool() override { run_parked(); }

    auto submit(std::function<void()> task) -> std::future<void> override {
        return submit_to_stage(std::move(task), "default");
    }

    auto submit_delayed(std::function<void()> task, std::chrono::milliseconds delay)
        -> std::future<void> override {
        return submit([task = std::move(task), delay]() {
            std::this_thread::sleep_for(delay);
            task();
        });
    }

    auto submit_to_stage(std::function<void()> task, const std::string& stage_name)
        -> std::future<void> override {
        std::packaged_task<void()> packaged(std::move(task));
        auto future = packaged.get_future();
        std::lock_guard lock(mutex_);
        ++submitted_[stage_name];
        parked_.push_back(std::move(packaged));
        return future;
    }

    /**
     * @brief Run parked work until none is left
     * @return Number of tasks run
     */
    auto run_parked() -> std::size_t {
        std::size_t ran = 0;
        while (true) {
            std::packaged_task<void()> task;
            {
                std::lock_guard lock(mutex_);
                if (parked_.empty()) {
                    return ran;
                }
                task = std::move(parked_.front());
                parked_.pop_front();
            }
            task();
            ++ran;
        }
    }

    auto parked() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return parked_.size();
    }

    auto submitted(const std::string& stage_name) const -> std::size_t {
        std::lock_guard lock(mutex_);
        auto it = submitted_.find(stage_name);
        return it == submitted_.end() ? 0 : it->second;
    }

    auto worker_count() const -> std::size_t override { return 1; }
    auto is_running() const -> bool override { return true; }

    auto pending_tasks() const -> std::size_t override { return parked(); }

    auto pending_tasks(const std::string& stage_name) const -> std::size_t override {
        (void)stage_name;
        return parked();
    }

    auto name() const -> std::string override { return "manual_pool"; }

private:
    mutable std::mutex mutex_;
    std::deque<std::packaged_task<void()>> parked_;
    std::map<std::string, std::size_t> submitted_;
};

// =============================================================================
// Fixtures
// =============================================================================

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().set_console_output(false);
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("image_upload_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto write_file(const std::string& name, const std::vector<std::byte>& data)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);
        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        return path;
    }

    std::filesystem::path test_dir_;
};

/**
 * @brief Engine wired to in-process fakes
 */
class EngineFixture : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        allocator_ = std::make_shared<fake_allocator>();
        transport_ = std::make_shared<fake_transport>();
        confirmer_ = std::make_shared<fake_confirmer>();
    }

    void TearDown() override {
        engine_.reset();
        TempDirectoryFixture::TearDown();
    }

    /**
     * @brief Concurrency settings that adapt quickly in tests
     */
    static auto fast_concurrency() -> concurrency_config {
        concurrency_config config;
        config.min_concurrency = 2;
        config.max_concurrency = 8;
        config.initial_concurrency = 4;
        config.cooldown = std::chrono::milliseconds(10);
        return config;
    }

    static auto fast_preflight() -> preflight_config {
        preflight_config config;
        config.retry.initial_delay = std::chrono::milliseconds(5);
        config.retry.max_delay = std::chrono::milliseconds(20);
        config.retry.use_jitter = false;
        return config;
    }

    auto base_builder() -> upload_engine::builder {
        upload_engine::builder builder;
        builder.with_container_id("gallery-1")
            .with_allocator(allocator_)
            .with_transport(transport_)
            .with_confirmer(confirmer_)
            .with_concurrency(fast_concurrency())
            .with_preflight(fast_preflight());
        return builder;
    }

    void build_engine(upload_engine::builder builder) {
        auto built = builder.build();
        ASSERT_TRUE(built.has_value()) << built.error().message;
        engine_ = std::make_unique<upload_engine>(std::move(built.value()));
    }

    void build_engine() { build_engine(base_builder()); }

    static auto memory_source(const std::string& name, std::size_t size,
                              const std::string& mime = "image/jpeg") -> upload_source {
        return upload_source::from_memory(name, make_payload(size), mime);
    }

    std::shared_ptr<fake_allocator> allocator_;
    std::shared_ptr<fake_transport> transport_;
    std::shared_ptr<fake_confirmer> confirmer_;
    std::unique_ptr<upload_engine> engine_;
};

}  // namespace kcenon::image_upload::test

#endif  // KCENON_IMAGE_UPLOAD_TEST_FIXTURES_H
