/**
 * @file batch_image_upload.cpp
 * @brief Upload a directory of images with adaptive parallelism
 *
 * This example demonstrates:
 * - Wiring the HTTP allocation, transfer and confirmation endpoints
 * - Compressing images before transfer
 * - Following per-file progress and batch statistics
 * - Retrying the files that failed
 */

#include <kcenon/image_upload/image_upload.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

using namespace kcenon::image_upload;

namespace {

/**
 * @brief Format bytes into human-readable string
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

void print_stats(const batch_stats& stats) {
    constexpr int bar_width = 40;
    int filled = static_cast<int>(stats.completion_percentage() / 100.0 * bar_width);

    std::cout << "\r[";
    for (int i = 0; i < bar_width; ++i) {
        if (i < filled) std::cout << "=";
        else if (i == filled) std::cout << ">";
        else std::cout << " ";
    }
    std::cout << "] " << std::fixed << std::setprecision(1) << stats.completion_percentage() << "%";
    std::cout << " | Files: " << stats.completed << "/" << stats.total_files;
    if (stats.failed > 0) {
        std::cout << " (failed: " << stats.failed << ")";
    }
    std::cout << " | " << format_bytes(static_cast<uint64_t>(stats.average_speed)) << "/s";
    std::cout << " | x" << stats.current_concurrency;
    if (stats.estimated_seconds_remaining) {
        std::cout << " | ETA " << std::setprecision(0) << *stats.estimated_seconds_remaining << "s";
    }
    std::cout << "     " << std::flush;
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Batch Image Upload Example" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] --container <id> <image> [image...]" << std::endl;
    std::cout << "   or: " << program << " [options] --container <id> --directory <dir>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -a, --api <url>         API base URL (default: http://localhost:8080/api)" << std::endl;
    std::cout << "  -c, --container <id>    Container the images are added to" << std::endl;
    std::cout << "  -d, --directory <dir>   Upload every image in a directory" << std::endl;
    std::cout << "  -t, --token <token>     Bearer token for the API" << std::endl;
    std::cout << "  -j, --max-jobs <n>      Upper bound on parallel uploads (default: 20)" << std::endl;
    std::cout << "  -q, --quality <0-1>     JPEG quality after compression (default: 0.85)" << std::endl;
    std::cout << "  --no-compression        Upload the original bytes" << std::endl;
    std::cout << "  --keep-exif             Keep EXIF metadata in re-encoded JPEGs" << std::endl;
    std::cout << "  --by-date               Upload in EXIF capture-time order" << std::endl;
    std::cout << "  --retry                 Retry failed files once at the end" << std::endl;
    std::cout << "  --verbose               Log at debug level" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string api = "http://localhost:8080/api";
    std::string container;
    std::string directory;
    std::string token;
    std::size_t max_jobs = 20;
    double quality = 0.85;
    bool compression = true;
    bool retry = false;
    bool keep_exif = false;
    bool by_date = false;
    std::vector<std::filesystem::path> files;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](const char* name) -> const char* {
            if (++i >= argc) {
                std::cerr << "Error: " << name << " requires an argument" << std::endl;
                std::exit(1);
            }
            return argv[i];
        };

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-a" || arg == "--api") {
            api = next("--api");
        } else if (arg == "-c" || arg == "--container") {
            container = next("--container");
        } else if (arg == "-d" || arg == "--directory") {
            directory = next("--directory");
        } else if (arg == "-t" || arg == "--token") {
            token = next("--token");
        } else if (arg == "-j" || arg == "--max-jobs") {
            max_jobs = static_cast<std::size_t>(std::stoul(next("--max-jobs")));
        } else if (arg == "-q" || arg == "--quality") {
            quality = std::stod(next("--quality"));
        } else if (arg == "--no-compression") {
            compression = false;
        } else if (arg == "--keep-exif") {
            keep_exif = true;
        } else if (arg == "--by-date") {
            by_date = true;
        } else if (arg == "--retry") {
            retry = true;
        } else if (arg == "--verbose") {
            get_logger().set_level(log_level::debug);
        } else if (arg[0] != '-') {
            files.emplace_back(arg);
        }
    }

    if (!directory.empty()) {
        std::error_code ec;
        for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
            if (entry.is_regular_file() &&
                mime_type_for(entry.path()).rfind("image/", 0) == 0) {
                files.push_back(entry.path());
            }
        }
        if (ec) {
            std::cerr << "Error: Cannot read directory " << directory << ": " << ec.message()
                      << std::endl;
            return 1;
        }
    }

    if (container.empty() || files.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    http_api_config api_config;
    api_config.allocation_url = api + "/uploads/allocate";
    api_config.confirmation_url = api + "/uploads/confirm";
    api_config.release_url = api + "/uploads/release";
    if (!token.empty()) {
        api_config.headers["Authorization"] = "Bearer " + token;
    }

    auto http = make_http_client();

    concurrency_config concurrency;
    concurrency.max_concurrency = std::max<std::size_t>(max_jobs, concurrency.min_concurrency);
    concurrency.initial_concurrency =
        std::min(concurrency.initial_concurrency, concurrency.max_concurrency);

    compression_options compression_opts;
    compression_opts.quality = quality;
    compression_opts.preserve_exif = keep_exif;

    auto engine_result = upload_engine::builder()
        .with_container_id(container)
        .with_allocator(std::make_shared<http_destination_allocator>(http, api_config))
        .with_transport(std::make_shared<http_blob_transport>(http, api_config.retry))
        .with_confirmer(std::make_shared<http_upload_confirmer>(http, api_config))
        .with_compression(compression)
        .with_compression_options(compression_opts)
        .with_concurrency(concurrency)
        .with_natural_sort(true)
        .with_capture_date_sort(by_date)
        .build();

    if (!engine_result.has_value()) {
        std::cerr << "Failed to create engine: " << engine_result.error().message << std::endl;
        return 1;
    }

    auto& engine = engine_result.value();
    std::mutex output_mutex;

    engine.on_file_update([&](const upload_task& task) {
        if (!is_terminal_status(task.status)) {
            return;
        }
        std::lock_guard lock(output_mutex);
        if (task.status == upload_status::completed) {
            std::cout << std::endl << "[Done] " << task.filename << " -> "
                      << task.image_id.value_or("?") << " (" << format_bytes(task.compressed_size)
                      << ", ratio " << std::setprecision(2) << task.compression_ratio << ")"
                      << std::endl;
        } else {
            std::cout << std::endl << "[Failed] " << task.filename << " - "
                      << task.error_message.value_or("unknown error") << std::endl;
        }
    });

    engine.on_stats_update([&](const batch_stats& stats) {
        std::lock_guard lock(output_mutex);
        print_stats(stats);
    });

    engine.on_batch_complete([&](std::size_t succeeded, std::size_t failed) {
        std::lock_guard lock(output_mutex);
        std::cout << std::endl << "Batch finished: " << succeeded << " uploaded, " << failed
                  << " failed" << std::endl;
    });

    std::vector<upload_source> sources;
    sources.reserve(files.size());
    for (const auto& file : files) {
        sources.push_back(upload_source::from_file(file));
    }

    std::cout << "Uploading " << sources.size() << " image(s) to " << container << std::endl;
    engine.add_files(std::move(sources));

    if (!engine.wait_for_completion(std::chrono::hours(1))) {
        std::cerr << "Timed out waiting for uploads" << std::endl;
        engine.cancel();
        return 1;
    }

    if (retry && engine.get_stats().failed > 0) {
        std::cout << "Retrying " << engine.retry_failed() << " failed file(s)" << std::endl;
        if (!engine.wait_for_completion(std::chrono::hours(1))) {
            std::cerr << "Timed out waiting for retried uploads" << std::endl;
        }
    }

    auto stats = engine.get_stats();
    auto compression_stats = engine.get_compression_stats();

    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "       Upload Summary" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "  Uploaded: " << stats.completed << "/" << stats.total_files << std::endl;
    std::cout << "  Failed: " << stats.failed << std::endl;
    std::cout << "  Original size: " << format_bytes(stats.total_bytes) << std::endl;
    std::cout << "  Sent: " << format_bytes(stats.uploaded_bytes) << std::endl;
    std::cout << "  Saved by compression: " << format_bytes(stats.compression_savings) << std::endl;
    std::cout << "  Images re-encoded: " << compression_stats.images_transcoded << std::endl;
    std::cout << "  Elapsed: " << stats.elapsed.count() << " ms" << std::endl;

    return stats.failed == 0 ? 0 : (stats.completed > 0 ? 2 : 1);
}
