/**
 * @file upload_types.cpp
 * @brief Upload source, handle and helper implementations
 */

#include "kcenon/image_upload/client/upload_types.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <system_error>

#include "kcenon/image_upload/client/upload_engine.h"
#include "kcenon/image_upload/core/exif_metadata.h"

namespace kcenon::image_upload {

// ============================================================================
// Helpers
// ============================================================================

auto mime_type_for(const std::filesystem::path& path) -> std::string {
    static const std::map<std::string, std::string> known{
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".jpe", "image/jpeg"},
        {".png", "image/png"},
        {".webp", "image/webp"},
        {".gif", "image/gif"},
        {".bmp", "image/bmp"},
        {".heic", "image/heic"},
        {".heif", "image/heif"},
        {".tif", "image/tiff"},
        {".tiff", "image/tiff"},
    };

    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = known.find(ext);
    return it != known.end() ? it->second : "application/octet-stream";
}

auto natural_less(std::string_view lhs, std::string_view rhs) -> bool {
    std::size_t i = 0;
    std::size_t j = 0;

    while (i < lhs.size() && j < rhs.size()) {
        auto a = static_cast<unsigned char>(lhs[i]);
        auto b = static_cast<unsigned char>(rhs[j]);

        if (std::isdigit(a) && std::isdigit(b)) {
            auto i_end = i;
            auto j_end = j;
            while (i_end < lhs.size() && std::isdigit(static_cast<unsigned char>(lhs[i_end]))) ++i_end;
            while (j_end < rhs.size() && std::isdigit(static_cast<unsigned char>(rhs[j_end]))) ++j_end;

            // Compare digit runs by value: strip leading zeros, then length, then digits
            auto a_run = lhs.substr(i, i_end - i);
            auto b_run = rhs.substr(j, j_end - j);
            a_run.remove_prefix(std::min(a_run.find_first_not_of('0'), a_run.size()));
            b_run.remove_prefix(std::min(b_run.find_first_not_of('0'), b_run.size()));

            if (a_run.size() != b_run.size()) {
                return a_run.size() < b_run.size();
            }
            if (a_run != b_run) {
                return a_run < b_run;
            }
            i = i_end;
            j = j_end;
            continue;
        }

        auto la = std::tolower(a);
        auto lb = std::tolower(b);
        if (la != lb) {
            return la < lb;
        }
        ++i;
        ++j;
    }
    return (lhs.size() - i) < (rhs.size() - j);
}

// ============================================================================
// upload_source
// ============================================================================

auto upload_source::from_file(std::filesystem::path path,
                              std::optional<std::string> mime_type) -> upload_source {
    upload_source source;
    source.filename_ = path.filename().string();
    source.mime_type_ = mime_type ? std::move(*mime_type) : mime_type_for(path);
    source.path_ = std::move(path);
    return source;
}

auto upload_source::from_memory(std::string filename, std::vector<std::byte> data,
                                std::string mime_type) -> upload_source {
    upload_source source;
    source.filename_ = std::move(filename);
    source.mime_type_ = std::move(mime_type);
    source.data_ = std::make_shared<const std::vector<std::byte>>(std::move(data));
    return source;
}

auto upload_source::size() const -> uint64_t {
    if (path_) {
        std::error_code ec;
        auto bytes = std::filesystem::file_size(*path_, ec);
        return ec ? 0 : static_cast<uint64_t>(bytes);
    }
    return data_ ? static_cast<uint64_t>(data_->size()) : 0;
}

auto upload_source::validate() const -> result<void> {
    if (filename_.empty()) {
        return unexpected{error{error_code::empty_filename, "Source has no file name"}};
    }

    if (mime_type_.rfind("image/", 0) != 0) {
        return unexpected{error{error_code::invalid_source,
            filename_ + " is not an image (" + mime_type_ + ")"}};
    }

    if (path_) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(*path_, ec)) {
            return unexpected{error{error_code::file_not_found,
                "File not found: " + path_->string()}};
        }
        if (std::filesystem::file_size(*path_, ec) == 0 || ec) {
            return unexpected{error{error_code::invalid_source, filename_ + " is empty"}};
        }
        return {};
    }

    if (!data_ || data_->empty()) {
        return unexpected{error{error_code::invalid_source, filename_ + " is empty"}};
    }
    return {};
}

auto upload_source::load() const -> result<std::vector<std::byte>> {
    if (!path_) {
        if (!data_) {
            return unexpected{error{error_code::invalid_source, "Source has no data"}};
        }
        return *data_;
    }

    std::ifstream file(*path_, std::ios::binary | std::ios::ate);
    if (!file) {
        return unexpected{error{error_code::file_read_error,
            "Failed to open file: " + path_->string()}};
    }

    auto length = file.tellg();
    if (length < 0) {
        return unexpected{error{error_code::file_read_error,
            "Failed to determine size of " + path_->string()}};
    }
    file.seekg(0, std::ios::beg);

    std::vector<std::byte> data(static_cast<std::size_t>(length));
    if (!file.read(reinterpret_cast<char*>(data.data()), length)) {
        return unexpected{error{error_code::file_read_error,
            "Failed to read file: " + path_->string()}};
    }
    return data;
}

auto upload_source::read_head(std::size_t max_bytes) const
    -> result<std::vector<std::byte>> {
    if (!path_) {
        if (!data_) {
            return unexpected{error{error_code::invalid_source, "Source has no data"}};
        }
        const auto count = std::min(max_bytes, data_->size());
        return std::vector<std::byte>(data_->begin(), data_->begin() + count);
    }

    std::ifstream file(*path_, std::ios::binary);
    if (!file) {
        return unexpected{error{error_code::file_read_error,
            "Failed to open file: " + path_->string()}};
    }

    std::vector<std::byte> data(max_bytes);
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(max_bytes));
    if (file.bad()) {
        return unexpected{error{error_code::file_read_error,
            "Failed to read file: " + path_->string()}};
    }
    data.resize(static_cast<std::size_t>(file.gcount()));
    return data;
}

void sort_by_capture_date(std::vector<upload_source>& sources) {
    std::vector<std::pair<std::optional<std::string>, upload_source>> keyed;
    keyed.reserve(sources.size());
    for (auto& source : sources) {
        std::optional<std::string> captured;
        if (source.mime_type() == "image/jpeg") {
            auto head = source.read_head(capture_date_scan_bytes);
            if (head.has_value()) {
                if (auto exif = read_jpeg_exif(head.value())) {
                    captured = exif->capture_time;
                }
            }
        }
        keyed.emplace_back(std::move(captured), std::move(source));
    }

    // "YYYY:MM:DD HH:MM:SS" compares chronologically as text
    std::stable_sort(keyed.begin(), keyed.end(), [](const auto& a, const auto& b) {
        if (a.first && b.first) {
            return *a.first < *b.first;
        }
        if (a.first || b.first) {
            return a.first.has_value();
        }
        return natural_less(a.second.filename(), b.second.filename());
    });

    sources.clear();
    for (auto& [captured, source] : keyed) {
        sources.push_back(std::move(source));
    }
}

// ============================================================================
// upload_handle
// ============================================================================

upload_handle::upload_handle(std::string id, const upload_engine* engine)
    : id_(std::move(id)), engine_(engine) {}

auto upload_handle::is_valid() const noexcept -> bool {
    return !id_.empty() && engine_ != nullptr;
}

auto upload_handle::get_status() const -> result<upload_status> {
    auto task = get_task();
    if (!task.has_value()) {
        return unexpected{task.error()};
    }
    return task.value().status;
}

auto upload_handle::get_task() const -> result<upload_task> {
    if (!is_valid()) {
        return unexpected{error{error_code::not_initialized, "Invalid upload handle"}};
    }
    return engine_->get_task(id_);
}

}  // namespace kcenon::image_upload
