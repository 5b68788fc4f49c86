/**
 * @file image_compressor.h
 * @brief Image recompression ahead of upload
 */

#ifndef KCENON_IMAGE_UPLOAD_CORE_IMAGE_COMPRESSOR_H
#define KCENON_IMAGE_UPLOAD_CORE_IMAGE_COMPRESSOR_H

#include <kcenon/image_upload/core/types.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::image_upload {

/**
 * @brief Container format detected from magic bytes
 */
enum class image_format {
    unknown,
    jpeg,
    png,
    gif,
    webp
};

[[nodiscard]] constexpr auto to_string(image_format format) -> const char* {
    switch (format) {
        case image_format::jpeg: return "jpeg";
        case image_format::png: return "png";
        case image_format::gif: return "gif";
        case image_format::webp: return "webp";
        default: return "unknown";
    }
}

/**
 * @brief Detect the image container from its leading bytes
 */
[[nodiscard]] auto detect_image_format(std::span<const std::byte> data) -> image_format;

/**
 * @brief Parameters for a single recompression
 */
struct compression_options {
    double quality = 0.85;                         ///< JPEG quality in (0, 1]
    std::optional<uint32_t> max_dimension = 4096;  ///< Longest edge after resize
    uint64_t min_input_size = 500 * 1024;          ///< Smaller inputs pass through
    double keep_original_threshold = 0.95;         ///< Keep original if output >= this share

    /// Copy the EXIF segment into re-encoded JPEGs (orientation reset to upright)
    bool preserve_exif = false;

    /**
     * @brief Preset for print-grade galleries
     */
    [[nodiscard]] static auto high_quality() -> compression_options {
        compression_options options;
        options.quality = 0.92;
        options.max_dimension = 6000;
        options.preserve_exif = true;
        return options;
    }
};

/**
 * @brief Output of image_compressor::compress
 *
 * When transcoded is false the data holds the original bytes and
 * compression_ratio is 1.
 */
struct compression_result {
    std::vector<std::byte> data;
    std::string mime_type;
    uint64_t original_size = 0;
    uint64_t compressed_size = 0;
    double compression_ratio = 1.0;  ///< original_size / compressed_size
    uint32_t width = 0;              ///< Upright size; 0 when the image was not decoded
    uint32_t height = 0;
    bool transcoded = false;

    [[nodiscard]] auto bytes_saved() const -> uint64_t {
        return compressed_size < original_size ? original_size - compressed_size : 0;
    }
};

/**
 * @brief Running totals across compress() calls
 */
struct image_compression_stats {
    uint64_t images_processed = 0;
    uint64_t images_transcoded = 0;
    uint64_t images_skipped = 0;   ///< Passed through without decoding
    uint64_t images_failed = 0;    ///< Decode or encode failures
    uint64_t total_input_bytes = 0;
    uint64_t total_output_bytes = 0;

    [[nodiscard]] auto bytes_saved() const -> uint64_t {
        return total_output_bytes < total_input_bytes ? total_input_bytes - total_output_bytes : 0;
    }
};

/**
 * @brief Resizes and re-encodes images as JPEG to reduce upload bytes
 *
 * JPEG and PNG inputs are decoded (libjpeg, libpng), scaled so the longest
 * edge fits max_dimension and re-encoded as JPEG at the requested quality.
 * Transparent PNG pixels are composited onto white. A JPEG's EXIF orientation
 * is applied to the pixels, and its ICC profile is carried into the output.
 *
 * Inputs that are below min_input_size or not a supported image mime type are
 * returned unchanged. Inputs that claim a supported type but cannot be decoded
 * produce an error; callers upload the original bytes in that case.
 *
 * @code
 * image_compressor compressor;
 * auto compressed = compressor.compress(bytes, "image/jpeg");
 * if (compressed) {
 *     upload(compressed.value().data, compressed.value().mime_type);
 * }
 * @endcode
 *
 * @note Thread-safe: compress() may run concurrently from several workers.
 */
class image_compressor {
public:
    explicit image_compressor(compression_options options = {});

    ~image_compressor();

    image_compressor(const image_compressor&) = delete;
    auto operator=(const image_compressor&) -> image_compressor& = delete;
    image_compressor(image_compressor&&) noexcept;
    auto operator=(image_compressor&&) noexcept -> image_compressor&;

    /**
     * @brief Compress with the default options
     */
    [[nodiscard]] auto compress(std::span<const std::byte> input, std::string_view mime_type)
        -> result<compression_result>;

    /**
     * @brief Compress with explicit options
     * @param input Encoded source image
     * @param mime_type Declared mime type of the source
     * @param options Quality and size limits for this call
     * @return Compressed or passed-through payload, or a compression error
     */
    [[nodiscard]] auto compress(std::span<const std::byte> input,
                                std::string_view mime_type,
                                const compression_options& options)
        -> result<compression_result>;

    /**
     * @brief Whether compress() attempts to transcode this mime type
     */
    [[nodiscard]] static auto is_supported_mime_type(std::string_view mime_type) -> bool;

    [[nodiscard]] auto options() const -> compression_options;
    auto set_options(const compression_options& options) -> void;

    [[nodiscard]] auto stats() const -> image_compression_stats;
    auto reset_stats() -> void;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::image_upload

#endif  // KCENON_IMAGE_UPLOAD_CORE_IMAGE_COMPRESSOR_H
