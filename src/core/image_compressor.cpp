/**
 * @file image_compressor.cpp
 * @brief libjpeg/libpng based image recompression
 */

#include <kcenon/image_upload/core/exif_metadata.h>
#include <kcenon/image_upload/core/image_compressor.h>
#include <kcenon/image_upload/core/logging.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <csetjmp>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <optional>

#include <jpeglib.h>
#include <png.h>

namespace kcenon::image_upload {

namespace {

struct magic_signature {
    std::array<uint8_t, 8> bytes;
    std::size_t length;
    image_format format;
};

constexpr std::array<magic_signature, 4> image_signatures = {{
    {{0xFF, 0xD8, 0xFF}, 3, image_format::jpeg},
    {{0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A}, 8, image_format::png},
    {{0x47, 0x49, 0x46, 0x38}, 4, image_format::gif},
    {{0x52, 0x49, 0x46, 0x46}, 4, image_format::webp},  // RIFF, checked for WEBP below
}};

// Refuse to allocate rasters above ~100 megapixels
constexpr uint64_t max_pixels = 100'000'000;

/**
 * @brief Decoded 8-bit RGB image
 */
struct raster {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> pixels;  // width * height * 3
};

/**
 * @brief Metadata segments carried over from a decoded JPEG
 */
struct jpeg_metadata {
    exif_metadata exif;
    std::vector<uint8_t> exif_segment;               ///< APP1 payload, "Exif\0\0" + TIFF
    std::vector<std::vector<uint8_t>> icc_segments;  ///< APP2 ICC_PROFILE chunks, in order
};

constexpr int exif_marker = JPEG_APP0 + 1;
constexpr int icc_marker = JPEG_APP0 + 2;
constexpr std::size_t icc_header_size = 14;  // "ICC_PROFILE\0" + sequence + count

auto lower(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// ============================================================================
// libjpeg
// ============================================================================

struct jpeg_error_context {
    jpeg_error_mgr manager;
    std::jmp_buf jump;
    char message[JMSG_LENGTH_MAX];
};

void on_jpeg_error(j_common_ptr info) {
    auto* ctx = reinterpret_cast<jpeg_error_context*>(info->err);
    (*info->err->format_message)(info, ctx->message);
    std::longjmp(ctx->jump, 1);
}

void on_jpeg_message(j_common_ptr /* info */) {}

void collect_markers(const jpeg_decompress_struct& info, jpeg_metadata& metadata) {
    for (jpeg_saved_marker_ptr marker = info.marker_list; marker; marker = marker->next) {
        std::span<const uint8_t> data(marker->data, marker->data_length);
        if (marker->marker == exif_marker && metadata.exif_segment.empty()) {
            if (auto exif = parse_exif_segment(data)) {
                metadata.exif = *exif;
                metadata.exif_segment.assign(data.begin(), data.end());
            }
        } else if (marker->marker == icc_marker && data.size() > icc_header_size &&
                   std::memcmp(data.data(), "ICC_PROFILE", 12) == 0) {
            metadata.icc_segments.emplace_back(data.begin(), data.end());
        }
    }
}

auto decode_jpeg(std::span<const std::byte> input, jpeg_metadata& metadata) -> result<raster> {
    // Heap-held so its state survives a longjmp from libjpeg
    auto image = std::make_unique<raster>();

    jpeg_decompress_struct info{};
    jpeg_error_context err{};
    info.err = jpeg_std_error(&err.manager);
    err.manager.error_exit = on_jpeg_error;
    err.manager.output_message = on_jpeg_message;

    if (setjmp(err.jump)) {
        jpeg_destroy_decompress(&info);
        return unexpected{error{error_code::image_decode_failed,
            std::string("JPEG decode failed: ") + err.message}};
    }

    jpeg_create_decompress(&info);
    jpeg_mem_src(&info, reinterpret_cast<const unsigned char*>(input.data()),
                 static_cast<unsigned long>(input.size()));
    jpeg_save_markers(&info, exif_marker, 0xFFFF);
    jpeg_save_markers(&info, icc_marker, 0xFFFF);
    jpeg_read_header(&info, TRUE);
    info.out_color_space = JCS_RGB;
    collect_markers(info, metadata);

    if (static_cast<uint64_t>(info.image_width) * info.image_height > max_pixels) {
        jpeg_destroy_decompress(&info);
        return unexpected{error{error_code::unsupported_image_format,
            "JPEG dimensions exceed decode limit"}};
    }

    jpeg_start_decompress(&info);

    image->width = info.output_width;
    image->height = info.output_height;
    image->pixels.resize(static_cast<std::size_t>(image->width) * image->height * 3);

    const std::size_t stride = static_cast<std::size_t>(image->width) * 3;
    while (info.output_scanline < info.output_height) {
        JSAMPROW row = image->pixels.data() + static_cast<std::size_t>(info.output_scanline) * stride;
        jpeg_read_scanlines(&info, &row, 1);
    }

    jpeg_finish_decompress(&info);
    jpeg_destroy_decompress(&info);
    return std::move(*image);
}

/**
 * @brief libjpeg output buffer, heap-held so it survives a longjmp
 */
struct jpeg_output {
    unsigned char* data = nullptr;
    unsigned long size = 0;

    ~jpeg_output() { std::free(data); }
};

/**
 * @param exif_segment APP1 payload to embed, empty for none
 * @param icc_segments ICC profile chunks to embed
 */
auto encode_jpeg(const raster& image, int quality, const std::vector<uint8_t>& exif_segment,
                 const std::vector<std::vector<uint8_t>>& icc_segments)
    -> result<std::vector<std::byte>> {
    jpeg_compress_struct info{};
    jpeg_error_context err{};
    auto output = std::make_unique<jpeg_output>();

    info.err = jpeg_std_error(&err.manager);
    err.manager.error_exit = on_jpeg_error;
    err.manager.output_message = on_jpeg_message;

    if (setjmp(err.jump)) {
        jpeg_destroy_compress(&info);
        return unexpected{error{error_code::image_encode_failed,
            std::string("JPEG encode failed: ") + err.message}};
    }

    jpeg_create_compress(&info);
    jpeg_mem_dest(&info, &output->data, &output->size);

    info.image_width = image.width;
    info.image_height = image.height;
    info.input_components = 3;
    info.in_color_space = JCS_RGB;
    jpeg_set_defaults(&info);
    jpeg_set_quality(&info, quality, TRUE);
    info.optimize_coding = TRUE;
    if (!exif_segment.empty()) {
        // EXIF files carry APP1 in place of the JFIF header
        info.write_JFIF_header = FALSE;
    }

    jpeg_start_compress(&info, TRUE);

    if (!exif_segment.empty()) {
        jpeg_write_marker(&info, exif_marker, exif_segment.data(),
                          static_cast<unsigned int>(exif_segment.size()));
    }
    for (const auto& segment : icc_segments) {
        jpeg_write_marker(&info, icc_marker, segment.data(),
                          static_cast<unsigned int>(segment.size()));
    }

    const std::size_t stride = static_cast<std::size_t>(image.width) * 3;
    while (info.next_scanline < info.image_height) {
        auto* row = const_cast<JSAMPROW>(image.pixels.data() +
                                         static_cast<std::size_t>(info.next_scanline) * stride);
        jpeg_write_scanlines(&info, &row, 1);
    }

    jpeg_finish_compress(&info);
    jpeg_destroy_compress(&info);

    std::vector<std::byte> encoded(output->size);
    std::memcpy(encoded.data(), output->data, output->size);
    return encoded;
}

// ============================================================================
// libpng
// ============================================================================

auto decode_png(std::span<const std::byte> input) -> result<raster> {
    png_image png{};
    png.version = PNG_IMAGE_VERSION;

    if (!png_image_begin_read_from_memory(&png, input.data(), input.size())) {
        std::string message = png.message;
        png_image_free(&png);
        return unexpected{error{error_code::image_decode_failed, "PNG decode failed: " + message}};
    }

    if (static_cast<uint64_t>(png.width) * png.height > max_pixels) {
        png_image_free(&png);
        return unexpected{error{error_code::unsupported_image_format,
            "PNG dimensions exceed decode limit"}};
    }

    png.format = PNG_FORMAT_RGB;

    raster image;
    image.width = png.width;
    image.height = png.height;
    image.pixels.resize(PNG_IMAGE_SIZE(png));

    // Alpha is composited onto white since JPEG has no transparency
    png_color background{255, 255, 255};
    if (!png_image_finish_read(&png, &background, image.pixels.data(), 0, nullptr)) {
        std::string message = png.message;
        png_image_free(&png);
        return unexpected{error{error_code::image_decode_failed, "PNG decode failed: " + message}};
    }

    return image;
}

// ============================================================================
// Resampling
// ============================================================================

/**
 * @brief Box-filter downscale so the longest edge equals max_dimension
 */
auto resize_to_fit(const raster& src, uint32_t max_dimension) -> std::optional<raster> {
    const uint32_t longest = std::max(src.width, src.height);
    if (max_dimension == 0 || longest <= max_dimension) {
        return std::nullopt;
    }

    const double scale = static_cast<double>(max_dimension) / static_cast<double>(longest);
    raster dst;
    dst.width = std::max<uint32_t>(1, static_cast<uint32_t>(std::lround(src.width * scale)));
    dst.height = std::max<uint32_t>(1, static_cast<uint32_t>(std::lround(src.height * scale)));
    dst.pixels.resize(static_cast<std::size_t>(dst.width) * dst.height * 3);

    for (uint32_t dy = 0; dy < dst.height; ++dy) {
        const auto sy0 = static_cast<uint32_t>(static_cast<uint64_t>(dy) * src.height / dst.height);
        auto sy1 = static_cast<uint32_t>(static_cast<uint64_t>(dy + 1) * src.height / dst.height);
        sy1 = std::max(sy1, sy0 + 1);

        for (uint32_t dx = 0; dx < dst.width; ++dx) {
            const auto sx0 = static_cast<uint32_t>(static_cast<uint64_t>(dx) * src.width / dst.width);
            auto sx1 = static_cast<uint32_t>(static_cast<uint64_t>(dx + 1) * src.width / dst.width);
            sx1 = std::max(sx1, sx0 + 1);

            uint64_t sum[3] = {0, 0, 0};
            for (uint32_t sy = sy0; sy < sy1; ++sy) {
                const uint8_t* row = src.pixels.data() + static_cast<std::size_t>(sy) * src.width * 3;
                for (uint32_t sx = sx0; sx < sx1; ++sx) {
                    sum[0] += row[sx * 3];
                    sum[1] += row[sx * 3 + 1];
                    sum[2] += row[sx * 3 + 2];
                }
            }

            const uint64_t count = static_cast<uint64_t>(sy1 - sy0) * (sx1 - sx0);
            uint8_t* out = dst.pixels.data() + (static_cast<std::size_t>(dy) * dst.width + dx) * 3;
            for (int c = 0; c < 3; ++c) {
                out[c] = static_cast<uint8_t>((sum[c] + count / 2) / count);
            }
        }
    }

    return dst;
}

/**
 * @brief Turn a stored raster upright according to its EXIF orientation
 */
auto apply_orientation(const raster& src, uint16_t orientation) -> raster {
    const bool swap = orientation >= 5 && orientation <= 8;
    const uint32_t w = src.width;
    const uint32_t h = src.height;

    raster dst;
    dst.width = swap ? h : w;
    dst.height = swap ? w : h;
    dst.pixels.resize(src.pixels.size());

    for (uint32_t y = 0; y < dst.height; ++y) {
        for (uint32_t x = 0; x < dst.width; ++x) {
            uint32_t sx = x;
            uint32_t sy = y;
            switch (orientation) {
                case 2: sx = w - 1 - x; sy = y; break;
                case 3: sx = w - 1 - x; sy = h - 1 - y; break;
                case 4: sx = x; sy = h - 1 - y; break;
                case 5: sx = y; sy = x; break;
                case 6: sx = y; sy = h - 1 - x; break;
                case 7: sx = w - 1 - y; sy = h - 1 - x; break;
                case 8: sx = w - 1 - y; sy = x; break;
                default: break;
            }
            const uint8_t* in = src.pixels.data() + (static_cast<std::size_t>(sy) * w + sx) * 3;
            uint8_t* out = dst.pixels.data() + (static_cast<std::size_t>(y) * dst.width + x) * 3;
            out[0] = in[0];
            out[1] = in[1];
            out[2] = in[2];
        }
    }
    return dst;
}

auto passthrough(std::span<const std::byte> input, std::string_view mime_type)
    -> compression_result {
    compression_result out;
    out.data.assign(input.begin(), input.end());
    out.mime_type = std::string(mime_type);
    out.original_size = input.size();
    out.compressed_size = input.size();
    out.compression_ratio = 1.0;
    return out;
}

}  // namespace

auto detect_image_format(std::span<const std::byte> data) -> image_format {
    for (const auto& sig : image_signatures) {
        if (data.size() < sig.length) {
            continue;
        }
        bool match = true;
        for (std::size_t i = 0; i < sig.length; ++i) {
            if (static_cast<uint8_t>(data[i]) != sig.bytes[i]) {
                match = false;
                break;
            }
        }
        if (!match) {
            continue;
        }
        if (sig.format == image_format::webp) {
            // RIFF....WEBP
            if (data.size() < 12 || std::memcmp(data.data() + 8, "WEBP", 4) != 0) {
                continue;
            }
        }
        return sig.format;
    }
    return image_format::unknown;
}

class image_compressor::impl {
public:
    explicit impl(compression_options options) : options_(std::move(options)) {}

    auto compress(std::span<const std::byte> input, std::string_view mime_type,
                  const compression_options& options) -> result<compression_result> {
        record([](image_compression_stats& s) { ++s.images_processed; });

        if (!is_supported_mime_type(mime_type) || input.size() < options.min_input_size) {
            IU_LOG_TRACE(log_category::compression,
                "Skipping " + std::string(mime_type) + " payload of " +
                std::to_string(input.size()) + " bytes");
            record([&](image_compression_stats& s) {
                ++s.images_skipped;
                s.total_input_bytes += input.size();
                s.total_output_bytes += input.size();
            });
            return passthrough(input, mime_type);
        }

        auto format = detect_image_format(input);
        jpeg_metadata metadata;
        result<raster> decoded = unexpected{error{error_code::unsupported_image_format,
            std::string("no decoder for ") + to_string(format) + " data"}};
        if (format == image_format::jpeg) {
            decoded = decode_jpeg(input, metadata);
        } else if (format == image_format::png) {
            decoded = decode_png(input);
        }

        if (!decoded) {
            return fail(decoded.error());
        }

        raster image = std::move(decoded.value());
        const uint16_t orientation = metadata.exif.orientation;
        const bool swapped = metadata.exif.swaps_dimensions();
        const uint32_t source_width = swapped ? image.height : image.width;
        const uint32_t source_height = swapped ? image.width : image.height;

        if (options.max_dimension) {
            if (auto resized = resize_to_fit(image, *options.max_dimension)) {
                image = std::move(*resized);
            }
        }
        if (orientation != 1) {
            image = apply_orientation(image, orientation);
        }

        // The raster is upright now, so an embedded orientation must not rotate it again
        std::vector<uint8_t> exif_segment;
        if (options.preserve_exif && !metadata.exif_segment.empty()) {
            exif_segment = std::move(metadata.exif_segment);
            if (!set_exif_orientation(exif_segment, 1)) {
                IU_LOG_TRACE(log_category::compression, "EXIF segment has no orientation tag");
            }
        }

        const double quality = std::clamp(options.quality, 0.01, 1.0);
        auto encoded = encode_jpeg(image, static_cast<int>(std::lround(quality * 100.0)),
                                   exif_segment, metadata.icc_segments);
        if (!encoded) {
            return fail(encoded.error());
        }

        const auto original_size = static_cast<uint64_t>(input.size());
        const auto encoded_size = static_cast<uint64_t>(encoded.value().size());

        if (static_cast<double>(encoded_size) >=
            static_cast<double>(original_size) * options.keep_original_threshold) {
            IU_LOG_TRACE(log_category::compression,
                "Keeping original (" + std::to_string(original_size) + " bytes, re-encode " +
                std::to_string(encoded_size) + " bytes)");
            auto out = passthrough(input, mime_type);
            out.width = source_width;
            out.height = source_height;
            record([&](image_compression_stats& s) {
                ++s.images_skipped;
                s.total_input_bytes += original_size;
                s.total_output_bytes += original_size;
            });
            return out;
        }

        compression_result out;
        out.data = std::move(encoded.value());
        out.mime_type = "image/jpeg";
        out.original_size = original_size;
        out.compressed_size = encoded_size;
        out.compression_ratio =
            static_cast<double>(original_size) / static_cast<double>(encoded_size);
        out.width = image.width;
        out.height = image.height;
        out.transcoded = true;

        IU_LOG_DEBUG(log_category::compression,
            "Compressed " + std::to_string(original_size) + " -> " +
            std::to_string(encoded_size) + " bytes (" + std::to_string(source_width) + "x" +
            std::to_string(source_height) + " -> " + std::to_string(image.width) + "x" +
            std::to_string(image.height) + ")");

        record([&](image_compression_stats& s) {
            ++s.images_transcoded;
            s.total_input_bytes += original_size;
            s.total_output_bytes += encoded_size;
        });
        return out;
    }

    auto options() const -> compression_options {
        std::lock_guard lock(mutex_);
        return options_;
    }

    auto set_options(const compression_options& options) -> void {
        std::lock_guard lock(mutex_);
        options_ = options;
    }

    auto stats() const -> image_compression_stats {
        std::lock_guard lock(mutex_);
        return stats_;
    }

    auto reset_stats() -> void {
        std::lock_guard lock(mutex_);
        stats_ = {};
    }

private:
    template <typename Update>
    void record(Update update) {
        std::lock_guard lock(mutex_);
        update(stats_);
    }

    auto fail(const error& err) -> result<compression_result> {
        IU_LOG_WARN(log_category::compression, err.message);
        record([](image_compression_stats& s) { ++s.images_failed; });
        return unexpected{err};
    }

    mutable std::mutex mutex_;
    compression_options options_;
    image_compression_stats stats_;
};

image_compressor::image_compressor(compression_options options)
    : impl_(std::make_unique<impl>(std::move(options))) {}

image_compressor::~image_compressor() = default;

image_compressor::image_compressor(image_compressor&&) noexcept = default;

auto image_compressor::operator=(image_compressor&&) noexcept -> image_compressor& = default;

auto image_compressor::compress(std::span<const std::byte> input, std::string_view mime_type)
    -> result<compression_result> {
    return impl_->compress(input, mime_type, impl_->options());
}

auto image_compressor::compress(std::span<const std::byte> input,
                                std::string_view mime_type,
                                const compression_options& options)
    -> result<compression_result> {
    return impl_->compress(input, mime_type, options);
}

auto image_compressor::is_supported_mime_type(std::string_view mime_type) -> bool {
    const auto type = lower(mime_type);
    return type == "image/jpeg" || type == "image/jpg" || type == "image/png" ||
           type == "image/webp";
}

auto image_compressor::options() const -> compression_options {
    return impl_->options();
}

auto image_compressor::set_options(const compression_options& options) -> void {
    impl_->set_options(options);
}

auto image_compressor::stats() const -> image_compression_stats {
    return impl_->stats();
}

auto image_compressor::reset_stats() -> void {
    impl_->reset_stats();
}

}  // namespace kcenon::image_upload
