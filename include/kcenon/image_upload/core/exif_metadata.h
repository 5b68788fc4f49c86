/**
 * @file exif_metadata.h
 * @brief Minimal EXIF reader for JPEG orientation and capture time
 */

#ifndef KCENON_IMAGE_UPLOAD_CORE_EXIF_METADATA_H
#define KCENON_IMAGE_UPLOAD_CORE_EXIF_METADATA_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace kcenon::image_upload {

/**
 * @brief The EXIF fields the upload pipeline acts on
 */
struct exif_metadata {
    /// TIFF orientation (1-8); 1 means the stored raster is upright
    uint16_t orientation = 1;

    /// "YYYY:MM:DD HH:MM:SS" from DateTimeOriginal, DateTimeDigitized or DateTime
    std::optional<std::string> capture_time;

    /**
     * @brief Whether displaying the image swaps its width and height
     */
    [[nodiscard]] auto swaps_dimensions() const -> bool {
        return orientation >= 5 && orientation <= 8;
    }
};

/**
 * @brief Leading bytes of an APP1 segment that carries EXIF
 */
inline constexpr std::size_t exif_header_size = 6;  // "Exif\0\0"

/**
 * @brief Parse the payload of an APP1 segment ("Exif\0\0" + TIFF block)
 * @return nullopt when the payload is not EXIF or the TIFF header is invalid
 *
 * Out-of-range offsets are treated as missing tags rather than errors.
 */
[[nodiscard]] auto parse_exif_segment(std::span<const uint8_t> segment)
    -> std::optional<exif_metadata>;

/**
 * @brief Find and parse the EXIF segment of an encoded JPEG
 * @param jpeg Leading bytes of the file; EXIF sits before the image data,
 *             so the first 128 KiB are enough
 * @return nullopt when the data is not a JPEG or has no EXIF segment
 */
[[nodiscard]] auto read_jpeg_exif(std::span<const std::byte> jpeg)
    -> std::optional<exif_metadata>;

/**
 * @brief Rewrite the orientation tag of an APP1 EXIF segment in place
 * @return false if the segment has no orientation tag to rewrite
 */
auto set_exif_orientation(std::vector<uint8_t>& segment, uint16_t orientation) -> bool;

}  // namespace kcenon::image_upload

#endif  // KCENON_IMAGE_UPLOAD_CORE_EXIF_METADATA_H
