/**
 * @file exif_metadata.cpp
 * @brief Minimal EXIF reader for JPEG orientation and capture time
 */

#include "kcenon/image_upload/core/exif_metadata.h"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace kcenon::image_upload {

namespace {

constexpr uint16_t tag_orientation = 0x0112;
constexpr uint16_t tag_date_time = 0x0132;
constexpr uint16_t tag_exif_ifd = 0x8769;
constexpr uint16_t tag_date_time_original = 0x9003;
constexpr uint16_t tag_date_time_digitized = 0x9004;

constexpr uint16_t type_ascii = 2;
constexpr uint16_t type_short = 3;
constexpr uint16_t type_long = 4;

constexpr std::size_t ifd_entry_size = 12;
constexpr std::size_t date_time_length = 19;  // "YYYY:MM:DD HH:MM:SS"

/**
 * @brief Bounds-checked reader over a TIFF block
 */
class tiff_view {
public:
    tiff_view(std::span<const uint8_t> data, bool little_endian)
        : data_(data), little_endian_(little_endian) {}

    [[nodiscard]] auto u16(std::size_t offset) const -> std::optional<uint16_t> {
        if (offset + 2 > data_.size()) {
            return std::nullopt;
        }
        const uint16_t a = data_[offset];
        const uint16_t b = data_[offset + 1];
        return static_cast<uint16_t>(little_endian_ ? (a | (b << 8)) : ((a << 8) | b));
    }

    [[nodiscard]] auto u32(std::size_t offset) const -> std::optional<uint32_t> {
        if (offset + 4 > data_.size()) {
            return std::nullopt;
        }
        uint32_t value = 0;
        for (std::size_t i = 0; i < 4; ++i) {
            const auto shift = little_endian_ ? 8 * i : 8 * (3 - i);
            value |= static_cast<uint32_t>(data_[offset + i]) << shift;
        }
        return value;
    }

    /**
     * @brief Offset of the entry for tag within the IFD at ifd_offset
     */
    [[nodiscard]] auto find_entry(std::size_t ifd_offset, uint16_t tag) const
        -> std::optional<std::size_t> {
        auto count = u16(ifd_offset);
        if (!count) {
            return std::nullopt;
        }
        for (std::size_t i = 0; i < *count; ++i) {
            const auto entry = ifd_offset + 2 + i * ifd_entry_size;
            auto entry_tag = u16(entry);
            if (!entry_tag) {
                return std::nullopt;
            }
            if (*entry_tag == tag) {
                return entry;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] auto ascii(std::size_t entry, std::size_t length) const
        -> std::optional<std::string> {
        auto type = u16(entry + 2);
        auto count = u32(entry + 4);
        auto offset = u32(entry + 8);
        if (!type || !count || !offset || *type != type_ascii || *count < length) {
            return std::nullopt;
        }
        if (static_cast<std::size_t>(*offset) + length > data_.size()) {
            return std::nullopt;
        }
        return std::string(reinterpret_cast<const char*>(data_.data() + *offset), length);
    }

    [[nodiscard]] auto little_endian() const -> bool { return little_endian_; }

private:
    std::span<const uint8_t> data_;
    bool little_endian_;
};

auto is_valid_date_time(const std::string& text) -> bool {
    if (text.size() != date_time_length) {
        return false;
    }
    static constexpr const char* pattern = "dddd:dd:dd dd:dd:dd";
    for (std::size_t i = 0; i < date_time_length; ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (pattern[i] == 'd' ? !std::isdigit(c) : text[i] != pattern[i]) {
            return false;
        }
    }
    const int month = std::stoi(text.substr(5, 2));
    const int day = std::stoi(text.substr(8, 2));
    return text.compare(0, 4, "0000") != 0 && month >= 1 && month <= 12 && day >= 1 &&
           day <= 31;
}

auto read_date_time(const tiff_view& tiff, std::size_t ifd_offset, uint16_t tag)
    -> std::optional<std::string> {
    auto entry = tiff.find_entry(ifd_offset, tag);
    if (!entry) {
        return std::nullopt;
    }
    auto text = tiff.ascii(*entry, date_time_length);
    if (!text || !is_valid_date_time(*text)) {
        return std::nullopt;
    }
    return text;
}

/**
 * @brief Byte order and IFD0 offset of a TIFF block
 */
auto open_tiff(std::span<const uint8_t> segment) -> std::optional<std::pair<tiff_view, uint32_t>> {
    if (segment.size() < exif_header_size + 8 ||
        std::memcmp(segment.data(), "Exif\0\0", exif_header_size) != 0) {
        return std::nullopt;
    }
    auto block = segment.subspan(exif_header_size);

    bool little_endian = false;
    if (block[0] == 'I' && block[1] == 'I') {
        little_endian = true;
    } else if (!(block[0] == 'M' && block[1] == 'M')) {
        return std::nullopt;
    }

    tiff_view tiff(block, little_endian);
    auto magic = tiff.u16(2);
    auto ifd0 = tiff.u32(4);
    if (!magic || *magic != 42 || !ifd0) {
        return std::nullopt;
    }
    return std::make_pair(tiff, *ifd0);
}

}  // namespace

auto parse_exif_segment(std::span<const uint8_t> segment) -> std::optional<exif_metadata> {
    auto opened = open_tiff(segment);
    if (!opened) {
        return std::nullopt;
    }
    const auto& [tiff, ifd0] = *opened;

    exif_metadata metadata;

    if (auto entry = tiff.find_entry(ifd0, tag_orientation)) {
        auto type = tiff.u16(*entry + 2);
        auto value = tiff.u16(*entry + 8);
        if (type && *type == type_short && value && *value >= 1 && *value <= 8) {
            metadata.orientation = *value;
        }
    }

    if (auto entry = tiff.find_entry(ifd0, tag_exif_ifd)) {
        auto type = tiff.u16(*entry + 2);
        auto pointer = tiff.u32(*entry + 8);
        if (type && *type == type_long && pointer) {
            metadata.capture_time = read_date_time(tiff, *pointer, tag_date_time_original);
            if (!metadata.capture_time) {
                metadata.capture_time = read_date_time(tiff, *pointer, tag_date_time_digitized);
            }
        }
    }
    if (!metadata.capture_time) {
        metadata.capture_time = read_date_time(tiff, ifd0, tag_date_time);
    }

    return metadata;
}

auto read_jpeg_exif(std::span<const std::byte> jpeg) -> std::optional<exif_metadata> {
    auto bytes = std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(jpeg.data()),
                                          jpeg.size());
    if (bytes.size() < 4 || bytes[0] != 0xFF || bytes[1] != 0xD8) {
        return std::nullopt;
    }

    std::size_t offset = 2;
    while (offset + 4 <= bytes.size()) {
        if (bytes[offset] != 0xFF) {
            ++offset;
            continue;
        }
        const uint8_t marker = bytes[offset + 1];
        if (marker == 0xFF) {
            ++offset;  // fill byte
            continue;
        }
        if (marker == 0xD9 || marker == 0xDA) {
            break;  // EOI or start of scan: no metadata follows
        }
        if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7)) {
            offset += 2;
            continue;
        }

        const std::size_t length = (static_cast<std::size_t>(bytes[offset + 2]) << 8) |
                                   bytes[offset + 3];
        if (length < 2 || offset + 2 + length > bytes.size()) {
            break;
        }
        if (marker == 0xE1) {
            if (auto metadata = parse_exif_segment(bytes.subspan(offset + 4, length - 2))) {
                return metadata;
            }
        }
        offset += 2 + length;
    }
    return std::nullopt;
}

auto set_exif_orientation(std::vector<uint8_t>& segment, uint16_t orientation) -> bool {
    auto opened = open_tiff(segment);
    if (!opened) {
        return false;
    }
    const auto& [tiff, ifd0] = *opened;

    auto entry = tiff.find_entry(ifd0, tag_orientation);
    if (!entry) {
        return false;
    }
    auto type = tiff.u16(*entry + 2);
    if (!type || *type != type_short) {
        return false;
    }

    const std::size_t at = exif_header_size + *entry + 8;
    if (tiff.little_endian()) {
        segment[at] = static_cast<uint8_t>(orientation & 0xFF);
        segment[at + 1] = static_cast<uint8_t>(orientation >> 8);
    } else {
        segment[at] = static_cast<uint8_t>(orientation >> 8);
        segment[at + 1] = static_cast<uint8_t>(orientation & 0xFF);
    }
    return true;
}

}  // namespace kcenon::image_upload
