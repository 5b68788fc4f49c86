/**
 * @file test_exif_metadata.cpp
 * @brief Unit tests for EXIF orientation and capture time parsing
 */

#include "integration/test_fixtures.h"

namespace kcenon::image_upload::test {

namespace {

/**
 * @brief Big-endian APP1 payload with DateTime in IFD0 and no Exif IFD
 */
auto make_big_endian_segment(uint16_t orientation, const std::string& date_time)
    -> std::vector<uint8_t> {
    std::vector<uint8_t> data = {'E', 'x', 'i', 'f', 0, 0, 'M', 'M', 0, 42, 0, 0, 0, 8};
    auto put16 = [&](uint16_t v) {
        data.push_back(static_cast<uint8_t>(v >> 8));
        data.push_back(static_cast<uint8_t>(v & 0xFF));
    };
    auto put32 = [&](uint32_t v) {
        for (int i = 3; i >= 0; --i) {
            data.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
        }
    };

    put16(2);
    put16(0x0112);
    put16(3);
    put32(1);
    put16(orientation);
    put16(0);
    put16(0x0132);
    put16(2);
    put32(20);
    put32(8 + 2 + 24 + 4);
    put32(0);
    data.insert(data.end(), date_time.begin(), date_time.end());
    data.push_back(0);
    return data;
}

auto as_bytes(const std::vector<uint8_t>& data) -> std::vector<std::byte> {
    return std::vector<std::byte>(reinterpret_cast<const std::byte*>(data.data()),
                                  reinterpret_cast<const std::byte*>(data.data()) + data.size());
}

}  // namespace

class ExifMetadataTest : public ::testing::Test {};

// =============================================================================
// Segment Parsing Tests
// =============================================================================

TEST_F(ExifMetadataTest, ReadsLittleEndianOrientationAndCaptureTime) {
    auto segment = make_exif_segment(6, "2021:07:04 18:30:05");

    auto metadata = parse_exif_segment(segment.data);

    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(metadata->orientation, 6);
    EXPECT_TRUE(metadata->swaps_dimensions());
    ASSERT_TRUE(metadata->capture_time.has_value());
    EXPECT_EQ(*metadata->capture_time, "2021:07:04 18:30:05");
}

TEST_F(ExifMetadataTest, FallsBackToDateTimeInBigEndianBlock) {
    auto segment = make_big_endian_segment(3, "2018:01:15 08:00:00");

    auto metadata = parse_exif_segment(segment);

    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(metadata->orientation, 3);
    EXPECT_FALSE(metadata->swaps_dimensions());
    EXPECT_EQ(metadata->capture_time.value_or(""), "2018:01:15 08:00:00");
}

TEST_F(ExifMetadataTest, MissingDateLeavesCaptureTimeEmpty) {
    auto segment = make_exif_segment(1);

    auto metadata = parse_exif_segment(segment.data);

    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(metadata->orientation, 1);
    EXPECT_FALSE(metadata->capture_time.has_value());
}

TEST_F(ExifMetadataTest, RejectsMalformedDates) {
    EXPECT_FALSE(parse_exif_segment(make_exif_segment(1, "0000:00:00 00:00:00").data)
                     ->capture_time.has_value());
    EXPECT_FALSE(parse_exif_segment(make_exif_segment(1, "2020:13:01 00:00:00").data)
                     ->capture_time.has_value());
    EXPECT_FALSE(parse_exif_segment(make_exif_segment(1, "2020-01-01 00:00:00").data)
                     ->capture_time.has_value());
}

TEST_F(ExifMetadataTest, OutOfRangeOrientationIsIgnored) {
    auto metadata = parse_exif_segment(make_exif_segment(9).data);

    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(metadata->orientation, 1);
}

TEST_F(ExifMetadataTest, RejectsNonExifPayload) {
    std::vector<uint8_t> xmp = {'h', 't', 't', 'p', ':', '/', '/', 'n', 's', '.', 'a', 'd'};
    EXPECT_FALSE(parse_exif_segment(xmp).has_value());

    auto bad_magic = make_exif_segment(1).data;
    bad_magic[8] = 43;
    EXPECT_FALSE(parse_exif_segment(bad_magic).has_value());
}

TEST_F(ExifMetadataTest, TruncatedSegmentDoesNotReadPastEnd) {
    auto segment = make_exif_segment(6, "2021:07:04 18:30:05").data;
    segment.resize(segment.size() - 12);

    auto metadata = parse_exif_segment(segment);

    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(metadata->orientation, 6);
    EXPECT_FALSE(metadata->capture_time.has_value());
}

// =============================================================================
// Orientation Rewrite Tests
// =============================================================================

TEST_F(ExifMetadataTest, RewritesOrientationInPlace) {
    auto little = make_exif_segment(8, "2021:07:04 18:30:05").data;
    ASSERT_TRUE(set_exif_orientation(little, 1));
    auto parsed = parse_exif_segment(little);
    EXPECT_EQ(parsed->orientation, 1);
    EXPECT_EQ(parsed->capture_time.value_or(""), "2021:07:04 18:30:05");

    auto big = make_big_endian_segment(6, "2018:01:15 08:00:00");
    ASSERT_TRUE(set_exif_orientation(big, 1));
    EXPECT_EQ(parse_exif_segment(big)->orientation, 1);
}

TEST_F(ExifMetadataTest, RewriteFailsWithoutOrientationTag) {
    std::vector<uint8_t> segment = {'E', 'x', 'i', 'f', 0, 0, 'I', 'I', 42, 0,
                                    8,   0,   0,   0,   0, 0, 0,   0,   0,  0};

    EXPECT_FALSE(set_exif_orientation(segment, 1));
}

// =============================================================================
// JPEG Scanning Tests
// =============================================================================

TEST_F(ExifMetadataTest, FindsSegmentInEncodedJpeg) {
    auto jpeg = make_jpeg(16, 16, 90, 7, {make_exif_segment(5, "2022:02:22 22:22:22")});

    auto metadata = read_jpeg_exif(jpeg);

    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(metadata->orientation, 5);
    EXPECT_EQ(metadata->capture_time.value_or(""), "2022:02:22 22:22:22");
}

TEST_F(ExifMetadataTest, SkipsOtherAppSegments) {
    jpeg_marker comment{JPEG_APP0 + 13, {'P', 'h', 'o', 't', 'o', 's', 'h', 'o', 'p'}};
    auto jpeg = make_jpeg(16, 16, 90, 7, {comment, make_exif_segment(7)});

    auto metadata = read_jpeg_exif(jpeg);

    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(metadata->orientation, 7);
}

TEST_F(ExifMetadataTest, JpegWithoutExifHasNoMetadata) {
    EXPECT_FALSE(read_jpeg_exif(make_jpeg(16, 16)).has_value());
    EXPECT_FALSE(read_jpeg_exif(make_payload(256)).has_value());
    EXPECT_FALSE(read_jpeg_exif(as_bytes({0xFF, 0xD8})).has_value());
}

TEST_F(ExifMetadataTest, HeadOfJpegIsEnough) {
    auto jpeg = make_jpeg(256, 256, 100, 7, {make_exif_segment(1, "2020:05:05 05:05:05")});
    std::vector<std::byte> head(jpeg.begin(), jpeg.begin() + 512);

    auto metadata = read_jpeg_exif(head);

    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(metadata->capture_time.value_or(""), "2020:05:05 05:05:05");
}

}  // namespace kcenon::image_upload::test
