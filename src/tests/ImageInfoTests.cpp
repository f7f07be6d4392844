// SPDX-License-Identifier: Apache-2.0
#include <detect/ImageInfo.hpp>

#include <catch2/catch_test_macros.hpp>

#include "TestHelpers.hpp"

using namespace klipdot;

TEST_CASE("readDimensions parses a PNG header", "[imageinfo]")
{
    auto const dims = readDimensions(test::samplePng());
    REQUIRE(dims.has_value());
    CHECK(dims->width == 16);
    CHECK(dims->height == 8);
}

TEST_CASE("readDimensions parses a GIF header", "[imageinfo]")
{
    auto const gif = Bytes { 'G', 'I', 'F', '8', '9', 'a', 0x40, 0x01, 0xF0, 0x00, 0x00, 0x00, 0x00 };
    auto const dims = readDimensions(gif);
    REQUIRE(dims.has_value());
    CHECK(dims->width == 320);
    CHECK(dims->height == 240);
}

TEST_CASE("readDimensions parses a JPEG start-of-frame", "[imageinfo]")
{
    auto const jpeg = Bytes {
        0xFF, 0xD8,                                     // SOI
        0xFF, 0xE0, 0x00, 0x04, 0x00, 0x00,             // APP0 with two payload bytes
        0xFF, 0xC0, 0x00, 0x11, 0x08, 0x00, 0x30, 0x00, // SOF0, precision, height 48
        0x40, 0x03, 0x01, 0x22, 0x00, 0x02, 0x11, 0x01, // width 64
        0x03, 0x11, 0x01,
    };
    auto const dims = readDimensions(jpeg);
    REQUIRE(dims.has_value());
    CHECK(dims->width == 64);
    CHECK(dims->height == 48);
}

TEST_CASE("readDimensions rejects unknown or truncated headers", "[imageinfo]")
{
    CHECK(!readDimensions(Bytes {}).has_value());
    CHECK(!readDimensions(Bytes { 0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A }).has_value());
    CHECK(!readDimensions(Bytes { 'h', 'e', 'l', 'l', 'o', ' ', 'w', 'o', 'r', 'l', 'd' }).has_value());
}

TEST_CASE("inspectImageFile collects size, format, and dimensions", "[imageinfo]")
{
    auto const dir = test::TempDir();
    auto const path = dir.write("image.png", test::samplePng());

    auto const info = inspectImageFile(path);
    REQUIRE(info.has_value());
    CHECK(info->path == path);
    CHECK(info->fileSize == test::samplePng().size());
    CHECK(info->format == ImageFormat::Png);
    REQUIRE(info->dimensions.has_value());
    CHECK(info->dimensions->width == 16);
}

TEST_CASE("inspectImageFile fails for a missing file", "[imageinfo]")
{
    auto const dir = test::TempDir();
    auto const info = inspectImageFile(dir.path() / "nope.png");
    REQUIRE(!info.has_value());
    CHECK(info.error().code == ErrorCode::IoError);
}

TEST_CASE("formatFileSize uses binary units with one decimal", "[imageinfo]")
{
    CHECK(formatFileSize(0) == "0 B");
    CHECK(formatFileSize(500) == "500 B");
    CHECK(formatFileSize(1023) == "1023 B");
    CHECK(formatFileSize(1536) == "1.5 KB");
    CHECK(formatFileSize(1468006) == "1.4 MB");
    CHECK(formatFileSize(std::uint64_t { 2 } * 1024 * 1024 * 1024) == "2.0 GB");
}
