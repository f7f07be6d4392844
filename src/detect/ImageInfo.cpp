// SPDX-License-Identifier: Apache-2.0
#include "ImageInfo.hpp"

#include <detect/SignatureSniffer.hpp>

#include <algorithm>
#include <format>
#include <fstream>

namespace klipdot
{

namespace
{
    /// Bytes read from a file for header inspection. Large enough for JPEG
    /// files that carry EXIF data ahead of the SOF marker.
    constexpr auto HeaderReadSize = std::size_t { 64 * 1024 };

    auto be16(std::span<const std::uint8_t> d, std::size_t at) -> std::uint32_t
    {
        return (std::uint32_t { d[at] } << 8) | d[at + 1];
    }

    auto be32(std::span<const std::uint8_t> d, std::size_t at) -> std::uint32_t
    {
        return (std::uint32_t { d[at] } << 24) | (std::uint32_t { d[at + 1] } << 16) | (std::uint32_t { d[at + 2] } << 8)
               | d[at + 3];
    }

    auto le16(std::span<const std::uint8_t> d, std::size_t at) -> std::uint32_t
    {
        return std::uint32_t { d[at] } | (std::uint32_t { d[at + 1] } << 8);
    }

    auto le24(std::span<const std::uint8_t> d, std::size_t at) -> std::uint32_t
    {
        return le16(d, at) | (std::uint32_t { d[at + 2] } << 16);
    }

    auto le32(std::span<const std::uint8_t> d, std::size_t at) -> std::uint32_t
    {
        return le16(d, at) | (le16(d, at + 2) << 16);
    }

    auto pngDimensions(std::span<const std::uint8_t> d) -> std::optional<Dimensions>
    {
        // Signature (8) + IHDR length (4) + "IHDR" (4) + width (4) + height (4)
        if (d.size() < 24 || d[12] != 'I' || d[13] != 'H' || d[14] != 'D' || d[15] != 'R')
            return std::nullopt;
        return Dimensions { .width = be32(d, 16), .height = be32(d, 20) };
    }

    auto gifDimensions(std::span<const std::uint8_t> d) -> std::optional<Dimensions>
    {
        if (d.size() < 10)
            return std::nullopt;
        return Dimensions { .width = le16(d, 6), .height = le16(d, 8) };
    }

    auto bmpDimensions(std::span<const std::uint8_t> d) -> std::optional<Dimensions>
    {
        if (d.size() < 26)
            return std::nullopt;
        auto const headerSize = le32(d, 14);
        if (headerSize == 12) // BITMAPCOREHEADER
            return Dimensions { .width = le16(d, 18), .height = le16(d, 20) };
        auto const height = static_cast<std::int32_t>(le32(d, 22));
        return Dimensions { .width = le32(d, 18), .height = static_cast<std::uint32_t>(height < 0 ? -height : height) };
    }

    auto jpegDimensions(std::span<const std::uint8_t> d) -> std::optional<Dimensions>
    {
        auto pos = std::size_t { 2 };
        while (pos + 4 <= d.size())
        {
            if (d[pos] != 0xFF)
                return std::nullopt;
            auto const marker = d[pos + 1];
            if (marker == 0xFF)
            {
                ++pos; // fill byte
                continue;
            }
            if (marker == 0xD8 || marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7))
            {
                pos += 2;
                continue;
            }
            auto const length = be16(d, pos + 2);
            if (length < 2)
                return std::nullopt;

            // SOF0..SOF15 except DHT (C4), JPG (C8), and DAC (CC).
            auto const isSof = marker >= 0xC0 && marker <= 0xCF && marker != 0xC4 && marker != 0xC8 && marker != 0xCC;
            if (isSof)
            {
                if (pos + 9 > d.size())
                    return std::nullopt;
                return Dimensions { .width = be16(d, pos + 7), .height = be16(d, pos + 5) };
            }
            if (marker == 0xDA) // start of scan without a frame header
                return std::nullopt;
            pos += 2 + length;
        }
        return std::nullopt;
    }

    auto webpDimensions(std::span<const std::uint8_t> d) -> std::optional<Dimensions>
    {
        if (d.size() < 30)
            return std::nullopt;
        auto const chunk = std::string_view { reinterpret_cast<const char*>(d.data() + 12), 4 };
        if (chunk == "VP8 ")
        {
            // Frame tag (3) + start code (3), then 14-bit width and height.
            return Dimensions { .width = le16(d, 26) & 0x3FFF, .height = le16(d, 28) & 0x3FFF };
        }
        if (chunk == "VP8L")
        {
            auto const bits = le32(d, 21);
            return Dimensions { .width = (bits & 0x3FFF) + 1, .height = ((bits >> 14) & 0x3FFF) + 1 };
        }
        if (chunk == "VP8X")
            return Dimensions { .width = le24(d, 24) + 1, .height = le24(d, 27) + 1 };
        return std::nullopt;
    }
} // namespace

auto readDimensions(std::span<const std::uint8_t> data) -> std::optional<Dimensions>
{
    auto const format = classify(data);
    if (!format)
        return std::nullopt;

    switch (*format)
    {
        case ImageFormat::Png: return pngDimensions(data);
        case ImageFormat::Gif: return gifDimensions(data);
        case ImageFormat::Bmp: return bmpDimensions(data);
        case ImageFormat::Jpeg: return jpegDimensions(data);
        case ImageFormat::Webp: return webpDimensions(data);
        case ImageFormat::Tiff:
        case ImageFormat::Ico:
        case ImageFormat::Unknown: break;
    }
    return std::nullopt;
}

auto inspectImageFile(const std::filesystem::path& path) -> Result<ImageInfo>
{
    auto ec = std::error_code {};
    auto const size = std::filesystem::file_size(path, ec);
    if (ec)
        return makeError(ErrorCode::IoError, std::format("Cannot stat {}: {}", path.string(), ec.message()));

    auto file = std::ifstream { path, std::ios::binary };
    if (!file)
        return makeError(ErrorCode::IoError, std::format("Cannot open {}", path.string()));

    auto header = Bytes(std::min<std::uintmax_t>(size, HeaderReadSize));
    file.read(reinterpret_cast<char*>(header.data()), static_cast<std::streamsize>(header.size()));
    header.resize(static_cast<std::size_t>(file.gcount()));

    return ImageInfo {
        .path = path,
        .fileSize = size,
        .format = classify(header),
        .dimensions = readDimensions(header),
    };
}

auto formatFileSize(std::uint64_t bytes) -> std::string
{
    constexpr auto Kilo = 1024.0;
    auto const value = static_cast<double>(bytes);
    if (bytes < 1024)
        return std::format("{} B", bytes);
    if (value < Kilo * Kilo)
        return std::format("{:.1f} KB", value / Kilo);
    if (value < Kilo * Kilo * Kilo)
        return std::format("{:.1f} MB", value / (Kilo * Kilo));
    return std::format("{:.1f} GB", value / (Kilo * Kilo * Kilo));
}

} // namespace klipdot
