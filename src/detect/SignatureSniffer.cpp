// SPDX-License-Identifier: Apache-2.0
#include "SignatureSniffer.hpp"

#include <algorithm>
#include <array>

namespace klipdot
{

namespace
{
    constexpr auto PngMagic = std::array<std::uint8_t, 8> { 0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A };
    constexpr auto JpegMagic = std::array<std::uint8_t, 3> { 0xFF, 0xD8, 0xFF };
    constexpr auto Gif87Magic = std::array<std::uint8_t, 6> { 'G', 'I', 'F', '8', '7', 'a' };
    constexpr auto Gif89Magic = std::array<std::uint8_t, 6> { 'G', 'I', 'F', '8', '9', 'a' };
    constexpr auto BmpMagic = std::array<std::uint8_t, 2> { 'B', 'M' };
    constexpr auto RiffMagic = std::array<std::uint8_t, 4> { 'R', 'I', 'F', 'F' };
    constexpr auto WebpMagic = std::array<std::uint8_t, 4> { 'W', 'E', 'B', 'P' };
    constexpr auto TiffLeMagic = std::array<std::uint8_t, 4> { 0x49, 0x49, 0x2A, 0x00 };
    constexpr auto TiffBeMagic = std::array<std::uint8_t, 4> { 0x4D, 0x4D, 0x00, 0x2A };
    constexpr auto IcoMagic = std::array<std::uint8_t, 4> { 0x00, 0x00, 0x01, 0x00 };

    auto matchesAt(std::span<const std::uint8_t> data, std::size_t offset, std::span<const std::uint8_t> magic)
        -> bool
    {
        if (data.size() < offset + magic.size())
            return false;
        return std::equal(magic.begin(), magic.end(), data.begin() + static_cast<std::ptrdiff_t>(offset));
    }
} // namespace

auto classify(std::span<const std::uint8_t> data) noexcept -> std::optional<ImageFormat>
{
    if (data.size() < 4)
        return std::nullopt;

    if (matchesAt(data, 0, PngMagic))
        return ImageFormat::Png;
    if (matchesAt(data, 0, JpegMagic))
        return ImageFormat::Jpeg;
    if (matchesAt(data, 0, Gif87Magic) || matchesAt(data, 0, Gif89Magic))
        return ImageFormat::Gif;
    if (matchesAt(data, 0, BmpMagic))
        return ImageFormat::Bmp;
    if (matchesAt(data, 0, RiffMagic) && matchesAt(data, 8, WebpMagic))
        return ImageFormat::Webp;
    if (matchesAt(data, 0, TiffLeMagic) || matchesAt(data, 0, TiffBeMagic))
        return ImageFormat::Tiff;
    if (matchesAt(data, 0, IcoMagic))
        return ImageFormat::Ico;

    return std::nullopt;
}

auto classify(std::string_view data) noexcept -> std::optional<ImageFormat>
{
    return classify(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(data.data()), data.size()));
}

} // namespace klipdot
