// SPDX-License-Identifier: Apache-2.0
#include "Base64.hpp"

#include <array>

namespace klipdot::base64
{

namespace
{
    constexpr auto Alphabet = std::string_view { "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/" };

    constexpr auto Invalid = std::uint8_t { 0xFF };

    constexpr auto makeDecodeTable() -> std::array<std::uint8_t, 256>
    {
        auto table = std::array<std::uint8_t, 256> {};
        table.fill(Invalid);
        for (auto i = std::size_t { 0 }; i < Alphabet.size(); ++i)
            table[static_cast<unsigned char>(Alphabet[i])] = static_cast<std::uint8_t>(i);
        return table;
    }

    constexpr auto DecodeTable = makeDecodeTable();
} // namespace

auto encode(std::span<const std::uint8_t> data) -> std::string
{
    auto out = std::string {};
    out.reserve(((data.size() + 2) / 3) * 4);

    auto i = std::size_t { 0 };
    for (; i + 3 <= data.size(); i += 3)
    {
        auto const triple = (static_cast<unsigned>(data[i]) << 16) | (static_cast<unsigned>(data[i + 1]) << 8)
                            | static_cast<unsigned>(data[i + 2]);
        out.push_back(Alphabet[(triple >> 18) & 0x3F]);
        out.push_back(Alphabet[(triple >> 12) & 0x3F]);
        out.push_back(Alphabet[(triple >> 6) & 0x3F]);
        out.push_back(Alphabet[triple & 0x3F]);
    }

    auto const remaining = data.size() - i;
    if (remaining > 0)
    {
        auto triple = static_cast<unsigned>(data[i]) << 16;
        if (remaining == 2)
            triple |= static_cast<unsigned>(data[i + 1]) << 8;
        out.push_back(Alphabet[(triple >> 18) & 0x3F]);
        out.push_back(Alphabet[(triple >> 12) & 0x3F]);
        out.push_back(remaining == 2 ? Alphabet[(triple >> 6) & 0x3F] : '=');
        out.push_back('=');
    }
    return out;
}

auto encode(std::string_view data) -> std::string
{
    return encode(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(data.data()), data.size()));
}

auto decode(std::string_view text) -> std::optional<Bytes>
{
    if (text.size() % 4 != 0)
        return std::nullopt;

    auto padding = std::size_t { 0 };
    if (!text.empty() && text.back() == '=')
        ++padding;
    if (text.size() >= 2 && text[text.size() - 2] == '=')
        ++padding;

    auto out = Bytes {};
    out.reserve(text.size() / 4 * 3);

    for (auto i = std::size_t { 0 }; i < text.size(); i += 4)
    {
        auto const isLastQuad = i + 4 == text.size();
        auto values = std::array<std::uint8_t, 4> {};
        for (auto j = std::size_t { 0 }; j < 4; ++j)
        {
            auto const c = text[i + j];
            if (c == '=')
            {
                // Padding only in the final quad, only in its trailing positions.
                if (!isLastQuad || j < 4 - padding)
                    return std::nullopt;
                values[j] = 0;
                continue;
            }
            values[j] = DecodeTable[static_cast<unsigned char>(c)];
            if (values[j] == Invalid)
                return std::nullopt;
        }

        auto const quad = (static_cast<unsigned>(values[0]) << 18) | (static_cast<unsigned>(values[1]) << 12)
                          | (static_cast<unsigned>(values[2]) << 6) | static_cast<unsigned>(values[3]);
        out.push_back(static_cast<std::uint8_t>((quad >> 16) & 0xFF));
        if (!isLastQuad || padding < 2)
            out.push_back(static_cast<std::uint8_t>((quad >> 8) & 0xFF));
        if (!isLastQuad || padding < 1)
            out.push_back(static_cast<std::uint8_t>(quad & 0xFF));
    }
    return out;
}

auto isAlphabet(std::string_view text) noexcept -> bool
{
    for (auto const c: text)
    {
        if (c != '=' && DecodeTable[static_cast<unsigned char>(c)] == Invalid)
            return false;
    }
    return true;
}

} // namespace klipdot::base64
