// SPDX-License-Identifier: Apache-2.0
#include "ContentDecoder.hpp"

#include <core/Base64.hpp>
#include <detect/SignatureSniffer.hpp>

#include <format>

namespace klipdot
{

namespace
{
    constexpr auto DataUriPrefix = std::string_view { "data:image/" };

    auto trimWhitespace(std::string_view text) -> std::string_view
    {
        auto const isSpace = [](char c) {
            return c == ' ' || c == '\t' || c == '\r' || c == '\n';
        };
        while (!text.empty() && isSpace(text.front()))
            text.remove_prefix(1);
        while (!text.empty() && isSpace(text.back()))
            text.remove_suffix(1);
        return text;
    }

    auto decodeDataUri(std::string_view content) -> Result<std::optional<DecodedImage>>
    {
        auto const comma = content.find(',');
        if (comma == std::string_view::npos)
            return makeError(ErrorCode::DecodeError, "InvalidDataUrl: missing ',' separator");

        auto const payload = trimWhitespace(content.substr(comma + 1));
        auto bytes = base64::decode(payload);
        if (!bytes)
            return makeError(ErrorCode::DecodeError, "InvalidDataUrl: malformed base64 payload");

        auto const format = classify(*bytes).value_or(ImageFormat::Unknown);
        return DecodedImage { .bytes = std::move(*bytes), .format = format };
    }
} // namespace

auto isImageDataUri(std::string_view content) noexcept -> bool
{
    return content.starts_with(DataUriPrefix);
}

auto decodeContent(std::string_view content) -> Result<std::optional<DecodedImage>>
{
    if (isImageDataUri(content))
        return decodeDataUri(content);

    if (content.size() > MinBase64PayloadLength && base64::isAlphabet(content))
    {
        if (auto bytes = base64::decode(content); bytes)
        {
            if (auto const format = classify(*bytes); format)
                return DecodedImage { .bytes = std::move(*bytes), .format = *format };
        }
    }

    if (auto const format = classify(content); format)
    {
        auto const* begin = reinterpret_cast<const std::uint8_t*>(content.data());
        return DecodedImage { .bytes = Bytes(begin, begin + content.size()), .format = *format };
    }

    return std::nullopt;
}

} // namespace klipdot
