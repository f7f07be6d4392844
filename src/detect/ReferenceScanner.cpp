// SPDX-License-Identifier: Apache-2.0
#include "ReferenceScanner.hpp"

#include <detect/SignatureSniffer.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <optional>

namespace klipdot
{

namespace
{
    constexpr auto ImageExtensions =
        std::array<std::string_view, 10> { "png", "jpg", "jpeg", "gif", "bmp", "webp", "svg", "tiff", "tif", "ico" };

    constexpr auto DataUriFormats =
        std::array<std::string_view, 7> { "png", "jpeg", "jpg", "gif", "bmp", "webp", "svg+xml" };

    auto isTokenDelimiter(char c) noexcept -> bool
    {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f' || c == '"' || c == '\'';
    }

    auto isBase64Char(char c) noexcept -> bool
    {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/' || c == '=';
    }

    auto equalsIgnoreCase(std::string_view a, std::string_view b) noexcept -> bool
    {
        return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                   return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
               });
    }

    auto extensionOf(std::string_view name) -> std::string_view
    {
        auto const dot = name.rfind('.');
        if (dot == std::string_view::npos)
            return {};
        auto const ext = name.substr(dot + 1);
        if (ext.find_first_of("/\\") != std::string_view::npos)
            return {};
        return ext;
    }

    auto splitTokens(std::string_view line) -> std::vector<std::string_view>
    {
        auto tokens = std::vector<std::string_view> {};
        auto i = std::size_t { 0 };
        while (i < line.size())
        {
            while (i < line.size() && isTokenDelimiter(line[i]))
                ++i;
            auto const start = i;
            while (i < line.size() && !isTokenDelimiter(line[i]))
                ++i;
            if (i > start)
                tokens.push_back(line.substr(start, i - start));
        }
        return tokens;
    }

    /// Strips punctuation that commonly wraps a path in prose or markup.
    auto trimPunctuation(std::string_view token) -> std::string_view
    {
        while (!token.empty() && std::string_view { "([<{`" }.find(token.front()) != std::string_view::npos)
            token.remove_prefix(1);
        while (!token.empty() && std::string_view { ")]>}`,;:.!?" }.find(token.back()) != std::string_view::npos)
            token.remove_suffix(1);
        return token;
    }

    auto looksLikePath(std::string_view token) noexcept -> bool
    {
        if (token.empty())
            return false;
        if (token.front() == '~' || token.front() == '/' || token.front() == '.')
            return true;
        if (token.starts_with("\\\\"))
            return true;
        // Drive letter, e.g. C:\ or C:/
        return token.size() >= 3 && std::isalpha(static_cast<unsigned char>(token[0])) && token[1] == ':'
               && (token[2] == '\\' || token[2] == '/');
    }

    auto isUrlLike(std::string_view token) noexcept -> bool
    {
        return token.find("://") != std::string_view::npos || token.find("data:") != std::string_view::npos;
    }

    /// Extracts an http(s) image URL from a token, including an optional query string.
    auto findImageUrl(std::string_view token) -> std::optional<std::string_view>
    {
        auto start = token.find("https://");
        if (start == std::string_view::npos)
            start = token.find("http://");
        if (start == std::string_view::npos)
            return std::nullopt;

        auto url = token.substr(start);
        while (!url.empty() && std::string_view { ")]>},;:.!" }.find(url.back()) != std::string_view::npos)
            url.remove_suffix(1);

        auto const schemeEnd = url.find("://") + 3;
        auto const location = url.substr(0, url.find_first_of("?#"));
        auto const slash = location.find('/', schemeEnd);
        if (slash == std::string_view::npos || slash == schemeEnd)
            return std::nullopt;
        if (!hasImageExtension(location.substr(slash)))
            return std::nullopt;
        return url;
    }

    /// Extracts a `data:image/<fmt>;base64,<payload>` reference from a token.
    auto findDataUri(std::string_view token) -> std::optional<std::string_view>
    {
        auto const start = token.find("data:image/");
        if (start == std::string_view::npos)
            return std::nullopt;

        auto rest = token.substr(start + std::string_view { "data:image/" }.size());
        auto const marker = rest.find(";base64,");
        if (marker == std::string_view::npos)
            return std::nullopt;

        auto const format = rest.substr(0, marker);
        if (std::ranges::none_of(DataUriFormats, [&](auto f) { return equalsIgnoreCase(f, format); }))
            return std::nullopt;

        auto const payloadStart = start + std::string_view { "data:image/" }.size() + marker
                                  + std::string_view { ";base64," }.size();
        auto payloadEnd = payloadStart;
        while (payloadEnd < token.size() && isBase64Char(token[payloadEnd]))
            ++payloadEnd;
        if (payloadEnd == payloadStart)
            return std::nullopt;

        return token.substr(start, payloadEnd - start);
    }

    auto lastToken(std::string_view text) -> std::string_view
    {
        auto end = text.size();
        while (end > 0 && isTokenDelimiter(text[end - 1]))
            --end;
        auto start = end;
        while (start > 0 && !isTokenDelimiter(text[start - 1]))
            --start;
        // A delimiter right at the end means nothing was cut.
        if (end != text.size())
            return {};
        return text.substr(start, end - start);
    }

    auto firstToken(std::string_view text) -> std::string_view
    {
        auto end = std::size_t { 0 };
        while (end < text.size() && !isTokenDelimiter(text[end]))
            ++end;
        return text.substr(0, end);
    }
} // namespace

auto hasImageExtension(std::string_view name) -> bool
{
    auto const ext = extensionOf(name);
    return !ext.empty() && std::ranges::any_of(ImageExtensions, [&](auto e) { return equalsIgnoreCase(e, ext); });
}

auto hasVectorExtension(std::string_view name) -> bool
{
    return equalsIgnoreCase(extensionOf(name), "svg");
}

auto isImageFile(const std::filesystem::path& path) -> bool
{
    auto ec = std::error_code {};
    if (!std::filesystem::is_regular_file(path, ec))
        return false;

    if (hasVectorExtension(path.filename().string()))
        return true;

    auto file = std::ifstream { path, std::ios::binary };
    if (!file)
        return false;

    auto header = std::array<char, SignatureProbeSize> {};
    file.read(header.data(), static_cast<std::streamsize>(header.size()));
    auto const got = static_cast<std::size_t>(file.gcount());
    return classify(std::string_view { header.data(), got }).has_value();
}

auto stripAnsi(std::string_view line) -> std::string
{
    enum class State : std::uint8_t
    {
        Ground,
        Escape,
        Csi,
        Osc,
        OscEscape,
    };

    auto out = std::string {};
    out.reserve(line.size());
    auto state = State::Ground;

    for (auto const c: line)
    {
        auto const byte = static_cast<unsigned char>(c);
        switch (state)
        {
            case State::Ground:
                if (byte == 0x1B)
                    state = State::Escape;
                else
                    out.push_back(c);
                break;
            case State::Escape:
                if (c == '[')
                    state = State::Csi;
                else if (c == ']')
                    state = State::Osc;
                else
                    state = State::Ground;
                break;
            case State::Csi:
                // Parameter and intermediate bytes run until a final byte in 0x40..0x7E.
                if (byte >= 0x40 && byte <= 0x7E)
                    state = State::Ground;
                break;
            case State::Osc:
                if (byte == 0x07)
                    state = State::Ground;
                else if (byte == 0x1B)
                    state = State::OscEscape;
                break;
            case State::OscEscape: state = c == '\\' ? State::Ground : State::Osc; break;
        }
    }
    return out;
}

ReferenceScanner::ReferenceScanner(ScannerOptions options): _options(std::move(options))
{
    if (_options.homeDir.empty())
    {
        if (auto const* home = std::getenv("HOME"); home && *home)
            _options.homeDir = home;
    }
    if (_options.baseDir.empty())
    {
        auto ec = std::error_code {};
        _options.baseDir = std::filesystem::current_path(ec);
    }
}

auto ReferenceScanner::resolvePath(std::string_view token) const -> std::filesystem::path
{
    if (token == "~")
        return _options.homeDir;
    if (token.starts_with("~/") && !_options.homeDir.empty())
        return _options.homeDir / std::filesystem::path { token.substr(2) };

    auto path = std::filesystem::path { token };
    if (path.is_relative() && !_options.baseDir.empty())
        return _options.baseDir / path;
    return path;
}

auto ReferenceScanner::scan(std::string_view line, const TuiProfile* profile, std::size_t lineNumber) const
    -> std::vector<DetectedImage>
{
    auto const strategy = profile ? profile->strategy : ScanStrategy::Default;
    auto detections = std::vector<DetectedImage> {};

    auto const alreadyFound = [&](ImageSource source, std::string_view reference) {
        return std::ranges::any_of(
            detections, [&](auto const& d) { return d.source == source && d.reference == reference; });
    };

    auto const emit = [&](ImageSource source, std::string_view reference, std::filesystem::path path) {
        if (alreadyFound(source, reference))
            return;
        detections.push_back(DetectedImage {
            .path = std::move(path),
            .reference = std::string { reference },
            .source = source,
            .context = std::string { line },
            .lineNumber = lineNumber,
        });
    };

    for (auto const rawToken: splitTokens(line))
    {
        if (auto const dataUri = findDataUri(rawToken))
        {
            emit(ImageSource::Base64Data, *dataUri, {});
            continue;
        }

        if (strategy != ScanStrategy::FileManager)
        {
            if (auto const url = findImageUrl(rawToken))
            {
                emit(ImageSource::Url, *url, {});
                continue;
            }
        }

        auto token = trimPunctuation(rawToken);
        if (token.empty() || isUrlLike(token) || !hasImageExtension(token))
            continue;

        // A "label:/path" prefix, e.g. "at:/tmp/x.png".
        if (!looksLikePath(token))
        {
            if (auto const colon = token.find(":/"); colon != std::string_view::npos && colon > 1)
                token = token.substr(colon + 1);
        }

        if (!looksLikePath(token) && strategy != ScanStrategy::FileManager)
            continue;

        auto path = resolvePath(token);
        if (isImageFile(path))
            emit(ImageSource::FilePath, token, std::move(path));
    }

    return detections;
}

auto ReferenceScanner::scanWrapped(std::string_view previous, std::string_view line, std::size_t lineNumber) const
    -> std::vector<DetectedImage>
{
    auto const tail = lastToken(previous);
    auto const head = firstToken(line);
    if (tail.empty() || head.empty())
        return {};

    auto joined = std::string { tail };
    joined += head;

    auto const url = findImageUrl(joined);
    if (!url)
        return {};

    // Only report what neither half produces alone.
    auto const tailUrl = findImageUrl(tail);
    if (tailUrl && *tailUrl == *url)
        return {};
    if (url->size() <= head.size() && head.find(*url) != std::string_view::npos)
        return {};

    auto context = std::string { previous };
    context += line;
    return { DetectedImage {
        .path = {},
        .reference = std::string { *url },
        .source = ImageSource::Url,
        .context = std::move(context),
        .lineNumber = lineNumber,
    } };
}

} // namespace klipdot
