// SPDX-License-Identifier: Apache-2.0
#include "PreviewDispatcher.hpp"

#include <core/Log.hpp>
#include <detect/ContentDecoder.hpp>

#include <format>

namespace klipdot
{

PreviewDispatcher::PreviewDispatcher(PreviewRenderer& renderer,
                                     tui::TerminalOutput& output,
                                     ImageStore* store,
                                     const TuiProfile* profile,
                                     bool previewEnabled):
    _renderer(renderer), _output(output), _store(store), _profile(profile), _previewEnabled(previewEnabled)
{
}

auto PreviewDispatcher::resolve(const DetectedImage& detection) -> Result<std::optional<std::filesystem::path>>
{
    switch (detection.source)
    {
        case ImageSource::Url: return std::nullopt;
        case ImageSource::FilePath:
        case ImageSource::StdinPipe:
        case ImageSource::ClipboardPayload:
            if (detection.path.empty())
                return std::nullopt;
            return detection.path;
        case ImageSource::Base64Data: break;
    }

    auto decoded = decodeContent(detection.reference);
    if (!decoded)
        return std::unexpected(decoded.error());
    if (!*decoded || (*decoded)->format == ImageFormat::Unknown)
    {
        log::debug("Inline payload on line {} is not a recognized image", detection.lineNumber);
        return std::nullopt;
    }
    if (!_store)
        return std::nullopt;

    auto path = _store->materialize((*decoded)->bytes, "stream");
    if (!path)
        return std::unexpected(path.error());
    return *path;
}

void PreviewDispatcher::handle(const DetectedImage& detection)
{
    if (detection.source == ImageSource::Url)
    {
        log::info("Image URL detected on line {}: {}", detection.lineNumber, detection.reference);
        return;
    }

    auto resolved = resolve(detection);
    if (!resolved)
    {
        log::warning("Cannot use {} reference on line {}: {}",
                     sourceName(detection.source),
                     detection.lineNumber,
                     resolved.error());
        return;
    }
    if (!*resolved)
        return;

    if (!_previewEnabled)
    {
        log::info("Image detected: {}", (*resolved)->string());
        return;
    }

    present(**resolved);
}

void PreviewDispatcher::present(const std::filesystem::path& path)
{
    if (!_profile)
    {
        renderOrDescribe(path, PreviewSize {});
        return;
    }

    switch (_profile->dispatch)
    {
        case PreviewDispatch::Inline:
            if (_profile->supportsImages)
                renderOrDescribe(path, InlinePreviewSize);
            else if (auto info = compactImageInfo(path); info)
                notice(std::format("[klipdot] {}", *info));
            else
                log::warning("{}", info.error());
            break;
        case PreviewDispatch::SeparatePane:
            notice(std::format("[klipdot] Image detected in {}: {}", _profile->name, path.string()));
            break;
        case PreviewDispatch::Overlay: renderOrDescribe(path, OverlayPreviewSize); break;
        case PreviewDispatch::External:
            notice(std::format("[klipdot] Image detected: {} (open it in an external viewer)", path.string()));
            break;
        case PreviewDispatch::None: log::debug("Image detected in {}: {}", _profile->name, path.string()); break;
    }
}

void PreviewDispatcher::renderOrDescribe(const std::filesystem::path& path, PreviewSize size)
{
    auto rendered = _renderer.render(path, size.width, size.height);
    if (rendered)
        return;

    log::warning("Preview of {} failed: {}", path.string(), rendered.error());
    if (auto described = _renderer.renderTextInfo(path); !described)
        log::warning("{}", described.error());
}

void PreviewDispatcher::notice(std::string_view message)
{
    _output.writeLine(message, tui::Style { .fg = 244, .bold = false, .dim = false });
    _output.flush();
}

} // namespace klipdot
