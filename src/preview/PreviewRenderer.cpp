// SPDX-License-Identifier: Apache-2.0
#include "PreviewRenderer.hpp"

#include <core/Base64.hpp>
#include <core/Log.hpp>
#include <detect/ImageInfo.hpp>

#include <algorithm>
#include <format>
#include <fstream>
#include <iterator>

namespace klipdot
{

namespace
{
    /// Cell-to-pixel factors for helpers that take pixel sizes.
    constexpr auto PixelsPerColumn = 10;
    constexpr auto PixelsPerRow = 20;

    auto readFile(const std::filesystem::path& path) -> Result<Bytes>
    {
        auto file = std::ifstream { path, std::ios::binary };
        if (!file)
            return makeError(ErrorCode::IoError, std::format("Cannot open {}", path.string()));
        auto bytes = Bytes(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
        if (file.bad())
            return makeError(ErrorCode::IoError, std::format("Failed to read {}", path.string()));
        return bytes;
    }

    auto firstLine(std::string_view text) -> std::string_view
    {
        auto const end = text.find('\n');
        return text.substr(0, end);
    }

    auto dimensionsText(const ImageInfo& info) -> std::string
    {
        if (!info.dimensions)
            return "unknown";
        return std::format("{}x{}", info.dimensions->width, info.dimensions->height);
    }
} // namespace

PreviewRenderer::PreviewRenderer(PreviewMethod method, tui::TerminalOutput& output, CommandRunner runner):
    _method(std::move(method)), _output(output), _runner(std::move(runner))
{
}

auto PreviewRenderer::render(const std::filesystem::path& path,
                             std::optional<int> maxWidth,
                             std::optional<int> maxHeight) -> VoidResult
{
    auto ec = std::error_code {};
    if (!std::filesystem::is_regular_file(path, ec))
        return makeError(ErrorCode::IoError, std::format("Image not found: {}", path.string()));

    auto const width = std::max(1, maxWidth.value_or(DefaultPreviewWidth));
    auto const height = std::max(1, maxHeight.value_or(DefaultPreviewHeight));

    log::debug("Rendering {} via {} ({}x{} cells)", path.string(), toString(_method), width, height);

    switch (_method.kind)
    {
        case PreviewKind::ITerm2: return renderITerm2(path, width, height);
        case PreviewKind::Kitty:
        case PreviewKind::Sixel:
        case PreviewKind::Ascii:
        case PreviewKind::External: return renderWithHelper(path, width, height);
        case PreviewKind::None: return renderTextInfo(path);
    }
    return makeError(ErrorCode::UnsupportedMethod, "Unknown preview method");
}

auto PreviewRenderer::renderTextInfo(const std::filesystem::path& path) -> VoidResult
{
    auto info = inspectImageFile(path);
    if (!info)
        return std::unexpected(info.error());

    auto const label = tui::Style { .fg = std::nullopt, .bold = true, .dim = false };
    auto const format = info->format ? formatName(*info->format) : std::string_view { "unknown" };

    _output.write("Image: ", label);
    _output.writeLine(std::format("{} ({})", path.filename().string(), format));
    _output.write("Size: ", label);
    _output.writeLine(formatFileSize(info->fileSize));
    _output.write("Dimensions: ", label);
    _output.writeLine(dimensionsText(*info));
    _output.write("Path: ", label);
    _output.writeLine(path.string());
    _output.flush();
    return {};
}

auto PreviewRenderer::encodeITerm2(std::span<const std::uint8_t> bytes,
                                   std::string_view filename,
                                   int width,
                                   int height) -> std::string
{
    return std::format("\033]1337;File=name={};size={};inline=1;preserveAspectRatio=1;width={};height={}:{}\a",
                       base64::encode(filename),
                       bytes.size(),
                       width,
                       height,
                       base64::encode(bytes));
}

auto PreviewRenderer::buildHelperCommand(const PreviewMethod& method,
                                         const std::filesystem::path& path,
                                         int width,
                                         int height) -> Result<CommandSpec>
{
    auto const file = path.string();
    auto spec = CommandSpec { .program = method.tool, .args = {}, .stdinData = std::nullopt };

    switch (method.kind)
    {
        case PreviewKind::Kitty:
            spec.program = "kitten";
            spec.args = { "icat",
                          "--stdin=no",
                          "--transfer-mode=stream",
                          std::format("--use-window-size={},{},{},{}",
                                      width,
                                      height,
                                      width * PixelsPerColumn,
                                      height * PixelsPerRow),
                          file };
            return spec;
        case PreviewKind::Sixel:
            spec.program = "img2sixel";
            spec.args = { "-w", std::to_string(width * PixelsPerColumn), "-h", std::to_string(height * PixelsPerRow),
                          file };
            return spec;
        case PreviewKind::Ascii:
            if (method.tool == "jp2a")
                spec.args = { "--colors", std::format("--width={}", width), std::format("--height={}", height), file };
            else if (method.tool == "img2txt")
                spec.args = { "-W", std::to_string(width), "-H", std::to_string(height), file };
            else
                break;
            return spec;
        case PreviewKind::External:
            if (method.tool == "imgcat")
                spec.args = { file };
            else if (method.tool == "catimg")
                spec.args = { "-w", std::to_string(width), file };
            else if (method.tool == "timg")
                spec.args = { std::format("-g{}x{}", width, height), file };
            else if (method.tool == "chafa")
                spec.args = { "--size", std::format("{}x{}", width, height), file };
            else
                break;
            return spec;
        case PreviewKind::ITerm2:
        case PreviewKind::None: break;
    }
    return makeError(ErrorCode::UnsupportedMethod,
                     std::format("Preview method {} has no helper command", toString(method)));
}

auto PreviewRenderer::renderITerm2(const std::filesystem::path& path, int width, int height) -> VoidResult
{
    auto bytes = readFile(path);
    if (!bytes)
        return std::unexpected(bytes.error());

    _output.writeRaw(encodeITerm2(*bytes, path.filename().string(), width, height));
    _output.writeRaw("\n");
    _output.flush();
    return {};
}

auto PreviewRenderer::renderWithHelper(const std::filesystem::path& path, int width, int height) -> VoidResult
{
    auto spec = buildHelperCommand(_method, path, width, height);
    if (!spec)
        return std::unexpected(spec.error());

    auto output = _runner(*spec);
    if (!output)
        return makeError(ErrorCode::RenderError,
                         std::format("{} failed: {}", describeCommand(*spec), output.error().message));
    if (output->exitCode != 0)
        return makeError(ErrorCode::RenderError,
                         std::format("{} exited with code {}: {}",
                                     spec->program,
                                     output->exitCode,
                                     firstLine(output->stderrData)));

    _output.writeRaw(output->stdoutData);
    _output.flush();
    return {};
}

auto compactImageInfo(const std::filesystem::path& path) -> Result<std::string>
{
    auto info = inspectImageFile(path);
    if (!info)
        return std::unexpected(info.error());

    auto const name = path.filename().string();
    auto const size = formatFileSize(info->fileSize);
    if (info->dimensions)
        return std::format("{} ({}) - {}", name, dimensionsText(*info), size);
    return std::format("{} - {}", name, size);
}

} // namespace klipdot
