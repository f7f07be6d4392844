// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <clipboard/CommandClipboard.hpp>
#include <core/ChildProcess.hpp>
#include <core/FdIo.hpp>
#include <core/Log.hpp>
#include <detect/ContentDecoder.hpp>
#include <detect/ImageInfo.hpp>
#include <detect/ReferenceScanner.hpp>
#include <detect/TuiProfile.hpp>
#include <monitor/ClipboardWatcher.hpp>
#include <monitor/StreamMonitor.hpp>
#include <preview/CapabilityProbe.hpp>
#include <preview/LiveCursorTracker.hpp>
#include <preview/PreviewDispatcher.hpp>
#include <preview/PreviewRenderer.hpp>
#include <store/ImageStore.hpp>
#include <tui/TerminalOutput.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <format>
#include <iostream>
#include <optional>
#include <print>
#include <string>
#include <thread>

#include <pthread.h>
#include <signal.h>
#include <unistd.h>

namespace klipdot
{

namespace
{
    /// Upper bound for one preview helper run (kitten, img2sixel, chafa, ...).
    constexpr auto PreviewHelperTimeout = std::chrono::milliseconds(10000);

    /// Live-preview surface that reports changes as text instead of drawing.
    class NoticeSurface: public PreviewSurface
    {
      public:
        explicit NoticeSurface(tui::TerminalOutput& output): _output(output) {}

        [[nodiscard]] auto show(const std::filesystem::path& path) -> VoidResult override
        {
            _output.writeLine(std::format("preview: {}", path.string()));
            _output.flush();
            return {};
        }

        [[nodiscard]] auto hide() -> VoidResult override
        {
            _output.writeLine("preview: none");
            _output.flush();
            return {};
        }

      private:
        tui::TerminalOutput& _output;
    };

    auto withoutWhitespace(std::string_view text) -> std::string
    {
        auto out = std::string {};
        out.reserve(text.size());
        for (auto const c: text)
        {
            if (c != ' ' && c != '\n' && c != '\r' && c != '\t')
                out.push_back(c);
        }
        return out;
    }
} // namespace

struct App::Impl
{
    AppConfig config;
    tui::TerminalOutput output;
    ReferenceScanner scanner;
    std::optional<PreviewMethod> method;

    explicit Impl(AppConfig cfg): config(std::move(cfg)) {}

    /// Selects the preview method on first use; it stays fixed afterwards.
    auto previewMethod() -> const PreviewMethod&
    {
        if (method)
            return *method;

        if (config.preview.method != "auto")
        {
            method = parsePreviewMethod(config.preview.method).value_or(PreviewMethod {});
            log::debug("Preview method pinned by configuration: {}", toString(*method));
        }
        else
        {
            auto const timeout = std::chrono::milliseconds(config.preview.sixelTimeoutMs);
            method = detectPreviewMethod(ProbeEnvironment::system(timeout));
            log::debug("Preview method detected: {}", toString(*method));
        }
        return *method;
    }

    auto screenshotStore() const -> ImageStore
    {
        return ImageStore(config.effectiveScreenshotDir(), config.maxFileSize);
    }

    auto monitorWithoutScanning(const std::vector<std::string>& command) -> int
    {
        auto child = ChildProcess {};
        auto started = child.start(ChildProcessConfig {
            .command = command.front(),
            .args = std::vector<std::string>(command.begin() + 1, command.end()),
            .env = {},
            .stdinMode = StreamMode::Inherit,
            .stdoutMode = StreamMode::Inherit,
            .stderrMode = StreamMode::Inherit,
        });
        if (!started)
        {
            log::error("{}", started.error());
            return 127;
        }
        auto status = child.wait();
        if (!status)
        {
            log::error("{}", status.error());
            return 1;
        }
        return status->shellCode();
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
}

App::~App() = default;

auto App::initialize() -> VoidResult
{
    auto const level = log::levelFromString(_impl->config.logLevel);
    if (!level)
        return makeError(ErrorCode::ConfigError, std::format("Unknown log level: {}", _impl->config.logLevel));

    log::setLevel(*level);

    // Helpers may exit before reading all of their stdin; report that as EPIPE.
    ::signal(SIGPIPE, SIG_IGN);

    auto const& pinned = _impl->config.preview.method;
    if (pinned != "auto" && !parsePreviewMethod(pinned))
        return makeError(ErrorCode::ConfigError, std::format("Unknown preview method: {}", pinned));

    if (auto const result = _impl->output.initialize(); !result)
        return result;

    return {};
}

auto App::runWatch() -> int
{
    if (!_impl->config.intercept.clipboard)
    {
        log::error("Clipboard interception is disabled in the configuration");
        return 1;
    }

    auto backend = detectClipboardBackend(_impl->config.clipboard.preferredTool);
    if (!backend)
    {
        log::error("{}", backend.error());
        return 1;
    }

    auto store = _impl->screenshotStore();
    auto watcher = ClipboardWatcher(**backend, store, std::chrono::milliseconds(_impl->config.pollInterval));

    // Block the stop signals before starting the worker so only sigwait sees them.
    auto signals = sigset_t {};
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    auto worker = std::jthread([&watcher](std::stop_token token) { watcher.run(std::move(token)); });

    auto signal = 0;
    if (sigwait(&signals, &signal) == 0)
        log::info("Received signal {}, stopping", signal);

    worker.request_stop();
    worker.join();
    pthread_sigmask(SIG_UNBLOCK, &signals, nullptr);
    return 0;
}

auto App::runPreview(const std::string& path, std::optional<int> width, std::optional<int> height) -> int
{
    auto const resolved = _impl->scanner.resolvePath(path);
    auto renderer = PreviewRenderer(_impl->previewMethod(), _impl->output, systemCommandRunner(PreviewHelperTimeout));

    auto rendered = renderer.render(resolved,
                                    width.value_or(_impl->config.preview.maxWidth),
                                    height.value_or(_impl->config.preview.maxHeight));
    if (rendered)
        return 0;

    log::error("Preview failed: {}", rendered.error());
    if (rendered.error().code != ErrorCode::IoError)
    {
        if (auto described = renderer.renderTextInfo(resolved); !described)
            log::error("{}", described.error());
    }
    return 1;
}

auto App::runPreviewStdin() -> int
{
    auto input = readAll(STDIN_FILENO);
    if (!input)
    {
        log::error("{}", input.error());
        return 1;
    }

    auto decoded = decodeContent(*input);
    if (decoded && !*decoded)
        decoded = decodeContent(withoutWhitespace(*input)); // wrapped base64, e.g. from base64(1)
    if (!decoded)
    {
        log::error("{}", decoded.error());
        return 1;
    }
    if (!*decoded)
    {
        log::error("stdin does not contain image data");
        return 1;
    }

    auto store = ImageStore(std::filesystem::temp_directory_path() / "klipdot", _impl->config.maxFileSize);
    auto path = store.materialize((*decoded)->bytes, "stdin");
    if (!path)
    {
        log::error("{}", path.error());
        return 1;
    }

    auto const exitCode = runPreview(path->string(), std::nullopt, std::nullopt);

    auto ec = std::error_code {};
    std::filesystem::remove(*path, ec);
    if (ec)
        log::warning("Cannot remove temporary file {}: {}", path->string(), ec.message());
    return exitCode;
}

auto App::runMonitorOutput(const std::vector<std::string>& command) -> int
{
    auto const monitoringStdin = command.empty();
    if (monitoringStdin && !_impl->config.intercept.stdinPipe)
    {
        log::error("stdin interception is disabled in the configuration");
        return 1;
    }
    if (!monitoringStdin && !_impl->config.intercept.stream)
    {
        log::info("Stream interception is disabled, running {} unmonitored", command.front());
        return _impl->monitorWithoutScanning(command);
    }

    auto const* profile = monitoringStdin ? nullptr : lookupTuiProfile(command.front());
    if (profile)
        log::info("Monitoring {} (dispatch: {})", profile->name, dispatchName(profile->dispatch));

    auto const previewEnabled = _impl->config.preview.enabled;
    auto dispatcher = std::optional<PreviewDispatcher> {};
    auto monitor = StreamMonitor(_impl->scanner,
                                 StreamMonitorConfig { .profile = profile },
                                 [&dispatcher](const DetectedImage& detection) { dispatcher->handle(detection); });

    // Previews are rendered off the output lock and only written under it.
    auto previewOutput = tui::TerminalOutput(monitor.serializedSink(makeFdSink(STDOUT_FILENO)));
    auto renderer = PreviewRenderer(previewEnabled ? _impl->previewMethod() : PreviewMethod {},
                                    previewOutput,
                                    systemCommandRunner(PreviewHelperTimeout));
    auto store = _impl->screenshotStore();
    dispatcher.emplace(renderer, previewOutput, &store, profile, previewEnabled);

    if (monitoringStdin)
    {
        if (auto result = monitor.monitorFd(STDIN_FILENO); !result)
        {
            log::error("{}", result.error());
            return 1;
        }
        return 0;
    }

    auto child = ChildProcess {};
    auto started = child.start(ChildProcessConfig {
        .command = command.front(),
        .args = std::vector<std::string>(command.begin() + 1, command.end()),
        .env = {},
        .stdinMode = StreamMode::Inherit,
        .stdoutMode = StreamMode::Pipe,
        .stderrMode = StreamMode::Pipe,
    });
    if (!started)
    {
        log::error("{}", started.error());
        return 127;
    }

    auto status = monitor.monitor(child);
    if (!status)
    {
        log::error("{}", status.error());
        return 1;
    }
    if (auto const dropped = monitor.droppedDetections(); dropped > 0)
        log::info("{} detection(s) were dropped while the preview queue was full", dropped);
    return status->shellCode();
}

auto App::runLivePreview(bool autoPreview) -> int
{
    auto renderer = PreviewRenderer(_impl->previewMethod(), _impl->output, systemCommandRunner(PreviewHelperTimeout));
    auto floating = FloatingPreview(renderer, _impl->output);
    auto notices = NoticeSurface(_impl->output);
    auto& surface = autoPreview ? static_cast<PreviewSurface&>(floating) : static_cast<PreviewSurface&>(notices);

    auto tracker = LiveCursorTracker(_impl->scanner, surface);
    auto line = std::string {};
    while (std::getline(std::cin, line))
    {
        if (auto changed = tracker.update(line, line.size()); !changed)
            log::warning("Live preview failed: {}", changed.error());
    }

    if (auto cleared = tracker.clear(); !cleared)
        log::warning("{}", cleared.error());
    return 0;
}

auto App::runDetect(const std::string& path) -> int
{
    auto info = inspectImageFile(_impl->scanner.resolvePath(path));
    if (!info)
    {
        log::error("{}", info.error());
        return 1;
    }

    auto const size = formatFileSize(info->fileSize);
    if (!info->format)
    {
        std::println("{}: not a recognized image ({})", path, size);
        return 1;
    }

    if (info->dimensions)
        std::println("{}: {} image, {}x{}, {}",
                     path,
                     formatName(*info->format),
                     info->dimensions->width,
                     info->dimensions->height,
                     size);
    else
        std::println("{}: {} image, {}", path, formatName(*info->format), size);
    return 0;
}

auto App::runCleanup(std::optional<int> days) -> int
{
    auto const maxAge = days.value_or(_impl->config.cleanupDays);
    if (maxAge < 0)
    {
        log::error("Cleanup age must not be negative");
        return 1;
    }

    auto store = _impl->screenshotStore();
    auto removed = store.cleanup(static_cast<unsigned>(maxAge));
    if (!removed)
    {
        log::error("{}", removed.error());
        return 1;
    }

    std::println("Removed {} file(s) from {}", *removed, store.directory().string());
    return 0;
}

} // namespace klipdot
