// SPDX-License-Identifier: Apache-2.0
#include "StreamMonitor.hpp"

#include <core/Channel.hpp>
#include <core/FdIo.hpp>
#include <core/Log.hpp>
#include <detect/ChangeTracker.hpp>
#include <monitor/ContextBuffer.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <format>
#include <mutex>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace klipdot
{

namespace
{
    constexpr auto ReadChunkSize = std::size_t { 4096 };

    /// Line assembly and scan state for one stream, owned by its reader thread.
    struct StreamState
    {
        std::string_view name;
        std::string pending;
        ContextBuffer context;
        ChangeTracker<std::string> lines;
        std::size_t lineNumber = 0;
    };
} // namespace

struct StreamMonitor::Impl
{
    const ReferenceScanner& scanner;
    StreamMonitorConfig config;
    DetectionHandler handler;
    OutputSink out = makeFdSink(STDOUT_FILENO);
    OutputSink err = makeFdSink(STDERR_FILENO);

    std::mutex outputMutex;
    std::unique_ptr<Channel<DetectedImage>> channel;
    std::atomic<std::size_t> dropped = 0;

    std::array<int, 2> stopPipe { -1, -1 };

    std::mutex readersMutex;
    std::condition_variable readersDone;
    int activeReaders = 0;

    Impl(const ReferenceScanner& scanner, StreamMonitorConfig config, DetectionHandler handler):
        scanner(scanner), config(config), handler(std::move(handler))
    {
    }

    ~Impl() { closeStopPipe(); }

    auto openStopPipe() -> VoidResult
    {
        closeStopPipe();
        if (::pipe(stopPipe.data()) != 0)
            return makeError(ErrorCode::IoError, std::format("Failed to create stop pipe: {}", std::strerror(errno)));
        for (auto const fd: stopPipe)
        {
            ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL, 0) | O_NONBLOCK);
            ::fcntl(fd, F_SETFD, FD_CLOEXEC);
        }
        return {};
    }

    void closeStopPipe()
    {
        for (auto& fd: stopPipe)
        {
            if (fd >= 0)
                ::close(fd);
            fd = -1;
        }
    }

    void signalStop()
    {
        if (stopPipe[1] < 0)
            return;
        auto const byte = char { 1 };
        auto const result = ::write(stopPipe[1], &byte, 1);
        static_cast<void>(result);
    }

    void passthrough(const OutputSink& sink, std::string_view chunk)
    {
        auto lock = std::lock_guard(outputMutex);
        sink(chunk);
    }

    void scanLine(StreamState& state, std::string_view line)
    {
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);

        ++state.lineNumber;

        // TUI output is full of escape sequences; scan a stripped copy.
        auto const stripped = config.profile ? stripAnsi(line) : std::string {};
        auto const text = config.profile ? std::string_view { stripped } : line;

        // A line identical to the previous one on this stream is not scanned again.
        if (!state.lines.observe(std::string { text }))
        {
            state.context.append(text);
            return;
        }

        auto detections = scanner.scan(text, config.profile, state.lineNumber);
        if (config.profile && config.profile->strategy == ScanStrategy::Browser)
        {
            auto wrapped = scanner.scanWrapped(state.context.lastLine(), text, state.lineNumber);
            detections.insert(detections.end(),
                              std::make_move_iterator(wrapped.begin()),
                              std::make_move_iterator(wrapped.end()));
        }
        state.context.append(text);

        for (auto& detection: detections)
        {
            log::debug("{}: detected {} reference '{}' on line {}",
                       state.name,
                       sourceName(detection.source),
                       detection.reference,
                       detection.lineNumber);
            if (!channel->trySend(std::move(detection)))
            {
                ++dropped;
                log::debug("{}: detection channel full, dropping detection", state.name);
            }
        }
    }

    void consumeLines(StreamState& state)
    {
        auto start = std::size_t { 0 };
        while (true)
        {
            auto const newline = state.pending.find('\n', start);
            if (newline == std::string::npos)
                break;
            scanLine(state, std::string_view { state.pending }.substr(start, newline - start));
            start = newline + 1;
        }
        state.pending.erase(0, start);

        if (state.pending.size() > config.maxLineLength)
        {
            scanLine(state, state.pending);
            state.pending.clear();
        }
    }

    /// Forwards one chunk and scans the lines it completes. Returns false at EOF or error.
    auto readChunk(int fd, const OutputSink& sink, StreamState& state) -> bool
    {
        auto buf = std::array<char, ReadChunkSize> {};
        auto const n = ::read(fd, buf.data(), buf.size());
        if (n == 0)
            return false;
        if (n < 0)
        {
            if (errno == EINTR || errno == EAGAIN)
                return true;
            log::warning("{}: read error: {}", state.name, std::strerror(errno));
            return false;
        }

        auto const chunk = std::string_view { buf.data(), static_cast<size_t>(n) };
        passthrough(sink, chunk);
        state.pending.append(chunk);
        consumeLines(state);
        return true;
    }

    /// Reads @p fd until EOF, error, or stop. After a stop, data already buffered is still forwarded.
    void readStream(int fd, const OutputSink& sink, std::string_view name)
    {
        auto state = StreamState {
            .name = name, .pending = {}, .context = ContextBuffer(config.contextCapacity), .lines = {}
        };

        auto open = true;
        auto stopped = false;
        while (open && !stopped)
        {
            auto fds = std::array<pollfd, 2> {
                pollfd { .fd = fd, .events = POLLIN, .revents = 0 },
                pollfd { .fd = stopPipe[0], .events = POLLIN, .revents = 0 },
            };
            auto const rc = ::poll(fds.data(), fds.size(), -1);
            if (rc < 0)
            {
                if (errno == EINTR)
                    continue;
                log::warning("{}: poll error: {}", name, std::strerror(errno));
                break;
            }

            if (fds[0].revents & POLLNVAL)
            {
                log::warning("{}: descriptor {} is not open", name, fd);
                open = false;
            }
            else if (fds[0].revents & (POLLIN | POLLHUP | POLLERR))
                open = readChunk(fd, sink, state);
            if (fds[1].revents & POLLIN)
                stopped = true;
        }

        // Abandoning: forward whatever is immediately available without blocking.
        while (open && stopped)
        {
            auto pfd = pollfd { .fd = fd, .events = POLLIN, .revents = 0 };
            if (::poll(&pfd, 1, 0) <= 0 || !(pfd.revents & (POLLIN | POLLHUP)))
                break;
            open = readChunk(fd, sink, state);
        }

        if (!state.pending.empty())
            scanLine(state, state.pending);

        log::trace("{}: reader finished after {} lines", name, state.lineNumber);
    }

    /// Runs the handler without the output lock; it writes through serializedSink().
    void consume()
    {
        while (auto detection = channel->receive())
        {
            if (handler)
                handler(*detection);
        }
    }

    auto startReader(int fd, const OutputSink& sink, std::string_view name) -> std::jthread
    {
        {
            auto lock = std::lock_guard(readersMutex);
            ++activeReaders;
        }
        return std::jthread([this, fd, &sink, name] {
            readStream(fd, sink, name);
            auto lock = std::lock_guard(readersMutex);
            --activeReaders;
            readersDone.notify_all();
        });
    }

    void waitForReaders(std::chrono::milliseconds timeout)
    {
        auto lock = std::unique_lock(readersMutex);
        if (!readersDone.wait_for(lock, timeout, [this] { return activeReaders == 0; }))
            log::debug("Readers still busy {}ms after child exit, abandoning", timeout.count());
    }
};

StreamMonitor::StreamMonitor(const ReferenceScanner& scanner, StreamMonitorConfig config, DetectionHandler handler):
    _impl(std::make_unique<Impl>(scanner, config, std::move(handler)))
{
}

StreamMonitor::~StreamMonitor() = default;

void StreamMonitor::setPassthrough(OutputSink out, OutputSink err)
{
    _impl->out = std::move(out);
    _impl->err = std::move(err);
}

auto StreamMonitor::serializedSink(OutputSink sink) -> OutputSink
{
    return [impl = _impl.get(), sink = std::move(sink)](std::string_view data) {
        impl->passthrough(sink, data);
    };
}

auto StreamMonitor::monitor(ChildProcess& child) -> Result<ExitStatus>
{
    if (auto opened = _impl->openStopPipe(); !opened)
        return std::unexpected(opened.error());

    _impl->channel = std::make_unique<Channel<DetectedImage>>(_impl->config.channelCapacity);
    auto consumer = std::jthread([this] { _impl->consume(); });

    auto readers = std::vector<std::jthread> {};
    if (child.stdoutFd() >= 0)
        readers.push_back(_impl->startReader(child.stdoutFd(), _impl->out, "stdout"));
    if (child.stderrFd() >= 0)
        readers.push_back(_impl->startReader(child.stderrFd(), _impl->err, "stderr"));

    auto status = child.wait();

    _impl->waitForReaders(_impl->config.drainTimeout);
    _impl->signalStop();
    readers.clear(); // joins

    _impl->channel->close();
    if (consumer.joinable())
        consumer.join();

    if (status)
        log::debug("'{}' exited with code {}", child.command(), status->shellCode());
    return status;
}

auto StreamMonitor::monitorFd(int fd) -> VoidResult
{
    if (fd < 0)
        return makeError(ErrorCode::InvalidArgument, "Invalid file descriptor");
    if (auto opened = _impl->openStopPipe(); !opened)
        return opened;

    _impl->channel = std::make_unique<Channel<DetectedImage>>(_impl->config.channelCapacity);
    auto consumer = std::jthread([this] { _impl->consume(); });

    _impl->readStream(fd, _impl->out, "stdin");

    _impl->channel->close();
    if (consumer.joinable())
        consumer.join();
    return {};
}

void StreamMonitor::requestStop()
{
    _impl->signalStop();
}

auto StreamMonitor::droppedDetections() const -> std::size_t
{
    return _impl->dropped.load();
}

} // namespace klipdot
