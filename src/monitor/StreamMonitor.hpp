// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/ChildProcess.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <detect/ReferenceScanner.hpp>
#include <detect/TuiProfile.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

namespace klipdot
{

/// @brief Callback receiving detections on the consumer thread.
using DetectionHandler = std::function<void(const DetectedImage& detection)>;

/// @brief Tuning for StreamMonitor.
struct StreamMonitorConfig
{
    const TuiProfile* profile = nullptr;           ///< Host application, if known.
    std::size_t channelCapacity = 100;             ///< Pending detections before drops.
    std::chrono::milliseconds drainTimeout { 50 }; ///< Reader grace period after child exit.
    std::size_t maxLineLength = 64 * 1024;         ///< Pending line is scanned and dropped past this.
    std::size_t contextCapacity = 4096;            ///< Rolling context per stream.
};

/// @brief Tees a child's stdout and stderr to the terminal while scanning for images.
///
/// Each stream is read on its own thread. Bytes are forwarded to the
/// passthrough sinks as soon as they are read; completed lines are then
/// scanned with the ReferenceScanner and detections are queued to a bounded
/// channel drained by a single consumer thread that invokes the handler.
/// A line identical to the previous one on the same stream is not scanned again.
///
/// The handler runs without holding the output lock. Preview output written
/// through serializedSink() takes that lock only for the write itself, so a
/// slow renderer never stalls the passthrough and never interleaves with it.
class StreamMonitor
{
  public:
    StreamMonitor(const ReferenceScanner& scanner, StreamMonitorConfig config, DetectionHandler handler);
    ~StreamMonitor();

    StreamMonitor(const StreamMonitor&) = delete;
    StreamMonitor& operator=(const StreamMonitor&) = delete;

    /// @brief Replaces the default STDOUT/STDERR passthrough sinks.
    void setPassthrough(OutputSink out, OutputSink err);

    /// @brief Wraps @p sink so each write is serialized with the passthrough.
    ///
    /// The returned sink refers to this monitor and must not outlive it.
    [[nodiscard]] auto serializedSink(OutputSink sink) -> OutputSink;

    /// @brief Monitors @p child until it exits.
    ///
    /// Read errors end only the affected stream. The child's exit status is
    /// always awaited and returned.
    [[nodiscard]] auto monitor(ChildProcess& child) -> Result<ExitStatus>;

    /// @brief Monitors a single descriptor (e.g. stdin) until EOF or requestStop().
    [[nodiscard]] auto monitorFd(int fd) -> VoidResult;

    /// @brief Wakes all readers; they forward what is already buffered and return.
    void requestStop();

    /// @brief Number of detections dropped because the channel was full.
    [[nodiscard]] auto droppedDetections() const -> std::size_t;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace klipdot
