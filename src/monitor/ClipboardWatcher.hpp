// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <clipboard/ClipboardBackend.hpp>
#include <core/Error.hpp>
#include <detect/ChangeTracker.hpp>
#include <store/ImageStore.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>

namespace klipdot
{

/// @brief Upper bound on the clipboard polling interval.
constexpr auto MaxClipboardPollInterval = std::chrono::milliseconds(250);

/// @brief Replaces image payloads on the clipboard with the path of a saved file.
///
/// Each tick reads the clipboard, skips unchanged content, decodes image data
/// (binary, base64, or data URI), stores it, and writes the file path back.
/// The written path becomes the last observed value so it is not reprocessed.
class ClipboardWatcher
{
  public:
    ClipboardWatcher(ClipboardBackend& clipboard, ImageStore& store, std::chrono::milliseconds interval);

    /// @brief Runs one tick.
    /// @return The stored file, std::nullopt if nothing was stored, or an error
    ///         from the clipboard or the store.
    [[nodiscard]] auto pollOnce() -> Result<std::optional<std::filesystem::path>>;

    /// @brief Ticks until @p stopToken is triggered.
    ///
    /// Errors are logged and followed by a doubled wait before the next tick.
    void run(std::stop_token stopToken);

    [[nodiscard]] auto interval() const noexcept -> std::chrono::milliseconds { return _interval; }

  private:
    ClipboardBackend& _clipboard;
    ImageStore& _store;
    std::chrono::milliseconds _interval;
    ChangeTracker<std::string> _tracker;
};

} // namespace klipdot
