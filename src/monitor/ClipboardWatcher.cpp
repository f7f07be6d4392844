// SPDX-License-Identifier: Apache-2.0
#include "ClipboardWatcher.hpp"

#include <core/Log.hpp>
#include <detect/ContentDecoder.hpp>

#include <algorithm>
#include <condition_variable>
#include <mutex>

namespace klipdot
{

ClipboardWatcher::ClipboardWatcher(ClipboardBackend& clipboard,
                                   ImageStore& store,
                                   std::chrono::milliseconds interval):
    _clipboard(clipboard),
    _store(store),
    _interval(std::clamp(interval, std::chrono::milliseconds(10), MaxClipboardPollInterval))
{
}

auto ClipboardWatcher::pollOnce() -> Result<std::optional<std::filesystem::path>>
{
    auto content = _clipboard.read();
    if (!content)
        return std::unexpected(content.error());
    if (!*content || (*content)->empty())
        return std::nullopt;

    if (!_tracker.observe(**content))
        return std::nullopt;

    auto decoded = decodeContent(**content);
    if (!decoded)
    {
        // A malformed payload is local to this observation.
        log::warning("Clipboard content looks like a data URI but does not decode: {}", decoded.error());
        return std::nullopt;
    }
    if (!*decoded)
        return std::nullopt;

    log::debug("Clipboard holds {} image data ({} bytes)", formatName((*decoded)->format), (*decoded)->bytes.size());

    auto path = _store.materialize((*decoded)->bytes, "clipboard");
    if (!path)
        return std::unexpected(path.error());

    auto const pathText = path->string();
    // The payload stays the last observed value if the write-back fails.
    if (auto written = _clipboard.write(pathText); !written)
        log::warning("Saved {} but could not update the clipboard: {}", pathText, written.error());
    else
        _tracker.remember(pathText);
    return *path;
}

void ClipboardWatcher::run(std::stop_token stopToken)
{
    log::info("Watching clipboard via {} every {}ms", _clipboard.name(), _interval.count());

    auto mutex = std::mutex {};
    auto cv = std::condition_variable_any {};

    while (!stopToken.stop_requested())
    {
        auto wait = _interval;
        auto result = pollOnce();
        if (!result)
        {
            log::warning("Clipboard tick failed: {}", result.error());
            wait = _interval * 2;
        }
        else if (*result)
            log::info("Clipboard image replaced with {}", (*result)->string());

        auto lock = std::unique_lock(mutex);
        cv.wait_for(lock, stopToken, wait, [] { return false; });
    }

    log::info("Clipboard watcher stopped");
}

} // namespace klipdot
