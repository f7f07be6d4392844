// SPDX-License-Identifier: Apache-2.0
#include "ImageStore.hpp"

#include <core/Log.hpp>
#include <detect/SignatureSniffer.hpp>

#include <format>
#include <fstream>
#include <random>

namespace klipdot
{

namespace
{
    auto randomSuffix() -> std::string
    {
        thread_local auto engine = std::mt19937 { std::random_device {}() };
        auto dist = std::uniform_int_distribution<std::uint32_t> {};
        return std::format("{:08x}", dist(engine));
    }
} // namespace

auto fileTimestamp(std::chrono::system_clock::time_point when) -> std::string
{
    auto const ms = std::chrono::floor<std::chrono::milliseconds>(when);
    return std::format("{:%Y-%m-%dT%H-%M-%S}Z", ms);
}

ImageStore::ImageStore(std::filesystem::path directory, std::uint64_t maxFileSize):
    _directory(std::move(directory)), _maxFileSize(maxFileSize)
{
}

auto ImageStore::materialize(std::span<const std::uint8_t> bytes, std::string_view source)
    -> Result<std::filesystem::path>
{
    if (bytes.empty())
        return makeError(ErrorCode::InvalidArgument, "Refusing to store an empty image");
    if (bytes.size() > _maxFileSize)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Image of {} bytes exceeds the limit of {} bytes", bytes.size(), _maxFileSize));

    auto const format = classify(bytes);
    if (!format)
        return makeError(ErrorCode::UnrecognizedFormat, "Payload carries no known image signature");

    auto ec = std::error_code {};
    std::filesystem::create_directories(_directory, ec);
    if (ec)
        return makeError(ErrorCode::IoError,
                         std::format("Cannot create {}: {}", _directory.string(), ec.message()));

    auto const filename = std::format("{}-{}-{}.{}",
                                      source,
                                      fileTimestamp(std::chrono::system_clock::now()),
                                      randomSuffix(),
                                      formatExtension(*format));
    auto const path = _directory / filename;

    auto file = std::ofstream { path, std::ios::binary | std::ios::trunc };
    if (!file)
        return makeError(ErrorCode::IoError, std::format("Cannot open {} for writing", path.string()));
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    file.close();
    if (!file)
        return makeError(ErrorCode::IoError, std::format("Failed to write {}", path.string()));

    log::info("Saved {} image ({} bytes) to {}", formatName(*format), bytes.size(), path.string());
    return path;
}

auto ImageStore::cleanup(unsigned days) -> Result<std::size_t>
{
    auto ec = std::error_code {};
    if (!std::filesystem::exists(_directory, ec))
        return std::size_t { 0 };

    auto const cutoff = std::filesystem::file_time_type::clock::now() - std::chrono::days(days);
    auto removed = std::size_t { 0 };

    auto it = std::filesystem::directory_iterator(_directory, ec);
    if (ec)
        return makeError(ErrorCode::IoError, std::format("Cannot list {}: {}", _directory.string(), ec.message()));

    for (auto const& entry: it)
    {
        if (!entry.is_regular_file(ec))
            continue;
        auto const modified = entry.last_write_time(ec);
        if (ec || modified >= cutoff)
            continue;
        if (std::filesystem::remove(entry.path(), ec))
        {
            ++removed;
            log::debug("Removed {}", entry.path().string());
        }
        else if (ec)
            log::warning("Cannot remove {}: {}", entry.path().string(), ec.message());
    }

    log::info("Cleanup removed {} file(s) older than {} days from {}", removed, days, _directory.string());
    return removed;
}

} // namespace klipdot
