// SPDX-License-Identifier: Apache-2.0
#include <clipboard/CommandClipboard.hpp>
#include <core/Base64.hpp>
#include <monitor/ClipboardWatcher.hpp>
#include <store/ImageStore.hpp>

#include <catch2/catch_test_macros.hpp>

#include "TestHelpers.hpp"

#include <map>
#include <set>
#include <thread>

using namespace klipdot;

namespace
{
    /// In-memory clipboard that records writes.
    class FakeClipboard: public ClipboardBackend
    {
      public:
        std::optional<std::string> content;
        std::vector<std::string> writes;
        bool failRead = false;
        bool failWrite = false;

        auto read() -> Result<std::optional<std::string>> override
        {
            if (failRead)
                return makeError(ErrorCode::ClipboardError, "read failed");
            return content;
        }

        auto write(std::string_view text) -> VoidResult override
        {
            if (failWrite)
                return makeError(ErrorCode::ClipboardError, "write failed");
            writes.emplace_back(text);
            content = std::string { text };
            return {};
        }

        auto name() const -> std::string_view override { return "fake"; }
    };

    auto encodedPng() -> std::string
    {
        auto bytes = test::samplePng();
        bytes.resize(150, 0x00);
        return base64::encode(bytes);
    }

    auto countFiles(const std::filesystem::path& dir) -> std::size_t
    {
        auto ec = std::error_code {};
        if (!std::filesystem::exists(dir, ec))
            return 0;
        auto count = std::size_t { 0 };
        for (auto const& entry: std::filesystem::directory_iterator(dir))
            count += entry.is_regular_file() ? 1 : 0;
        return count;
    }

    auto toolNamed(std::string_view name) -> ClipboardTool
    {
        for (auto const& tool: knownClipboardTools())
            if (tool.name == name)
                return tool;
        return {};
    }

    auto fakeEnvironment(std::map<std::string, std::string> vars, std::set<std::string> installed)
        -> ClipboardEnvironment
    {
        return ClipboardEnvironment {
            .getEnv = [vars = std::move(vars)](std::string_view name) -> std::optional<std::string> {
                if (auto const it = vars.find(std::string { name }); it != vars.end())
                    return it->second;
                return std::nullopt;
            },
            .commandAvailable = [installed = std::move(installed)](std::string_view binary) {
                return installed.contains(std::string { binary });
            },
        };
    }
} // namespace

TEST_CASE("ImageStore writes sniffed images with a typed extension", "[store]")
{
    auto const dir = test::TempDir();
    auto store = ImageStore(dir.path() / "screenshots", 1024);

    auto const png = test::samplePng();
    auto const path = store.materialize(png, "clipboard");
    REQUIRE(path.has_value());
    CHECK(path->parent_path() == dir.path() / "screenshots");
    CHECK(path->extension() == ".png");
    CHECK(path->filename().string().starts_with("clipboard-"));
    CHECK(test::readFile(*path) == png);

    auto const second = store.materialize(png, "clipboard");
    REQUIRE(second.has_value());
    CHECK(*second != *path);
}

TEST_CASE("ImageStore rejects unusable payloads", "[store]")
{
    auto const dir = test::TempDir();
    auto store = ImageStore(dir.path(), 16);

    auto const empty = store.materialize(Bytes {}, "stream");
    REQUIRE(!empty.has_value());
    CHECK(empty.error().code == ErrorCode::InvalidArgument);

    auto const large = store.materialize(test::samplePng(), "stream");
    REQUIRE(!large.has_value());
    CHECK(large.error().code == ErrorCode::InvalidArgument);

    auto const text = Bytes { 'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e' };
    auto const unknown = store.materialize(text, "stream");
    REQUIRE(!unknown.has_value());
    CHECK(unknown.error().code == ErrorCode::UnrecognizedFormat);
    CHECK(countFiles(dir.path()) == 0);
}

TEST_CASE("ImageStore cleanup removes only old files", "[store]")
{
    auto const dir = test::TempDir();
    auto store = ImageStore(dir.path(), 1024);

    auto const oldFile = dir.write("old.png", test::samplePng());
    auto const newFile = dir.write("new.png", test::samplePng());
    std::filesystem::last_write_time(oldFile,
                                     std::filesystem::file_time_type::clock::now() - std::chrono::days(40));

    auto const removed = store.cleanup(30);
    REQUIRE(removed.has_value());
    CHECK(*removed == 1);
    CHECK(!std::filesystem::exists(oldFile));
    CHECK(std::filesystem::exists(newFile));
}

TEST_CASE("ImageStore cleanup of a missing directory is a no-op", "[store]")
{
    auto const dir = test::TempDir();
    auto store = ImageStore(dir.path() / "missing", 1024);
    auto const removed = store.cleanup(1);
    REQUIRE(removed.has_value());
    CHECK(*removed == 0);
}

TEST_CASE("fileTimestamp is filename safe", "[store]")
{
    using namespace std::chrono;
    auto const when = sys_days { year { 2024 } / 1 / 2 } + hours(3) + minutes(4) + seconds(5) + milliseconds(678);
    CHECK(fileTimestamp(when) == "2024-01-02T03-04-05.678Z");
}

TEST_CASE("ClipboardWatcher replaces image payloads with a file path", "[watcher]")
{
    auto const dir = test::TempDir();
    auto clipboard = FakeClipboard {};
    auto store = ImageStore(dir.path(), 1024 * 1024);
    auto watcher = ClipboardWatcher(clipboard, store, std::chrono::milliseconds(100));

    clipboard.content = "hello";
    auto const text = watcher.pollOnce();
    REQUIRE(text.has_value());
    CHECK(!text->has_value());
    CHECK(countFiles(dir.path()) == 0);

    clipboard.content = encodedPng();
    auto const stored = watcher.pollOnce();
    REQUIRE(stored.has_value());
    REQUIRE(stored->has_value());
    CHECK(countFiles(dir.path()) == 1);
    REQUIRE(clipboard.writes.size() == 1);
    CHECK(clipboard.writes[0] == (*stored)->string());

    // The written path is now on the clipboard and must not be processed again.
    auto const next = watcher.pollOnce();
    REQUIRE(next.has_value());
    CHECK(!next->has_value());
    CHECK(countFiles(dir.path()) == 1);
    CHECK(clipboard.writes.size() == 1);
}

TEST_CASE("ClipboardWatcher ignores unchanged content", "[watcher]")
{
    auto const dir = test::TempDir();
    auto clipboard = FakeClipboard {};
    clipboard.failWrite = true;
    auto store = ImageStore(dir.path(), 1024 * 1024);
    auto watcher = ClipboardWatcher(clipboard, store, std::chrono::milliseconds(100));

    clipboard.content = "data:image/png;base64," + encodedPng();
    auto const first = watcher.pollOnce();
    REQUIRE(first.has_value());
    CHECK(first->has_value());

    // The clipboard still holds the payload because the write-back failed.
    auto const second = watcher.pollOnce();
    REQUIRE(second.has_value());
    CHECK(!second->has_value());
    CHECK(countFiles(dir.path()) == 1);
}

TEST_CASE("ClipboardWatcher survives malformed data URIs and empty reads", "[watcher]")
{
    auto const dir = test::TempDir();
    auto clipboard = FakeClipboard {};
    auto store = ImageStore(dir.path(), 1024 * 1024);
    auto watcher = ClipboardWatcher(clipboard, store, std::chrono::milliseconds(100));

    clipboard.content = std::nullopt;
    auto const empty = watcher.pollOnce();
    REQUIRE(empty.has_value());
    CHECK(!empty->has_value());

    clipboard.content = "data:image/png;base64,@@@";
    auto const malformed = watcher.pollOnce();
    REQUIRE(malformed.has_value());
    CHECK(!malformed->has_value());

    clipboard.failRead = true;
    auto const failed = watcher.pollOnce();
    REQUIRE(!failed.has_value());
    CHECK(failed.error().code == ErrorCode::ClipboardError);
}

TEST_CASE("ClipboardWatcher clamps the poll interval", "[watcher]")
{
    auto const dir = test::TempDir();
    auto clipboard = FakeClipboard {};
    auto store = ImageStore(dir.path(), 1024);

    CHECK(ClipboardWatcher(clipboard, store, std::chrono::milliseconds(1000)).interval() == MaxClipboardPollInterval);
    CHECK(ClipboardWatcher(clipboard, store, std::chrono::milliseconds(0)).interval() == std::chrono::milliseconds(10));
    CHECK(ClipboardWatcher(clipboard, store, std::chrono::milliseconds(100)).interval()
          == std::chrono::milliseconds(100));
}

TEST_CASE("ClipboardWatcher run stops on request", "[watcher]")
{
    auto const dir = test::TempDir();
    auto clipboard = FakeClipboard {};
    clipboard.content = encodedPng();
    auto store = ImageStore(dir.path(), 1024 * 1024);
    auto watcher = ClipboardWatcher(clipboard, store, std::chrono::milliseconds(10));

    {
        auto worker = std::jthread([&](std::stop_token token) { watcher.run(token); });
        auto const deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (countFiles(dir.path()) == 0 && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    CHECK(countFiles(dir.path()) == 1);
}

TEST_CASE("CommandClipboard returns the first non-empty read", "[clipboard]")
{
    auto calls = std::vector<std::string> {};
    auto clipboard = CommandClipboard(toolNamed("xclip"), [&](const CommandSpec& spec) -> Result<CommandOutput> {
        calls.push_back(describeCommand(spec));
        if (calls.size() == 1)
            return CommandOutput { .exitCode = 1, .stdoutData = "", .stderrData = "target not available" };
        return CommandOutput { .exitCode = 0, .stdoutData = "PNGDATA", .stderrData = "" };
    });

    auto const content = clipboard.read();
    REQUIRE(content.has_value());
    REQUIRE(content->has_value());
    CHECK(**content == "PNGDATA");
    REQUIRE(calls.size() == 2);
    CHECK(calls[0] == "xclip -selection clipboard -o");
    CHECK(calls[1] == "xclip -selection clipboard -t image/png -o");
    CHECK(clipboard.name() == "xclip");
}

TEST_CASE("CommandClipboard reports an empty clipboard", "[clipboard]")
{
    auto clipboard = CommandClipboard(toolNamed("xsel"), [](const CommandSpec&) -> Result<CommandOutput> {
        return CommandOutput {};
    });
    auto const content = clipboard.read();
    REQUIRE(content.has_value());
    CHECK(!content->has_value());
}

TEST_CASE("CommandClipboard fails when no read command runs", "[clipboard]")
{
    auto clipboard = CommandClipboard(toolNamed("wl-clipboard"), [](const CommandSpec&) -> Result<CommandOutput> {
        return makeError(ErrorCode::ProcessError, "spawn failed");
    });
    auto const content = clipboard.read();
    REQUIRE(!content.has_value());
    CHECK(content.error().code == ErrorCode::ClipboardError);
}

TEST_CASE("CommandClipboard writes through stdin", "[clipboard]")
{
    auto captured = std::optional<CommandSpec> {};
    auto exitCode = 0;
    auto clipboard = CommandClipboard(toolNamed("wl-clipboard"), [&](const CommandSpec& spec) -> Result<CommandOutput> {
        captured = spec;
        return CommandOutput { .exitCode = exitCode };
    });

    REQUIRE(clipboard.write("/tmp/a.png").has_value());
    REQUIRE(captured.has_value());
    CHECK(captured->program == "wl-copy");
    CHECK(captured->stdinData == "/tmp/a.png");
    CHECK(captured->discardOutput);

    exitCode = 1;
    auto const failed = clipboard.write("/tmp/a.png");
    REQUIRE(!failed.has_value());
    CHECK(failed.error().code == ErrorCode::ClipboardError);
}

TEST_CASE("selectClipboardTool follows the display server", "[clipboard]")
{
    auto const all = std::set<std::string> { "wl-paste", "xclip", "xsel", "pbpaste" };

    SECTION("wayland")
    {
        auto const tool = selectClipboardTool("", fakeEnvironment({ { "WAYLAND_DISPLAY", "wayland-0" } }, all));
        REQUIRE(tool.has_value());
        CHECK(tool->name == "wl-clipboard");
    }

    SECTION("x11 prefers xclip")
    {
        auto const tool = selectClipboardTool("", fakeEnvironment({ { "DISPLAY", ":0" } }, all));
        REQUIRE(tool.has_value());
        CHECK(tool->name == "xclip");
    }

    SECTION("x11 falls back to xsel")
    {
        auto const tool = selectClipboardTool("", fakeEnvironment({ { "XDG_SESSION_TYPE", "x11" } }, { "xsel" }));
        REQUIRE(tool.has_value());
        CHECK(tool->name == "xsel");
    }

    SECTION("macOS")
    {
        auto const tool = selectClipboardTool("", fakeEnvironment({}, { "pbpaste" }));
        REQUIRE(tool.has_value());
        CHECK(tool->name == "pbpaste");
    }

    SECTION("nothing installed")
    {
        auto const tool = selectClipboardTool("", fakeEnvironment({ { "DISPLAY", ":0" } }, {}));
        REQUIRE(!tool.has_value());
        CHECK(tool.error().code == ErrorCode::ClipboardError);
    }
}

TEST_CASE("selectClipboardTool honors the preferred tool", "[clipboard]")
{
    auto const env = fakeEnvironment({ { "WAYLAND_DISPLAY", "wayland-0" } }, { "wl-paste", "xsel" });

    auto const preferred = selectClipboardTool("xsel", env);
    REQUIRE(preferred.has_value());
    CHECK(preferred->name == "xsel");

    auto const missing = selectClipboardTool("xclip", env);
    REQUIRE(missing.has_value());
    CHECK(missing->name == "wl-clipboard");

    auto const unknown = selectClipboardTool("klipper", env);
    REQUIRE(!unknown.has_value());
    CHECK(unknown.error().code == ErrorCode::ConfigError);
}
