// SPDX-License-Identifier: Apache-2.0
#include <core/Base64.hpp>
#include <preview/CapabilityProbe.hpp>
#include <preview/PreviewDispatcher.hpp>
#include <preview/PreviewMethod.hpp>
#include <preview/PreviewRenderer.hpp>
#include <tui/DeviceAttributes.hpp>
#include <tui/TerminalOutput.hpp>

#include <catch2/catch_test_macros.hpp>

#include "TestHelpers.hpp"

#include <format>
#include <map>
#include <set>

using namespace klipdot;

namespace
{
    /// Terminal output that appends everything flushed to a string.
    struct CapturedTerminal
    {
        std::string text;
        tui::TerminalOutput output { [this](std::string_view data) { text.append(data); } };
    };

    /// Command runner that records invocations and replies with a fixed result.
    struct FakeRunner
    {
        std::vector<CommandSpec> calls;
        CommandOutput reply { .exitCode = 0, .stdoutData = "<helper output>", .stderrData = "" };

        auto runner() -> CommandRunner
        {
            return [this](const CommandSpec& spec) -> Result<CommandOutput> {
                calls.push_back(spec);
                return reply;
            };
        }
    };

    auto probeEnvironment(std::map<std::string, std::string> vars, std::set<std::string> tools, bool sixel)
        -> ProbeEnvironment
    {
        return ProbeEnvironment {
            .getEnv = [vars = std::move(vars)](std::string_view name) -> std::optional<std::string> {
                if (auto const it = vars.find(std::string { name }); it != vars.end())
                    return it->second;
                return std::nullopt;
            },
            .querySixel = [sixel] { return sixel; },
            .commandAvailable = [tools = std::move(tools)](std::string_view binary) {
                return tools.contains(std::string { binary });
            },
        };
    }

    auto external(std::string tool) -> PreviewMethod
    {
        return PreviewMethod { .kind = PreviewKind::External, .tool = std::move(tool) };
    }
} // namespace

TEST_CASE("PreviewMethod names round-trip through the parser", "[preview]")
{
    CHECK(toString(PreviewMethod {}) == "none");
    CHECK(toString(external("chafa")) == "external(chafa)");
    CHECK(toString(PreviewMethod { .kind = PreviewKind::Ascii, .tool = "jp2a" }) == "ascii(jp2a)");

    CHECK(parsePreviewMethod("kitty") == PreviewMethod { .kind = PreviewKind::Kitty, .tool = {} });
    CHECK(parsePreviewMethod("iterm2") == PreviewMethod { .kind = PreviewKind::ITerm2, .tool = {} });
    CHECK(parsePreviewMethod("chafa") == external("chafa"));
    CHECK(parsePreviewMethod("external(timg)") == external("timg"));
    CHECK(parsePreviewMethod("ascii(img2txt)") == PreviewMethod { .kind = PreviewKind::Ascii, .tool = "img2txt" });
    CHECK(!parsePreviewMethod("auto").has_value());
    CHECK(!parsePreviewMethod("external(feh)").has_value());
    CHECK(!parsePreviewMethod("ascii(chafa)").has_value());
}

TEST_CASE("detectPreviewMethod follows the fixed priority", "[probe]")
{
    auto const everything = std::set<std::string> { "kitten", "img2sixel", "chafa", "timg", "jp2a" };

    SECTION("iTerm2 wins over everything")
    {
        auto const env = probeEnvironment({ { "TERM_PROGRAM", "iTerm.app" }, { "TERM", "xterm-kitty" } }, everything, true);
        CHECK(detectPreviewMethod(env).kind == PreviewKind::ITerm2);
    }

    SECTION("kitty via TERM")
    {
        auto const env = probeEnvironment({ { "TERM", "xterm-kitty" } }, everything, true);
        CHECK(detectPreviewMethod(env) == PreviewMethod { .kind = PreviewKind::Kitty, .tool = "kitten" });
    }

    SECTION("kitty via KITTY_WINDOW_ID")
    {
        auto const env = probeEnvironment({ { "KITTY_WINDOW_ID", "1" } }, everything, false);
        CHECK(detectPreviewMethod(env).kind == PreviewKind::Kitty);
    }

    SECTION("sixel when the terminal advertises it")
    {
        auto const env = probeEnvironment({ { "TERM", "xterm-256color" } }, everything, true);
        CHECK(detectPreviewMethod(env) == PreviewMethod { .kind = PreviewKind::Sixel, .tool = "img2sixel" });
    }

    SECTION("external helpers in probe order")
    {
        auto const env = probeEnvironment({ { "TERM", "xterm-256color" } }, everything, false);
        CHECK(detectPreviewMethod(env) == external("timg"));
    }

    SECTION("ascii helpers after external ones")
    {
        auto const env = probeEnvironment({}, { "jp2a", "img2txt" }, false);
        CHECK(detectPreviewMethod(env) == PreviewMethod { .kind = PreviewKind::Ascii, .tool = "jp2a" });
    }

    SECTION("nothing available")
    {
        auto const env = probeEnvironment({ { "TERM", "xterm-kitty" } }, {}, true);
        CHECK(detectPreviewMethod(env).kind == PreviewKind::None);
    }
}

TEST_CASE("detectPreviewMethod does not query sixel without img2sixel", "[probe]")
{
    auto queried = false;
    auto env = probeEnvironment({}, { "chafa" }, true);
    env.querySixel = [&] {
        queried = true;
        return true;
    };
    CHECK(detectPreviewMethod(env) == external("chafa"));
    CHECK(!queried);
}

TEST_CASE("parseDeviceAttributes reads DA1 replies", "[probe]")
{
    CHECK(parseDeviceAttributes("\033[?62;4;9;22c") == std::vector<int> { 62, 4, 9, 22 });
    CHECK(parseDeviceAttributes("noise\033[?1;2c") == std::vector<int> { 1, 2 });
    CHECK(parseDeviceAttributes("\033[?62;4").empty());
    CHECK(parseDeviceAttributes("garbage").empty());
}

TEST_CASE("hasSixelAttribute ignores the terminal class", "[probe]")
{
    CHECK(hasSixelAttribute({ 62, 4, 22 }));
    CHECK(!hasSixelAttribute({ 4, 22 }));
    CHECK(!hasSixelAttribute({ 62, 22 }));
    CHECK(!hasSixelAttribute({}));
}

TEST_CASE("TerminalOutput buffers until flush", "[terminal]")
{
    auto terminal = CapturedTerminal {};
    terminal.output.write("bold", tui::Style { .fg = std::nullopt, .bold = true, .dim = false });
    terminal.output.writeLine(" plain");
    CHECK(terminal.text.empty());

    terminal.output.flush();
    CHECK(terminal.text == "\033[1mbold\033[m plain\n");

    terminal.text.clear();
    terminal.output.moveTo(3, 7);
    terminal.output.write("x", tui::Style { .fg = 244, .bold = false, .dim = false });
    terminal.output.flush();
    CHECK(terminal.text == "\033[3;7H\033[38;5;244mx\033[m");
}

TEST_CASE("PreviewRenderer encodes iTerm2 inline images", "[renderer]")
{
    auto const bytes = Bytes { 1, 2, 3 };
    auto const sequence = PreviewRenderer::encodeITerm2(bytes, "a.png", 40, 20);
    CHECK(sequence
          == std::format("\033]1337;File=name={};size=3;inline=1;preserveAspectRatio=1;width=40;height=20:{}\a",
                         base64::encode(std::string_view { "a.png" }),
                         base64::encode(bytes)));
}

TEST_CASE("PreviewRenderer writes the iTerm2 sequence for a file", "[renderer]")
{
    auto const dir = test::TempDir();
    auto const image = dir.write("pic.png", test::samplePng());
    auto terminal = CapturedTerminal {};
    auto renderer = PreviewRenderer(PreviewMethod { .kind = PreviewKind::ITerm2, .tool = {} }, terminal.output);

    REQUIRE(renderer.render(image).has_value());
    CHECK(terminal.text.starts_with("\033]1337;File="));
    CHECK(terminal.text.find(base64::encode(test::samplePng())) != std::string::npos);
    CHECK(terminal.text.find("width=40;height=20") != std::string::npos);
}

TEST_CASE("PreviewRenderer builds helper command lines", "[renderer]")
{
    auto const path = std::filesystem::path { "/tmp/a.png" };

    auto const args = [&](PreviewMethod method, int w, int h) {
        auto spec = PreviewRenderer::buildHelperCommand(method, path, w, h);
        REQUIRE(spec.has_value());
        return describeCommand(*spec);
    };

    CHECK(args(external("chafa"), 40, 20) == "chafa --size 40x20 /tmp/a.png");
    CHECK(args(external("timg"), 60, 30) == "timg -g60x30 /tmp/a.png");
    CHECK(args(external("catimg"), 40, 20) == "catimg -w 40 /tmp/a.png");
    CHECK(args(external("imgcat"), 40, 20) == "imgcat /tmp/a.png");
    CHECK(args(PreviewMethod { .kind = PreviewKind::Ascii, .tool = "jp2a" }, 40, 20)
          == "jp2a --colors --width=40 --height=20 /tmp/a.png");
    CHECK(args(PreviewMethod { .kind = PreviewKind::Ascii, .tool = "img2txt" }, 40, 20)
          == "img2txt -W 40 -H 20 /tmp/a.png");
    CHECK(args(PreviewMethod { .kind = PreviewKind::Sixel, .tool = "img2sixel" }, 40, 20)
          == "img2sixel -w 400 -h 400 /tmp/a.png");
    CHECK(args(PreviewMethod { .kind = PreviewKind::Kitty, .tool = "kitten" }, 40, 20)
          == "kitten icat --stdin=no --transfer-mode=stream --use-window-size=40,20,400,400 /tmp/a.png");

    auto const none = PreviewRenderer::buildHelperCommand(PreviewMethod {}, path, 40, 20);
    REQUIRE(!none.has_value());
    CHECK(none.error().code == ErrorCode::UnsupportedMethod);
}

TEST_CASE("PreviewRenderer forwards helper output", "[renderer]")
{
    auto const dir = test::TempDir();
    auto const image = dir.write("pic.png", test::samplePng());
    auto terminal = CapturedTerminal {};
    auto fake = FakeRunner {};
    auto renderer = PreviewRenderer(external("chafa"), terminal.output, fake.runner());

    REQUIRE(renderer.render(image, 30, 10).has_value());
    REQUIRE(fake.calls.size() == 1);
    CHECK(fake.calls[0].program == "chafa");
    CHECK(fake.calls[0].args[1] == "30x10");
    CHECK(terminal.text == "<helper output>");
}

TEST_CASE("PreviewRenderer reports helper failures", "[renderer]")
{
    auto const dir = test::TempDir();
    auto const image = dir.write("pic.png", test::samplePng());
    auto terminal = CapturedTerminal {};
    auto fake = FakeRunner {};
    fake.reply = CommandOutput { .exitCode = 2, .stdoutData = "", .stderrData = "cannot decode\nmore" };
    auto renderer = PreviewRenderer(external("chafa"), terminal.output, fake.runner());

    auto const result = renderer.render(image);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::RenderError);
    CHECK(result.error().message.find("cannot decode") != std::string::npos);
    CHECK(terminal.text.empty());
}

TEST_CASE("PreviewRenderer fails for a missing file", "[renderer]")
{
    auto const dir = test::TempDir();
    auto terminal = CapturedTerminal {};
    auto fake = FakeRunner {};
    auto renderer = PreviewRenderer(external("chafa"), terminal.output, fake.runner());

    auto const result = renderer.render(dir.path() / "gone.png");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::IoError);
    CHECK(fake.calls.empty());
}

TEST_CASE("PreviewRenderer prints text info without a graphics method", "[renderer]")
{
    auto const dir = test::TempDir();
    auto const image = dir.write("pic.png", test::samplePng());
    auto terminal = CapturedTerminal {};
    auto renderer = PreviewRenderer(PreviewMethod {}, terminal.output);

    REQUIRE(renderer.render(image).has_value());
    CHECK(terminal.text.find("pic.png (PNG)") != std::string::npos);
    CHECK(terminal.text.find("16x8") != std::string::npos);
    CHECK(terminal.text.find(std::format("{} B", test::samplePng().size())) != std::string::npos);
    CHECK(terminal.text.find(image.string()) != std::string::npos);
}

TEST_CASE("compactImageInfo summarizes a file", "[renderer]")
{
    auto const dir = test::TempDir();
    auto const image = dir.write("pic.png", test::samplePng());
    auto const info = compactImageInfo(image);
    REQUIRE(info.has_value());
    CHECK(*info == std::format("pic.png (16x8) - {} B", test::samplePng().size()));
}

TEST_CASE("PreviewDispatcher sizes previews by host profile", "[dispatcher]")
{
    auto const dir = test::TempDir();
    auto const image = dir.write("pic.png", test::samplePng());
    auto terminal = CapturedTerminal {};
    auto fake = FakeRunner {};
    auto renderer = PreviewRenderer(external("chafa"), terminal.output, fake.runner());
    auto const detection = DetectedImage { .path = image, .reference = image.string() };

    SECTION("plain output")
    {
        auto dispatcher = PreviewDispatcher(renderer, terminal.output, nullptr, nullptr, true);
        dispatcher.handle(detection);
        REQUIRE(fake.calls.size() == 1);
        CHECK(fake.calls[0].args[1] == "40x20");
    }

    SECTION("overlay")
    {
        auto dispatcher = PreviewDispatcher(renderer, terminal.output, nullptr, lookupTuiProfile("nvim"), true);
        dispatcher.handle(detection);
        REQUIRE(fake.calls.size() == 1);
        CHECK(fake.calls[0].args[1] == "80x40");
    }

    SECTION("inline")
    {
        auto dispatcher = PreviewDispatcher(renderer, terminal.output, nullptr, lookupTuiProfile("w3m"), true);
        dispatcher.handle(detection);
        REQUIRE(fake.calls.size() == 1);
        CHECK(fake.calls[0].args[1] == "60x30");
    }

    SECTION("separate pane only announces")
    {
        auto dispatcher = PreviewDispatcher(renderer, terminal.output, nullptr, lookupTuiProfile("ranger"), true);
        dispatcher.handle(detection);
        CHECK(fake.calls.empty());
        CHECK(terminal.text.find("Image detected in Ranger") != std::string::npos);
    }

    SECTION("external suggests a viewer")
    {
        auto dispatcher = PreviewDispatcher(renderer, terminal.output, nullptr, lookupTuiProfile("vim"), true);
        dispatcher.handle(detection);
        CHECK(fake.calls.empty());
        CHECK(terminal.text.find("external viewer") != std::string::npos);
    }

    SECTION("none stays quiet")
    {
        auto dispatcher = PreviewDispatcher(renderer, terminal.output, nullptr, lookupTuiProfile("htop"), true);
        dispatcher.handle(detection);
        CHECK(fake.calls.empty());
        CHECK(terminal.text.empty());
    }

    SECTION("previews disabled")
    {
        auto dispatcher = PreviewDispatcher(renderer, terminal.output, nullptr, nullptr, false);
        dispatcher.handle(detection);
        CHECK(fake.calls.empty());
        CHECK(terminal.text.empty());
    }
}

TEST_CASE("PreviewDispatcher falls back to text info when rendering fails", "[dispatcher]")
{
    auto const dir = test::TempDir();
    auto const image = dir.write("pic.png", test::samplePng());
    auto terminal = CapturedTerminal {};
    auto fake = FakeRunner {};
    fake.reply = CommandOutput { .exitCode = 1, .stdoutData = "", .stderrData = "boom" };
    auto renderer = PreviewRenderer(external("chafa"), terminal.output, fake.runner());
    auto dispatcher = PreviewDispatcher(renderer, terminal.output, nullptr, nullptr, true);

    dispatcher.handle(DetectedImage { .path = image, .reference = image.string() });
    CHECK(fake.calls.size() == 1);
    CHECK(terminal.text.find("pic.png (PNG)") != std::string::npos);
}

TEST_CASE("PreviewDispatcher resolves detections to files", "[dispatcher]")
{
    auto const dir = test::TempDir();
    auto terminal = CapturedTerminal {};
    auto renderer = PreviewRenderer(PreviewMethod {}, terminal.output);
    auto store = ImageStore(dir.path() / "store", 1024 * 1024);
    auto dispatcher = PreviewDispatcher(renderer, terminal.output, &store, nullptr, true);

    SECTION("URLs have no local file")
    {
        auto const resolved = dispatcher.resolve(
            DetectedImage { .path = {}, .reference = "https://example.com/a.png", .source = ImageSource::Url });
        REQUIRE(resolved.has_value());
        CHECK(!resolved->has_value());
    }

    SECTION("inline payloads are stored")
    {
        auto const reference = "data:image/png;base64," + base64::encode(test::samplePng());
        auto const resolved =
            dispatcher.resolve(DetectedImage { .path = {}, .reference = reference, .source = ImageSource::Base64Data });
        REQUIRE(resolved.has_value());
        REQUIRE(resolved->has_value());
        CHECK((*resolved)->parent_path() == dir.path() / "store");
        CHECK(test::readFile(**resolved) == test::samplePng());
        CHECK((*resolved)->filename().string().starts_with("stream-"));
    }

    SECTION("payloads without a signature are skipped")
    {
        auto const reference = "data:image/png;base64," + base64::encode(std::string_view { "plain" });
        auto const resolved =
            dispatcher.resolve(DetectedImage { .path = {}, .reference = reference, .source = ImageSource::Base64Data });
        REQUIRE(resolved.has_value());
        CHECK(!resolved->has_value());
    }
}
