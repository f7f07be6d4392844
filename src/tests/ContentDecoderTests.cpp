// SPDX-License-Identifier: Apache-2.0
#include <core/Base64.hpp>
#include <detect/ChangeTracker.hpp>
#include <detect/ContentDecoder.hpp>

#include <catch2/catch_test_macros.hpp>

#include "TestHelpers.hpp"

#include <string>

using namespace klipdot;

namespace
{
    auto paddedPng(std::size_t size) -> Bytes
    {
        auto bytes = test::samplePng();
        bytes.resize(size, 0x00);
        return bytes;
    }
} // namespace

TEST_CASE("base64 encodes with padding", "[base64]")
{
    CHECK(base64::encode(std::string_view { "" }).empty());
    CHECK(base64::encode(std::string_view { "f" }) == "Zg==");
    CHECK(base64::encode(std::string_view { "fo" }) == "Zm8=");
    CHECK(base64::encode(std::string_view { "foo" }) == "Zm9v");
    CHECK(base64::encode(std::string_view { "foobar" }) == "Zm9vYmFy");
}

TEST_CASE("base64 decode is strict", "[base64]")
{
    auto const decoded = base64::decode("Zm9vYmE=");
    REQUIRE(decoded.has_value());
    CHECK(test::asString(*decoded) == "fooba");

    CHECK(!base64::decode("Zm9vY").has_value());     // length not a multiple of four
    CHECK(!base64::decode("Zm9v!mFy").has_value());  // character outside the alphabet
    CHECK(!base64::decode("Zg==Zm9v").has_value());  // padding before the last quad
    CHECK(!base64::decode("Z===").has_value());
}

TEST_CASE("base64 alphabet check", "[base64]")
{
    CHECK(base64::isAlphabet("abcXYZ019+/="));
    CHECK(!base64::isAlphabet("abc def"));
    CHECK(!base64::isAlphabet("abc-def"));
}

TEST_CASE("decodeContent round-trips bytes through a data URI", "[decoder]")
{
    auto const original = paddedPng(200);
    auto const uri = "data:image/png;base64," + base64::encode(original);

    auto const result = decodeContent(uri);
    REQUIRE(result.has_value());
    REQUIRE(result->has_value());
    CHECK((*result)->bytes == original);
    CHECK((*result)->format == ImageFormat::Png);
}

TEST_CASE("decodeContent keeps data URI payloads without a signature", "[decoder]")
{
    auto const uri = "data:image/png;base64," + base64::encode(std::string_view { "not an image" });

    auto const result = decodeContent(uri);
    REQUIRE(result.has_value());
    REQUIRE(result->has_value());
    CHECK((*result)->format == ImageFormat::Unknown);
    CHECK(test::asString((*result)->bytes) == "not an image");
}

TEST_CASE("decodeContent trims whitespace around a data URI payload", "[decoder]")
{
    auto const uri = "data:image/png;base64," + base64::encode(paddedPng(40)) + "\n";

    auto const result = decodeContent(uri);
    REQUIRE(result.has_value());
    REQUIRE(result->has_value());
    CHECK((*result)->format == ImageFormat::Png);
}

TEST_CASE("decodeContent reports malformed data URIs", "[decoder]")
{
    SECTION("missing comma")
    {
        auto const result = decodeContent("data:image/png;base64");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::DecodeError);
    }

    SECTION("invalid base64")
    {
        auto const result = decodeContent("data:image/png;base64,@@@notbase64@@@");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::DecodeError);
    }
}

TEST_CASE("decodeContent ignores ordinary text", "[decoder]")
{
    for (auto const* text: { "hello", "", "see you tomorrow", "data:text/plain,hello" })
    {
        auto const result = decodeContent(text);
        REQUIRE(result.has_value());
        CHECK(!result->has_value());
    }
}

TEST_CASE("decodeContent accepts long bare base64 only with a signature", "[decoder]")
{
    auto const encodedPng = base64::encode(paddedPng(120));
    REQUIRE(encodedPng.size() > MinBase64PayloadLength);

    auto const png = decodeContent(encodedPng);
    REQUIRE(png.has_value());
    REQUIRE(png->has_value());
    CHECK((*png)->format == ImageFormat::Png);
    CHECK((*png)->bytes.size() == 120);

    auto const encodedText = base64::encode(std::string(120, 'x'));
    auto const text = decodeContent(encodedText);
    REQUIRE(text.has_value());
    CHECK(!text->has_value());
}

TEST_CASE("decodeContent ignores short bare base64", "[decoder]")
{
    auto const encoded = base64::encode(paddedPng(40));
    REQUIRE(encoded.size() <= MinBase64PayloadLength);

    auto const result = decodeContent(encoded);
    REQUIRE(result.has_value());
    CHECK(!result->has_value());
}

TEST_CASE("decodeContent sniffs raw binary payloads", "[decoder]")
{
    auto const raw = test::asString(test::samplePng());

    auto const result = decodeContent(raw);
    REQUIRE(result.has_value());
    REQUIRE(result->has_value());
    CHECK((*result)->format == ImageFormat::Png);
    CHECK((*result)->bytes == test::samplePng());
}

TEST_CASE("isImageDataUri", "[decoder]")
{
    CHECK(isImageDataUri("data:image/png;base64,AAAA"));
    CHECK(isImageDataUri("data:image/svg+xml;base64,AAAA"));
    CHECK(!isImageDataUri("data:text/plain;base64,AAAA"));
    CHECK(!isImageDataUri(" data:image/png;base64,AAAA"));
}

TEST_CASE("ChangeTracker reports only changes", "[tracker]")
{
    auto tracker = ChangeTracker<std::string> {};

    CHECK(tracker.observe("x"));
    CHECK(!tracker.observe("x"));
    CHECK(tracker.observe("y"));
    CHECK(tracker.observe("x"));
    REQUIRE(tracker.last().has_value());
    CHECK(*tracker.last() == "x");
}

TEST_CASE("ChangeTracker remember suppresses the next observation", "[tracker]")
{
    auto tracker = ChangeTracker<std::string> {};
    CHECK(tracker.observe("payload"));

    tracker.remember("/tmp/written.png");
    CHECK(!tracker.observe("/tmp/written.png"));

    tracker.reset();
    CHECK(!tracker.last().has_value());
    CHECK(tracker.observe("/tmp/written.png"));
}
