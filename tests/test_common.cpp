/*
* @license
* (C) zachbabanov
*
*/

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <common.hpp>
#include <fault.hpp>

#include <string>
#include <vector>

using namespace canvasrelay;
using namespace canvasrelay::common;

TEST_CASE("redactSecret replaces every occurrence", "[common]") {
    REQUIRE(redactSecret("rtmp://a/live/k3y?x=k3y", "k3y") == "rtmp://a/live/***?x=***");
    REQUIRE(redactSecret("nothing here", "k3y") == "nothing here");
    // empty secret would match everywhere
    REQUIRE(redactSecret("abc", "") == "abc");
}

TEST_CASE("redactDestination hides the stream key", "[common]") {
    REQUIRE(redactDestination("rtmp://live.example.com/app", "sk_123") == "rtmp://live.example.com/app/***");
    REQUIRE(redactDestination("rtmp://live.example.com/app//", "sk_123") == "rtmp://live.example.com/app/***");

    std::string leaked = redactDestination("rtmp://host/sk_123/app", "sk_123");
    REQUIRE(leaked.find("sk_123") == std::string::npos);
}

TEST_CASE("base64 encode known vectors", "[common]") {
    const std::string foo = "foobar";
    REQUIRE(base64Encode((const unsigned char *)foo.data(), 1) == "Zg==");
    REQUIRE(base64Encode((const unsigned char *)foo.data(), 2) == "Zm8=");
    REQUIRE(base64Encode((const unsigned char *)foo.data(), 6) == "Zm9vYmFy");
    REQUIRE(base64Encode(nullptr, 0).empty());
}

TEST_CASE("base64Decode honours padding and offset", "[common]") {
    std::vector<uint8_t> out;

    REQUIRE(base64Decode("Zm8=", 0, out));
    REQUIRE(std::string(out.begin(), out.end()) == "fo");

    REQUIRE(base64Decode("prefix:Zm9vYmFy", 7, out));
    REQUIRE(std::string(out.begin(), out.end()) == "foobar");

    // line breaks inside the body are tolerated
    REQUIRE(base64Decode("Zm9v\r\nYmFy", 0, out));
    REQUIRE(std::string(out.begin(), out.end()) == "foobar");
}

TEST_CASE("base64Decode rejects malformed bodies", "[common]") {
    std::vector<uint8_t> out;
    REQUIRE_FALSE(base64Decode("", 0, out));
    REQUIRE_FALSE(base64Decode("Zm9", 0, out));
    REQUIRE_FALSE(base64Decode("Zm9v!!!!", 0, out));
    REQUIRE_FALSE(base64Decode("abc", 10, out));
}

TEST_CASE("fault kinds have stable wire names", "[common]") {
    REQUIRE(std::string(fault_kind_name(FaultKind::CONFIGURATION_ERROR)) == "ConfigurationError");
    REQUIRE(std::string(fault_kind_name(FaultKind::PIPE_CLOSED)) == "PipeClosed");
    REQUIRE(std::string(fault_kind_name(FaultKind::PROCESS_EXITED)) == "ProcessExited");
    REQUIRE(std::string(fault_kind_name(FaultKind::PUBLISH_REJECTED)) == "PublishRejected");

    Fault f;
    REQUIRE(f.ok());
    f.set(FaultKind::DECODE_ERROR, "bad");
    REQUIRE_FALSE(f.ok());
    f.clear();
    REQUIRE(f.ok());
    REQUIRE(f.message.empty());
}
