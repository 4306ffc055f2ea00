/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include <protocol.hpp>

#include <nlohmann/json.hpp>

using namespace canvasrelay::protocol;
using json = nlohmann::json;

TEST_CASE("start-stream with nested destination and quality", "[protocol]") {
    const std::string text = R"({"type":"start-stream","sessionId":"s1",
        "destination":{"ingestURL":"rtmp://live.example/app","streamKey":"abc"},
        "userPlan":"pro","quality":{"bitrateKbps":4500,"resolution":"720p","frameRate":25}})";
    InboundMessage m;
    std::string err;
    REQUIRE(parse_text_message(text, m, err));
    REQUIRE(m.kind == MessageKind::START);
    REQUIRE(m.session_id == "s1");
    REQUIRE(m.ingest_url == "rtmp://live.example/app");
    REQUIRE(m.stream_key == "abc");
    REQUIRE(m.plan == "pro");
    REQUIRE(m.bitrate_kbps == 4500);
    REQUIRE(m.resolution == "720p");
    REQUIRE(m.frame_rate == 25);
}

TEST_CASE("legacy start message with flat fields", "[protocol]") {
    const std::string text = R"({"type":"start-webrtc-stream","streamId":"legacy",
        "rtmpUrl":"rtmps://live.example/app","streamKey":"k","plan":"basic","quality":"1080p","bitrate":3000})";
    InboundMessage m;
    std::string err;
    REQUIRE(parse_text_message(text, m, err));
    REQUIRE(m.kind == MessageKind::START);
    REQUIRE(m.session_id == "legacy");
    REQUIRE(m.ingest_url == "rtmps://live.example/app");
    REQUIRE(m.plan == "basic");
    REQUIRE(m.resolution == "1080p");
    REQUIRE(m.bitrate_kbps == 3000);
}

TEST_CASE("start-stream validation errors", "[protocol]") {
    InboundMessage m;
    std::string err;

    REQUIRE_FALSE(parse_text_message(R"({"type":"start-stream","destination":{"ingestURL":"rtmp://a/b","streamKey":"k"}})", m, err));
    REQUIRE(err == "missing field: sessionId");

    REQUIRE_FALSE(parse_text_message(R"({"type":"start-stream","sessionId":"s","destination":{"streamKey":"k"}})", m, err));
    REQUIRE(err == "missing field: destination.ingestURL");
    REQUIRE(m.session_id == "s");

    REQUIRE_FALSE(parse_text_message(R"({"type":"start-stream","sessionId":"s","destination":{"ingestURL":"rtmp://a/b"}})", m, err));
    REQUIRE(err == "missing field: destination.streamKey");

    REQUIRE_FALSE(parse_text_message(R"({"type":"start-stream","sessionId":"s","destination":{"ingestURL":"http://a/b","streamKey":"k"}})", m, err));
    REQUIRE(err == "ingestURL must be an rtmp:// or rtmps:// URL");

    REQUIRE_FALSE(parse_text_message(R"({"type":"start-stream","sessionId":"s","destination":{"ingestURL":"rtmp://a/b","streamKey":"k"},"quality":{"bitrateKbps":-5}})", m, err));
    REQUIRE(err == "invalid field: quality.bitrateKbps");

    REQUIRE_FALSE(parse_text_message(R"({"type":"start-stream","sessionId":7})", m, err));
    REQUIRE(err == "invalid field: sessionId");

    const std::string long_id(200, 'x');
    REQUIRE_FALSE(parse_text_message(R"({"type":"stop-stream","sessionId":")" + long_id + R"("})", m, err));
    REQUIRE(err == "sessionId too long");
}

TEST_CASE("canvas-frame carries data and optional sequence", "[protocol]") {
    InboundMessage m;
    std::string err;
    REQUIRE(parse_text_message(R"({"type":"canvas-frame","sessionId":"s","frameData":"data:image/png;base64,AAAA","sequenceHint":42})", m, err));
    REQUIRE(m.kind == MessageKind::FRAME);
    REQUIRE(m.frame_data == "data:image/png;base64,AAAA");
    REQUIRE(m.has_sequence);
    REQUIRE(m.sequence == 42);
    REQUIRE_FALSE(m.binary);

    REQUIRE(parse_text_message(R"({"type":"canvas-frame","sessionId":"s","frameData":"x"})", m, err));
    REQUIRE_FALSE(m.has_sequence);

    // empty payloads reach the decoder rather than being rejected here
    REQUIRE(parse_text_message(R"({"type":"canvas-frame","sessionId":"s","frameData":""})", m, err));
    REQUIRE(m.kind == MessageKind::FRAME);
    REQUIRE(m.frame_data.empty());

    REQUIRE_FALSE(parse_text_message(R"({"type":"canvas-frame","sessionId":"s"})", m, err));
    REQUIRE(err == "missing field: frameData");
}

TEST_CASE("stop and heartbeat", "[protocol]") {
    InboundMessage m;
    std::string err;
    REQUIRE(parse_text_message(R"({"type":"stop-stream","sessionId":"s"})", m, err));
    REQUIRE(m.kind == MessageKind::STOP);
    REQUIRE(parse_text_message(R"({"type":"stop-webrtc-stream","streamId":"s"})", m, err));
    REQUIRE(m.kind == MessageKind::STOP);
    REQUIRE_FALSE(parse_text_message(R"({"type":"stop-stream"})", m, err));
    REQUIRE(err == "missing field: sessionId");

    REQUIRE(parse_text_message(R"({"type":"heartbeat"})", m, err));
    REQUIRE(m.kind == MessageKind::HEARTBEAT);
    REQUIRE(m.session_id.empty());
    REQUIRE(parse_text_message(R"({"type":"heartbeat","sessionId":"s"})", m, err));
    REQUIRE(m.session_id == "s");
}

TEST_CASE("malformed envelopes", "[protocol]") {
    InboundMessage m;
    std::string err;
    REQUIRE_FALSE(parse_text_message("{not json", m, err));
    REQUIRE(err == "malformed JSON message");
    REQUIRE_FALSE(parse_text_message("[1,2]", m, err));
    REQUIRE(err == "message must be a JSON object");
    REQUIRE_FALSE(parse_text_message(R"({"sessionId":"s"})", m, err));
    REQUIRE(err == "missing field: type");
    REQUIRE_FALSE(parse_text_message(R"({"type":"dance","sessionId":"s"})", m, err));
    REQUIRE(err == "unknown message type: dance");
    // id still available for attribution
    REQUIRE(m.session_id == "s");
}

TEST_CASE("binary frame layout", "[protocol]") {
    const std::string png = std::string("\x89PNG", 4) + "rest";
    std::string wire = build_binary_frame("abc", png);
    REQUIRE(wire.size() == 2 + 3 + png.size());
    REQUIRE(wire[0] == 0);
    REQUIRE(wire[1] == 3);

    InboundMessage m;
    std::string err;
    REQUIRE(parse_binary_frame(wire, m, err));
    REQUIRE(m.kind == MessageKind::FRAME);
    REQUIRE(m.binary);
    REQUIRE(m.session_id == "abc");
    REQUIRE(m.frame_data == png);

    REQUIRE_FALSE(parse_binary_frame(std::string(1, '\0'), m, err));
    REQUIRE(err == "binary frame too short");
    REQUIRE_FALSE(parse_binary_frame(std::string("\0\0x", 3), m, err));
    REQUIRE(err == "binary frame has invalid session id length");
    REQUIRE_FALSE(parse_binary_frame(std::string("\0\x05" "abc", 5), m, err));
    REQUIRE(err == "binary frame truncated");

    // no image bytes: still a frame, the decoder rejects it
    REQUIRE(parse_binary_frame(build_binary_frame("abc", ""), m, err));
    REQUIRE(m.session_id == "abc");
    REQUIRE(m.frame_data.empty());
}

TEST_CASE("outbound messages serialize to the wire names", "[protocol]") {
    json ready = json::parse(serialize(make_ready("s1", "rtmp://h/app/***")));
    REQUIRE(ready["type"] == "stream-ready");
    REQUIRE(ready["sessionId"] == "s1");
    REQUIRE(ready["state"] == "live");
    REQUIRE(ready["destination"] == "rtmp://h/app/***");

    SessionCounters c;
    c.frames_written = 10;
    c.frames_dropped = 2;
    c.decode_errors = 1;
    c.pending_frames = 0;
    c.uptime_ms = 1234;
    json status = json::parse(serialize(make_status("s1", "live", c)));
    REQUIRE(status["type"] == "stream-status");
    REQUIRE(status["framesWritten"] == 10);
    REQUIRE(status["framesDropped"] == 2);
    REQUIRE(status["decodeErrors"] == 1);
    REQUIRE(status["uptimeMs"] == 1234);
    REQUIRE_FALSE(status.contains("warning"));

    json error = json::parse(serialize(make_error("s1", "ProcessExited", "encoder exited")));
    REQUIRE(error["type"] == "stream-error");
    REQUIRE(error["kind"] == "ProcessExited");
    REQUIRE(error["message"] == "encoder exited");

    json bare = json::parse(serialize(make_error("", "", "malformed JSON message")));
    REQUIRE_FALSE(bare.contains("sessionId"));
    REQUIRE_FALSE(bare.contains("kind"));

    json stopped = json::parse(serialize(make_stopped("s1", "stopped")));
    REQUIRE(stopped["type"] == "stream-stopped");
    REQUIRE(stopped["exitReason"] == "stopped");
}

TEST_CASE("invalid UTF-8 in diagnostics still serializes", "[protocol]") {
    std::string out = serialize(make_error("s", "PublishRejected", std::string("bad \xff byte")));
    REQUIRE_NOTHROW(json::parse(out));
}
