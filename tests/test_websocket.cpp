/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include <websocket.hpp>

using namespace canvasrelay::ws;

namespace {

    const std::string kUpgrade =
            "GET /ws?token=1 HTTP/1.1\r\n"
            "Host: relay.local\r\n"
            "Upgrade: websocket\r\n"
            "Connection: keep-alive, Upgrade\r\n"
            "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
            "Sec-WebSocket-Version: 13\r\n"
            "Origin: https://studio.example\r\n"
            "\r\n";

} // namespace

TEST_CASE("accept key matches the RFC 6455 sample", "[websocket]") {
    REQUIRE(accept_key("dGhlIHNhbXBsZSBub25jZQ==") == "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
    std::string resp = handshake_response("dGhlIHNhbXBsZSBub25jZQ==");
    REQUIRE(resp.rfind("HTTP/1.1 101 Switching Protocols\r\n", 0) == 0);
    REQUIRE(resp.find("Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n") != std::string::npos);
}

TEST_CASE("handshake parses a browser upgrade", "[websocket]") {
    HandshakeRequest req;
    size_t consumed = 0;
    std::string err;
    REQUIRE(parse_handshake(kUpgrade + "extra", 16384, req, consumed, err) == ParseStatus::OK);
    REQUIRE(consumed == kUpgrade.size());
    REQUIRE(req.path == "/ws");
    REQUIRE(req.key == "dGhlIHNhbXBsZSBub25jZQ==");
    REQUIRE(req.origin == "https://studio.example");
}

TEST_CASE("handshake waits for the blank line", "[websocket]") {
    HandshakeRequest req;
    size_t consumed = 0;
    std::string err;
    REQUIRE(parse_handshake(kUpgrade.substr(0, 40), 16384, req, consumed, err) == ParseStatus::NEED_MORE);
    REQUIRE(parse_handshake(std::string(200, 'a'), 100, req, consumed, err) == ParseStatus::ERROR);
    REQUIRE(err == "request head too large");
}

TEST_CASE("handshake rejects non upgrade requests", "[websocket]") {
    HandshakeRequest req;
    size_t consumed = 0;
    std::string err;

    REQUIRE(parse_handshake("POST /ws HTTP/1.1\r\n\r\n", 16384, req, consumed, err) == ParseStatus::ERROR);
    REQUIRE(err == "method must be GET");

    REQUIRE(parse_handshake("GET / HTTP/1.1\r\nHost: x\r\n\r\n", 16384, req, consumed, err) == ParseStatus::ERROR);
    REQUIRE(err == "not a websocket upgrade");

    HandshakeRequest r2;
    REQUIRE(parse_handshake("GET / HTTP/1.1\r\nUpgrade: websocket\r\nConnection: Upgrade\r\n"
                            "Sec-WebSocket-Key: abc\r\nSec-WebSocket-Version: 8\r\n\r\n",
                            16384, r2, consumed, err) == ParseStatus::ERROR);
    REQUIRE(err == "unsupported websocket version");

    REQUIRE(http_error_response(404, "Not Found").rfind("HTTP/1.1 404 Not Found\r\n", 0) == 0);
}

TEST_CASE("masked client frames decode", "[websocket]") {
    const std::string payload = "{\"type\":\"heartbeat\"}";
    std::string wire = encode_masked_frame(Opcode::TEXT, payload, 0x37fa213d);

    Frame f;
    size_t consumed = 0;
    uint16_t code = 0;
    REQUIRE(parse_frame(wire, 0, 1024, f, consumed, code) == ParseStatus::OK);
    REQUIRE(consumed == wire.size());
    REQUIRE(f.fin);
    REQUIRE(f.opcode == Opcode::TEXT);
    REQUIRE(f.payload == payload);

    // partial input
    REQUIRE(parse_frame(wire.substr(0, wire.size() - 1), 0, 1024, f, consumed, code) == ParseStatus::NEED_MORE);
}

TEST_CASE("extended payload lengths", "[websocket]") {
    const std::string medium(300, 'm');
    const std::string large(70000, 'L');
    std::string wire = encode_masked_frame(Opcode::BINARY, medium, 1) + encode_masked_frame(Opcode::BINARY, large, 2);

    Frame f;
    size_t consumed = 0;
    uint16_t code = 0;
    REQUIRE(parse_frame(wire, 0, 100000, f, consumed, code) == ParseStatus::OK);
    REQUIRE(f.payload == medium);
    size_t off = consumed;
    REQUIRE(parse_frame(wire, off, 100000, f, consumed, code) == ParseStatus::OK);
    REQUIRE(f.payload == large);
    REQUIRE(off + consumed == wire.size());

    std::string server = encode_frame(Opcode::TEXT, large);
    REQUIRE((uint8_t)server[1] == 127);
    REQUIRE(server.size() == large.size() + 10);
}

TEST_CASE("protocol violations carry a close code", "[websocket]") {
    Frame f;
    size_t consumed = 0;
    uint16_t code = 0;

    // unmasked client frame
    REQUIRE(parse_frame(encode_frame(Opcode::TEXT, "x"), 0, 1024, f, consumed, code) == ParseStatus::ERROR);
    REQUIRE(code == CLOSE_PROTOCOL_ERROR);

    // oversized payload
    REQUIRE(parse_frame(encode_masked_frame(Opcode::TEXT, std::string(2000, 'x'), 9), 0, 1024, f, consumed, code) ==
            ParseStatus::ERROR);
    REQUIRE(code == CLOSE_TOO_BIG);

    // fragmented ping
    REQUIRE(parse_frame(encode_masked_frame(Opcode::PING, "p", 9, false), 0, 1024, f, consumed, code) ==
            ParseStatus::ERROR);
    REQUIRE(code == CLOSE_PROTOCOL_ERROR);

    // reserved opcode 0x3
    std::string bad = encode_masked_frame(Opcode::TEXT, "x", 9);
    bad[0] = (char)(0x80 | 0x3);
    REQUIRE(parse_frame(bad, 0, 1024, f, consumed, code) == ParseStatus::ERROR);
    REQUIRE(code == CLOSE_PROTOCOL_ERROR);
}

TEST_CASE("close payloads", "[websocket]") {
    std::string wire = encode_close(CLOSE_GOING_AWAY, "shutdown");
    REQUIRE((uint8_t)wire[0] == 0x88);
    REQUIRE(close_code_of(wire.substr(2)) == CLOSE_GOING_AWAY);
    REQUIRE(close_code_of("") == CLOSE_NO_STATUS);
}

TEST_CASE("assembler joins fragments and passes control frames", "[websocket]") {
    MessageAssembler a(100);
    Message m;
    uint16_t code = 0;

    Frame first{false, Opcode::TEXT, "hel"};
    REQUIRE(a.push(first, m, code) == MessageAssembler::Result::NONE);
    REQUIRE(a.in_progress());

    Frame ping{true, Opcode::PING, "p"};
    REQUIRE(a.push(ping, m, code) == MessageAssembler::Result::CONTROL);
    REQUIRE(m.opcode == Opcode::PING);

    Frame last{true, Opcode::CONTINUATION, "lo"};
    REQUIRE(a.push(last, m, code) == MessageAssembler::Result::MESSAGE);
    REQUIRE(m.opcode == Opcode::TEXT);
    REQUIRE(m.data == "hello");
    REQUIRE_FALSE(a.in_progress());
}

TEST_CASE("assembler rejects broken sequences", "[websocket]") {
    Message m;
    uint16_t code = 0;

    MessageAssembler a(100);
    Frame stray{true, Opcode::CONTINUATION, "x"};
    REQUIRE(a.push(stray, m, code) == MessageAssembler::Result::ERROR);
    REQUIRE(code == CLOSE_PROTOCOL_ERROR);

    MessageAssembler b(4);
    Frame f1{false, Opcode::BINARY, "abc"};
    Frame f2{true, Opcode::CONTINUATION, "def"};
    REQUIRE(b.push(f1, m, code) == MessageAssembler::Result::NONE);
    REQUIRE(b.push(f2, m, code) == MessageAssembler::Result::ERROR);
    REQUIRE(code == CLOSE_TOO_BIG);
}
