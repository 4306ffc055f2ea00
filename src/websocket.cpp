/*
* @license
* (C) zachbabanov
*
*/

#include <websocket.hpp>
#include <common.hpp>

#include <algorithm>
#include <cctype>
#include <utility>

#include <openssl/evp.h>

namespace canvasrelay::ws {

    namespace {

        const char *WS_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

        std::string lower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
            return s;
        }

        std::string trim(const std::string &s) {
            size_t b = s.find_first_not_of(" \t");
            if (b == std::string::npos) return std::string();
            size_t e = s.find_last_not_of(" \t\r");
            return s.substr(b, e - b + 1);
        }

        bool is_known_opcode(uint8_t op) {
            return op == 0x0 || op == 0x1 || op == 0x2 || op == 0x8 || op == 0x9 || op == 0xA;
        }

        void append_header(std::string &out, uint8_t first, bool masked, size_t len) {
            out.push_back((char)first);
            uint8_t mask_bit = masked ? 0x80 : 0x00;
            if (len <= 125) {
                out.push_back((char)(mask_bit | (uint8_t)len));
            } else if (len <= 0xFFFF) {
                out.push_back((char)(mask_bit | 126));
                out.push_back((char)((len >> 8) & 0xFF));
                out.push_back((char)(len & 0xFF));
            } else {
                out.push_back((char)(mask_bit | 127));
                for (int i = 7; i >= 0; --i) {
                    out.push_back((char)(((uint64_t)len >> (i * 8)) & 0xFF));
                }
            }
        }

    } // namespace

    ParseStatus parse_handshake(const std::string &buf, size_t max_bytes, HandshakeRequest &out,
                                size_t &consumed, std::string &error) {
        size_t end = buf.find("\r\n\r\n");
        if (end == std::string::npos) {
            if (buf.size() > max_bytes) {
                error = "request head too large";
                return ParseStatus::ERROR;
            }
            return ParseStatus::NEED_MORE;
        }
        consumed = end + 4;

        size_t line_end = buf.find("\r\n");
        const std::string request_line = buf.substr(0, line_end);
        size_t sp1 = request_line.find(' ');
        size_t sp2 = request_line.rfind(' ');
        if (sp1 == std::string::npos || sp2 == sp1) {
            error = "malformed request line";
            return ParseStatus::ERROR;
        }
        if (request_line.substr(0, sp1) != "GET") {
            error = "method must be GET";
            return ParseStatus::ERROR;
        }
        if (request_line.compare(sp2 + 1, std::string::npos, "HTTP/1.1") != 0) {
            error = "HTTP/1.1 required";
            return ParseStatus::ERROR;
        }
        std::string target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
        size_t q = target.find('?');
        out.path = q == std::string::npos ? target : target.substr(0, q);

        bool upgrade = false, connection_upgrade = false, version_ok = false;
        size_t pos = line_end + 2;
        while (pos < end) {
            size_t eol = buf.find("\r\n", pos);
            if (eol == std::string::npos || eol > end) eol = end;
            const std::string line = buf.substr(pos, eol - pos);
            pos = eol + 2;

            size_t colon = line.find(':');
            if (colon == std::string::npos) continue;
            const std::string name = lower(trim(line.substr(0, colon)));
            const std::string value = trim(line.substr(colon + 1));

            if (name == "upgrade") {
                upgrade = lower(value).find("websocket") != std::string::npos;
            } else if (name == "connection") {
                connection_upgrade = lower(value).find("upgrade") != std::string::npos;
            } else if (name == "sec-websocket-key") {
                out.key = value;
            } else if (name == "sec-websocket-version") {
                version_ok = value == "13";
            } else if (name == "origin") {
                out.origin = value;
            }
        }

        if (!upgrade || !connection_upgrade) {
            error = "not a websocket upgrade";
            return ParseStatus::ERROR;
        }
        if (out.key.empty()) {
            error = "missing Sec-WebSocket-Key";
            return ParseStatus::ERROR;
        }
        if (!version_ok) {
            error = "unsupported websocket version";
            return ParseStatus::ERROR;
        }
        return ParseStatus::OK;
    }

    std::string accept_key(const std::string &client_key) {
        const std::string input = client_key + WS_GUID;
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int digest_len = 0;
        if (EVP_Digest(input.data(), input.size(), digest, &digest_len, EVP_sha1(), nullptr) != 1) {
            return std::string();
        }
        return common::base64Encode(digest, digest_len);
    }

    std::string handshake_response(const std::string &client_key) {
        return "HTTP/1.1 101 Switching Protocols\r\n"
               "Upgrade: websocket\r\n"
               "Connection: Upgrade\r\n"
               "Sec-WebSocket-Accept: " + accept_key(client_key) + "\r\n\r\n";
    }

    std::string http_error_response(int status, const std::string &reason) {
        return "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n"
               "Content-Length: 0\r\n"
               "Connection: close\r\n\r\n";
    }

    ParseStatus parse_frame(const std::string &buf, size_t offset, size_t max_payload, Frame &out,
                            size_t &consumed, uint16_t &close_code) {
        if (buf.size() < offset + 2) return ParseStatus::NEED_MORE;
        const uint8_t *p = (const uint8_t *)buf.data() + offset;
        const size_t avail = buf.size() - offset;

        const uint8_t b0 = p[0];
        const uint8_t b1 = p[1];
        const bool fin = (b0 & 0x80) != 0;
        const uint8_t op = b0 & 0x0F;
        const bool masked = (b1 & 0x80) != 0;

        close_code = CLOSE_PROTOCOL_ERROR;
        if ((b0 & 0x70) != 0 || !is_known_opcode(op) || !masked) return ParseStatus::ERROR;

        const bool control = (op & 0x08) != 0;
        uint64_t len = b1 & 0x7F;
        size_t header = 2;
        if (len == 126) {
            if (avail < 4) return ParseStatus::NEED_MORE;
            len = ((uint64_t)p[2] << 8) | p[3];
            header = 4;
        } else if (len == 127) {
            if (avail < 10) return ParseStatus::NEED_MORE;
            len = 0;
            for (int i = 0; i < 8; ++i) len = (len << 8) | p[2 + i];
            if (len >> 63) return ParseStatus::ERROR;
            header = 10;
        }
        if (control && (!fin || len > MAX_CONTROL_PAYLOAD)) return ParseStatus::ERROR;
        if (len > max_payload) {
            close_code = CLOSE_TOO_BIG;
            return ParseStatus::ERROR;
        }

        if (avail < header + 4 + len) return ParseStatus::NEED_MORE;
        const uint8_t *mask = p + header;
        const uint8_t *data = mask + 4;

        out.fin = fin;
        out.opcode = (Opcode)op;
        out.payload.resize((size_t)len);
        for (size_t i = 0; i < (size_t)len; ++i) {
            out.payload[i] = (char)(data[i] ^ mask[i & 3]);
        }
        consumed = header + 4 + (size_t)len;
        close_code = 0;
        return ParseStatus::OK;
    }

    std::string encode_frame(Opcode opcode, const std::string &payload, bool fin) {
        std::string out;
        out.reserve(payload.size() + 10);
        append_header(out, (uint8_t)((fin ? 0x80 : 0x00) | (uint8_t)opcode), false, payload.size());
        out += payload;
        return out;
    }

    std::string encode_masked_frame(Opcode opcode, const std::string &payload, uint32_t mask, bool fin) {
        std::string out;
        out.reserve(payload.size() + 14);
        append_header(out, (uint8_t)((fin ? 0x80 : 0x00) | (uint8_t)opcode), true, payload.size());
        uint8_t key[4] = {(uint8_t)(mask >> 24), (uint8_t)(mask >> 16), (uint8_t)(mask >> 8), (uint8_t)mask};
        out.append((const char *)key, 4);
        for (size_t i = 0; i < payload.size(); ++i) {
            out.push_back((char)((uint8_t)payload[i] ^ key[i & 3]));
        }
        return out;
    }

    std::string encode_close(uint16_t code, const std::string &reason) {
        std::string payload;
        payload.push_back((char)((code >> 8) & 0xFF));
        payload.push_back((char)(code & 0xFF));
        payload += reason.substr(0, MAX_CONTROL_PAYLOAD - 2);
        return encode_frame(Opcode::CLOSE, payload);
    }

    uint16_t close_code_of(const std::string &payload) {
        if (payload.size() < 2) return CLOSE_NO_STATUS;
        return (uint16_t)(((uint8_t)payload[0] << 8) | (uint8_t)payload[1]);
    }

    MessageAssembler::MessageAssembler(size_t max_message)
            : max_message_(max_message), in_progress_(false), opcode_(Opcode::TEXT) {}

    void MessageAssembler::reset() {
        in_progress_ = false;
        buffer_.clear();
    }

    MessageAssembler::Result MessageAssembler::push(Frame &frame, Message &out, uint16_t &close_code) {
        switch (frame.opcode) {
            case Opcode::CLOSE:
            case Opcode::PING:
            case Opcode::PONG:
                out.opcode = frame.opcode;
                out.data = std::move(frame.payload);
                return Result::CONTROL;

            case Opcode::TEXT:
            case Opcode::BINARY:
                if (in_progress_) {
                    close_code = CLOSE_PROTOCOL_ERROR;
                    return Result::ERROR;
                }
                if (frame.fin) {
                    out.opcode = frame.opcode;
                    out.data = std::move(frame.payload);
                    return Result::MESSAGE;
                }
                in_progress_ = true;
                opcode_ = frame.opcode;
                buffer_ = std::move(frame.payload);
                return Result::NONE;

            case Opcode::CONTINUATION:
                if (!in_progress_) {
                    close_code = CLOSE_PROTOCOL_ERROR;
                    return Result::ERROR;
                }
                if (buffer_.size() + frame.payload.size() > max_message_) {
                    reset();
                    close_code = CLOSE_TOO_BIG;
                    return Result::ERROR;
                }
                buffer_ += frame.payload;
                if (!frame.fin) return Result::NONE;
                out.opcode = opcode_;
                out.data = std::move(buffer_);
                reset();
                return Result::MESSAGE;
        }
        close_code = CLOSE_PROTOCOL_ERROR;
        return Result::ERROR;
    }

} // namespace canvasrelay::ws
