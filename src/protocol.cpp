/*
* @license
* (C) zachbabanov
*
*/

#include <protocol.hpp>
#include <common.hpp>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace canvasrelay::protocol {

    namespace {

        enum class Field { ABSENT, OK, BAD };

        Field get_string(const json &j, const char *key, std::string &out) {
            auto it = j.find(key);
            if (it == j.end() || it->is_null()) return Field::ABSENT;
            if (!it->is_string()) return Field::BAD;
            out = it->get<std::string>();
            return Field::OK;
        }

        Field get_uint(const json &j, const char *key, uint64_t &out) {
            auto it = j.find(key);
            if (it == j.end() || it->is_null()) return Field::ABSENT;
            if (it->is_number_unsigned()) {
                out = it->get<uint64_t>();
                return Field::OK;
            }
            if (it->is_number_integer()) {
                int64_t v = it->get<int64_t>();
                if (v < 0) return Field::BAD;
                out = (uint64_t)v;
                return Field::OK;
            }
            if (it->is_number_float()) {
                double v = it->get<double>();
                if (v < 0 || v > 4294967295.0) return Field::BAD;
                out = (uint64_t)v;
                return Field::OK;
            }
            return Field::BAD;
        }

        bool has_prefix(const std::string &s, const char *p) {
            return s.rfind(p, 0) == 0;
        }

        bool read_session_id(const json &j, InboundMessage &out, bool required, std::string &error) {
            std::string id;
            Field f = get_string(j, "sessionId", id);
            if (f == Field::ABSENT) f = get_string(j, "streamId", id);
            if (f == Field::BAD) {
                error = "invalid field: sessionId";
                return false;
            }
            if (f == Field::ABSENT || id.empty()) {
                if (!required) return true;
                error = "missing field: sessionId";
                return false;
            }
            if (id.size() > common::MAX_SESSION_ID_LEN) {
                error = "sessionId too long";
                return false;
            }
            out.session_id = id;
            return true;
        }

        bool read_start(const json &j, InboundMessage &out, std::string &error) {
            // destination: nested object, or flat rtmpUrl / streamKey
            auto dest = j.find("destination");
            if (dest != j.end() && !dest->is_null()) {
                if (!dest->is_object()) {
                    error = "invalid field: destination";
                    return false;
                }
                Field f = get_string(*dest, "ingestURL", out.ingest_url);
                if (f == Field::ABSENT) f = get_string(*dest, "ingestUrl", out.ingest_url);
                if (f == Field::BAD) { error = "invalid field: destination.ingestURL"; return false; }
                if (get_string(*dest, "streamKey", out.stream_key) == Field::BAD) {
                    error = "invalid field: destination.streamKey";
                    return false;
                }
            } else {
                if (get_string(j, "rtmpUrl", out.ingest_url) == Field::BAD) { error = "invalid field: rtmpUrl"; return false; }
                if (get_string(j, "streamKey", out.stream_key) == Field::BAD) { error = "invalid field: streamKey"; return false; }
            }
            if (out.ingest_url.empty()) {
                error = "missing field: destination.ingestURL";
                return false;
            }
            if (out.stream_key.empty()) {
                error = "missing field: destination.streamKey";
                return false;
            }
            if (!has_prefix(out.ingest_url, "rtmp://") && !has_prefix(out.ingest_url, "rtmps://")) {
                error = "ingestURL must be an rtmp:// or rtmps:// URL";
                return false;
            }

            Field f = get_string(j, "userPlan", out.plan);
            if (f == Field::ABSENT) f = get_string(j, "plan", out.plan);
            if (f == Field::BAD) { error = "invalid field: plan"; return false; }

            uint64_t v = 0;
            auto q = j.find("quality");
            if (q != j.end() && q->is_object()) {
                if ((f = get_uint(*q, "bitrateKbps", v)) == Field::BAD) { error = "invalid field: quality.bitrateKbps"; return false; }
                if (f == Field::OK) out.bitrate_kbps = (uint32_t)std::min<uint64_t>(v, UINT32_MAX);
                if (get_string(*q, "resolution", out.resolution) == Field::BAD) { error = "invalid field: quality.resolution"; return false; }
                if ((f = get_uint(*q, "frameRate", v)) == Field::BAD) { error = "invalid field: quality.frameRate"; return false; }
                if (f == Field::OK) out.frame_rate = (uint32_t)std::min<uint64_t>(v, UINT32_MAX);
            } else if (q != j.end() && q->is_string()) {
                out.resolution = q->get<std::string>();
            } else if (q != j.end() && !q->is_null()) {
                error = "invalid field: quality";
                return false;
            }

            if (out.bitrate_kbps == 0) {
                if ((f = get_uint(j, "bitrate", v)) == Field::BAD) { error = "invalid field: bitrate"; return false; }
                if (f == Field::OK) out.bitrate_kbps = (uint32_t)std::min<uint64_t>(v, UINT32_MAX);
            }
            return true;
        }

    } // namespace

    bool parse_text_message(const std::string &text, InboundMessage &out, std::string &error) {
        out = InboundMessage{};
        json j;
        try {
            j = json::parse(text);
        } catch (const json::exception &) {
            error = "malformed JSON message";
            return false;
        }
        if (!j.is_object()) {
            error = "message must be a JSON object";
            return false;
        }

        std::string type;
        Field tf = get_string(j, "type", type);
        // read the id first so errors can still be attributed to a session
        if (!read_session_id(j, out, false, error)) return false;
        if (tf == Field::BAD || type.empty()) {
            error = "missing field: type";
            return false;
        }

        try {
            if (type == MSG_START || type == MSG_START_LEGACY) {
                out.kind = MessageKind::START;
                if (!read_session_id(j, out, true, error)) return false;
                return read_start(j, out, error);
            }
            if (type == MSG_FRAME) {
                out.kind = MessageKind::FRAME;
                if (!read_session_id(j, out, true, error)) return false;
                Field f = get_string(j, "frameData", out.frame_data);
                if (f == Field::BAD) { error = "invalid field: frameData"; return false; }
                // an empty payload is left to the decoder and counted as a decode error
                if (f == Field::ABSENT) { error = "missing field: frameData"; return false; }
                uint64_t seq = 0;
                f = get_uint(j, "sequenceHint", seq);
                if (f == Field::BAD) { error = "invalid field: sequenceHint"; return false; }
                out.has_sequence = (f == Field::OK);
                out.sequence = seq;
                return true;
            }
            if (type == MSG_STOP || type == MSG_STOP_LEGACY) {
                out.kind = MessageKind::STOP;
                return read_session_id(j, out, true, error);
            }
            if (type == MSG_HEARTBEAT) {
                out.kind = MessageKind::HEARTBEAT;
                return true;
            }
        } catch (const json::exception &) {
            error = "malformed message";
            return false;
        }

        error = "unknown message type: " + type.substr(0, 64);
        return false;
    }

    bool parse_binary_frame(const std::string &data, InboundMessage &out, std::string &error) {
        out = InboundMessage{};
        if (data.size() < 2) {
            error = "binary frame too short";
            return false;
        }
        size_t id_len = ((size_t)(uint8_t)data[0] << 8) | (size_t)(uint8_t)data[1];
        if (id_len == 0 || id_len > common::MAX_SESSION_ID_LEN) {
            error = "binary frame has invalid session id length";
            return false;
        }
        if (data.size() < 2 + id_len) {
            error = "binary frame truncated";
            return false;
        }
        out.kind = MessageKind::FRAME;
        out.binary = true;
        out.session_id = data.substr(2, id_len);
        out.frame_data = data.substr(2 + id_len);
        return true;
    }

    std::string build_binary_frame(const std::string &session_id, const std::string &png_bytes) {
        std::string out;
        out.reserve(2 + session_id.size() + png_bytes.size());
        out.push_back((char)((session_id.size() >> 8) & 0xFF));
        out.push_back((char)(session_id.size() & 0xFF));
        out += session_id;
        out += png_bytes;
        return out;
    }

    const char *outbound_type_name(OutboundType t) {
        switch (t) {
            case OutboundType::READY: return MSG_READY;
            case OutboundType::STATUS: return MSG_STATUS;
            case OutboundType::ERROR: return MSG_ERROR;
            case OutboundType::STOPPED: return MSG_STOPPED;
        }
        return MSG_STATUS;
    }

    OutboundMessage make_ready(const std::string &session_id, const std::string &redacted_destination) {
        OutboundMessage m;
        m.type = OutboundType::READY;
        m.session_id = session_id;
        m.state = "live";
        m.destination = redacted_destination;
        return m;
    }

    OutboundMessage make_error(const std::string &session_id, const std::string &kind, const std::string &message) {
        OutboundMessage m;
        m.type = OutboundType::ERROR;
        m.session_id = session_id;
        m.kind = kind;
        m.message = message;
        return m;
    }

    OutboundMessage make_stopped(const std::string &session_id, const std::string &exit_reason) {
        OutboundMessage m;
        m.type = OutboundType::STOPPED;
        m.session_id = session_id;
        m.exit_reason = exit_reason;
        return m;
    }

    OutboundMessage make_status(const std::string &session_id, const std::string &state, const SessionCounters &c) {
        OutboundMessage m;
        m.type = OutboundType::STATUS;
        m.session_id = session_id;
        m.state = state;
        m.has_counters = true;
        m.counters = c;
        return m;
    }

    std::string serialize(const OutboundMessage &msg) {
        json j;
        j["type"] = outbound_type_name(msg.type);
        if (!msg.session_id.empty()) j["sessionId"] = msg.session_id;

        switch (msg.type) {
            case OutboundType::READY:
                j["state"] = msg.state;
                if (!msg.destination.empty()) j["destination"] = msg.destination;
                break;
            case OutboundType::STATUS:
                j["state"] = msg.state;
                if (msg.has_counters) {
                    j["framesWritten"] = msg.counters.frames_written;
                    j["framesDropped"] = msg.counters.frames_dropped;
                    j["decodeErrors"] = msg.counters.decode_errors;
                    j["pendingFrames"] = msg.counters.pending_frames;
                    j["uptimeMs"] = msg.counters.uptime_ms;
                }
                if (!msg.warning.empty()) j["warning"] = msg.warning;
                break;
            case OutboundType::ERROR:
                j["message"] = msg.message;
                if (!msg.kind.empty()) j["kind"] = msg.kind;
                break;
            case OutboundType::STOPPED:
                j["exitReason"] = msg.exit_reason;
                break;
        }
        // diagnostics may carry arbitrary bytes
        return j.dump(-1, ' ', false, json::error_handler_t::replace);
    }

} // namespace canvasrelay::protocol
