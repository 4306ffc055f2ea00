/*
* @license
* (C) zachbabanov
*
*/

#include <quality.hpp>
#include <logger.hpp>

#include <algorithm>
#include <cctype>
#include <string>

namespace canvasrelay::quality {

    PlanTable::PlanTable() : fallback_("free") {}

    PlanTable PlanTable::defaults() {
        PlanTable t;
        t.set("free",  PlanQuality{1500, "720p",  DEFAULT_FRAME_RATE});
        t.set("basic", PlanQuality{3000, "1080p", DEFAULT_FRAME_RATE});
        t.set("pro",   PlanQuality{6000, "1080p", DEFAULT_FRAME_RATE});
        t.set("goat",  PlanQuality{9000, "1080p", DEFAULT_FRAME_RATE});
        return t;
    }

    void PlanTable::set(const std::string &plan, const PlanQuality &q) {
        plans_[plan] = q;
    }

    void PlanTable::set_fallback(const std::string &plan) {
        fallback_ = plan;
    }

    bool PlanTable::contains(const std::string &plan) const {
        return plans_.count(plan) != 0;
    }

    PlanQuality PlanTable::lookup(const std::string &plan) const {
        auto it = plans_.find(plan);
        if (it != plans_.end()) return it->second;
        auto fb = plans_.find(fallback_);
        if (fb != plans_.end()) return fb->second;
        // empty table: conservative built-in
        return PlanQuality{1500, "720p", DEFAULT_FRAME_RATE};
    }

    static bool parse_uint(const std::string &s, uint32_t &out) {
        if (s.empty() || s.size() > 9) return false;
        uint32_t v = 0;
        for (char c : s) {
            if (!std::isdigit((unsigned char)c)) return false;
            v = v * 10 + (uint32_t)(c - '0');
        }
        out = v;
        return true;
    }

    bool parse_resolution(const std::string &text, uint32_t &width, uint32_t &height) {
        std::string v = text;
        std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return (char)std::tolower(c); });

        uint32_t w = 0, h = 0;
        if (v == "480p") { w = 854; h = 480; }
        else if (v == "720p") { w = 1280; h = 720; }
        else if (v == "1080p") { w = 1920; h = 1080; }
        else if (v == "1440p") { w = 2560; h = 1440; }
        else {
            size_t x = v.find('x');
            if (x == std::string::npos) return false;
            if (!parse_uint(v.substr(0, x), w) || !parse_uint(v.substr(x + 1), h)) return false;
        }

        if (w < MIN_DIMENSION || h < MIN_DIMENSION || w > MAX_DIMENSION || h > MAX_DIMENSION) return false;
        // yuv420p needs even dimensions
        if ((w % 2) != 0 || (h % 2) != 0) return false;

        width = w;
        height = h;
        return true;
    }

    bool resolve_profile(const PlanTable &plans, const QualityRequest &req, QualityProfile &out, Fault &fault) {
        PlanQuality base = plans.lookup(req.plan);
        if (!req.plan.empty() && !plans.contains(req.plan)) {
            LOG_SESSION_DEBUG("unknown plan '{}', using fallback profile", req.plan);
        }

        QualityProfile p;
        p.bitrate_kbps = req.bitrate_kbps ? req.bitrate_kbps : base.bitrate_kbps;
        p.bitrate_kbps = std::max(MIN_BITRATE_KBPS, std::min(MAX_BITRATE_KBPS, p.bitrate_kbps));

        const std::string &res = req.resolution.empty() ? base.resolution : req.resolution;
        if (!parse_resolution(res, p.width, p.height)) {
            fault.set(FaultKind::CONFIGURATION_ERROR, "unsupported resolution '" + res + "'");
            return false;
        }

        uint32_t fps = req.frame_rate ? req.frame_rate : base.frame_rate;
        if (fps == 0 || fps > MAX_FRAME_RATE) {
            fault.set(FaultKind::CONFIGURATION_ERROR, "unsupported frame rate " + std::to_string(fps));
            return false;
        }
        p.frame_rate = fps;

        out = p;
        return true;
    }

} // namespace canvasrelay::quality
