/*
* @license
* (C) zachbabanov
*
*/

#include <logger.hpp>

#include <fmt/core.h>
#include <fmt/chrono.h>

#include <algorithm>
#include <chrono>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <ctime>

namespace canvasrelay::log {

    Logger &Logger::instance() {
        static Logger lg;
        return lg;
    }

    Logger::Logger() : min_level_(Level::INFO) {}

    Logger::~Logger() {
        if (file_.is_open()) file_.close();
    }

    void Logger::set_level(Level l) {
        min_level_.store(l);
    }

    Level Logger::level() const {
        return min_level_.load();
    }

    bool Logger::open_logfile(const std::string &path) {
        std::lock_guard<std::mutex> lk(mtx_);
        if (file_.is_open()) file_.close();
        file_.open(path, std::ios::out | std::ios::app);
        return file_.is_open();
    }

    void Logger::close_logfile() {
        std::lock_guard<std::mutex> lk(mtx_);
        if (file_.is_open()) file_.close();
    }

    std::string Logger::timestamp_now() {
        using namespace std::chrono;
        auto now = system_clock::now();
        auto itt = system_clock::to_time_t(now);
        std::tm tm{};
        localtime_r(&itt, &tm);
        auto us = duration_cast<microseconds>(now.time_since_epoch()) % 1000000;
        return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:06}", tm, static_cast<int>(us.count()));
    }

    void Logger::log(Level lvl, Category cat, const std::string &msg, const char *file, int line) {
        if (lvl < min_level_.load()) return;

        const char *lvl_s = "INFO ";
        switch (lvl) {
            case Level::TRACE: lvl_s = "TRACE"; break;
            case Level::DEBUG: lvl_s = "DEBUG"; break;
            case Level::INFO:  lvl_s = "INFO "; break;
            case Level::WARN:  lvl_s = "WARN "; break;
            case Level::ERROR: lvl_s = "ERROR"; break;
        }

        const char *cat_s = "GEN";
        switch (cat) {
            case Category::GENERAL: cat_s = "GEN"; break;
            case Category::SESSION: cat_s = "SESSION"; break;
            case Category::ENCODER: cat_s = "ENC"; break;
            case Category::CODEC:   cat_s = "CODEC"; break;
            case Category::NETWORK: cat_s = "NET"; break;
        }

        std::string ts = timestamp_now();

        std::string location;
        if (file) {
            const char *fname = file;
            const char *p = std::strrchr(file, '/');
            if (p) fname = p + 1;
            location = fmt::format(" ({}:{})", fname, line);
        }

        std::string out = fmt::format("{} [{}] {{{}}}{} - {}\n", ts, lvl_s, cat_s, location, msg);

        // Output under lock
        std::lock_guard<std::mutex> lk(mtx_);
        std::fwrite(out.data(), 1, out.size(), stdout);
        std::fflush(stdout);
        if (file_.is_open()) {
            file_ << out;
            file_.flush();
        }
    }

    bool parse_level(const std::string &s, Level &out) {
        std::string v = s;
        std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return (char)std::tolower(c); });
        if (v == "trace") { out = Level::TRACE; return true; }
        if (v == "debug") { out = Level::DEBUG; return true; }
        if (v == "info") { out = Level::INFO; return true; }
        if (v == "warn" || v == "warning") { out = Level::WARN; return true; }
        if (v == "error" || v == "err") { out = Level::ERROR; return true; }
        return false;
    }

} // namespace canvasrelay::log
