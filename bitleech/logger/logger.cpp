// logger.cpp
#include "logger.hpp"
#include <iostream>
#include <syncstream>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace bitleech::logger {

    const char* levelName(LogLevel l) noexcept {
        switch (l) {
            case LogLevel::trace: return "TRACE";
            case LogLevel::debug: return "DEBUG";
            case LogLevel::info:  return "INFO";
            case LogLevel::warn:  return "WARN";
            case LogLevel::error: return "ERROR";
            default:              return "NONE";
        }
    }

    static std::string ts_iso8601(std::chrono::system_clock::time_point tp) {
        std::time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        gmtime_r(&t, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return oss.str();
    }

    std::string formatRecord(const LogRecord& rec) {
        std::ostringstream out;
        out << ts_iso8601(rec.ts) << " [" << levelName(rec.level) << "] "
            << (rec.logger.empty() ? "bitleech" : rec.logger) << ": "
            << rec.msg;

        if (!rec.url.empty())    out << " url="      << rec.url;
        if (!rec.peer.empty())   out << " peer="     << rec.peer;
        if (!rec.event.empty())  out << " event="    << rec.event;
        if (!rec.code.empty())   out << " code="     << rec.code;
        if (rec.piece >= 0)      out << " piece="    << rec.piece;
        if (rec.retries >= 0)    out << " retries="  << rec.retries;
        if (rec.interval >= 0)   out << " interval=" << rec.interval;
        return out.str();
    }

    std::string redactQueryParam(std::string_view text, std::string_view key) {
        std::string out{text};
        std::string needle{key};
        needle += '=';
        std::size_t pos = 0;
        while ((pos = out.find(needle, pos)) != std::string::npos) {
            auto start = pos + needle.size();
            auto end = out.find_first_of("& \t\n", start);
            if (end == std::string::npos) end = out.size();
            out.replace(start, end - start, "***");
            pos = start + 3;
        }
        return out;
    }

    // -------- StdoutSink: atomic per-line emission --------
    void StdoutSink::write(const LogRecord& rec) {
        std::osyncstream out(std::cout);
        out << formatRecord(rec) << '\n';
    }

    // -------- FileSink: mutex-serialized writes --------
    FileSink::FileSink(const std::string& path) : out_(path, std::ios::app) {}

    void FileSink::write(const LogRecord& rec) {
        std::scoped_lock lk(mu_);
        if (!out_) return;
        out_ << formatRecord(rec) << '\n';
        out_.flush();
    }

} // namespace bitleech::logger
