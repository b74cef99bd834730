#define BL_LOG_LEVEL bitleech::logger::LogLevel::trace
#include <catch2/catch_all.hpp>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <filesystem>
#include <unistd.h>
#include "../logger.hpp"


using namespace bitleech::logger;

// ---------------- Test Sink (in-memory capture) ----------------

class TestSink : public ILoggerSink 
{
public:
    void write(const LogRecord& rec) override {
        records.push_back(rec);
        lines.push_back(formatRecord(rec));
    }

    std::vector<LogRecord> records;
    std::vector<std::string> lines;
};

// ---------------- Helpers ----------------

static bool contains(const std::string& hay, const std::string& needle) {
    return hay.find(needle) != std::string::npos;
}

static std::string read_file(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    REQUIRE(f.good());
    std::ostringstream oss;
    oss << f.rdbuf();
    return oss.str();
}

// ---------------- Tests ----------------

TEST_CASE("Logger: level threshold filters messages") {
    auto sink = std::make_shared<TestSink>();
    Logger log{sink};

    log.setLevel(LogLevel::info);
    log.debug("debug should be filtered", "L1");
    log.info("info should pass", "L1");
    log.warn("warn should pass", "L1");
    log.error("error should pass", "L1");

    REQUIRE(sink->records.size() == 3);
    CHECK(contains(sink->lines[0], "info should pass"));
    CHECK(contains(sink->lines[1], "warn should pass"));
    CHECK(contains(sink->lines[2], "error should pass"));
}

TEST_CASE("Logger: redactor is applied to url and msg") {
    auto sink = std::make_shared<TestSink>();
    Logger log{sink};
    log.setLevel(LogLevel::debug);

    log.setRedactor([](std::string_view s) { return redactQueryParam(s, "peer_id"); });

    LogRecord rec;
    rec.level = LogLevel::info;
    rec.logger = "announce";
    rec.msg = "sent peer_id=%2DBL0001&port=1";
    rec.url = "http://tracker/announce?peer_id=abc";
    log.log(std::move(rec));

    REQUIRE(sink->records.size() == 1);
    CHECK(contains(sink->lines[0], "sent peer_id=***&port=1"));
    CHECK(contains(sink->lines[0], "url=http://tracker/announce?peer_id=***"));
}

TEST_CASE("redactQueryParam masks every occurrence and leaves the rest") {
    CHECK(redactQueryParam("a?peer_id=x&peer_id=y z", "peer_id") == "a?peer_id=***&peer_id=*** z");
    CHECK(redactQueryParam("no secrets here", "peer_id") == "no secrets here");
    CHECK(redactQueryParam("peer_id=", "peer_id") == "peer_id=***");
}

TEST_CASE("Logger: BL_LOG macro routes message via LogStreamHelper") {
    auto sink = std::make_shared<TestSink>();
    Logger log{sink};
    log.setLevel(LogLevel::debug);

    BL_LOG(&log, LogLevel::debug, "session") << "hello " << 42;
    BL_LOG(&log, LogLevel::trace, "session") << "below runtime level";

    REQUIRE(sink->records.size() == 1);
    CHECK(contains(sink->records[0].msg, "hello 42"));
    CHECK(sink->records[0].level == LogLevel::debug);
    CHECK(sink->records[0].logger == "session");
}

TEST_CASE("BL_LOG tolerates a null logger") {
    Logger* none = nullptr;
    BL_LOG(none, LogLevel::error, "x") << "dropped";
    SUCCEED();
}

TEST_CASE("StdoutSink: one line formatted and written to std::cout") {
    std::ostringstream cap;
    auto* old = std::cout.rdbuf(cap.rdbuf());

    StdoutSink sink;
    LogRecord rec;
    rec.level = LogLevel::warn;
    rec.logger = "coordinator";
    rec.msg = "re-announce scheduled";
    rec.url = "http://t/ann";
    rec.peer = "1.2.3.4:6881";
    rec.event = "started";
    rec.code = "PeerStalled";
    rec.piece = 12;
    rec.retries = 1;
    rec.interval = 1800;

    sink.write(rec);

    std::cout.rdbuf(old);

    const std::string out = cap.str();
    CHECK(contains(out, " [WARN] "));
    CHECK(contains(out, "coordinator: re-announce scheduled"));
    CHECK(contains(out, "url=http://t/ann"));
    CHECK(contains(out, "peer=1.2.3.4:6881"));
    CHECK(contains(out, "event=started"));
    CHECK(contains(out, "code=PeerStalled"));
    CHECK(contains(out, "piece=12"));
    CHECK(contains(out, "retries=1"));
    CHECK(contains(out, "interval=1800"));
    REQUIRE(!out.empty());
    CHECK(out.back() == '\n');
}

TEST_CASE("FileSink: appends lines atomically under mutex") {
    auto tmp = std::filesystem::temp_directory_path() / ("bitleech_log_" + std::to_string(::getpid()) + ".log");

    {
        FileSink sink(tmp.string());
        REQUIRE(sink.good());
        LogRecord a; a.level = LogLevel::info;  a.logger = "A"; a.msg = "first";
        LogRecord b; b.level = LogLevel::error; b.logger = "B"; b.msg = "second";
        sink.write(a);
        sink.write(b);
    }

    const std::string content = read_file(tmp);
    CHECK(contains(content, " [INFO] A: first"));
    CHECK(contains(content, " [ERROR] B: second"));

    std::error_code ec;
    std::filesystem::remove(tmp, ec);
}

TEST_CASE("formatRecord omits unset structured fields") {
    LogRecord rec;
    rec.msg = "plain";
    auto line = formatRecord(rec);
    CHECK(contains(line, "bitleech: plain"));
    CHECK_FALSE(contains(line, "piece="));
    CHECK_FALSE(contains(line, "peer="));
}
