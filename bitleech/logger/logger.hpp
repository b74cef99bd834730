#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace bitleech::logger {

    enum class LogLevel : uint8_t { trace=0, debug=1, info=2, warn=3, error=4, none=255 };

    const char* levelName(LogLevel l) noexcept;

    struct LogRecord 
    {
        LogLevel level{LogLevel::info};
        std::chrono::system_clock::time_point ts{};
        std::string logger;        // e.g. "session", "pieces", "announce"
        std::string msg;           // rendered text
        
        // Optional structured fields:
        std::string url;           // tracker URL (redacted)
        std::string peer;          // ip:port
        std::string event;         // "started|completed|stopped|none"
        std::string code;          // ErrorCode name
        long long   piece{-1};
        int         retries{-1};
        int         interval{-1};
    };

    class ILoggerSink 
    {
    public:
        virtual ~ILoggerSink() = default;
        virtual void write(const LogRecord& rec) = 0;
    };

    class StdoutSink : public ILoggerSink 
    {
    public:
        void write(const LogRecord& rec) override;
    };

    class FileSink : public ILoggerSink 
    {
    public:
        explicit FileSink(const std::string& path);
        bool good() const { return out_.good(); }
        void write(const LogRecord& rec) override;
    private:
        std::mutex mu_;
        std::ofstream out_;
    };

    // Renders one line the way the stock sinks print it (no trailing newline).
    std::string formatRecord(const LogRecord& rec);

    // Masks every "key=value" occurrence up to the next '&' or whitespace.
    std::string redactQueryParam(std::string_view text, std::string_view key);

    class Logger 
    {
    public:
        using RedactorFn = std::function<std::string(std::string_view)>;

        explicit Logger(std::shared_ptr<ILoggerSink> sink = std::make_shared<StdoutSink>())
        : sink_(std::move(sink)) {}

        void setLevel(LogLevel lvl) { level_.store(lvl, std::memory_order_relaxed); }
        LogLevel level() const { return level_.load(std::memory_order_relaxed); }
        bool enabled(LogLevel lvl) const { return static_cast<unsigned>(lvl) >= static_cast<unsigned>(level()); }

        void setRedactor(RedactorFn r) { std::scoped_lock lk(mu_); redactor_ = std::move(r); }

        void log(LogRecord rec) {
            if (!enabled(rec.level)) return;
            rec.ts = std::chrono::system_clock::now();
            {
                std::scoped_lock lk(mu_);
                if (redactor_) {
                    rec.url = redactor_(rec.url);
                    rec.msg = redactor_(rec.msg);
                }
            }
            sink_->write(rec);
        }

        void trace(std::string msg, std::string logger = {}) { emit(LogLevel::trace, std::move(msg), std::move(logger)); }
        void debug(std::string msg, std::string logger = {}) { emit(LogLevel::debug, std::move(msg), std::move(logger)); }
        void info (std::string msg, std::string logger = {}) { emit(LogLevel::info , std::move(msg), std::move(logger)); }
        void warn (std::string msg, std::string logger = {}) { emit(LogLevel::warn , std::move(msg), std::move(logger)); }
        void error(std::string msg, std::string logger = {}) { emit(LogLevel::error, std::move(msg), std::move(logger)); }

    private:
        void emit(LogLevel lvl, std::string msg, std::string logger) {
            LogRecord rec;
            rec.level = lvl;
            rec.msg   = std::move(msg);
            rec.logger= std::move(logger);
            log(std::move(rec));
        }

        std::mutex mu_;
        std::shared_ptr<ILoggerSink> sink_;
        std::atomic<LogLevel> level_{LogLevel::info};
        RedactorFn redactor_;
    };

    // Compile-time floor; records below it never reach the runtime check.
    #ifndef BL_LOG_LEVEL
    #define BL_LOG_LEVEL bitleech::logger::LogLevel::debug
    #endif

    #define BL_LOG_ENABLED(lvl) (static_cast<unsigned>(lvl) >= static_cast<unsigned>(BL_LOG_LEVEL))

    // Usage: BL_LOG(loggerPtr, LogLevel::debug, "session") << "message " << x;
    #define BL_LOG(LOGGER_PTR, LVL, NAME) \
        if (!(LOGGER_PTR) || !BL_LOG_ENABLED(LVL) || !(LOGGER_PTR)->enabled(LVL)) ; \
        else ::bitleech::logger::detail::LogStreamHelper(*(LOGGER_PTR), (LVL), (NAME), __func__, __LINE__).stream()

    namespace detail {
        class LogStreamHelper 
        {
        public:
            LogStreamHelper(Logger& lg, LogLevel lvl, const char* name, const char* fn, int line)
            : lg_(lg) { ss_ << "[" << fn << ":" << line << "] "; rec_.level = lvl; rec_.logger = name; }
            ~LogStreamHelper() {
                rec_.msg = ss_.str();
                lg_.log(std::move(rec_));
            }
            std::ostream& stream() { return ss_; }
            LogRecord rec_;
        private:
            Logger& lg_;
            std::ostringstream ss_;
        };
    }

} // namespace bitleech::logger
