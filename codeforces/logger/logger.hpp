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

namespace codeforces::logger {

    enum class LogLevel : uint8_t { trace=0, debug=1, info=2, warn=3, error=4, none=255 };

    struct LogRecord
    {
        LogLevel level{LogLevel::info};
        std::chrono::system_clock::time_point ts{};
        std::string logger;        // e.g. "ApiClient"
        std::string msg;           // rendered text

        // Optional structured fields:
        std::string method;        // API method, e.g. "contest.list"
        std::string url;           // request URL (apiKey/apiSig redacted)
        std::string status;        // "OK|FAILED|transport|decode|invalid"
        int         httpStatus{-1};
        long long   elapsedMs{-1};
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

    // Keeps log lines apart from program output on stdout.
    class StderrSink : public ILoggerSink
    {
    public:
        void write(const LogRecord& rec) override;
    };

    class FileSink : public ILoggerSink
    {
    public:
        explicit FileSink(const std::string& path);
        void write(const LogRecord& rec) override;
    private:
        std::mutex mu_;
        std::ofstream out_;
    };

    // Renders "<ts> [LEVEL] logger: msg key=value..." without the trailing newline.
    std::string formatRecord(const LogRecord& rec);

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

    // Compile-time floor; records below it are never built.
    #ifndef CF_API_LOG_LEVEL
    #define CF_API_LOG_LEVEL codeforces::logger::LogLevel::info
    #endif

    #define CF_LOG_ENABLED(lvl) (static_cast<unsigned>(lvl) >= static_cast<unsigned>(CF_API_LOG_LEVEL))

    // Usage: CF_LOG(loggerPtr, LogLevel::debug) << "message " << x;
    #define CF_LOG(LOGGER_PTR, LVL) \
        if (!(LOGGER_PTR) || !CF_LOG_ENABLED(LVL)) ; \
        else ::codeforces::logger::detail::LogStreamHelper(*(LOGGER_PTR), (LVL), __FILE__, __LINE__, __func__).stream()

    namespace detail {
        class LogStreamHelper
        {
        public:
            LogStreamHelper(Logger& lg, LogLevel lvl, const char* /*file*/, int line, const char* fn)
            : lg_(lg) { ss_ << "[" << fn << ":" << line << "] "; rec_.level = lvl; }
            ~LogStreamHelper() {
                rec_.msg = ss_.str();
                rec_.logger = "codeforces";
                lg_.log(std::move(rec_));
            }
            std::ostream& stream() { return ss_; }
            LogRecord rec_;
        private:
            Logger& lg_;
            std::ostringstream ss_;
        };
    }

} // namespace codeforces::logger
