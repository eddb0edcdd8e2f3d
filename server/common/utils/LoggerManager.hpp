#pragma once

namespace fs = std::filesystem;

/**
 * @brief trantor::AsyncFileLogger that starts a new file every day
 *
 * File: <dir>/<prefix>_YYYY-MM-DD.log, split again past 100MB.
 * write() may be called from any thread.
 */
class DailyLogFile {
public:
    static constexpr uint64_t FILE_SIZE_LIMIT = 100 * 1024 * 1024;

    DailyLogFile(std::string dir, std::string prefix) : dir_(std::move(dir)), prefix_(std::move(prefix)) {
        int today = todayInt();
        day_.store(today, std::memory_order_relaxed);
        logger_ = open(today);
    }

    DailyLogFile(const DailyLogFile&) = delete;
    DailyLogFile& operator=(const DailyLogFile&) = delete;

    void write(const std::string& line) {
        int today = todayInt();
        if (today != day_.load(std::memory_order_relaxed)) {
            rotate(today);
        }
        std::shared_lock lock(mutex_);
        if (logger_) logger_->output(line.c_str(), line.size());
    }

    void flush() {
        std::shared_lock lock(mutex_);
        if (logger_) logger_->flush();
    }

    void close() {
        std::unique_lock lock(mutex_);
        logger_.reset();
    }

    const std::string& prefix() const { return prefix_; }

    /** YYYYMMDD, cheap to compare */
    static int todayInt() {
        auto now = std::chrono::system_clock::now();
        std::chrono::year_month_day ymd{std::chrono::floor<std::chrono::days>(now)};
        return static_cast<int>(ymd.year()) * 10000
             + static_cast<int>(static_cast<unsigned>(ymd.month())) * 100
             + static_cast<int>(static_cast<unsigned>(ymd.day()));
    }

    static std::string dayToStr(int day) {
        char buf[11];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", day / 10000, day % 10000 / 100, day % 100);
        return buf;
    }

private:
    std::string dir_;
    std::string prefix_;
    std::unique_ptr<trantor::AsyncFileLogger> logger_;
    std::shared_mutex mutex_;
    std::atomic<int> day_{0};

    std::unique_ptr<trantor::AsyncFileLogger> open(int day) const {
        auto logger = std::make_unique<trantor::AsyncFileLogger>();
        logger->setFileName(dir_ + "/" + prefix_ + "_" + dayToStr(day));
        logger->setFileSizeLimit(FILE_SIZE_LIMIT);
        logger->startLogging();
        return logger;
    }

    void rotate(int today) {
        std::unique_ptr<trantor::AsyncFileLogger> previous;
        std::unique_lock lock(mutex_);
        if (today == day_.load(std::memory_order_relaxed) || !logger_) return;
        previous = std::move(logger_);
        logger_ = open(today);
        day_.store(today, std::memory_order_relaxed);
        lock.unlock();
        // previous flushes on destruction, outside the lock
    }
};

/**
 * @brief Process logging: trantor output goes to logs/plc-bridge_*.log
 *
 * A second daily file, logs/plc-bridge-events_*.log, receives the audit
 * trail as JSON lines (see FileEventSink).
 */
class LoggerManager {
public:
    /**
     * @brief Install the file logger as trantor's output
     * @param logDir log directory, created if missing
     */
    static void initialize(const std::string& logDir) {
        fs::create_directories(logDir);
        {
            std::unique_lock lock(filesMutex_);
            mainLog_ = std::make_unique<DailyLogFile>(logDir, "plc-bridge");
            auditLog_ = std::make_unique<DailyLogFile>(logDir, "plc-bridge-events");
        }

        trantor::Logger::setDisplayLocalTime(true);
        trantor::Logger::setOutputFunction(output, flush);
        trantor::Logger::setLogLevel(trantor::Logger::kInfo);
    }

    /**
     * @brief Set the log level by name (TRACE/DEBUG/INFO/WARN/ERROR/FATAL, case-insensitive)
     * @return false when the name is not a level; the current level stays
     */
    static bool setLogLevel(std::string level) {
        static const std::map<std::string, trantor::Logger::LogLevel> levels = {
            {"TRACE", trantor::Logger::kTrace},
            {"DEBUG", trantor::Logger::kDebug},
            {"INFO", trantor::Logger::kInfo},
            {"WARN", trantor::Logger::kWarn},
            {"ERROR", trantor::Logger::kError},
            {"FATAL", trantor::Logger::kFatal},
        };
        std::transform(level.begin(), level.end(), level.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        auto it = levels.find(level);
        if (it == levels.end()) return false;
        trantor::Logger::setLogLevel(it->second);
        return true;
    }

    /** Mirror every log line to stdout as well */
    static void setConsoleEcho(bool enabled) {
        consoleEcho_.store(enabled, std::memory_order_relaxed);
    }

    /** Audit file, nullptr before initialize() and after close() */
    static DailyLogFile* auditLog() {
        std::shared_lock lock(filesMutex_);
        return auditLog_.get();
    }

    static void close() {
        std::unique_lock lock(filesMutex_);
        mainLog_.reset();
        auditLog_.reset();
    }

    /**
     * @brief Shorten a trantor log line
     *
     * "20250101 08:00:00.123456 4242 INFO  [operator ()] msg - Bridge.hpp:10"
     * becomes "2025-01-01 08:00:00 4242 INFO  msg". Lines in another shape pass through.
     */
    static std::string formatLogMessage(const char* msg, uint64_t len) {
        std::string line(msg, len);
        if (len < 17 || line[8] != ' ') return line;

        size_t timeEnd = line.find(' ', 9);
        if (timeEnd == std::string::npos || timeEnd <= 15) return line;
        std::string rest = line.substr(timeEnd);

        // lambdas report their function as [operator ()]
        size_t op = rest.find("[operator ()");
        if (op != std::string::npos) {
            size_t close = rest.find("] ", op);
            if (close != std::string::npos) rest.erase(op, close + 2 - op);
        }

        size_t source = rest.rfind(" - ");
        if (source != std::string::npos) {
            auto where = std::string_view(rest).substr(source + 3);
            if (where.find(".cpp:") != std::string_view::npos || where.find(".hpp:") != std::string_view::npos) {
                rest.resize(source);
                rest += "\n";
            }
        }

        std::string out;
        out.reserve(rest.size() + 19);
        out.append(line, 0, 4).append("-").append(line, 4, 2).append("-").append(line, 6, 2);
        out.append(" ").append(line, 9, 8).append(rest);
        return out;
    }

private:
    inline static std::shared_mutex filesMutex_;
    inline static std::unique_ptr<DailyLogFile> mainLog_;
    inline static std::unique_ptr<DailyLogFile> auditLog_;
    inline static std::atomic<bool> consoleEcho_{false};

    static void output(const char* msg, const uint64_t len) {
        std::string line = formatLogMessage(msg, len);
        if (consoleEcho_.load(std::memory_order_relaxed)) {
            std::cout << line << std::flush;
        }
        std::shared_lock lock(filesMutex_);
        if (mainLog_) mainLog_->write(line);
    }

    static void flush() {
        std::shared_lock lock(filesMutex_);
        if (mainLog_) mainLog_->flush();
        if (auditLog_) auditLog_->flush();
    }
};
