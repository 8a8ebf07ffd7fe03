// tracker_log.hpp
#ifndef PRESENCEFILTER_TRACKER_LOG_HPP_
#define PRESENCEFILTER_TRACKER_LOG_HPP_

#include <atomic>   // For std::atomic
#include <iostream> // For std::cerr, std::ostream
#include <mutex>    // For std::mutex, std::lock_guard
#include <sstream>  // For std::ostringstream
#include <string>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    OFF
};

/**
 * @brief Minimal leveled logger writing one line per message to a stream (std::cerr by default).
 *
 * Messages are composed from stream-insertable arguments:
 *   log.warning("device ", id, " dropped: ", reason);
 * Writes are serialized so lines from producer threads and the tick never interleave.
 */
class TrackerLog {
public:
    explicit TrackerLog(LogLevel min_level = LogLevel::WARNING, std::ostream* out = &std::cerr)
        : min_level_(min_level), out_(out) {}

    void setLevel(LogLevel level) { min_level_ = level; }
    LogLevel level() const { return min_level_; }

    // Redirects output; nullptr silences the logger.
    void setStream(std::ostream* out) {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = out;
    }

    bool enabled(LogLevel level) const {
        return level != LogLevel::OFF && level >= min_level_;
    }

    template<typename... Args>
    void debug(const Args&... args) { write(LogLevel::DEBUG, args...); }

    template<typename... Args>
    void info(const Args&... args) { write(LogLevel::INFO, args...); }

    template<typename... Args>
    void warning(const Args&... args) { write(LogLevel::WARNING, args...); }

    template<typename... Args>
    void error(const Args&... args) { write(LogLevel::ERROR, args...); }

private:
    static const char* prefix(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "[presencefilter] DEBUG: ";
            case LogLevel::INFO: return "[presencefilter] INFO: ";
            case LogLevel::WARNING: return "[presencefilter] WARNING: ";
            case LogLevel::ERROR: return "[presencefilter] ERROR: ";
            case LogLevel::OFF: break;
        }
        return "";
    }

    template<typename... Args>
    void write(LogLevel level, const Args&... args) {
        if (!enabled(level)) return;
        std::ostringstream line;
        line << prefix(level);
        (line << ... << args); // C++17 fold
        std::lock_guard<std::mutex> lock(mutex_);
        if (out_ != nullptr) {
            *out_ << line.str() << std::endl;
        }
    }

    std::atomic<LogLevel> min_level_;
    std::ostream* out_;
    std::mutex mutex_;
};

#endif // PRESENCEFILTER_TRACKER_LOG_HPP_
