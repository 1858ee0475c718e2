/**
 * Seedhound Logger
 *
 * File-based logging for long unattended recovery runs.
 * Logs to ~/.seedhound/seedhound.log (or a configured directory) with
 * millisecond timestamps and size-based rotation.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>

namespace seedhound {

class Logger {
public:
    enum class Level {
        DEBUG,
        INFO,
        WARN,
        ERR,    // Named ERR to avoid Windows ERROR macro conflict
        FATAL
    };

    static constexpr uintmax_t ROTATE_BYTES = 10 * 1024 * 1024;

    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    bool init(const std::string& log_dir = "") {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string dir = log_dir;
        if (dir.empty()) {
            const char* home = std::getenv("HOME");
            dir = home ? std::string(home) + "/.seedhound" : ".";
        }

        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return false;
        }

        log_path_ = dir + "/seedhound.log";

        // Rotate when too large; a failed rotation just keeps appending
        if (std::filesystem::exists(log_path_, ec) &&
            std::filesystem::file_size(log_path_, ec) > ROTATE_BYTES && !ec) {
            std::string backup = log_path_ + ".old";
            std::filesystem::remove(backup, ec);
            std::filesystem::rename(log_path_, backup, ec);
        }

        if (log_file_.is_open()) {
            log_file_.close();
        }
        log_file_.open(log_path_, std::ios::app);
        if (!log_file_.is_open()) {
            return false;
        }

        initialized_ = true;

        // Write directly: we already hold the mutex
        log_file_ << timestamp() << " [INFO ] === Seedhound Logger Started ===\n";
        log_file_.flush();
        return true;
    }

    void set_min_level(Level level) { min_level_ = level; }

    void log(Level level, const std::string& message) {
        if (!initialized_ || level < min_level_) return;

        std::lock_guard<std::mutex> lock(mutex_);
        log_file_ << timestamp() << " [" << level_str(level) << "] " << message << "\n";
        log_file_.flush();  // Always flush so a crash leaves the tail on disk
    }

    void log_startup(const std::string& mode, const std::string& oracle,
                     const std::string& space_size, const std::string& fingerprint) {
        std::stringstream ss;
        ss << "STARTUP: Mode=" << mode << ", Oracle=" << oracle
           << ", Candidates=" << space_size << ", Fingerprint=" << fingerprint;
        log(Level::INFO, ss.str());
    }

    void log_worker_range(size_t driver, const std::string& start, const std::string& end,
                          const std::string& cursor) {
        std::stringstream ss;
        ss << "RANGE: Driver=" << driver << ", Start=" << start << ", End=" << end
           << ", Cursor=" << cursor;
        log(Level::INFO, ss.str());
    }

    void log_progress(const std::string& tested, double rate, double percent) {
        std::stringstream ss;
        ss << "PROGRESS: Tested=" << tested
           << " (" << std::fixed << std::setprecision(1) << rate << " /s)"
           << ", Done=" << std::setprecision(3) << percent << "%";
        log(Level::INFO, ss.str());
    }

    void log_checkpoint_save(const std::string& path, const std::string& cursor) {
        log(Level::DEBUG, "CHECKPOINT_SAVE: Path=" + path + ", Cursor=" + cursor);
    }

    void log_found(size_t driver, const std::string& ordinal) {
        // The recovered secret itself is never written to the log file
        std::stringstream ss;
        ss << "FOUND: Driver=" << driver << ", Ordinal=" << ordinal;
        log(Level::INFO, ss.str());
    }

    void log_shutdown(const std::string& reason, const std::string& tested, double elapsed_sec) {
        std::stringstream ss;
        ss << "SHUTDOWN: Reason=" << reason
           << ", Tested=" << tested
           << ", ElapsedSec=" << std::fixed << std::setprecision(1) << elapsed_sec;
        log(Level::INFO, ss.str());
    }

    void log_error(const std::string& error_msg) {
        log(Level::ERR, "ERROR: " + error_msg);
    }

    std::string get_log_path() const { return log_path_; }

    ~Logger() {
        if (initialized_) {
            log(Level::INFO, "=== Seedhound Logger Stopped ===");
            log_file_.close();
        }
    }

private:
    Logger() : initialized_(false) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    static std::string timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&time_t, &tm_buf);

        std::stringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
           << "." << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    static const char* level_str(Level level) {
        switch (level) {
            case Level::DEBUG: return "DEBUG";
            case Level::INFO:  return "INFO ";
            case Level::WARN:  return "WARN ";
            case Level::ERR:   return "ERROR";
            case Level::FATAL: return "FATAL";
            default: return "?????";
        }
    }

    bool initialized_;
    Level min_level_ = Level::INFO;
    std::string log_path_;
    std::ofstream log_file_;
    std::mutex mutex_;
};

// Convenience macros
#define LOG_INFO(msg)  seedhound::Logger::instance().log(seedhound::Logger::Level::INFO, msg)
#define LOG_WARN(msg)  seedhound::Logger::instance().log(seedhound::Logger::Level::WARN, msg)
#define LOG_ERROR(msg) seedhound::Logger::instance().log(seedhound::Logger::Level::ERR, msg)
#define LOG_DEBUG(msg) seedhound::Logger::instance().log(seedhound::Logger::Level::DEBUG, msg)

}  // namespace seedhound
