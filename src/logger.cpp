#include "logger.h"
#include "utils.h"
#include <iostream>
#include <fstream>
#include <mutex>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <ctime>

namespace domo_nlu {

namespace {

// "2026-03-01 12:00:00.123", local time
std::string format_timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // namespace

class Logger::Impl {
public:
    Impl(LogLevel min_level, const std::string& output_file, bool console_to_stderr)
        : min_level_(min_level), console_(console_to_stderr ? &std::cerr : &std::cout) {
        if (!output_file.empty()) {
            file_.open(output_file, std::ios::app);
            if (!file_.is_open()) {
                std::cerr << "Warning: cannot open log file " << output_file
                          << ", logging to console only" << std::endl;
            }
        }
    }

    void write(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < min_level_) {
            return;
        }

        // One insertion per line so records never split across worker threads
        std::string line = std::string("[") + Logger::level_string(level) + "] " +
                           format_timestamp() + ": " + message + "\n";

        std::ostream& console = (level >= LogLevel::ERROR) ? std::cerr : *console_;
        console << line;
        console.flush();

        if (file_.is_open()) {
            file_ << line;
            file_.flush();
        }
    }

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    LogLevel level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

private:
    mutable std::mutex mutex_;
    LogLevel min_level_;
    std::ostream* console_;
    std::ofstream file_;
};

std::unique_ptr<Logger::Impl> Logger::impl_ = nullptr;

void Logger::initialize(LogLevel min_level, const std::string& output_file, bool console_to_stderr) {
    if (!impl_) {
        impl_ = std::make_unique<Impl>(min_level, output_file, console_to_stderr);
    }
}

void Logger::shutdown() {
    impl_.reset();
}

void Logger::log(LogLevel level, const std::string& message) {
    if (impl_) {
        impl_->write(level, message);
        return;
    }
    // Not initialized: stdout belongs to interpretation results
    if (level >= LogLevel::WARN) {
        std::cerr << "[" << level_string(level) << "] " << message << std::endl;
    }
}

const char* Logger::level_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?????";
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::set_level(LogLevel level) {
    if (impl_) {
        impl_->set_level(level);
    }
}

LogLevel Logger::get_level() {
    return impl_ ? impl_->level() : LogLevel::INFO;
}

LogLevel Logger::parse_level(const std::string& name, LogLevel fallback) {
    std::string n = utils::lower_copy(utils::trim_copy(name));
    if (n == "debug") return LogLevel::DEBUG;
    if (n == "info") return LogLevel::INFO;
    if (n == "warn" || n == "warning") return LogLevel::WARN;
    if (n == "error") return LogLevel::ERROR;
    return fallback;
}

} // namespace domo_nlu
