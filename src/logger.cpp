// =============================================================================
// logger.cpp - Timestamped Line Logger
// =============================================================================

#include "flashx/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace flashx {

std::unique_ptr<Logger> Logger::instance_;
std::mutex Logger::instance_mutex_;

namespace {

std::string now_to_string() {
    auto tp = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return std::string(buf);
}

} // namespace

void Logger::Initialize(const std::string& path, LogLevel min_level) {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    instance_.reset(new Logger());
    instance_->min_level_ = min_level;
    if (path.empty()) {
        instance_->to_stderr_ = true;
        return;
    }
    instance_->log_file_.open(path, std::ios::out | std::ios::app);
    if (!instance_->log_file_.is_open()) {
        instance_.reset();
        throw std::runtime_error("Cannot open log file: " + path);
    }
}

void Logger::Shutdown() {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    if (!instance_) return;
    if (instance_->log_file_.is_open()) instance_->log_file_.close();
    instance_.reset();
}

bool Logger::IsEnabled(LogLevel level) {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    return instance_ && level >= instance_->min_level_;
}

void Logger::Log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    if (!instance_) return;
    if (level < instance_->min_level_) return;

    std::ostringstream oss;
    oss << now_to_string() << " [" << LevelToString(level) << "]"
        << " (" << std::this_thread::get_id() << ") " << message << '\n';

    if (instance_->to_stderr_) {
        std::cerr << oss.str();
    } else {
        instance_->log_file_ << oss.str();
        instance_->log_file_.flush();
    }
}

LogLevel Logger::ParseLevel(const std::string& name) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "debug") return LogLevel::DEBUG;
    if (s == "info") return LogLevel::INFO;
    if (s == "warn" || s == "warning") return LogLevel::WARNING;
    if (s == "error") return LogLevel::ERROR;
    if (s == "critical") return LogLevel::CRITICAL;
    throw std::invalid_argument("unknown log level: " + name);
}

const char* Logger::LevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
    }
    return "UNK";
}

} // namespace flashx
