#include "logger.hpp"
#include <iostream>

namespace Tether {
namespace Core {

int Logger::level_ = LOG_INFO | LOG_WARN | LOG_ERROR;

std::ostream* Logger::output_ = nullptr;

std::mutex Logger::mutex_;

namespace {
const char* RESET  = "\033[0m";
const char* RED    = "\033[31m";
const char* YELLOW = "\033[33m";
const char* BLUE   = "\033[34m";
const char* GRAY   = "\033[90m";
}  // namespace

void Logger::set_level(int level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

int Logger::level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::set_output(std::ostream* out) {
    std::lock_guard<std::mutex> lock(mutex_);
    output_ = out;
}

void Logger::write(int level, const char* color, const char* tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!(level_ & level))
        return;

    if (output_) {
        *output_ << tag << " " << message << std::endl;
        return;
    }
    std::ostream& out = (level & (LOG_WARN | LOG_ERROR)) ? std::cerr : std::cout;
    out << color << tag << " " << RESET << message << std::endl;
}

void Logger::debug(const std::string& message) {
    write(LOG_DEBUG, GRAY, "[DEBUG]", message);
}

void Logger::info(const std::string& message) {
    write(LOG_INFO, BLUE, "[INFO]", message);
}

void Logger::warn(const std::string& message) {
    write(LOG_WARN, YELLOW, "[WARN]", message);
}

void Logger::error(const std::string& message) {
    write(LOG_ERROR, RED, "[ERROR]", message);
}

std::optional<int> Logger::parse_level(const std::string& name) {
    if (name == "none")
        return LOG_NONE;
    if (name == "error")
        return LOG_ERROR;
    if (name == "warn")
        return LOG_WARN | LOG_ERROR;
    if (name == "info")
        return LOG_INFO | LOG_WARN | LOG_ERROR;
    if (name == "debug" || name == "all")
        return LOG_ALL;
    return std::nullopt;
}

}  // namespace Core
}  // namespace Tether
