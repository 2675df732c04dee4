#pragma once
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

namespace Tether {
namespace Core {

enum LogLevel {
    LOG_NONE  = 0,
    LOG_DEBUG = 1 << 0,
    LOG_INFO  = 1 << 1,
    LOG_WARN  = 1 << 2,
    LOG_ERROR = 1 << 3,
    LOG_ALL   = LOG_DEBUG | LOG_INFO | LOG_WARN | LOG_ERROR
};

class Logger {
public:
    static void set_level(int level);
    static int  level();

    // Redirects every level to one stream; nullptr restores stdout/stderr.
    static void set_output(std::ostream* out);

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    // "error" enables error only, "info" enables info and above, and so on.
    static std::optional<int> parse_level(const std::string& name);

private:
    static void write(int level, const char* color, const char* tag, const std::string& message);

    static int           level_;
    static std::ostream* output_;
    static std::mutex    mutex_;
};

}  // namespace Core
}  // namespace Tether
