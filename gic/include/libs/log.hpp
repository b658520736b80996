#pragma once

#include <cstdint>

// All macros take a printf-style format. LOG_DEBUG compiles to nothing
// unless GIC_DEBUG is defined.
#define GIC_LOG(level, fmt, ...)                                               \
    gic::__details::Logger::log(gic::__details::LogLevel::level, __FILE_NAME__, \
                                __LINE__, fmt, ##__VA_ARGS__)

#ifdef GIC_DEBUG
#define LOG_DEBUG(fmt, ...) GIC_LOG(Debug, fmt, ##__VA_ARGS__)
#else
#define LOG_DEBUG(fmt, ...) static_cast<void>(0)
#endif

#define LOG_INFO(fmt, ...)  GIC_LOG(Info, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  GIC_LOG(Warning, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) GIC_LOG(Error, fmt, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) GIC_LOG(Fatal, fmt, ##__VA_ARGS__)

/// Log and halt the calling core. Never returns.
#define PANIC(fmt, ...) gic::__details::Logger::panic(__FILE_NAME__, __LINE__, fmt, ##__VA_ARGS__)

namespace gic {
namespace __details {
enum class LogLevel : uint8_t { Debug = 0, Info, Warning, Error, Fatal };

class Logger {
   public:
    static void log(LogLevel level, const char* file, int line, const char* format, ...)
        __attribute__((format(printf, 4, 5)));
    [[noreturn]] static void panic(const char* file, int line, const char* format, ...)
        __attribute__((format(printf, 3, 4)));

   private:
    static const char* level_to_string(LogLevel level);
    static const char* level_to_color(LogLevel level);
};
}  // namespace __details
}  // namespace gic
