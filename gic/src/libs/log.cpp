#include <stdarg.h>
#include <stdio.h>
#include "arch.hpp"
#include "libs/log.hpp"

namespace gic {
namespace __details {
namespace {
constexpr const char* RESET = "\033[0m";

struct LevelStyle {
    const char* tag;
    const char* color;
};

// Indexed by LogLevel.
constexpr LevelStyle STYLES[] = {
    {"DBG", "\033[90m"},  // grey
    {"INF", "\033[37m"},  // white
    {"WRN", "\033[33m"},  // yellow
    {"ERR", "\033[31m"},  // red
    {"FTL", "\033[35m"},  // magenta
};

constexpr LevelStyle PANIC_STYLE = {"PANIC", "\033[35m"};

void emit(const LevelStyle& style, const char* file, int line, const char* format,
          va_list args) {
    printf("%s[%s] (%s:%d) ", style.color, style.tag, file, line);
    vprintf(format, args);
    printf("%s\n", RESET);
}
}  // namespace

const char* Logger::level_to_string(LogLevel level) {
    const size_t index = static_cast<size_t>(level);
    return index < sizeof(STYLES) / sizeof(STYLES[0]) ? STYLES[index].tag : "?";
}

const char* Logger::level_to_color(LogLevel level) {
    const size_t index = static_cast<size_t>(level);
    return index < sizeof(STYLES) / sizeof(STYLES[0]) ? STYLES[index].color : RESET;
}

void Logger::log(LogLevel level, const char* file, int line, const char* format, ...) {
    const LevelStyle style = {level_to_string(level), level_to_color(level)};

    va_list args;
    va_start(args, format);
    emit(style, file, line, format, args);
    va_end(args);
}

void Logger::panic(const char* file, int line, const char* format, ...) {
    va_list args;
    va_start(args, format);
    emit(PANIC_STYLE, file, line, format, args);
    va_end(args);

    arch::halt(false);
}
}  // namespace __details
}  // namespace gic
