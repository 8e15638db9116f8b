/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "log.h"

#include <atomic>
#include <cstdio>

namespace nxm::log {
static std::atomic<bool> g_quiet{false};

static void vwrite(Level level, const char* fmt, va_list args) {
    FILE* f = stdout;
    const char* prefix = "";
    switch (level) {
        case Level::Info:
            if (g_quiet.load()) {
                return;
            }
            break;
        case Level::Warn:
            f = stderr;
            prefix = "[WARN] ";
            break;
        case Level::Error:
            f = stderr;
            prefix = "[ERROR] ";
            break;
    }
    std::fputs(prefix, f);
    std::vfprintf(f, fmt, args);
    std::fputc('\n', f);
    std::fflush(f);
}

void set_quiet(bool quiet) {
    g_quiet.store(quiet);
}

bool quiet() {
    return g_quiet.load();
}

void write(Level level, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(level, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(Level::Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(Level::Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(Level::Error, fmt, args);
    va_end(args);
}
}  // namespace nxm::log
