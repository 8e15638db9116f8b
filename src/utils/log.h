/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdarg>

namespace nxm::log {
enum class Level {
    Info,
    Warn,
    Error,
};

// Info lines are dropped while quiet; warnings and errors always print.
void set_quiet(bool quiet);
bool quiet();

void write(Level level, const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);
}  // namespace nxm::log

#define NXM_LOG_INFO(fmt, ...) ::nxm::log::info(fmt, ##__VA_ARGS__)
#define NXM_LOG_WARN(fmt, ...) ::nxm::log::warn(fmt, ##__VA_ARGS__)
#define NXM_LOG_ERROR(fmt, ...) ::nxm::log::error(fmt, ##__VA_ARGS__)
