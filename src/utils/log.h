/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdarg>

namespace lyn::log {
void set_debug(bool enabled);
bool debug_enabled();

void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);
}  // namespace lyn::log

#define LYN_LOG_DEBUG(fmt, ...) ::lyn::log::debug(fmt, ##__VA_ARGS__)
#define LYN_LOG_INFO(fmt, ...) ::lyn::log::info(fmt, ##__VA_ARGS__)
#define LYN_LOG_WARN(fmt, ...) ::lyn::log::warn(fmt, ##__VA_ARGS__)
#define LYN_LOG_ERROR(fmt, ...) ::lyn::log::error(fmt, ##__VA_ARGS__)
