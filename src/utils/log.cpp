/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "log.h"

#include <atomic>
#include <cstdio>

namespace {
std::atomic<bool> g_debug{false};

// stdout carries the normalized document, so every level goes to stderr.
void vprint(const char* prefix, const char* fmt, va_list args) {
    std::fputs(prefix, stderr);
    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
    std::fflush(stderr);
}
}  // namespace

namespace lyn::log {
void set_debug(bool enabled) {
    g_debug.store(enabled);
}

bool debug_enabled() {
    return g_debug.load();
}

void debug(const char* fmt, ...) {
    if (!debug_enabled()) {
        return;
    }
    va_list args;
    va_start(args, fmt);
    vprint("[DEBUG] ", fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vprint("", fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vprint("[WARN] ", fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vprint("[ERROR] ", fmt, args);
    va_end(args);
}
}  // namespace lyn::log
