/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdarg>

namespace atp::log {
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);
}  // namespace atp::log

#define ATP_LOG_INFO(fmt, ...) ::atp::log::info(fmt, ##__VA_ARGS__)
#define ATP_LOG_WARN(fmt, ...) ::atp::log::warn(fmt, ##__VA_ARGS__)
#define ATP_LOG_ERROR(fmt, ...) ::atp::log::error(fmt, ##__VA_ARGS__)
