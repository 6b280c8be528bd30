#pragma once

#ifndef DEBUG_WATARU
#define DEBUG_WATARU 1  // Set to 0 to disable debug prints
#endif

#if DEBUG_WATARU
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#define WATARU_DEBUG(msg) do { \
    auto now = std::chrono::system_clock::now(); \
    auto time = std::chrono::system_clock::to_time_t(now); \
    std::tm tm = *std::localtime(&time); \
    std::ostringstream oss; \
    oss << "[C++ " << std::put_time(&tm, "%H:%M:%S") << "] " << msg << std::endl; \
    std::cout << oss.str() << std::flush; \
} while(0)
#else
#define WATARU_DEBUG(msg) do { } while(0)
#endif
