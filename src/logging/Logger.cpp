//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger static members, sinks and environment setup.
//==========================================================================================================

#include "logging/Logger.h"

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "env/EnvVars.h"

// Define static members
LogLevel Logger::sLogLevel = LogLevel::LOG_INFO_LEVEL;
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;

LogLevel Logger::levelFromString(const std::string& lvl) {
    std::string s;
    s.reserve(lvl.size());
    for (char c : lvl) {
        s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
    }
    if (s == "DEBUG") return LogLevel::LOG_DEBUG_LEVEL;
    if (s == "INFO")  return LogLevel::LOG_INFO_LEVEL;
    if (s == "WARN" || s == "WARNING")  return LogLevel::LOG_WARN_LEVEL;
    if (s == "ERROR") return LogLevel::LOG_ERROR_LEVEL;
    if (s == "FATAL") return LogLevel::LOG_FATAL_LEVEL;
    return LogLevel::LOG_INFO_LEVEL;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::LOG_DEBUG_LEVEL: return "DEBUG";
        case LogLevel::LOG_INFO_LEVEL: return "INFO";
        case LogLevel::LOG_WARN_LEVEL: return "WARN";
        case LogLevel::LOG_ERROR_LEVEL: return "ERROR";
        case LogLevel::LOG_FATAL_LEVEL: return "FATAL";
    }
    return "INFO";
}

bool Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) {
        sLogFile.close();
    }
    if (filePath.empty()) {
        return true;
    }
    sLogFile.open(filePath, std::ios::out | std::ios::app);
    if (!sLogFile.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
        return false;
    }
    auto now = std::chrono::system_clock::now();
    std::time_t now_time = std::chrono::system_clock::to_time_t(now);
    std::tm buf{};
    ::localtime_r(&now_time, &buf);
    sLogFile << "\n=== mcpgw log opened at " << std::put_time(&buf, "%Y-%m-%d %H:%M:%S") << " ===\n";
    sLogFile.flush();
    return true;
}

void Logger::initFromEnvironment() {
    setLogLevelFromString(GetEnvOrDefault("MCPGW_LOG_LEVEL", "INFO"));
    const std::string file = GetEnvOrDefault("MCPGW_LOG_FILE", "");
    if (!file.empty()) {
        (void)setLogFile(file);
    }
}

void Logger::log(const char* level, const std::string& msg, const char* file, unsigned int line) {
    // Label colorization controlled by MCPGW_LOG_COLOR
    static const bool colorEnabled = []() {
        const std::string v = GetEnvOrDefault("MCPGW_LOG_COLOR", "0");
        return (v == "1" || v == "true" || v == "TRUE");
    }();
    const char* reset = colorEnabled ? "\033[0m" : "";
    const char* labelColor = "";
    if (colorEnabled) {
        if (::strncmp(level, "ERROR", 5) == 0 || ::strncmp(level, "FATAL", 5) == 0) {
            labelColor = "\033[31m";
        } else if (::strncmp(level, "WARN", 4) == 0) {
            labelColor = "\033[33m";
        } else {
            labelColor = "\033[36m";
        }
    }

    // Basename only; full build paths add nothing to gateway logs
    const char* slash = std::strrchr(file, '/');
    const char* shortFile = slash != nullptr ? slash + 1 : file;

    auto now = std::chrono::system_clock::now();
    std::time_t now_time = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tmBuf{};
    ::gmtime_r(&now_time, &tmBuf);

    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << "Z ";
    oss << "[" << labelColor << level << reset << "] " << shortFile << ":" << line << ": " << msg << '\n';
    const std::string logMessage = oss.str();

    std::lock_guard<std::mutex> lock(sLogMutex);
    // Gateway output goes to stderr so stdout stays free for process supervisors
    std::cerr << logMessage;
    if (sLogFile.is_open()) {
        sLogFile << logMessage;
        sLogFile.flush();
    }
}
