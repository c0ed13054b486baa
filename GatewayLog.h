// GatewayLog.h
#pragma once

#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <cstdint>

enum class LogType {
    SYSTEM,  // Default, always show
    WARNING,
    FAILURE  // Mirrored to stderr
};

// --- Global Diagnostic Log ---
extern std::mutex g_log_mutex;
extern std::deque<std::string> g_logs;
extern const size_t g_log_max_lines; // Max log lines

void AddLog(const std::string& msg, LogType type = LogType::SYSTEM);

// Copies the diagnostic log (used by the dashboard "Diagnostics" tab).
// Returns the number of lines ever added, which keeps growing once the log is capped.
uint64_t GetLogs(std::vector<std::string>& logs);
void ClearLogs();

// --- Error Log File ---
// Every LogError() line is appended to this file as
// "YYYY-mm-dd HH:MM:SS - [ERROR] - <context>: <message>"
void InitErrorLog(const std::string& path);
void LogError(const std::string& context, const std::string& message);

// "HH:MM:SS" for the current local time
std::string CurrentTimeString();
