#include "GatewayLog.h"

#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <ctime>

// --- Global Logging System ---
std::mutex g_log_mutex;
std::deque<std::string> g_logs;
const size_t g_log_max_lines = 1000; // Max log lines
static uint64_t s_log_sequence = 0; // Guarded by g_log_mutex

namespace {
std::mutex s_error_log_mutex;
std::string s_error_log_path;

std::tm LocalTimeNow() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf; // Structure to hold the time
#ifdef _WIN32
    localtime_s(&tm_buf, &in_time_t);
#else
    localtime_r(&in_time_t, &tm_buf);
#endif
    return tm_buf;
}
} // namespace

std::string CurrentTimeString() {
    std::tm tm_buf = LocalTimeNow();
    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%H:%M:%S");
    return ss.str();
}

void AddLog(const std::string& msg, LogType type) {
    std::string line = "[" + CurrentTimeString() + "] " + msg;
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (type == LogType::FAILURE) {
        std::cerr << line << std::endl;
    }
    else {
        std::cout << line << std::endl;
    }
    g_logs.push_back(std::move(line));
    s_log_sequence++;
    if (g_logs.size() > g_log_max_lines) {
        g_logs.pop_front();
    }
}

uint64_t GetLogs(std::vector<std::string>& logs) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    logs.assign(g_logs.begin(), g_logs.end());
    return s_log_sequence;
}

void ClearLogs() {
    {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        g_logs.clear();
    }
    AddLog("Log cleared.");
}

void InitErrorLog(const std::string& path) {
    std::lock_guard<std::mutex> lock(s_error_log_mutex);
    s_error_log_path = path;
}

void LogError(const std::string& context, const std::string& message) {
    const std::string full_msg = context + ": " + message;
    AddLog("[ERROR] " + full_msg, LogType::FAILURE);

    std::lock_guard<std::mutex> lock(s_error_log_mutex);
    if (s_error_log_path.empty()) return;

    std::ofstream out(s_error_log_path, std::ios::app);
    if (!out) {
        std::cerr << "Cannot open error log " << s_error_log_path << std::endl;
        return;
    }
    std::tm tm_buf = LocalTimeNow();
    out << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << " - [ERROR] - " << full_msg << '\n';
}
