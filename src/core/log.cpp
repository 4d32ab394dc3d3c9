#include "log.hpp"
#include <chrono>
#include <ctime>
#include <deque>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace pcash {

namespace {

std::deque<std::string> system_logs;
std::mutex log_mutex;
size_t log_capacity = 200;
int log_threshold = 1;
bool log_console = true;

int level_rank(const std::string& level) {
    if (level == "DEBUG") return 0;
    if (level == "WARN") return 2;
    if (level == "ERROR") return 3;
    if (level == "FATAL") return 4;
    return 1;
}

} // namespace

void pcash_log(const std::string& level, const std::string& message) {
    const int rank = level_rank(level);

    std::lock_guard<std::mutex> lock(log_mutex);
    if (rank < log_threshold) return;

    while (!system_logs.empty() && system_logs.size() >= log_capacity) {
        system_logs.pop_front();
    }

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local_tm{};
    localtime_r(&now, &local_tm);
    std::stringstream ss;
    ss << std::put_time(&local_tm, "%H:%M:%S");

    std::string log_entry = "[" + ss.str() + "] [" + level + "] " + message;
    if (log_capacity > 0) system_logs.push_back(log_entry);

    if (!log_console) return;
    // stdout belongs to command replies and stdout sinks.
    if (rank >= 2) {
        std::cerr << log_entry << std::endl;
    } else {
        std::clog << log_entry << std::endl;
    }
}

void set_log_level(const std::string& level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_threshold = level_rank(level);
}

void set_log_capacity(size_t capacity) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_capacity = capacity;
    while (system_logs.size() > log_capacity) {
        system_logs.pop_front();
    }
}

void set_log_console(bool enabled) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_console = enabled;
}

std::vector<std::string> recent_logs() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return std::vector<std::string>(system_logs.begin(), system_logs.end());
}

} // namespace pcash
