/**
 * PCash: Plasma Cash Core - System Log
 * Purpose: Timestamped process log with a bounded in-memory history.
 */

#ifndef PCASH_LOG_HPP
#define PCASH_LOG_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace pcash {

/**
 * pcash_log
 * Writes "[HH:MM:SS] [LEVEL] message" to std::clog (std::cerr for WARN and
 * above), never to stdout, and keeps it in the ring buffer returned by
 * recent_logs().
 * Levels: DEBUG, INFO, WARN, ERROR, FATAL. Unknown levels are treated as INFO.
 */
void pcash_log(const std::string& level, const std::string& message);

// Entries below this level are dropped entirely. Default: INFO.
void set_log_level(const std::string& level);

// Ring buffer size. Default: 200. Shrinking discards the oldest entries.
void set_log_capacity(size_t capacity);

// Mutes console output; the ring buffer still records. Used by tests.
void set_log_console(bool enabled);

std::vector<std::string> recent_logs();

} // namespace pcash

#endif
