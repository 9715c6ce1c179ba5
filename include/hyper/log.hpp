#ifndef HYPER_LOG_HPP
#define HYPER_LOG_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace hyper {

// =============================================================================
// Leveled Logger (process-wide, writes to std::cerr by default)
// =============================================================================

namespace log {

enum class Level : uint8_t {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    OFF = 5
};

using Sink = std::function<void(Level, const std::string&)>;

// "trace", "debug", "info", "warn", "error", "off"; throws std::invalid_argument otherwise
Level parse_level(std::string_view name);
const char* level_name(Level level);

void set_level(Level level);
Level level();

// Replaces the output sink; an empty sink restores std::cerr
void set_sink(Sink sink);

bool enabled(Level level);
void write(Level level, const std::string& message);

inline void trace(const std::string& m) { write(Level::TRACE, m); }
inline void debug(const std::string& m) { write(Level::DEBUG, m); }
inline void info(const std::string& m) { write(Level::INFO, m); }
inline void warn(const std::string& m) { write(Level::WARN, m); }
inline void error(const std::string& m) { write(Level::ERROR, m); }

} // namespace log

} // namespace hyper

#endif // HYPER_LOG_HPP
