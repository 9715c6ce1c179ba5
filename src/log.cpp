// =============================================================================
// log.cpp - Leveled logger
// =============================================================================

#include "hyper/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace hyper {
namespace log {

namespace {

std::atomic<Level> g_level{Level::INFO};
std::mutex g_sink_mutex;
Sink g_sink;

}  // namespace

Level parse_level(std::string_view name) {
    if (name == "trace") return Level::TRACE;
    if (name == "debug") return Level::DEBUG;
    if (name == "info") return Level::INFO;
    if (name == "warn" || name == "warning") return Level::WARN;
    if (name == "error") return Level::ERROR;
    if (name == "off") return Level::OFF;
    throw std::invalid_argument("Unknown log level: " + std::string(name));
}

const char* level_name(Level level) {
    switch (level) {
        case Level::TRACE: return "TRACE";
        case Level::DEBUG: return "DEBUG";
        case Level::INFO: return "INFO";
        case Level::WARN: return "WARN";
        case Level::ERROR: return "ERROR";
        case Level::OFF: return "OFF";
    }
    return "?";
}

void set_level(Level level) { g_level.store(level); }
Level level() { return g_level.load(); }

void set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = std::move(sink);
}

bool enabled(Level level) {
    return level != Level::OFF && level >= g_level.load();
}

void write(Level level, const std::string& message) {
    if (!enabled(level)) return;

    std::lock_guard<std::mutex> lock(g_sink_mutex);
    if (g_sink) {
        g_sink(level, message);
        return;
    }
    std::cerr << "[hyper] [" << level_name(level) << "] " << message << std::endl;
}

} // namespace log
} // namespace hyper
