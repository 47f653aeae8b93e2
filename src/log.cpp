// =============================================================================
// log.cpp - Level-gated stderr logging
// =============================================================================

#include "pump/log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace pump {
namespace log {

namespace {

std::atomic<int> g_level{static_cast<int>(Level::Info)};
std::mutex g_write_mutex;

} // anonymous namespace

void set_level(Level lvl) {
    g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

Level level() {
    return static_cast<Level>(g_level.load(std::memory_order_relaxed));
}

Level level_from_string(const std::string& name) {
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "off" || name == "none") return Level::Off;
    return Level::Info;
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
        case Level::Off: return "OFF";
    }
    return "INFO";
}

void write(Level lvl, const std::string& message) {
    if (lvl == Level::Off || !enabled(lvl)) return;
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << "[pump] " << level_name(lvl) << " " << message << "\n";
}

} // namespace log
} // namespace pump
