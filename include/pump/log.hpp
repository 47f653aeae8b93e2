#ifndef PUMP_LOG_HPP
#define PUMP_LOG_HPP

#include <string>

namespace pump {
namespace log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

// Process-wide threshold; messages below it are dropped.
void set_level(Level level);
Level level();

// Accepts "debug", "info", "warn", "error", "off". Unknown names map to Info.
Level level_from_string(const std::string& name);
const char* level_name(Level level);

void write(Level level, const std::string& message);

inline void debug(const std::string& message) { write(Level::Debug, message); }
inline void info(const std::string& message) { write(Level::Info, message); }
inline void warn(const std::string& message) { write(Level::Warn, message); }
inline void error(const std::string& message) { write(Level::Error, message); }

inline bool enabled(Level lvl) { return static_cast<int>(lvl) >= static_cast<int>(level()); }

} // namespace log
} // namespace pump

#endif // PUMP_LOG_HPP
