#pragma once

#include <sstream>
#include <string>
#include <utility>

namespace objfs {
namespace log {

enum class Level {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

// Process-wide threshold; messages above it are dropped
void setLevel(Level level);
Level level();

inline bool enabled(Level l) {
    return static_cast<int>(l) <= static_cast<int>(level());
}

// Writes one line: Error/Warn go to stderr, Info/Debug to stdout
void write(Level level, const std::string& message);

template <typename... Args>
std::string concat(Args&&... args) {
    std::ostringstream out;
    (out << ... << std::forward<Args>(args));
    return out.str();
}

template <typename... Args>
void debug(Args&&... args) {
    if (enabled(Level::Debug)) {
        write(Level::Debug, concat(std::forward<Args>(args)...));
    }
}

template <typename... Args>
void info(Args&&... args) {
    if (enabled(Level::Info)) {
        write(Level::Info, concat(std::forward<Args>(args)...));
    }
}

template <typename... Args>
void warn(Args&&... args) {
    if (enabled(Level::Warn)) {
        write(Level::Warn, concat(std::forward<Args>(args)...));
    }
}

template <typename... Args>
void error(Args&&... args) {
    write(Level::Error, concat(std::forward<Args>(args)...));
}

} // namespace log
} // namespace objfs
