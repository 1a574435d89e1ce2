#include "log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace objfs {
namespace log {

namespace {
    std::atomic<int> current_level{static_cast<int>(Level::Warn)};
    std::mutex output_mutex;

    const char* prefix(Level level) {
        switch (level) {
            case Level::Error: return "[ERROR] ";
            case Level::Warn:  return "[WARN] ";
            case Level::Info:  return "";
            case Level::Debug: return "[DEBUG] ";
        }
        return "";
    }
}  // End anonymous namespace

void setLevel(Level level) {
    current_level.store(static_cast<int>(level));
}

Level level() {
    return static_cast<Level>(current_level.load());
}

void write(Level level, const std::string& message) {
    // Worker threads of multipart uploads log concurrently with the caller
    std::lock_guard<std::mutex> lock(output_mutex);
    if (level == Level::Error || level == Level::Warn) {
        std::cerr << prefix(level) << message << std::endl;
    } else {
        std::cout << prefix(level) << message << std::endl;
    }
}

} // namespace log
} // namespace objfs
