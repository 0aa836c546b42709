#pragma once

#include <string>

namespace sentinel {
namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

// Enable JSON-structured output (one JSON object per line to stderr).
// Default mode is plain text: "[LEVEL] component: message".
// Call from main() based on logging.format / SENTINEL_LOG_FORMAT before any
// logging.
void SetJsonMode(bool enabled);
bool IsJsonMode();

// Entries below the minimum level are dropped. Default is INFO.
void SetMinLevel(Level level);
Level MinLevel();

// Parses "debug", "info", "warn"/"warning", "error" (case-insensitive).
// Returns false and leaves *level untouched for anything else.
bool ParseLevel(const std::string &text, Level *level);

// Emit a log entry at the given level.  `component` identifies the subsystem
// (e.g. "engine", "pipeline", "upstream").  `extra` is an optional key=value
// string appended to the JSON object or the text line (ignored when empty).
void Log(Level level, const std::string &component, const std::string &message,
         const std::string &extra = {});

// Convenience wrappers.
inline void Debug(const std::string &component, const std::string &message,
                  const std::string &extra = {}) {
  Log(Level::DEBUG, component, message, extra);
}
inline void Info(const std::string &component, const std::string &message,
                 const std::string &extra = {}) {
  Log(Level::INFO, component, message, extra);
}
inline void Warn(const std::string &component, const std::string &message,
                 const std::string &extra = {}) {
  Log(Level::WARN, component, message, extra);
}
inline void Error(const std::string &component, const std::string &message,
                  const std::string &extra = {}) {
  Log(Level::ERROR, component, message, extra);
}

} // namespace log
} // namespace sentinel
