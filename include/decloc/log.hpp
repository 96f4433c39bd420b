#pragma once

#include <cstddef>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace decloc::log {

enum class Level {
  Debug,
  Info,
  Good,
  Warn,
  Error,
  Off,
};

// Messages below the level are dropped. Defaults to Info.
void setLevel(Level level);
Level level();

// Thread-safe, writes one colored line to stderr
void write(Level level, std::string_view message);

// "stage: current/total" progress line at Info level
void progress(std::string_view stage, size_t current, size_t total);

template <typename... Args> void debug(fmt::format_string<Args...> format, Args &&...args) {
  if (level() <= Level::Debug) {
    write(Level::Debug, fmt::format(format, std::forward<Args>(args)...));
  }
}

template <typename... Args> void info(fmt::format_string<Args...> format, Args &&...args) {
  if (level() <= Level::Info) {
    write(Level::Info, fmt::format(format, std::forward<Args>(args)...));
  }
}

template <typename... Args> void good(fmt::format_string<Args...> format, Args &&...args) {
  if (level() <= Level::Good) {
    write(Level::Good, fmt::format(format, std::forward<Args>(args)...));
  }
}

template <typename... Args> void warn(fmt::format_string<Args...> format, Args &&...args) {
  if (level() <= Level::Warn) {
    write(Level::Warn, fmt::format(format, std::forward<Args>(args)...));
  }
}

template <typename... Args> void error(fmt::format_string<Args...> format, Args &&...args) {
  if (level() <= Level::Error) {
    write(Level::Error, fmt::format(format, std::forward<Args>(args)...));
  }
}

} // namespace decloc::log
