#include <atomic>
#include <cstdio>
#include <mutex>

#include <fmt/color.h>

#include <decloc/log.hpp>

namespace decloc::log {

namespace {

std::mutex gLogMutex;
std::atomic<Level> gLevel{Level::Info};

struct LevelStyle {
  const char *tag;
  fmt::text_style style;
};

LevelStyle styleFor(Level level) {
  switch (level) {
  case Level::Debug:
    return {"debug", fmt::fg(fmt::terminal_color::bright_black)};
  case Level::Info:
    return {"info", fmt::fg(fmt::terminal_color::cyan)};
  case Level::Good:
    return {"good", fmt::fg(fmt::terminal_color::green)};
  case Level::Warn:
    return {"warn", fmt::fg(fmt::terminal_color::yellow)};
  case Level::Error:
  case Level::Off:
    break;
  }
  return {"error", fmt::fg(fmt::terminal_color::red) | fmt::emphasis::bold};
}

} // namespace

void setLevel(Level level) {
  gLevel.store(level);
}

Level level() {
  return gLevel.load();
}

void write(Level level, std::string_view message) {
  if (level < gLevel.load() || level == Level::Off) {
    return;
  }

  auto style = styleFor(level);

  std::lock_guard<std::mutex> lock(gLogMutex);
  fmt::print(stderr, style.style, "[{}]", style.tag);
  fmt::print(stderr, " {}\n", message);
}

void progress(std::string_view stage, size_t current, size_t total) {
  if (level() > Level::Info) {
    return;
  }
  write(Level::Info, fmt::format("{}: {}/{}", stage, current, total));
}

} // namespace decloc::log
