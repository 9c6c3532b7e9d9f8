#include "log.hpp"

#include "fmt/chrono.h"

#include <atomic>
#include <ctime>
#include <mutex>
#include <stdio.h>

namespace pk {
namespace Log {

namespace {
std::atomic<Display> displayLevel = Display::None;
std::mutex           logMutex;

auto TheTime() -> std::string
{
  auto const t = std::time(nullptr);
  return fmt::format("{:%H:%M:%S}", fmt::localtime(t));
}
} // namespace

void SetDisplayLevel(Display const l)
{
  displayLevel = l;
  // Move the cursor one more line down so we don't erase whatever the caller printed last
  if (l == Display::Ephemeral) { fmt::print(stderr, "\n"); }
}

auto IsShown(Display const l) -> bool { return displayLevel.load() >= l; }

auto IsHigh() -> bool { return displayLevel.load() == Display::High; }

auto FormatEntry(std::string const &category, fmt::string_view fmt, fmt::format_args args) -> std::string
{
  return fmt::format("[{}] [{:<6}] {}", TheTime(), category, fmt::vformat(fmt, args));
}

void WriteEntry(std::string const &s, fmt::text_style const style)
{
  std::scoped_lock lock(logMutex);
  if (displayLevel.load() == Display::Ephemeral) { fmt::print(stderr, "\033[A\33[2K\r"); }
  fmt::print(stderr, style, "{}\n", s);
}

Time Now() { return std::chrono::high_resolution_clock::now(); }

std::string ToNow(Log::Time const t1)
{
  using ms = std::chrono::milliseconds;
  auto const t2 = std::chrono::high_resolution_clock::now();
  auto const diff = std::chrono::duration_cast<ms>(t2 - t1).count();
  auto const mins = diff / (60 * 1000);
  auto const secs = diff % (60 * 1000) / 1000;
  auto const millis = diff % 1000;
  if (mins > 0) {
    return fmt::format("{} minute{} {} second{}", mins, mins > 1 ? "s" : "", secs, secs > 1 ? "s" : "");
  } else if (secs > 0) {
    return fmt::format("{}.{:03d} seconds", secs, millis);
  } else {
    return fmt::format("{} millisecond{}", diff, diff > 1 ? "s" : "");
  }
}

} // namespace Log
} // namespace pk
