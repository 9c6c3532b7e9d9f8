#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <fmt/color.h>
#include <fmt/ostream.h>
#include <fmt/ranges.h>
#include <fmt/std.h>

namespace pk {
namespace Log {

enum struct Display
{
  None = 0,
  Ephemeral = 1,
  Low = 2,
  High = 3
};

using Time = std::chrono::high_resolution_clock::time_point;

void SetDisplayLevel(Display const l);
auto IsShown(Display const l) -> bool;
auto IsHigh() -> bool;
auto FormatEntry(std::string const &category, fmt::string_view fmt, fmt::format_args args) -> std::string;
void WriteEntry(std::string const &entry, fmt::text_style const style);

template <typename... Args> inline void Print(std::string const &category, fmt::format_string<Args...> fstr, Args &&...args)
{
  if (IsShown(Display::Ephemeral)) {
    WriteEntry(FormatEntry(category, fstr, fmt::make_format_args(args...)), fmt::text_style());
  }
}

template <typename... Args> inline void Debug(std::string const &category, fmt::format_string<Args...> fstr, Args &&...args)
{
  if (IsShown(Display::High)) { WriteEntry(FormatEntry(category, fstr, fmt::make_format_args(args...)), fmt::text_style()); }
}

struct Failure : std::runtime_error
{
  template <typename... Args>
  Failure(std::string const &cat, fmt::format_string<Args...> fs, Args &&...args)
    : std::runtime_error(FormatEntry(cat, fs, fmt::make_format_args(args...)))
  {
  }
};

auto Now() -> Time;
auto ToNow(Time const t) -> std::string;

} // namespace Log
} // namespace pk
