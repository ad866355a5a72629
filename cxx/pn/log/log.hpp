#pragma once

#include <chrono>
#include <fmt/color.h>
#include <fmt/format.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace pn::Log {

enum struct Display
{
  None = 0,
  Ephemeral = 1,
  Low = 2,
  High = 3
};

using Time = std::chrono::steady_clock::time_point;

void SetDisplayLevel(Display const l);
auto IsHigh() -> bool;

/*
 * Every entry is "[HH:MM:SS] [category] message". All entries are kept, whatever the display level, so a run can
 * store its log next to its result.
 */
auto Entry(std::string const &category, fmt::string_view fmt, fmt::format_args args) -> std::string;
void Record(std::string entry, Display const level, fmt::text_style const style = fmt::text_style());
auto Saved() -> std::vector<std::string>;
auto Category(std::string const &entry) -> std::string; // Empty if entry was not made by Entry()
void End();

template <typename... Args> inline void Print(std::string const &category, fmt::format_string<Args...> fs, Args &&...args)
{
  Record(Entry(category, fs, fmt::make_format_args(args...)), Display::Ephemeral);
}

template <typename... Args> inline void Debug(std::string const &category, fmt::format_string<Args...> fs, Args &&...args)
{
  Record(Entry(category, fs, fmt::make_format_args(args...)), Display::High);
}

template <typename... Args> inline void Warn(std::string const &category, fmt::format_string<Args...> fs, Args &&...args)
{
  Record(Entry(category, fs, fmt::make_format_args(args...)), Display::None, fmt::fg(fmt::terminal_color::bright_yellow));
}

struct Failure : std::runtime_error
{
  template <typename... Args>
  Failure(std::string const &category, fmt::format_string<Args...> fs, Args &&...args)
    : std::runtime_error(Entry(category, fs, fmt::make_format_args(args...)))
  {
  }
};

/*
 * Failure kinds raised by the initializer. Callers can catch Log::Failure for all of them.
 */
struct InvalidInputError : Failure
{
  using Failure::Failure;
};

struct DimensionMismatchError : Failure
{
  using Failure::Failure;
};

struct ConvergenceError : Failure
{
  using Failure::Failure;
};

struct DegenerateScaleError : Failure
{
  using Failure::Failure;
};

inline void Fail(Failure const &f) { Record(f.what(), Display::None, fmt::fg(fmt::terminal_color::bright_red)); }

auto Now() -> Time;
auto ToNow(Time const t) -> std::string;

} // namespace pn::Log
