#include "log.hpp"

#include <ctime>
#include <fmt/chrono.h>
#include <mutex>

namespace pn::Log {

namespace {
struct Sink
{
  std::mutex               mutex;
  Display                  level = Display::None;
  std::vector<std::string> entries;
};

auto TheSink() -> Sink &
{
  static Sink sink;
  return sink;
}
} // namespace

void SetDisplayLevel(Display const l)
{
  TheSink().level = l;
  // Ephemeral entries erase the line above them, keep the command line visible
  if (l == Display::Ephemeral) { fmt::print(stderr, "\n"); }
}

auto IsHigh() -> bool { return TheSink().level == Display::High; }

auto Entry(std::string const &category, fmt::string_view fmt, fmt::format_args args) -> std::string
{
  auto const t = std::time(nullptr);
  return fmt::format("[{:%H:%M:%S}] [{:<7}] {}", fmt::localtime(t), category, fmt::vformat(fmt, args));
}

void Record(std::string entry, Display const level, fmt::text_style const style)
{
  auto            &sink = TheSink();
  std::scoped_lock lock(sink.mutex);
  if (sink.level >= level) {
    if (sink.level == Display::Ephemeral) { fmt::print(stderr, "\033[A\33[2K\r"); }
    fmt::print(stderr, style, "{}\n", entry);
  }
  sink.entries.push_back(std::move(entry));
}

auto Saved() -> std::vector<std::string>
{
  auto            &sink = TheSink();
  std::scoped_lock lock(sink.mutex);
  return sink.entries;
}

auto Category(std::string const &entry) -> std::string
{
  // The category is the second bracketed field, padded on the right
  auto const open = entry.find("] [");
  if (open == std::string::npos) { return {}; }
  auto const close = entry.find(']', open + 3);
  if (close == std::string::npos) { return {}; }
  std::string category = entry.substr(open + 3, close - open - 3);
  category.erase(category.find_last_not_of(' ') + 1);
  return category;
}

void End() { TheSink().level = Display::None; }

auto Now() -> Time { return std::chrono::steady_clock::now(); }

auto ToNow(Time const t) -> std::string
{
  auto const ms = std::chrono::duration_cast<std::chrono::milliseconds>(Now() - t).count();
  if (ms < 1000) { return fmt::format("{} ms", ms); }
  auto const s = ms / 1000;
  if (s < 60) { return fmt::format("{}.{:03d} s", s, ms % 1000); }
  return fmt::format("{} min {:02d} s", s / 60, s % 60);
}

} // namespace pn::Log
