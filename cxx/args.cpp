#include "args.hpp"

#include "pn/log/log.hpp"
#include "pn/sys/threads.hpp"

#include <cstdlib>
#include <optional>
#include <unordered_map>

using namespace pn;

namespace {
std::unordered_map<int, Log::Display> levelMap{
  {0, Log::Display::None}, {1, Log::Display::Ephemeral}, {2, Log::Display::Low}, {3, Log::Display::High}};
}

args::Group                      global_group("GLOBAL OPTIONS");
args::HelpFlag                   help(global_group, "H", "Show this help message", {'h', "help"});
args::MapFlag<int, Log::Display> verbosity(global_group, "V", "Log level 0-3", {'v', "verbosity"}, levelMap, Log::Display::Low);
args::ValueFlag<Index>           nthreads(global_group, "N", "Limit number of threads", {"nthreads"});

namespace {
// Flag wins over the environment, which wins over the default
auto EnvInt(char const *var) -> std::optional<int>
{
  char const *const v = std::getenv(var);
  if (!v) { return std::nullopt; }
  char     *end = nullptr;
  long const i = std::strtol(v, &end, 10);
  if (end == v || *end != '\0') { throw args::Error(fmt::format("{} must be an integer, was '{}'", var, v)); }
  return static_cast<int>(i);
}

void Require(args::Positional<std::string> &p, char const *what)
{
  if (!p) { throw args::Error(fmt::format("No {} file specified", what)); }
}
} // namespace

void SetLogging(std::string const &name)
{
  if (verbosity) {
    Log::SetDisplayLevel(verbosity.Get());
  } else if (auto const level = EnvInt("PN_VERBOSITY")) {
    auto const it = levelMap.find(*level);
    if (it == levelMap.end()) { throw args::Error(fmt::format("PN_VERBOSITY must be 0-3, was {}", *level)); }
    Log::SetDisplayLevel(it->second);
  }
  Log::Print(name, "PINOT {} threads", Threads::GlobalThreadCount());
}

void ParseCommand(args::Subparser &parser)
{
  args::GlobalOptions globals(parser, global_group);
  parser.Parse();
  if (nthreads) {
    Threads::SetGlobalThreadCount(nthreads.Get());
  } else if (auto const n = EnvInt("PN_THREADS")) {
    Threads::SetGlobalThreadCount(*n);
  }
  SetLogging(parser.GetCommand().Name());
}

void ParseCommand(args::Subparser &parser, args::Positional<std::string> &iname)
{
  ParseCommand(parser);
  Require(iname, "input");
}

void ParseCommand(args::Subparser &parser, args::Positional<std::string> &iname, args::Positional<std::string> &oname)
{
  ParseCommand(parser);
  Require(iname, "input");
  Require(oname, "output");
}
