#include "iter.hpp"

#include "../log/log.hpp"

#include <csignal>
#include <cstdlib>
#include <filesystem>

namespace pn::Iterating {

namespace {
using Handler = void (*)(int);

volatile std::sig_atomic_t interrupted = 0;
int                        depth = 0;
Handler                    previous = SIG_DFL;

void OnInterrupt(int)
{
  // Second Ctrl-C before the solver noticed the first one
  if (interrupted) { std::_Exit(EXIT_FAILURE); }
  interrupted = 1;
}
} // namespace

Scope::Scope()
{
  if (depth++ == 0) {
    interrupted = 0;
    Handler const old = std::signal(SIGINT, OnInterrupt);
    previous = (old == SIG_ERR) ? SIG_DFL : old;
  }
}

Scope::~Scope()
{
  if (--depth == 0) { std::signal(SIGINT, previous); }
}

auto ShouldStop(char const *name) -> bool
{
  if (interrupted) {
    Log::Print(name, "Interrupt received, stopping. Ctrl-C again terminates immediately");
    return true;
  }
  if (std::filesystem::exists(".stop")) {
    Log::Print(name, "Found .stop file, stopping");
    return true;
  }
  return false;
}

} // namespace pn::Iterating
