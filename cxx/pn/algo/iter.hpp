#pragma once

namespace pn::Iterating {

/*
 * Installs a SIGINT handler for the lifetime of a solver run so Ctrl-C ends the run at the next check instead of
 * killing the process. Scopes nest. The outermost one restores the previous handler when it is destroyed, including
 * during stack unwinding, so nothing outlives the call that created it.
 */
struct Scope
{
  Scope();
  ~Scope();
  Scope(Scope const &) = delete;
  auto operator=(Scope const &) -> Scope & = delete;
};

// True once SIGINT arrived inside the current Scope, or while a file named .stop exists in the working directory
auto ShouldStop(char const *name) -> bool;

} // namespace pn::Iterating
