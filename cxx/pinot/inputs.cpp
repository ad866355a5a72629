#include "inputs.hpp"

using namespace pn;

LanczosArgs::LanczosArgs(args::Subparser &parser)
  : kmax(parser, "K", "Krylov basis size per cycle (32)", {"kmax", 'k'}, 32)
  , restarts(parser, "R", "Max restart cycles (16)", {"restarts", 'r'}, 16)
  , tol(parser, "T", "Relative residual tolerance (1e-5)", {"tol", 't'}, 1.e-5f)
{
}

auto LanczosArgs::Get() -> Lanczos::Opts { return Lanczos::Opts{.kmax = kmax.Get(), .restarts = restarts.Get(), .tol = tol.Get()}; }

NullArgs::NullArgs(args::Subparser &parser)
  : γ(parser, "γ", "Fraction of measurements treated as large (0.5)", {"gamma", 'g'}, 0.5f)
  , noScale(parser, "S", "Return the unit-norm estimate without rescaling", {"no-scale"})
  , lanczos(parser)
{
}

auto NullArgs::Get() -> NullInit::Opts
{
  return NullInit::Opts{.γ = γ.Get(), .scale = !noScale, .verbose = true, .lanczos = lanczos.Get()};
}
