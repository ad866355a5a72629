#pragma once

#include "args.hpp"

#include "pn/algo/lanczos.hpp"
#include "pn/init/null.hpp"
#include "pn/types.hpp"

struct LanczosArgs
{
  args::ValueFlag<Index> kmax, restarts;
  args::ValueFlag<float> tol;

  LanczosArgs(args::Subparser &parser);
  auto Get() -> pn::Lanczos::Opts;
};

struct NullArgs
{
  args::ValueFlag<float> γ;
  args::Flag             noScale;
  LanczosArgs            lanczos;

  NullArgs(args::Subparser &parser);
  auto Get() -> pn::NullInit::Opts;
};
