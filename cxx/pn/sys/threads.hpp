#pragma once

#include "../types.hpp"

#include <unsupported/Eigen/CXX11/ThreadPool>

namespace pn::Threads {

auto GlobalPool() -> Eigen::ThreadPool *; // Created on first use with one thread per core
auto GlobalThreadCount() -> Index;
void SetGlobalThreadCount(Index const n); // n < 1 means one per core

} // namespace pn::Threads
