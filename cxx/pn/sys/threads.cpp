#include "threads.hpp"

#include "../log/log.hpp"

#include <algorithm>
#include <thread>

namespace pn::Threads {

namespace {
std::unique_ptr<Eigen::ThreadPool> pool;
}

auto GlobalPool() -> Eigen::ThreadPool *
{
  if (!pool) { SetGlobalThreadCount(0); }
  return pool.get();
}

auto GlobalThreadCount() -> Index { return GlobalPool()->NumThreads(); }

void SetGlobalThreadCount(Index const n)
{
  Index const nt = n > 0 ? n : std::max<Index>(1, std::thread::hardware_concurrency());
  Log::Debug("Thread", "Starting pool of {} threads", nt);
  pool = std::make_unique<Eigen::ThreadPool>(static_cast<int>(nt));
}

} // namespace pn::Threads
