#pragma once

#include "../log/log.hpp"
#include "../types.hpp"

#include <memory>
#include <string>

namespace pn::Ops {

/*
 * A linear operator known only through its action. rows() is the size of the measurement (range) space,
 * cols() the size of the signal (domain) space. adjoint() must be the exact adjoint of forward().
 */
struct Op
{
  using Vector = Eigen::Vector<Cx, Eigen::Dynamic>;
  using Map = Eigen::Map<Vector, Eigen::AlignedMax>;
  using CMap = Eigen::Map<Vector const, Eigen::AlignedMax>;
  using Ptr = std::shared_ptr<Op>;

  std::string name;
  Op(std::string const &n);
  virtual ~Op() = default;

  virtual auto rows() const -> Index = 0;
  virtual auto cols() const -> Index = 0;

  virtual void forward(CMap x, Map y) const = 0;
  virtual void adjoint(CMap y, Map x) const = 0;
  auto         forward(Vector const &x) const -> Vector;
  auto         adjoint(Vector const &y) const -> Vector;
  void         forward(Vector const &x, Vector &y) const;
  void         adjoint(Vector const &y, Vector &x) const;

protected:
  // Size checks and debug timing around one application, dir is "Forward" or "Adjoint"
  auto begin(char const *dir, CMap in, Index const inSz, Map const &out, Index const outSz) const -> Log::Time;
  void end(char const *dir, Map const &out, Log::Time const start) const;
};

#define OP_INHERIT                                                                                                             \
  using typename Op::Vector;                                                                                                   \
  using typename Op::Map;                                                                                                      \
  using typename Op::CMap;                                                                                                     \
  using typename Op::Ptr;                                                                                                      \
  using Op::forward;                                                                                                           \
  using Op::adjoint;                                                                                                           \
  auto rows() const -> Index final;                                                                                            \
  auto cols() const -> Index final;

} // namespace pn::Ops
