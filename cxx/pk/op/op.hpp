#pragma once

#include "../log/log.hpp"
#include "../types.hpp"

#include <memory>
#include <set>

namespace pk::Ops {

enum struct Property
{
  Unitary,
  SelfAdjoint
};

/* Real-valued linear operator. Concrete operators report which algebraic properties they have so that
 * consumers can check preconditions (e.g. an L1 prox transform must be unitary).
 */
struct Op
{
  using Vector = Eigen::VectorXf;
  using Map = Eigen::Map<Vector>;
  using CMap = Eigen::Map<Vector const>;
  using Ptr = std::shared_ptr<Op>;

  std::string const         name;
  std::set<Property> const properties;
  Op(std::string const &n, std::set<Property> const &props = {});

  virtual auto rows() const -> Index = 0;
  virtual auto cols() const -> Index = 0;
  auto         is(Property const p) const -> bool;

  virtual void forward(CMap x, Map y, float const s = 1.f) const = 0;
  virtual void adjoint(CMap y, Map x, float const s = 1.f) const = 0;
  auto         forward(Vector const &x, float const s = 1.f) const -> Vector;
  auto         adjoint(Vector const &y, float const s = 1.f) const -> Vector;

  virtual ~Op() {};

protected:
  auto startForward(CMap x, Map const &y) const -> Log::Time;
  void finishForward(Map const &y, Log::Time const start) const;
  auto startAdjoint(CMap y, Map const &x) const -> Log::Time;
  void finishAdjoint(Map const &x, Log::Time const start) const;
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

} // namespace pk::Ops
