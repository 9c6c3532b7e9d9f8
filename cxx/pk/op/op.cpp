#include "op.hpp"

namespace pk::Ops {

Op::Op(std::string const &n, std::set<Property> const &props)
  : name{n}
  , properties{props}
{
}

auto Op::is(Property const p) const -> bool { return properties.contains(p); }

auto Op::forward(Vector const &x, float const s) const -> Vector
{
  if (x.rows() != cols()) { throw Log::Failure(this->name, "Forward x {} != cols {}", x.rows(), cols()); }
  Vector y(this->rows());
  y.setZero();
  this->forward(CMap(x.data(), x.size()), Map(y.data(), y.size()), s);
  return y;
}

auto Op::adjoint(Vector const &y, float const s) const -> Vector
{
  if (y.rows() != rows()) { throw Log::Failure(this->name, "Adjoint y {} != rows {}", y.rows(), rows()); }
  Vector x(this->cols());
  x.setZero();
  this->adjoint(CMap(y.data(), y.size()), Map(x.data(), x.size()), s);
  return x;
}

auto Op::startForward(CMap x, Map const &y) const -> Log::Time
{
  if (x.rows() != cols()) { throw Log::Failure(this->name, "Forward x [{}] expected [{}]", x.rows(), cols()); }
  if (y.rows() != rows()) { throw Log::Failure(this->name, "Forward y [{}] expected [{}]", y.rows(), rows()); }
  if (Log::IsHigh()) { Log::Debug(this->name, "Forward [{}, {}] |x| {}", rows(), cols(), x.stableNorm()); }
  return Log::Now();
}

void Op::finishForward(Map const &y, Log::Time const start) const
{
  if (Log::IsHigh()) { Log::Debug(this->name, "Forward finished in {} |y| {}", Log::ToNow(start), y.stableNorm()); }
}

auto Op::startAdjoint(CMap y, Map const &x) const -> Log::Time
{
  if (y.rows() != rows()) { throw Log::Failure(this->name, "Adjoint y [{}] expected [{}]", y.rows(), rows()); }
  if (x.rows() != cols()) { throw Log::Failure(this->name, "Adjoint x [{}] expected [{}]", x.rows(), cols()); }
  if (Log::IsHigh()) { Log::Debug(this->name, "Adjoint [{}, {}] |y| {}", rows(), cols(), y.stableNorm()); }
  return Log::Now();
}

void Op::finishAdjoint(Map const &x, Log::Time const start) const
{
  if (Log::IsHigh()) { Log::Debug(this->name, "Adjoint finished in {} |x| {}", Log::ToNow(start), x.stableNorm()); }
}

} // namespace pk::Ops
