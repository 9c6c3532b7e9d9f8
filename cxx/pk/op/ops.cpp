#include "ops.hpp"

namespace pk::Ops {

Identity::Identity(Index const s)
  : Op("Identity", {Property::Unitary, Property::SelfAdjoint})
  , sz{s}
{
}

auto Identity::Make(Index const s) -> Ptr { return std::make_shared<Identity>(s); }
auto Identity::rows() const -> Index { return sz; }
auto Identity::cols() const -> Index { return sz; }

void Identity::forward(CMap x, Map y, float const s) const
{
  auto const time = this->startForward(x, y);
  y = x * s;
  this->finishForward(y, time);
}

void Identity::adjoint(CMap y, Map x, float const s) const
{
  auto const time = this->startAdjoint(y, x);
  x = y * s;
  this->finishAdjoint(x, time);
}

namespace {
auto MatProperties(MatMul::Matrix const &m) -> std::set<Property>
{
  std::set<Property> props;
  if (m.rows() == m.cols()) {
    float const tol = 1.e-5f * m.rows();
    if ((m.transpose() * m - MatMul::Matrix::Identity(m.rows(), m.cols())).norm() <= tol) { props.insert(Property::Unitary); }
    if ((m - m.transpose()).norm() <= tol) { props.insert(Property::SelfAdjoint); }
  }
  return props;
}
} // namespace

MatMul::MatMul(Matrix const m)
  : Op("MatMul", MatProperties(m))
  , mat{m}
{
  Log::Debug("MatMul", "[{}, {}] unitary {}", mat.rows(), mat.cols(), this->is(Property::Unitary));
}

auto MatMul::Make(Matrix const m) -> Ptr { return std::make_shared<MatMul>(m); }
auto MatMul::rows() const -> Index { return mat.rows(); }
auto MatMul::cols() const -> Index { return mat.cols(); }

void MatMul::forward(CMap x, Map y, float const s) const
{
  auto const time = this->startForward(x, y);
  y.noalias() = mat * x * s;
  this->finishForward(y, time);
}

void MatMul::adjoint(CMap y, Map x, float const s) const
{
  auto const time = this->startAdjoint(y, x);
  x.noalias() = mat.transpose() * y * s;
  this->finishAdjoint(x, time);
}

DiagScale::DiagScale(Index const sz1, float const s1)
  : Op("DiagScale", std::abs(s1) == 1.f ? std::set<Property>{Property::Unitary, Property::SelfAdjoint}
                                         : std::set<Property>{Property::SelfAdjoint})
  , scale{s1}
  , sz{sz1}
{
}

auto DiagScale::Make(Index const sz, float const s) -> Ptr { return std::make_shared<DiagScale>(sz, s); }
auto DiagScale::rows() const -> Index { return sz; }
auto DiagScale::cols() const -> Index { return sz; }

void DiagScale::forward(CMap x, Map y, float const s) const
{
  auto const time = this->startForward(x, y);
  y = x * scale * s;
  this->finishForward(y, time);
}

void DiagScale::adjoint(CMap y, Map x, float const s) const
{
  auto const time = this->startAdjoint(y, x);
  x = y * scale * s;
  this->finishAdjoint(x, time);
}

namespace {
auto MulProperties(Op::Ptr const &A, Op::Ptr const &B) -> std::set<Property>
{
  if (A->is(Property::Unitary) && B->is(Property::Unitary)) { return {Property::Unitary}; }
  return {};
}
} // namespace

Multiply::Multiply(Ptr AA, Ptr BB)
  : Op("Multiply", MulProperties(AA, BB))
  , A{AA}
  , B{BB}
{
  if (A->cols() != B->rows()) {
    throw Log::Failure("Multiply", "Operator {} had {} cols but {} had {} rows", A->name, A->cols(), B->name, B->rows());
  }
}

auto Multiply::rows() const -> Index { return A->rows(); }
auto Multiply::cols() const -> Index { return B->cols(); }

void Multiply::forward(CMap x, Map y, float const s) const
{
  auto const time = this->startForward(x, y);
  Vector     temp(B->rows());
  B->forward(x, Map(temp.data(), temp.size()), s);
  A->forward(CMap(temp.data(), temp.size()), y);
  this->finishForward(y, time);
}

void Multiply::adjoint(CMap y, Map x, float const s) const
{
  auto const time = this->startAdjoint(y, x);
  Vector     temp(A->cols());
  A->adjoint(y, Map(temp.data(), temp.size()), s);
  B->adjoint(CMap(temp.data(), temp.size()), x);
  this->finishAdjoint(x, time);
}

auto Mul(Op::Ptr a, Op::Ptr b) -> Op::Ptr { return std::make_shared<Multiply>(a, b); }

} // namespace pk::Ops
