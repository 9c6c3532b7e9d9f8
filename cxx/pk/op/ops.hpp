#pragma once

#include "op.hpp"

namespace pk::Ops {

struct Identity final : Op
{
  OP_INHERIT

  Identity(Index const s);
  static auto Make(Index const s) -> Ptr;
  void        forward(CMap x, Map y, float const s = 1.f) const;
  void        adjoint(CMap y, Map x, float const s = 1.f) const;

private:
  Index sz;
};

//! Dense matrix. Reports Unitary if square with orthonormal columns.
struct MatMul final : Op
{
  OP_INHERIT
  using Matrix = Eigen::MatrixXf;
  MatMul(Matrix const m);
  static auto Make(Matrix const m) -> Ptr;
  void        forward(CMap x, Map y, float const s = 1.f) const;
  void        adjoint(CMap y, Map x, float const s = 1.f) const;

private:
  Matrix mat;
};

//! Scale the input by a constant
struct DiagScale final : Op
{
  OP_INHERIT
  DiagScale(Index const sz, float const s);
  static auto Make(Index const sz, float const s) -> Ptr;
  void        forward(CMap x, Map y, float const s = 1.f) const;
  void        adjoint(CMap y, Map x, float const s = 1.f) const;

  float const scale;

private:
  Index sz;
};

//! Multiply operators, i.e. y = A * B * x
struct Multiply final : Op
{
  OP_INHERIT
  Multiply(Ptr A, Ptr B);
  void forward(CMap x, Map y, float const s = 1.f) const;
  void adjoint(CMap y, Map x, float const s = 1.f) const;

private:
  Ptr A, B;
};

// Returns an Op representing A * B
auto Mul(Op::Ptr a, Op::Ptr b) -> Op::Ptr;

} // namespace pk::Ops
