#pragma once

#include "../op/op.hpp"
#include "prox.hpp"

namespace pk::Proxs {

/* Soft-thresholding, f(x) = λ|Tx|_1. T is optional but must be unitary. */
struct L1 final : Prox
{
  PROX_INHERIT
  float const λ;
  static auto Make(float const λ, Ops::Op::Ptr T = nullptr, Phase const phase = Phase::Polar) -> Prox::Ptr;
  L1(float const λ, Ops::Op::Ptr T = nullptr, Phase const phase = Phase::Polar);
  void solve(float const α, Vector &x) const;
  auto transformed() const -> bool;

private:
  Ops::Op::Ptr T;
};

/* Shrinkage of the whole array, f(x) = λ|x|_2 */
struct L2 final : Prox
{
  PROX_INHERIT
  float const λ;
  static auto Make(float const λ, Phase const phase = Phase::Polar) -> Prox::Ptr;
  L2(float const λ, Phase const phase = Phase::Polar);
  void solve(float const α, Vector &x) const;
};

/* Ridge shrinkage, f(x) = λ|x|²_2 */
struct SquaredL2 final : Prox
{
  PROX_INHERIT
  float const λ;
  static auto Make(float const λ, Phase const phase = Phase::Polar) -> Prox::Ptr;
  SquaredL2(float const λ, Phase const phase = Phase::Polar);
  void solve(float const α, Vector &x) const;
};

/* Indicator of the interval [lower, upper]. λ is accepted so all operators share a constructor shape, but an
 * indicator function is unchanged by scaling so it does not enter the result.
 */
struct Box final : Prox
{
  PROX_INHERIT
  float const λ, lower, upper;
  static auto Make(float const λ, float const lower, float const upper, Phase const phase = Phase::Polar) -> Prox::Ptr;
  Box(float const λ, float const lower, float const upper, Phase const phase = Phase::Polar);
  void solve(float const α, Vector &x) const;
};

} // namespace pk::Proxs
