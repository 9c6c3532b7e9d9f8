#include "norms.hpp"

namespace pk::Proxs {

namespace {
auto CheckedLambda(std::string const &name, float const λ) -> float
{
  if (!std::isfinite(λ) || λ < 0.f) { throw InvalidParameter(name, "λ must be finite and non-negative, was {}", λ); }
  return λ;
}
} // namespace

auto L1::Make(float const λ, Ops::Op::Ptr T, Phase const ph) -> Prox::Ptr { return std::make_shared<L1>(λ, T, ph); }

L1::L1(float const λ_, Ops::Op::Ptr T_, Phase const ph)
  : Prox("L1Prox", ph)
  , λ{CheckedLambda("L1Prox", λ_)}
  , T{T_}
{
  if (T) {
    if (!T->is(Ops::Property::Unitary)) { throw InvalidParameter(name, "Transform {} is not unitary", T->name); }
    Log::Print(name, "λ {} transform {}", λ, T->name);
  } else {
    Log::Print(name, "λ {}", λ);
  }
}

void L1::solve(float const α, Vector &x) const
{
  float const nx = Log::IsHigh() ? x.stableNorm() : 0.f;
  if (T) { x = T->forward(x); }
  float const t = α * λ;
  for (Index ii = 0; ii < x.size(); ii++) {
    float const ax = std::abs(x[ii]);
    x[ii] = ax > t ? (1.f - t / ax) * x[ii] : 0.f;
  }
  if (Log::IsHigh()) { Log::Debug(name, "α {:4.3E} λ {:4.3E} t {:4.3E} |x| {:4.3E} |z| {:4.3E}", α, λ, t, nx, x.stableNorm()); }
}

auto L1::transformed() const -> bool { return T != nullptr; }

auto L2::Make(float const λ, Phase const ph) -> Prox::Ptr { return std::make_shared<L2>(λ, ph); }

L2::L2(float const λ_, Phase const ph)
  : Prox("L2Prox", ph)
  , λ{CheckedLambda("L2Prox", λ_)}
{
  Log::Print(name, "λ {}", λ);
}

void L2::solve(float const α, Vector &x) const
{
  float const t = α * λ;
  float const norm = x.stableNorm();
  // Equivalent to scaling by 1 - t / max(t, |x|), but t = |x| = 0 leaves x alone instead of dividing 0 by 0
  if (norm > t) {
    x *= 1.f - t / norm;
  } else {
    x.setZero();
  }
  if (Log::IsHigh()) { Log::Debug(name, "α {} λ {} t {} |x| {} |z| {}", α, λ, t, norm, x.stableNorm()); }
}

auto SquaredL2::Make(float const λ, Phase const ph) -> Prox::Ptr { return std::make_shared<SquaredL2>(λ, ph); }

SquaredL2::SquaredL2(float const λ_, Phase const ph)
  : Prox("SqL2Prox", ph)
  , λ{CheckedLambda("SqL2Prox", λ_)}
{
  Log::Print(name, "λ {}", λ);
}

void SquaredL2::solve(float const α, Vector &x) const
{
  float const nx = Log::IsHigh() ? x.stableNorm() : 0.f;
  x /= 1.f + 2.f * α * λ;
  if (Log::IsHigh()) { Log::Debug(name, "α {} λ {} |x| {} |z| {}", α, λ, nx, x.stableNorm()); }
}

auto Box::Make(float const λ, float const lo, float const hi, Phase const ph) -> Prox::Ptr
{
  return std::make_shared<Box>(λ, lo, hi, ph);
}

Box::Box(float const λ_, float const lo, float const hi, Phase const ph)
  : Prox("BoxProx", ph)
  , λ{CheckedLambda("BoxProx", λ_)}
  , lower{lo}
  , upper{hi}
{
  if (std::isnan(lower) || std::isnan(upper) || lower > upper) {
    throw InvalidParameter(name, "Bounds [{}, {}] are not a valid interval", lower, upper);
  }
  Log::Print(name, "Bounds [{}, {}]", lower, upper);
}

void Box::solve(float const, Vector &x) const
{
  x = x.cwiseMax(lower).cwiseMin(upper);
  if (Log::IsHigh()) { Log::Debug(name, "Bounds [{}, {}] |z| {}", lower, upper, x.stableNorm()); }
}

} // namespace pk::Proxs
