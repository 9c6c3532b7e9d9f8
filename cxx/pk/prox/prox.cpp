#include "prox.hpp"

namespace pk::Proxs {

Prox::Prox(std::string const &n, Phase const ph)
  : name{n}
  , phase{ph}
{
}

void Prox::checkStep(float const α) const
{
  if (!std::isfinite(α) || α <= 0.f) { throw Log::Failure(name, "Step size α must be finite and positive, was {}", α); }
}

auto Prox::apply(float const α, Vector const &v) const -> Vector
{
  checkStep(α);
  Vector z = v;
  this->solve(α, z);
  return z;
}

auto Prox::apply(float const α, CxVector const &v) const -> CxVector
{
  checkStep(α);
  return SplitPhase(phase, v, [this, α](Vector &m) { this->solve(α, m); });
}

auto Direction(Phase const phase, Prox::CxVector const &v) -> Prox::CxVector
{
  Prox::CxVector d(v.size());
  switch (phase) {
  case Phase::Polar:
    for (Index ii = 0; ii < v.size(); ii++) {
      float const m = std::abs(v[ii]);
      d[ii] = Cx(v[ii].real() / m, v[ii].imag() / m);
    }
    break;
  case Phase::Atan:
    for (Index ii = 0; ii < v.size(); ii++) {
      float const θ = std::atan(v[ii].imag() / v[ii].real());
      d[ii] = Cx(std::cos(θ), std::sin(θ));
    }
    break;
  }
  return d;
}

Conjugate::Conjugate(Prox::Ptr pp)
  : Prox{pp->name + "*", pp->phase}
  , p{pp}
{
  if (p->transformed()) {
    throw InvalidParameter(name, "Cannot take the conjugate of {}, its result is in a transform domain", p->name);
  }
}

auto Conjugate::Make(Prox::Ptr p) -> Prox::Ptr { return std::make_shared<Conjugate>(p); }

void Conjugate::solve(float const α, Vector &x) const
{
  Vector z = x / α;
  p->solve(1.f / α, z);
  if (z.size() != x.size()) { throw Log::Failure(name, "Wrapped prox changed size from {} to {}", x.size(), z.size()); }
  x = x - α * z;
}

} // namespace pk::Proxs
