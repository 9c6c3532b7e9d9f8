#include "wavelets.hpp"

namespace pk::Ops {

Wavelets::Wavelets(Index const sz, Index const N)
  : Op("Waves", {Property::Unitary})
  , sz_{sz}
  , N_{N}
{
  if (sz_ < 2 || sz_ % 2 == 1) { throw Log::Failure(this->name, "Wavelet size {} must be even", sz_); }
  if (N_ != 2 && N_ != 4 && N_ != 6 && N_ != 8) {
    throw Log::Failure(this->name, "Asked for {} co-efficients, only 2/4/6/8 are implemented", N_);
  }
  // Daubechie's coeffs courtesy of Wikipedia
  Cc_.resize(N_);
  Cr_.resize(N_);
  switch (N_) {
  case 2: Cc_ << 1.f, 1.f; break;
  case 4: Cc_ << 0.6830127f, 1.1830127f, 0.3169873f, -0.1830127f; break;
  case 6: Cc_ << 0.47046721f, 1.14111692f, 0.650365f, -0.19093442f, -0.12083221f, 0.0498175f; break;
  case 8: Cc_ << 0.32580343f, 1.01094572f, 0.89220014f, -0.03957503f, -0.26450717f, 0.0436163f, 0.0465036f, -0.01498699f; break;
  }
  Cc_ = Cc_ / static_cast<float>(M_SQRT2); // Get scaling correct
  float sign = 1;
  for (Index ii = 0; ii < N_; ii++) {
    Cr_[ii] = sign * Cc_[N_ - 1 - ii];
    sign = -sign;
  }
  // Smallest level is the first odd half-size, or 2
  minSz_ = sz_;
  while ((minSz_ / 2) % 2 == 0 && minSz_ > 2) {
    minSz_ /= 2;
  }
  Log::Debug(this->name, "Size {} levels {}-{} coeffs {}", sz_, sz_, minSz_, fmt::streamed(Cc_.transpose()));
}

auto Wavelets::Make(Index const sz, Index const N) -> Ptr { return std::make_shared<Wavelets>(sz, N); }
auto Wavelets::rows() const -> Index { return sz_; }
auto Wavelets::cols() const -> Index { return sz_; }

void Wavelets::forward(CMap x, Map y, float const s) const
{
  auto const time = this->startForward(x, y);
  y = x * s;
  levels(y, false);
  this->finishForward(y, time);
}

void Wavelets::adjoint(CMap y, Map x, float const s) const
{
  auto const time = this->startAdjoint(y, x);
  x = y * s;
  levels(x, true);
  this->finishAdjoint(x, time);
}

void Wavelets::levels(Map x, bool const reverse) const
{
  if (reverse) {
    for (Index sz = minSz_; sz <= sz_; sz *= 2) {
      wav1(sz, reverse, x);
    }
  } else {
    for (Index sz = sz_; sz >= minSz_; sz /= 2) {
      wav1(sz, reverse, x);
    }
  }
}

void Wavelets::wav1(Index const sz, bool const reverse, Map x) const
{
  if (sz < 2) return;
  if (sz % 2 == 1) return;

  Eigen::VectorXf w(sz);
  w.setZero();
  Index const Noff = -N_ / 2;
  Index const hSz = sz / 2;
  if (reverse) {
    for (Index ii = 0; ii < hSz; ii++) {
      float const xLo = x[ii];
      float const xHi = x[ii + hSz];
      Index const index = 2 * ii + Noff;
      for (Index k = 0; k < N_; k++) {
        Index const wrapped = Wrap(index + k, sz);
        w[wrapped] += Cc_[k] * xLo;
        w[wrapped] += Cr_[k] * xHi;
      }
    }
  } else {
    for (Index ii = 0; ii < hSz; ii++) {
      Index const index = 2 * ii + Noff;
      for (Index k = 0; k < N_; k++) {
        Index const wrapped = Wrap(index + k, sz);
        w[ii] += Cc_[k] * x[wrapped];
        w[ii + hSz] += Cr_[k] * x[wrapped];
      }
    }
  }
  x.head(sz) = w;
}

} // namespace pk::Ops
