#pragma once

#include "op.hpp"

namespace pk::Ops {

/* Periodic multi-level Daubechies wavelet transform of a 1D signal. The coefficients are normalised so the
 * transform is orthonormal, hence it reports itself as Unitary.
 */
struct Wavelets final : Op
{
  OP_INHERIT

  Wavelets(Index const sz, Index const N);
  static auto Make(Index const sz, Index const N) -> Ptr;
  void        forward(CMap x, Map y, float const s = 1.f) const;
  void        adjoint(CMap y, Map x, float const s = 1.f) const;

private:
  void           levels(Map x, bool const reverse) const;
  void           wav1(Index const sz, bool const reverse, Map x) const;
  Index          sz_, N_, minSz_;
  Eigen::ArrayXf Cc_, Cr_; // Coefficients
};

} // namespace pk::Ops
