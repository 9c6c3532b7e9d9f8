#pragma once

#include "pk/types.hpp"

inline auto RandN(Index const sz, float sigma) -> Eigen::ArrayXcf
{
  Eigen::ArrayXf  u = (Eigen::ArrayXf::Random(sz) * 0.5f) + 0.5f;
  Eigen::ArrayXf  v = (Eigen::ArrayXf::Random(sz) * 0.5f) + 0.5f;
  Eigen::ArrayXcf x(sz);
  x.real() = sigma * (-2.f * u.log()).sqrt() * cos(2.f * float(M_PI) * v);
  x.imag() = sigma * (-2.f * v.log()).sqrt() * sin(2.f * float(M_PI) * u);
  return x;
}
