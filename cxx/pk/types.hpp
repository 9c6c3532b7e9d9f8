#pragma once

// This doesn't actually help with complex matrices as std::complex has no NaN
#ifdef DEBUG
#define EIGEN_INITIALIZE_MATRICES_BY_NAN
#endif

#include <Eigen/Dense>
#include <unsupported/Eigen/CXX11/Tensor>

#include <complex>

using Index = Eigen::Index;

namespace pk {

template <int N> using ReN = Eigen::Tensor<float, N>;
using Re2 = ReN<2>;

using Cx = std::complex<float>;

template <int N> using CxN = Eigen::Tensor<Cx, N>;
using Cx3 = CxN<3>;

// Useful shorthands
template <int Rank> using Sz = typename Eigen::DSizes<Index, Rank>;
using Sz3 = Sz<3>;

template <typename T> auto Wrap(T const index, T const sz) -> T
{
  T const w = index % sz;
  return w < 0 ? w + sz : w;
}

} // namespace pk
