#pragma once

#include "../log/log.hpp"
#include "../types.hpp"

#include <memory>
#include <utility>

namespace pk::Proxs {

//! Thrown when an operator is constructed with parameters that violate its preconditions
struct InvalidParameter : Log::Failure
{
  template <typename... Args>
  InvalidParameter(std::string const &cat, fmt::format_string<Args...> fs, Args &&...args)
    : Log::Failure(cat, fs, std::forward<Args>(args)...)
  {
  }
};

/* How the unit-magnitude direction of a complex value is recovered.
 *
 * Polar - v / |v|. 0 + 0i gives NaN.
 * Atan  - cos θ + i sin θ with θ = atan(Im v / Re v). Re v = 0 gives θ = ±π/2 (or NaN when Im v = 0 too), and as
 *         this is not atan2, values with Re v < 0 get the direction of -v.
 */
enum struct Phase
{
  Polar,
  Atan
};

/*
 * Proximal operator of α f, argmin_x ½|x - v|² + α f(x).
 *
 * Real inputs go straight to solve(). Complex inputs are split into magnitude and phase, solve() is applied to the
 * magnitude and the result is recombined with the original phase. The step size α must be finite and positive.
 */
struct Prox
{
  using Vector = Eigen::VectorXf;
  using CxVector = Eigen::VectorXcf;
  using Ptr = std::shared_ptr<Prox>;

  Prox(std::string const &name, Phase const phase);

  auto apply(float const α, Vector const &v) const -> Vector;
  auto apply(float const α, CxVector const &v) const -> CxVector;

  template <typename Scalar, int N>
  auto apply(float const α, Eigen::Tensor<Scalar, N> const &v) const -> Eigen::Tensor<Scalar, N>
  {
    checkStep(α);
    using V = Eigen::Vector<Scalar, Eigen::Dynamic>;
    V const z = this->apply(α, V(Eigen::Map<V const>(v.data(), v.size())));
    if (z.size() != v.size()) {
      throw Log::Failure(name, "Result size {} does not match input size {}", z.size(), v.size());
    }
    Eigen::Tensor<Scalar, N> out(v.dimensions());
    Eigen::Map<V>(out.data(), out.size()) = z;
    return out;
  }

  template <typename T> auto operator()(T const &v) const -> T { return this->apply(1.f, v); }

  /* The real-valued closed form, in place. Transforms may change the size of x. */
  virtual void solve(float const α, Vector &x) const = 0;

  /* True if solve() returns coefficients of a transform rather than values in the input domain */
  virtual auto transformed() const -> bool { return false; }

  virtual ~Prox() {};

  std::string const name;
  Phase const       phase;

protected:
  void checkStep(float const α) const;
};

#define PROX_INHERIT                                                                                                           \
  using Vector = typename Prox::Vector;                                                                                        \
  using CxVector = typename Prox::CxVector;                                                                                    \
  using Ptr = Prox::Ptr;                                                                                                       \
  using Prox::apply;

//! Unit-magnitude direction of each element of v
auto Direction(Phase const phase, Prox::CxVector const &v) -> Prox::CxVector;

/*
 * Shared complex path: direction(v) * magnitude(|v|). The magnitude solver is passed the elementwise magnitude of v
 * and must leave an array of the same size.
 */
template <typename F> auto SplitPhase(Phase const phase, Prox::CxVector const &v, F &&magnitude) -> Prox::CxVector
{
  Prox::Vector m = v.cwiseAbs();
  magnitude(m);
  if (m.size() != v.size()) {
    throw Log::Failure("Prox", "Magnitude result size {} did not match input size {}", m.size(), v.size());
  }
  return (Direction(phase, v).array() * m.array().cast<Cx>()).matrix();
}

/* prox of the convex conjugate α f*, via Moreau's decomposition. The wrapped prox must not be transformed. */
struct Conjugate final : Prox
{
  PROX_INHERIT
  static auto Make(Prox::Ptr p) -> Prox::Ptr;
  Conjugate(Prox::Ptr p);

  void solve(float const α, Vector &x) const;

private:
  Prox::Ptr p;
};

} // namespace pk::Proxs
