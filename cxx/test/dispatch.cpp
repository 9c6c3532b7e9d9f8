#include "pk/prox/norms.hpp"
#include "randn.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>

using namespace pk;
using namespace Catch;

TEST_CASE("ComplexSplit", "[dispatch]")
{
  Index const                   sz = 16;
  Eigen::VectorXcf const        v = RandN(sz, 2.f);
  Eigen::VectorXf const         mag = v.cwiseAbs();
  Eigen::VectorXcf const        dir = v.array() / mag.array().cast<Cx>();
  std::vector<Proxs::Prox::Ptr> proxs{Proxs::L1::Make(0.5f), Proxs::L2::Make(0.5f), Proxs::SquaredL2::Make(0.5f),
                                      Proxs::Box::Make(0.f, 0.2f, 0.8f)};
  for (auto const &p : proxs) {
    INFO(p->name);
    Eigen::VectorXcf const z = p->apply(1.f, v);
    Eigen::VectorXf const  zm = p->apply(1.f, mag);
    Eigen::VectorXcf const y = dir.array() * zm.array().cast<Cx>();
    CHECK((z - y).norm() == Approx(0.f).margin(1.e-5f));
    CHECK((z - Proxs::Direction(p->phase, v).cwiseProduct(zm.cast<Cx>())).norm() == Approx(0.f).margin(1.e-5f));
  }
}

TEST_CASE("SplitPhaseCallback", "[dispatch]")
{
  Eigen::VectorXcf const v = RandN(8, 1.f);
  Eigen::VectorXcf const z = Proxs::SplitPhase(Proxs::Phase::Polar, v, [](Eigen::VectorXf &m) { m *= 2.f; });
  CHECK((z - 2.f * v).norm() == Approx(0.f).margin(1.e-5f));

  CHECK_THROWS_AS(Proxs::SplitPhase(Proxs::Phase::Polar, v, [](Eigen::VectorXf &m) { m.resize(3); }), Log::Failure);
}

TEST_CASE("PolarPhase", "[dispatch]")
{
  Proxs::L1        prox(1.f, nullptr, Proxs::Phase::Polar);
  Eigen::VectorXcf v(3);
  v << Cx(0.f, 3.f), Cx(0.f, -3.f), Cx(-4.f, 3.f);
  Eigen::VectorXcf const z = prox(v);
  CHECK(z[0].real() == 0.f);
  CHECK(z[0].imag() == Approx(2.f));
  CHECK(z[1].real() == 0.f);
  CHECK(z[1].imag() == Approx(-2.f));
  CHECK(z[2].real() == Approx(-3.2f));
  CHECK(z[2].imag() == Approx(2.4f));

  Eigen::VectorXcf const d = Proxs::Direction(Proxs::Phase::Polar, v);
  CHECK(d[0] == Cx(0.f, 1.f));
  CHECK(d[2].real() == Approx(-0.8f));
  CHECK(d[2].imag() == Approx(0.6f));
}

TEST_CASE("AtanPhase", "[dispatch]")
{
  Proxs::L1        prox(1.f, nullptr, Proxs::Phase::Atan);
  Eigen::VectorXcf v(4);
  v << Cx(0.f, 3.f), Cx(0.f, -3.f), Cx(3.f, 4.f), Cx(-4.f, 3.f);

  SECTION("Zero real part gives ±π/2")
  {
    Eigen::VectorXcf const d = Proxs::Direction(Proxs::Phase::Atan, v);
    CHECK(std::isfinite(d[0].real()));
    CHECK(d[0].real() == Approx(0.f).margin(1.e-6f));
    CHECK(d[0].imag() == Approx(1.f));
    CHECK(d[1].real() == Approx(0.f).margin(1.e-6f));
    CHECK(d[1].imag() == Approx(-1.f));

    Eigen::VectorXcf const z = prox(v);
    CHECK(z[0].real() == Approx(0.f).margin(1.e-6f));
    CHECK(z[0].imag() == Approx(2.f));
    CHECK(z[1].real() == Approx(0.f).margin(1.e-6f));
    CHECK(z[1].imag() == Approx(-2.f));
  }

  SECTION("Right half-plane matches polar")
  {
    Eigen::VectorXcf const z = prox(v);
    CHECK(z[2].real() == Approx(2.4f));
    CHECK(z[2].imag() == Approx(3.2f));
  }

  SECTION("Left half-plane is folded onto the right")
  {
    Eigen::VectorXcf const d = Proxs::Direction(Proxs::Phase::Atan, v);
    CHECK(d[3].real() == Approx(0.8f));
    CHECK(d[3].imag() == Approx(-0.6f));

    Proxs::L1        l1(2.f, nullptr, Proxs::Phase::Atan);
    Eigen::VectorXcf neg(1);
    neg << Cx(-5.f, 0.f);
    CHECK(l1(neg)[0].real() == Approx(3.f));
    CHECK(l1(neg)[0].imag() == Approx(0.f).margin(1.e-6f));
  }
}

TEST_CASE("ZeroComplexInput", "[dispatch]")
{
  Eigen::VectorXcf v(2);
  v << Cx(0.f, 0.f), Cx(0.f, 3.f);
  for (auto const phase : {Proxs::Phase::Polar, Proxs::Phase::Atan}) {
    Eigen::VectorXcf const d = Proxs::Direction(phase, v);
    CHECK(std::isnan(d[0].real()));
    CHECK(std::isnan(d[0].imag()));

    Eigen::VectorXcf const z = Proxs::SquaredL2(0.f, phase)(v);
    CHECK(std::isnan(z[0].real()));
    CHECK(std::isnan(z[0].imag()));
    CHECK_FALSE(std::isnan(z[1].real()));
    CHECK(z[1].imag() == Approx(3.f));
  }

  Eigen::VectorXf const r = Eigen::VectorXf::Zero(3);
  CHECK(Proxs::L1(1.f)(r) == r);
}

TEST_CASE("Tensors", "[dispatch]")
{
  Sz3 const shape{2, 3, 4};
  Cx3       x(shape);
  Eigen::Map<Eigen::VectorXcf>(x.data(), x.size()) = RandN(x.size(), 1.f).matrix();
  Re2 r(6, 4);
  r.setRandom();

  auto const l2 = Proxs::L2::Make(0.5f);
  Cx3 const  z = (*l2)(x);
  CHECK(z.dimensions() == x.dimensions());
  Eigen::VectorXcf const zflat = l2->apply(1.f, Eigen::VectorXcf(Eigen::Map<Eigen::VectorXcf const>(x.data(), x.size())));
  CHECK((Eigen::Map<Eigen::VectorXcf const>(z.data(), z.size()) - zflat).norm() == Approx(0.f).margin(1.e-6f));

  Proxs::Box const box(0.f, 0.25f, 0.5f);
  Re2 const        b = box.apply(2.f, r);
  CHECK(b.dimensions() == r.dimensions());
  for (Index ii = 0; ii < r.size(); ii++) {
    CHECK(b.data()[ii] == std::clamp(r.data()[ii], 0.25f, 0.5f));
  }
}
