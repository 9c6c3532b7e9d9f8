#pragma once

#include "../op/op.hpp"
#include "prox.hpp"

#include <limits>

namespace pk::Proxs {

struct Opts
{
  std::string type;   // l1, l2, sql2 or box
  float       λ = 0.f;
  float       lower = -std::numeric_limits<float>::infinity();
  float       upper = std::numeric_limits<float>::infinity();
  Phase       phase = Phase::Polar;
};

auto ParsePhase(std::string const &s) -> Phase;
auto PhaseName(Phase const p) -> std::string;

//! Build an operator from options. Only L1 accepts a transform.
auto Make(Opts const &opts, Ops::Op::Ptr T = nullptr) -> Prox::Ptr;

} // namespace pk::Proxs
