#include "make.hpp"

#include "norms.hpp"

namespace pk::Proxs {

auto ParsePhase(std::string const &s) -> Phase
{
  if (s == "polar") {
    return Phase::Polar;
  } else if (s == "atan") {
    return Phase::Atan;
  } else {
    throw InvalidParameter("Prox", "Unknown phase mode {}, must be polar or atan", s);
  }
}

auto PhaseName(Phase const p) -> std::string
{
  switch (p) {
  case Phase::Polar: return "polar";
  case Phase::Atan: return "atan";
  }
  throw Log::Failure("Prox", "Unknown phase mode");
}

auto Make(Opts const &opts, Ops::Op::Ptr T) -> Prox::Ptr
{
  Log::Debug("Prox", "Making {} λ {} phase {}", opts.type, opts.λ, PhaseName(opts.phase));
  if (T && opts.type != "l1") { throw InvalidParameter("Prox", "Only l1 takes a transform, not {}", opts.type); }

  if (opts.type == "l1") {
    return L1::Make(opts.λ, T, opts.phase);
  } else if (opts.type == "l2") {
    return L2::Make(opts.λ, opts.phase);
  } else if (opts.type == "sql2") {
    return SquaredL2::Make(opts.λ, opts.phase);
  } else if (opts.type == "box") {
    return Box::Make(opts.λ, opts.lower, opts.upper, opts.phase);
  } else {
    throw InvalidParameter("Prox", "Unknown prox type {}, must be l1, l2, sql2 or box", opts.type);
  }
}

} // namespace pk::Proxs
