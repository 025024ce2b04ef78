#pragma once
#include "lpkit/common.hpp"
#include "lpkit/solver.hpp"

namespace lpkit {

// GLPK simplex / branch-and-bound backend.
//
// Continuous models: primal simplex, duals and reduced costs reported.
// Models with integer columns: simplex on the relaxation, then glp_intopt;
// only primal values and the objective are reported.
class GlpkBackend : public SolverBackend {
public:
  explicit GlpkBackend(const SolverOptions &options = {});

  std::string name() const override { return "glpk"; }

  SolverOutput invoke(const SolverInput &input) override;

  const SolverOptions &options() const { return options_; }

  // Read a CPLEX LP file with glp_read_lp and solve it as-is.
  // Used to check that LpWriter output is re-parseable.
  SolverOutput solveLpFile(const std::string &path);

private:
  SolverOptions options_;
};

} // namespace lpkit
