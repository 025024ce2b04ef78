#include "lpkit/solver.hpp"
#include "lpkit/model.hpp"

namespace lpkit {

bool SolverInput::isMip() const {
  for (auto d : col_domain) {
    if (d == Domain::INTEGER)
      return true;
  }
  return false;
}

// ── Model → column/row form ──────────────────────────────────────────
SolverInput SolverBackend::translate(const Model &model) const {
  SolverInput in;
  in.name = model.name();
  in.sense = model.objective().sense;
  in.objective_constant = model.objective().expression.constant();

  const auto &vars = model.variables();
  in.col_names.reserve(vars.size());
  in.objective.assign(vars.size(), 0.0);
  for (auto &v : vars) {
    in.col_names.push_back(v.name());
    in.col_lower.push_back(v.lower());
    in.col_upper.push_back(v.upper());
    in.col_domain.push_back(v.domain());
  }
  for (auto &t : model.objective().expression.terms())
    in.objective[t.var.index()] += t.coef;

  int row = 0;
  for (auto &con : model.constraints()) {
    in.row_names.push_back(con.name());
    in.row_op.push_back(con.op());
    in.row_rhs.push_back(con.effectiveRhs());

    // LinearExpression merges repeated variables, so one entry per column
    for (auto &t : con.expression().terms()) {
      if (t.coef == 0.0)
        continue;
      in.triplets.push_back({row, (int)t.var.index(), t.coef});
    }
    row++;
  }
  return in;
}

} // namespace lpkit
