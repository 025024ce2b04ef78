#include "lpkit/glpk_backend.hpp"
#include "lpkit/errors.hpp"
#include <chrono>
#include <climits>
#include <cmath>
#include <glpk.h>
#include <memory>
#include <spdlog/spdlog.h>

namespace lpkit {

struct GlpProbDeleter {
  void operator()(glp_prob *lp) const { glp_delete_prob(lp); }
};
using GlpProbPtr = std::unique_ptr<glp_prob, GlpProbDeleter>;

static std::string simplexError(int code) {
  switch (code) {
  case GLP_EBADB:
    return "invalid initial basis";
  case GLP_ESING:
    return "singular basis matrix";
  case GLP_ECOND:
    return "ill-conditioned basis matrix";
  case GLP_EBOUND:
    return "incorrect variable bounds";
  case GLP_EFAIL:
    return "numerical failure";
  case GLP_EOBJLL:
  case GLP_EOBJUL:
    return "objective limit reached";
  case GLP_EITLIM:
    return "iteration limit reached";
  case GLP_EROOT:
    return "no optimal basis for the LP relaxation";
  case GLP_EMIPGAP:
    return "MIP gap tolerance reached";
  case GLP_ESTOP:
    return "search terminated by application";
  }
  return "glpk error code " + std::to_string(code);
}

// GLPK bound type for [lb, ub]
static int boundType(double lb, double ub) {
  bool has_lb = std::isfinite(lb);
  bool has_ub = std::isfinite(ub);
  if (!has_lb && !has_ub)
    return GLP_FR;
  if (has_lb && !has_ub)
    return GLP_LO;
  if (!has_lb && has_ub)
    return GLP_UP;
  if (lb == ub)
    return GLP_FX;
  return GLP_DB;
}

// Time limit, 0 → unbounded
static int timeLimit(const SolverOptions &opts) {
  return opts.time_limit_ms > 0 ? opts.time_limit_ms : INT_MAX;
}

// glp_intopt rejects fractional bounds on integer columns (GLP_EBOUND).
// Tighten them to the integer range; false when that range is empty.
static bool roundIntegerBounds(glp_prob *lp) {
  constexpr double kIntTol = 1e-9;
  const int n = glp_get_num_cols(lp);
  for (int j = 1; j <= n; j++) {
    if (glp_get_col_kind(lp, j) != GLP_IV)
      continue;
    int type = glp_get_col_type(lp, j);
    double lb = -kInfinity, ub = kInfinity;
    if (type == GLP_LO || type == GLP_DB || type == GLP_FX)
      lb = std::ceil(glp_get_col_lb(lp, j) - kIntTol);
    if (type == GLP_UP || type == GLP_DB || type == GLP_FX)
      ub = std::floor(glp_get_col_ub(lp, j) + kIntTol);
    if (lb > ub) {
      spdlog::debug("[GLPK] Column {} has no integer in its bounds",
                    glp_get_col_name(lp, j) ? glp_get_col_name(lp, j) : "?");
      return false;
    }
    glp_set_col_bnds(lp, j, boundType(lb, ub), std::isfinite(lb) ? lb : 0.0,
                     std::isfinite(ub) ? ub : 0.0);
  }
  return true;
}

// ── Run simplex (+ branch-and-bound) on a loaded problem ─────────────
static SolverOutput run(glp_prob *lp, const SolverOptions &opts) {
  SolverOutput out;
  const int n = glp_get_num_cols(lp);
  const int m = glp_get_num_rows(lp);
  const bool mip = glp_get_num_int(lp) > 0;
  auto start = std::chrono::steady_clock::now();

  if (mip && !roundIntegerBounds(lp)) {
    out.status = SolutionStatus::INFEASIBLE;
    out.message = "integer variable bounds contain no integer";
    return out;
  }

  glp_smcp parm;
  glp_init_smcp(&parm);
  parm.msg_lev = opts.verbose ? GLP_MSG_ON : GLP_MSG_OFF;
  parm.presolve = opts.presolve ? GLP_ON : GLP_OFF;
  parm.tm_lim = timeLimit(opts);

  int rc = glp_simplex(lp, &parm);

  if (rc == GLP_ETMLIM) {
    out.status = SolutionStatus::NOT_SOLVED;
    out.message = "time limit reached";
    spdlog::warn("[GLPK] Simplex stopped: time limit of {}ms reached",
                 opts.time_limit_ms);
    return out;
  }
  if (rc == GLP_ENOPFS) {
    out.status = SolutionStatus::INFEASIBLE;
    out.message = "no primal feasible solution (presolver)";
    return out;
  }
  if (rc == GLP_ENODFS) {
    out.status = SolutionStatus::UNBOUNDED;
    out.message = "no dual feasible solution (presolver)";
    return out;
  }
  if (rc != 0)
    throw SolverInvocationError("glp_simplex failed: " + simplexError(rc));

  switch (glp_get_status(lp)) {
  case GLP_OPT:
    break;
  case GLP_NOFEAS:
    out.status = SolutionStatus::INFEASIBLE;
    out.message = "no primal feasible solution";
    return out;
  case GLP_UNBND:
    out.status = SolutionStatus::UNBOUNDED;
    out.message = "objective is unbounded";
    return out;
  default:
    out.status = SolutionStatus::NOT_SOLVED;
    out.message = "simplex ended without an optimal basis";
    return out;
  }

  if (!mip) {
    out.status = SolutionStatus::OPTIMAL;
    out.objective = glp_get_obj_val(lp);
    out.col_values.resize(n);
    out.col_duals.resize(n);
    out.row_duals.resize(m);
    for (int j = 0; j < n; j++) {
      out.col_values[j] = glp_get_col_prim(lp, j + 1);
      out.col_duals[j] = glp_get_col_dual(lp, j + 1);
    }
    for (int i = 0; i < m; i++)
      out.row_duals[i] = glp_get_row_dual(lp, i + 1);
    spdlog::debug("[GLPK] LP optimal, objective={}", out.objective);
    return out;
  }

  // Branch-and-bound from the optimal relaxation, within what is left of
  // the time limit
  glp_iocp iocp;
  glp_init_iocp(&iocp);
  iocp.msg_lev = opts.verbose ? GLP_MSG_ON : GLP_MSG_OFF;
  iocp.tm_lim = timeLimit(opts);
  if (opts.time_limit_ms > 0) {
    double left = opts.time_limit_ms - elapsed_ms(start);
    if (left < 1.0) {
      out.status = SolutionStatus::NOT_SOLVED;
      out.message = "time limit reached";
      spdlog::warn("[GLPK] Time limit of {}ms used up by the relaxation",
                   opts.time_limit_ms);
      return out;
    }
    iocp.tm_lim = (int)left;
  }

  rc = glp_intopt(lp, &iocp);

  if (rc != 0 && rc != GLP_ETMLIM)
    throw SolverInvocationError("glp_intopt failed: " + simplexError(rc));

  switch (glp_mip_status(lp)) {
  case GLP_OPT:
    out.status = SolutionStatus::OPTIMAL;
    break;
  case GLP_NOFEAS:
    out.status = SolutionStatus::INFEASIBLE;
    out.message = "no integer feasible solution";
    return out;
  default:
    // GLP_FEAS after a time limit: incumbent not proven optimal
    out.status = SolutionStatus::NOT_SOLVED;
    out.message = rc == GLP_ETMLIM ? "time limit reached"
                                   : "branch-and-bound did not finish";
    spdlog::warn("[GLPK] Branch-and-bound stopped: {}", out.message);
    return out;
  }

  out.objective = glp_mip_obj_val(lp);
  out.col_values.resize(n);
  for (int j = 0; j < n; j++)
    out.col_values[j] = glp_mip_col_val(lp, j + 1);
  spdlog::debug("[GLPK] MIP optimal, objective={}", out.objective);
  return out;
}

GlpkBackend::GlpkBackend(const SolverOptions &options) : options_(options) {}

// ── Load a SolverInput into GLPK and solve ───────────────────────────
SolverOutput GlpkBackend::invoke(const SolverInput &input) {
  const size_t n = input.numCols();
  const size_t m = input.numRows();

  if (input.col_lower.size() != n || input.col_upper.size() != n ||
      input.col_domain.size() != n || input.objective.size() != n ||
      input.row_op.size() != m || input.row_rhs.size() != m) {
    throw SolverInvocationError("inconsistent solver input for '" +
                                input.name + "'");
  }

  glp_term_out(options_.verbose ? GLP_ON : GLP_OFF);

  GlpProbPtr lp(glp_create_prob());
  glp_set_prob_name(lp.get(), input.name.c_str());
  glp_set_obj_dir(lp.get(),
                  input.sense == Sense::MAXIMIZE ? GLP_MAX : GLP_MIN);
  glp_set_obj_coef(lp.get(), 0, input.objective_constant);

  // Columns
  if (n > 0) {
    glp_add_cols(lp.get(), (int)n);
    for (size_t j = 0; j < n; j++) {
      int col = (int)j + 1;
      glp_set_col_name(lp.get(), col, input.col_names[j].c_str());
      glp_set_col_bnds(lp.get(), col,
                       boundType(input.col_lower[j], input.col_upper[j]),
                       std::isfinite(input.col_lower[j]) ? input.col_lower[j]
                                                         : 0.0,
                       std::isfinite(input.col_upper[j]) ? input.col_upper[j]
                                                         : 0.0);
      glp_set_obj_coef(lp.get(), col, input.objective[j]);
      if (input.col_domain[j] == Domain::INTEGER)
        glp_set_col_kind(lp.get(), col, GLP_IV);
    }
  }

  // Rows
  if (m > 0) {
    glp_add_rows(lp.get(), (int)m);
    for (size_t r = 0; r < m; r++) {
      int row = (int)r + 1;
      glp_set_row_name(lp.get(), row, input.row_names[r].c_str());
      double rhs = input.row_rhs[r];
      switch (input.row_op[r]) {
      case Operator::LE:
        glp_set_row_bnds(lp.get(), row, GLP_UP, 0.0, rhs);
        break;
      case Operator::GE:
        glp_set_row_bnds(lp.get(), row, GLP_LO, rhs, 0.0);
        break;
      case Operator::EQ:
        glp_set_row_bnds(lp.get(), row, GLP_FX, rhs, rhs);
        break;
      }
    }

    // Load constraint matrix (GLPK uses 1-indexed arrays)
    size_t nnz = input.triplets.size();
    std::vector<int> ia(nnz + 1), ja(nnz + 1);
    std::vector<double> ar(nnz + 1);

    for (size_t k = 0; k < nnz; k++) {
      const auto &t = input.triplets[k];
      if (t.row < 0 || t.row >= (int)m || t.col < 0 || t.col >= (int)n)
        throw SolverInvocationError("matrix entry out of range in '" +
                                    input.name + "'");
      ia[k + 1] = t.row + 1;
      ja[k + 1] = t.col + 1;
      ar[k + 1] = t.val;
    }

    glp_load_matrix(lp.get(), (int)nnz, ia.data(), ja.data(), ar.data());
  }

  spdlog::debug("[GLPK] Loaded '{}': {} cols, {} rows, {} nonzeros",
                input.name, n, m, input.triplets.size());

  return run(lp.get(), options_);
}

// ── Read CPLEX LP text and solve ─────────────────────────────────────
SolverOutput GlpkBackend::solveLpFile(const std::string &path) {
  glp_term_out(options_.verbose ? GLP_ON : GLP_OFF);

  GlpProbPtr lp(glp_create_prob());
  if (glp_read_lp(lp.get(), nullptr, path.c_str()) != 0)
    throw SolverInvocationError("glp_read_lp could not parse '" + path + "'");

  spdlog::debug("[GLPK] Read '{}': {} cols, {} rows", path,
                glp_get_num_cols(lp.get()), glp_get_num_rows(lp.get()));
  return run(lp.get(), options_);
}

} // namespace lpkit
