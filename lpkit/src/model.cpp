#include "lpkit/model.hpp"
#include "lpkit/errors.hpp"
#include "lpkit/glpk_backend.hpp"
#include "lpkit/lp_writer.hpp"
#include "lpkit/solver.hpp"
#include <atomic>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstring>
#include <spdlog/spdlog.h>

namespace lpkit {

static std::atomic<uint64_t> next_model_id{1};

// CPLEX LP identifiers: no leading digit or period, restricted charset
static bool isValidName(const std::string &name) {
  if (name.empty() || name.size() > 255)
    return false;
  if (std::isdigit(static_cast<unsigned char>(name[0])) || name[0] == '.')
    return false;
  static const char *extra = "!\"#$%&()/,.;?@_`'{}|~";
  for (char c : name) {
    if (std::isalnum(static_cast<unsigned char>(c)))
      continue;
    if (std::strchr(extra, c) == nullptr)
      return false;
  }
  return true;
}

Model::Model(std::string name) : name_(std::move(name)), id_(next_model_id++) {
  if (!isValidName(name_))
    throw InvalidModelError("invalid model name '" + name_ + "'");
}

// ── Structure ────────────────────────────────────────────────────────
void Model::requireUnsolved(const char *operation) const {
  if (state_ != ModelState::UNSOLVED) {
    throw InvalidStateError(std::string(operation) + " on model '" + name_ +
                            "' in state " + toString(state_) +
                            "; rebuild the model to change it");
  }
}

Variable Model::addVariable(const std::string &name, double lower,
                            double upper, Domain domain) {
  requireUnsolved("addVariable");

  if (!isValidName(name))
    throw InvalidModelError("invalid variable name '" + name + "'");
  if (var_index_.count(name))
    throw DuplicateNameError("variable '" + name + "' already exists in '" +
                             name_ + "'");
  if (std::isnan(lower) || std::isnan(upper) || lower == kInfinity ||
      upper == -kInfinity || lower > upper) {
    throw InvalidModelError("variable '" + name + "' has invalid bounds [" +
                            std::to_string(lower) + ", " +
                            std::to_string(upper) + "]");
  }

  Variable var(id_, variables_.size(), name, lower, upper, domain);
  var_index_[name] = variables_.size();
  variables_.push_back(var);
  spdlog::debug("[Model] {}: variable {} in [{}, {}] ({})", name_, name,
                lower, upper, toString(domain));
  return var;
}

void Model::checkOwned(const Variable &var) const {
  if (var.owner() != id_ || var.index() >= variables_.size() ||
      variables_[var.index()].name() != var.name()) {
    throw UnknownVariableError("variable '" + var.name() +
                               "' does not belong to model '" + name_ + "'");
  }
}

void Model::checkOwned(const Constraint &con) const {
  if (con.owner() != id_ || con.index() >= constraints_.size()) {
    throw std::out_of_range("constraint '" + con.name() +
                            "' does not belong to model '" + name_ + "'");
  }
}

void Model::checkExpression(const LinearExpression &expr,
                            const char *where) const {
  for (auto &t : expr.terms()) {
    checkOwned(t.var);
    if (!std::isfinite(t.coef))
      throw InvalidModelError(std::string(where) + ": coefficient of '" +
                              t.var.name() + "' is not finite");
  }
  if (!std::isfinite(expr.constant()))
    throw InvalidModelError(std::string(where) + ": constant is not finite");
}

Model &Model::setObjective(LinearExpression expression, Sense sense) {
  requireUnsolved("setObjective");
  checkExpression(expression, "objective");
  objective_.expression = std::move(expression);
  objective_.sense = sense;
  return *this;
}

Constraint Model::addConstraint(LinearExpression expression, Operator op,
                                double rhs, const std::string &name) {
  requireUnsolved("addConstraint");

  std::string cname =
      name.empty() ? "_C" + std::to_string(constraints_.size() + 1) : name;
  if (!isValidName(cname))
    throw InvalidModelError("invalid constraint name '" + cname + "'");
  if (con_index_.count(cname))
    throw DuplicateNameError("constraint '" + cname +
                             "' already exists in '" + name_ + "'");
  checkExpression(expression, cname.c_str());
  if (!std::isfinite(rhs))
    throw InvalidModelError("constraint '" + cname +
                            "': right-hand side is not finite");

  Constraint con(id_, constraints_.size(), cname, std::move(expression), op,
                 rhs);
  con_index_[cname] = constraints_.size();
  constraints_.push_back(con);
  return con;
}

// ── Queries ──────────────────────────────────────────────────────────
bool Model::isMip() const {
  for (auto &v : variables_) {
    if (v.isInteger())
      return true;
  }
  return false;
}

const Variable &Model::variable(const std::string &name) const {
  auto it = var_index_.find(name);
  if (it == var_index_.end())
    throw UnknownVariableError("no variable '" + name + "' in model '" +
                               name_ + "'");
  return variables_[it->second];
}

const Constraint &Model::constraint(const std::string &name) const {
  auto it = con_index_.find(name);
  if (it == con_index_.end())
    throw std::out_of_range("no constraint '" + name + "' in model '" +
                            name_ + "'");
  return constraints_[it->second];
}

bool Model::hasVariable(const std::string &name) const {
  return var_index_.count(name) > 0;
}

std::optional<double> Model::value(const Variable &var) const {
  checkOwned(var);
  if (solution_.values.empty())
    return std::nullopt;
  return solution_.values[var.index()];
}

std::optional<double> Model::reducedCost(const Variable &var) const {
  checkOwned(var);
  if (solution_.reduced_costs.empty())
    return std::nullopt;
  return solution_.reduced_costs[var.index()];
}

std::optional<double> Model::activity(const Constraint &con) const {
  checkOwned(con);
  if (solution_.activities.empty())
    return std::nullopt;
  return solution_.activities[con.index()];
}

std::optional<double> Model::slack(const Constraint &con) const {
  checkOwned(con);
  if (solution_.slacks.empty())
    return std::nullopt;
  return solution_.slacks[con.index()];
}

std::optional<double> Model::dual(const Constraint &con) const {
  checkOwned(con);
  if (solution_.duals.empty())
    return std::nullopt;
  return solution_.duals[con.index()];
}

// ── Geometry ─────────────────────────────────────────────────────────
Eigen::MatrixXd Model::coefficientMatrix() const {
  Eigen::MatrixXd A =
      Eigen::MatrixXd::Zero(constraints_.size(), variables_.size());
  for (size_t r = 0; r < constraints_.size(); r++) {
    for (auto &t : constraints_[r].expression().terms())
      A(r, t.var.index()) += t.coef;
  }
  return A;
}

Eigen::VectorXd Model::rhsVector() const {
  Eigen::VectorXd b(constraints_.size());
  for (size_t r = 0; r < constraints_.size(); r++)
    b[r] = constraints_[r].effectiveRhs();
  return b;
}

Eigen::VectorXd Model::objectiveVector() const {
  Eigen::VectorXd c = Eigen::VectorXd::Zero(variables_.size());
  for (auto &t : objective_.expression.terms())
    c[t.var.index()] += t.coef;
  return c;
}

// ── Solving ──────────────────────────────────────────────────────────
SolutionStatus Model::solve(const SolverOptions &options) {
  GlpkBackend backend(options);
  return solve(backend);
}

// Reject responses whose shape does not match the model
static void validateOutput(const SolverOutput &out, size_t n, size_t m,
                           bool mip, const std::string &backend) {
  if (out.status != SolutionStatus::OPTIMAL)
    return;
  auto fail = [&](const std::string &what) {
    throw SolverInvocationError(backend + " returned a malformed solution: " +
                                what);
  };
  if (out.col_values.size() != n)
    fail("expected " + std::to_string(n) + " column values, got " +
         std::to_string(out.col_values.size()));
  if (!std::isfinite(out.objective))
    fail("objective value is not finite");
  if (!mip) {
    if (out.col_duals.size() != n)
      fail("expected " + std::to_string(n) + " reduced costs, got " +
           std::to_string(out.col_duals.size()));
    if (out.row_duals.size() != m)
      fail("expected " + std::to_string(m) + " row duals, got " +
           std::to_string(out.row_duals.size()));
  }
}

SolutionStatus Model::solve(SolverBackend &backend) {
  if (state_ != ModelState::UNSOLVED) {
    throw InvalidStateError("model '" + name_ + "' was already solved (" +
                            toString(state_) +
                            "); build a new model to solve again");
  }

  state_ = ModelState::SOLVING;
  auto start = std::chrono::steady_clock::now();
  spdlog::info("[Model] Solving '{}' with {}: {} variables, {} constraints{}",
               name_, backend.name(), variables_.size(), constraints_.size(),
               isMip() ? " (MIP)" : "");

  SolverOutput out;
  try {
    auto input = backend.translate(*this);
    out = backend.invoke(input);
    validateOutput(out, variables_.size(), constraints_.size(), isMip(),
                   backend.name());
  } catch (const SolverInvocationError &e) {
    state_ = ModelState::ERROR;
    spdlog::error("[Model] {}: solver failed: {}", name_, e.what());
    throw;
  } catch (const std::exception &e) {
    state_ = ModelState::ERROR;
    spdlog::error("[Model] {}: solver failed: {}", name_, e.what());
    throw SolverInvocationError(backend.name() + ": " + e.what());
  }

  solution_.backend = backend.name();
  attachSolution(out, elapsed_ms(start));

  if (solution_.objective) {
    spdlog::info("[Model] {}: {} objective={} in {:.1f}ms", name_,
                 toString(solution_.status), *solution_.objective,
                 solution_.elapsed_ms);
  } else {
    spdlog::info("[Model] {}: {} in {:.1f}ms", name_,
                 toString(solution_.status), solution_.elapsed_ms);
  }
  return solution_.status;
}

void Model::attachSolution(const SolverOutput &out, double elapsed) {
  const size_t n = variables_.size();
  const size_t m = constraints_.size();
  const bool mip = isMip();

  solution_.status = out.status;
  solution_.message = out.message;
  solution_.elapsed_ms = elapsed;
  solution_.values.assign(n, std::nullopt);
  solution_.reduced_costs.assign(n, std::nullopt);
  solution_.activities.assign(m, std::nullopt);
  solution_.slacks.assign(m, std::nullopt);
  solution_.duals.assign(m, std::nullopt);
  solution_.objective.reset();

  switch (out.status) {
  case SolutionStatus::OPTIMAL:
    state_ = ModelState::OPTIMAL;
    break;
  case SolutionStatus::INFEASIBLE:
    state_ = ModelState::INFEASIBLE;
    return;
  case SolutionStatus::UNBOUNDED:
    state_ = ModelState::UNBOUNDED;
    return;
  case SolutionStatus::NOT_SOLVED:
    state_ = ModelState::ERROR;
    return;
  }

  solution_.objective = out.objective;

  Eigen::VectorXd x(n);
  for (size_t j = 0; j < n; j++) {
    x[j] = out.col_values[j];
    solution_.values[j] = out.col_values[j];
    if (!mip)
      solution_.reduced_costs[j] = out.col_duals[j];
  }

  // activity = A x + expression constant
  Eigen::VectorXd ax = coefficientMatrix() * x;
  for (size_t r = 0; r < m; r++) {
    const auto &con = constraints_[r];
    double act = ax[r] + con.expression().constant();
    solution_.activities[r] = act;
    switch (con.op()) {
    case Operator::LE:
      solution_.slacks[r] = con.rhs() - act;
      break;
    case Operator::GE:
      solution_.slacks[r] = act - con.rhs();
      break;
    case Operator::EQ:
      solution_.slacks[r] = 0.0;
      break;
    }
    if (!mip)
      solution_.duals[r] = out.row_duals[r];
  }
}

void Model::writeFormat(const std::string &path) const {
  LpWriter::writeFile(*this, path);
}

} // namespace lpkit
