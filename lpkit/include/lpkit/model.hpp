#pragma once
#include "lpkit/common.hpp"
#include "lpkit/expression.hpp"
#include <Eigen/Dense>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lpkit {

class SolverBackend;
struct SolverOutput;

// Linear row: expression <op> rhs
class Constraint {
public:
  Constraint() = default;

  const std::string &name() const { return name_; }
  size_t index() const { return index_; }
  const LinearExpression &expression() const { return expr_; }
  Operator op() const { return op_; }
  double rhs() const { return rhs_; }
  uint64_t owner() const { return owner_; }

  // rhs with the expression constant moved to the right-hand side
  double effectiveRhs() const { return rhs_ - expr_.constant(); }

private:
  friend class Model;
  Constraint(uint64_t owner, size_t index, std::string name,
             LinearExpression expr, Operator op, double rhs)
      : owner_(owner), index_(index), name_(std::move(name)),
        expr_(std::move(expr)), op_(op), rhs_(rhs) {}

  uint64_t owner_ = 0;
  size_t index_ = 0;
  std::string name_;
  LinearExpression expr_;
  Operator op_ = Operator::LE;
  double rhs_ = 0.0;
};

struct Objective {
  LinearExpression expression;
  Sense sense = Sense::MINIMIZE;
};

// Results attached by solve(). Every optional is empty when the value is
// not applicable: no numbers for infeasible/unbounded models, no duals or
// reduced costs for models with integer variables.
struct Solution {
  SolutionStatus status = SolutionStatus::NOT_SOLVED;
  std::optional<double> objective;
  std::vector<std::optional<double>> values;
  std::vector<std::optional<double>> reduced_costs;
  std::vector<std::optional<double>> activities;
  std::vector<std::optional<double>> slacks;
  std::vector<std::optional<double>> duals;
  std::string backend;
  std::string message;
  double elapsed_ms = 0.0;
};

// A linear / mixed-integer program. Built while UNSOLVED, solved once.
//
//   Model m("farm");
//   auto x = m.addVariable("x", 0, kInfinity);
//   m.setObjective(LinearExpression().add(3, x), Sense::MAXIMIZE);
//   m.addConstraint(LinearExpression().add(1, x), Operator::LE, 4, "cap");
//   m.solve();
class Model {
public:
  explicit Model(std::string name = "model");

  Model(const Model &) = delete;
  Model &operator=(const Model &) = delete;
  Model(Model &&) = default;
  Model &operator=(Model &&) = default;

  // ===== Structure =====

  Variable addVariable(const std::string &name, double lower = 0.0,
                       double upper = kInfinity,
                       Domain domain = Domain::CONTINUOUS);

  Model &setObjective(LinearExpression expression, Sense sense);

  // Empty name → "_C<n>" with n the 1-based insertion position
  Constraint addConstraint(LinearExpression expression, Operator op,
                           double rhs, const std::string &name = "");

  // ===== Solving =====

  // Solve with GLPK
  SolutionStatus solve(const SolverOptions &options = {});

  // Solve with any backend
  SolutionStatus solve(SolverBackend &backend);

  // Write CPLEX LP text. Allowed in every state.
  void writeFormat(const std::string &path) const;

  // ===== Queries =====

  const std::string &name() const { return name_; }
  uint64_t id() const { return id_; }
  ModelState state() const { return state_; }
  SolutionStatus status() const { return solution_.status; }
  bool isMip() const;

  const std::vector<Variable> &variables() const { return variables_; }
  const std::vector<Constraint> &constraints() const { return constraints_; }
  const Objective &objective() const { return objective_; }
  const Solution &solution() const { return solution_; }

  // Throw UnknownVariableError / std::out_of_range when absent
  const Variable &variable(const std::string &name) const;
  const Constraint &constraint(const std::string &name) const;
  bool hasVariable(const std::string &name) const;

  std::optional<double> objectiveValue() const { return solution_.objective; }
  std::optional<double> value(const Variable &var) const;
  std::optional<double> reducedCost(const Variable &var) const;
  std::optional<double> activity(const Constraint &con) const;
  std::optional<double> slack(const Constraint &con) const;
  std::optional<double> dual(const Constraint &con) const;

  // ===== Geometry (for plotting collaborators) =====

  // Row i = coefficients of constraint i, column j = variable j
  Eigen::MatrixXd coefficientMatrix() const;
  Eigen::VectorXd rhsVector() const;
  Eigen::VectorXd objectiveVector() const;

private:
  std::string name_;
  uint64_t id_;
  ModelState state_ = ModelState::UNSOLVED;

  std::vector<Variable> variables_;
  std::vector<Constraint> constraints_;
  Objective objective_;
  Solution solution_;

  std::unordered_map<std::string, size_t> var_index_;
  std::unordered_map<std::string, size_t> con_index_;

  void requireUnsolved(const char *operation) const;
  void checkExpression(const LinearExpression &expr, const char *where) const;
  void checkOwned(const Variable &var) const;
  void checkOwned(const Constraint &con) const;
  void attachSolution(const SolverOutput &out, double elapsed);
};

} // namespace lpkit
