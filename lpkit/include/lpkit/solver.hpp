#pragma once
#include "lpkit/common.hpp"
#include <string>
#include <vector>

namespace lpkit {

class Model;

// Solver-neutral column/row form of a Model. Columns follow variable
// insertion order, rows follow constraint insertion order.
struct SolverInput {
  std::string name;
  Sense sense = Sense::MINIMIZE;
  double objective_constant = 0.0;

  // Columns
  std::vector<std::string> col_names;
  std::vector<double> col_lower;
  std::vector<double> col_upper;
  std::vector<Domain> col_domain;
  std::vector<double> objective;

  // Rows: Σ a_ij x_j <op> rhs (expression constants already moved right)
  std::vector<std::string> row_names;
  std::vector<Operator> row_op;
  std::vector<double> row_rhs;

  // Constraint matrix in triplet form, no zeros, no duplicates
  struct Triplet {
    int row;
    int col;
    double val;
  };
  std::vector<Triplet> triplets;

  size_t numCols() const { return col_names.size(); }
  size_t numRows() const { return row_names.size(); }
  bool isMip() const;
};

// What a backend hands back. Vectors are empty when the backend has no
// numbers for them (infeasible, unbounded, duals of a MIP).
struct SolverOutput {
  SolutionStatus status = SolutionStatus::NOT_SOLVED;
  double objective = 0.0;
  std::vector<double> col_values;
  std::vector<double> col_duals; // reduced costs
  std::vector<double> row_duals; // shadow prices
  std::string message;
};

// External solver collaborator: translate a model, invoke the solver.
// invoke() throws SolverInvocationError when the solver cannot run.
class SolverBackend {
public:
  virtual ~SolverBackend() = default;

  virtual std::string name() const = 0;

  // Default translation into column/row form
  virtual SolverInput translate(const Model &model) const;

  virtual SolverOutput invoke(const SolverInput &input) = 0;
};

} // namespace lpkit
