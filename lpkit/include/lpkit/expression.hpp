#pragma once
#include "lpkit/common.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace lpkit {

class Model;

// Handle to a decision variable. Only a Model creates valid ones; a
// default-constructed Variable belongs to no model.
class Variable {
public:
  Variable() = default;

  const std::string &name() const { return name_; }
  size_t index() const { return index_; }
  double lower() const { return lower_; }
  double upper() const { return upper_; }
  Domain domain() const { return domain_; }
  bool isInteger() const { return domain_ == Domain::INTEGER; }
  uint64_t owner() const { return owner_; }

  bool operator==(const Variable &o) const {
    return owner_ == o.owner_ && index_ == o.index_;
  }
  bool operator!=(const Variable &o) const { return !(*this == o); }

private:
  friend class Model;
  Variable(uint64_t owner, size_t index, std::string name, double lower,
           double upper, Domain domain)
      : owner_(owner), index_(index), name_(std::move(name)), lower_(lower),
        upper_(upper), domain_(domain) {}

  uint64_t owner_ = 0; // 0 = no model
  size_t index_ = 0;
  std::string name_;
  double lower_ = 0.0;
  double upper_ = kInfinity;
  Domain domain_ = Domain::CONTINUOUS;
};

struct Term {
  Variable var;
  double coef;
};

// Σ coef_i * var_i + constant, terms kept in insertion order.
class LinearExpression {
public:
  LinearExpression() = default;
  explicit LinearExpression(double constant) : constant_(constant) {}

  // Adds coef * var; merges into an existing term for the same variable
  LinearExpression &add(double coef, const Variable &var);
  LinearExpression &addConstant(double value);
  void setConstant(double value) { constant_ = value; }

  const std::vector<Term> &terms() const { return terms_; }
  double constant() const { return constant_; }
  bool empty() const { return terms_.empty(); }

  // Coefficient of var, 0 if absent
  double coefficient(const Variable &var) const;

  // Value of the expression for per-variable values indexed by
  // Variable::index()
  double evaluate(const std::vector<double> &values) const;

private:
  std::vector<Term> terms_;
  double constant_ = 0.0;
};

} // namespace lpkit
