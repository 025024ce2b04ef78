#include "lpkit/expression.hpp"

namespace lpkit {

LinearExpression &LinearExpression::add(double coef, const Variable &var) {
  for (auto &t : terms_) {
    if (t.var == var) {
      t.coef += coef;
      return *this;
    }
  }
  terms_.push_back({var, coef});
  return *this;
}

LinearExpression &LinearExpression::addConstant(double value) {
  constant_ += value;
  return *this;
}

double LinearExpression::coefficient(const Variable &var) const {
  for (auto &t : terms_) {
    if (t.var == var)
      return t.coef;
  }
  return 0.0;
}

double LinearExpression::evaluate(const std::vector<double> &values) const {
  double sum = constant_;
  for (auto &t : terms_) {
    if (t.var.index() < values.size())
      sum += t.coef * values[t.var.index()];
  }
  return sum;
}

} // namespace lpkit
