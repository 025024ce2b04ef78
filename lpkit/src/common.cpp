#include "lpkit/common.hpp"
#include "lpkit/errors.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace lpkit {

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string toString(Sense sense) {
  return sense == Sense::MAXIMIZE ? "maximize" : "minimize";
}

std::string toString(Operator op) {
  switch (op) {
  case Operator::LE:
    return "<=";
  case Operator::GE:
    return ">=";
  case Operator::EQ:
    return "=";
  }
  return "?";
}

std::string toString(Domain domain) {
  return domain == Domain::INTEGER ? "integer" : "continuous";
}

std::string toString(SolutionStatus status) {
  switch (status) {
  case SolutionStatus::OPTIMAL:
    return "Optimal";
  case SolutionStatus::INFEASIBLE:
    return "Infeasible";
  case SolutionStatus::UNBOUNDED:
    return "Unbounded";
  case SolutionStatus::NOT_SOLVED:
    return "Not Solved";
  }
  return "?";
}

std::string toString(ModelState state) {
  switch (state) {
  case ModelState::UNSOLVED:
    return "Unsolved";
  case ModelState::SOLVING:
    return "Solving";
  case ModelState::OPTIMAL:
    return "Optimal";
  case ModelState::INFEASIBLE:
    return "Infeasible";
  case ModelState::UNBOUNDED:
    return "Unbounded";
  case ModelState::ERROR:
    return "Error";
  }
  return "?";
}

Operator parseOperator(const std::string &text) {
  if (text == "<=" || text == "=<" || text == "le")
    return Operator::LE;
  if (text == ">=" || text == "=>" || text == "ge")
    return Operator::GE;
  if (text == "=" || text == "==" || text == "eq")
    return Operator::EQ;
  throw InvalidModelError("unknown operator '" + text + "'");
}

Sense parseSense(const std::string &text) {
  auto t = lower(text);
  if (t == "maximize" || t == "max")
    return Sense::MAXIMIZE;
  if (t == "minimize" || t == "min")
    return Sense::MINIMIZE;
  throw InvalidModelError("unknown objective sense '" + text + "'");
}

Domain parseDomain(const std::string &text) {
  auto t = lower(text);
  if (t == "continuous")
    return Domain::CONTINUOUS;
  if (t == "integer")
    return Domain::INTEGER;
  throw InvalidModelError("unknown variable domain '" + text + "'");
}

bool isLogLevel(const std::string &name) {
  // from_str maps unknown names to off
  return name == "off" ||
         spdlog::level::from_str(name) != spdlog::level::off;
}

} // namespace lpkit
