#include "lpkit/report.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <vector>

using json = nlohmann::json;

namespace lpkit {

static json optToJson(const std::optional<double> &v) {
  return v ? json(*v) : json(nullptr);
}

// Finite bound as number, infinite as "inf"/"-inf"
static json boundToJson(double v) {
  if (std::isinf(v))
    return v > 0 ? json("inf") : json("-inf");
  return v;
}

std::string formatValue(const std::optional<double> &value) {
  if (!value)
    return "n/a";
  double v = *value;
  // Print -0 as 0
  if (v == 0.0)
    v = 0.0;
  std::ostringstream ss;
  ss << std::setprecision(10) << v;
  return ss.str();
}

// ── Console report ───────────────────────────────────────────────────
void printReport(const Model &model, std::ostream &out) {
  const auto &sol = model.solution();

  int width = 12;
  for (auto &v : model.variables())
    width = std::max(width, (int)v.name().size() + 2);
  for (auto &c : model.constraints())
    width = std::max(width, (int)c.name().size() + 2);

  out << "Model: " << model.name() << "\n";
  out << "Status: " << toString(model.status());
  if (!sol.message.empty() && model.status() != SolutionStatus::OPTIMAL)
    out << " (" << sol.message << ")";
  out << "\n";

  if (!sol.objective) {
    if (model.state() == ModelState::UNSOLVED)
      out << "Model has not been solved.\n";
    else
      out << "No solution values to report.\n";
    return;
  }

  out << "Objective value: " << formatValue(sol.objective) << "\n\n";

  out << std::left << std::setw(width) << "Variable" << std::setw(16)
      << "Value" << "Reduced Cost\n";
  for (auto &v : model.variables()) {
    out << std::setw(width) << v.name() << std::setw(16)
        << formatValue(model.value(v)) << formatValue(model.reducedCost(v))
        << "\n";
  }

  if (!model.constraints().empty()) {
    out << "\n"
        << std::setw(width) << "Constraint" << std::setw(16) << "Dual Price"
        << "Slack\n";
    for (auto &c : model.constraints()) {
      out << std::setw(width) << c.name() << std::setw(16)
          << formatValue(model.dual(c)) << formatValue(model.slack(c)) << "\n";
    }
  }
  out << std::right;
}

std::string reportString(const Model &model) {
  std::ostringstream ss;
  printReport(model, ss);
  return ss.str();
}

json reportJson(const Model &model) {
  const auto &sol = model.solution();

  json vars = json::array();
  for (auto &v : model.variables()) {
    vars.push_back({{"name", v.name()},
                    {"value", optToJson(model.value(v))},
                    {"reduced_cost", optToJson(model.reducedCost(v))}});
  }

  json cons = json::array();
  for (auto &c : model.constraints()) {
    cons.push_back({{"name", c.name()},
                    {"activity", optToJson(model.activity(c))},
                    {"dual", optToJson(model.dual(c))},
                    {"slack", optToJson(model.slack(c))}});
  }

  return {{"model", model.name()},
          {"status", toString(model.status())},
          {"state", toString(model.state())},
          {"message", sol.message},
          {"backend", sol.backend},
          {"elapsed_ms", sol.elapsed_ms},
          {"objective", optToJson(sol.objective)},
          {"variables", vars},
          {"constraints", cons}};
}

// ── Geometry for plotting collaborators ──────────────────────────────
json geometryJson(const Model &model) {
  Eigen::MatrixXd A = model.coefficientMatrix();
  Eigen::VectorXd b = model.rhsVector();
  Eigen::VectorXd c = model.objectiveVector();

  json vars = json::array();
  for (auto &v : model.variables()) {
    vars.push_back({{"name", v.name()},
                    {"lower", boundToJson(v.lower())},
                    {"upper", boundToJson(v.upper())}});
  }

  json cons = json::array();
  for (size_t r = 0; r < model.constraints().size(); r++) {
    const auto &con = model.constraints()[r];
    std::vector<double> row(A.cols());
    for (Eigen::Index j = 0; j < A.cols(); j++)
      row[j] = A((Eigen::Index)r, j);
    cons.push_back({{"name", con.name()},
                    {"coefficients", row},
                    {"op", toString(con.op())},
                    {"rhs", b[r]}});
  }

  std::vector<double> obj(c.data(), c.data() + c.size());
  json geo = {{"variables", vars},
              {"objective",
               {{"sense", toString(model.objective().sense)},
                {"coefficients", obj},
                {"constant", model.objective().expression.constant()}}},
              {"constraints", cons}};
  if (model.objectiveValue())
    geo["objective"]["value"] = *model.objectiveValue();
  return geo;
}

} // namespace lpkit
