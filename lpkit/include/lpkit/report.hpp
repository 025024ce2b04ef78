#pragma once
#include "lpkit/model.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <string>

namespace lpkit {

// Console report: status, objective, then one line per variable
// (value, reduced cost) and per constraint (dual price, slack), in
// insertion order. Not-applicable values print as "n/a".
void printReport(const Model &model, std::ostream &out);
std::string reportString(const Model &model);

// Same content as JSON, null for not-applicable values
nlohmann::json reportJson(const Model &model);

// Coefficients, operators, effective right-hand sides and bounds: what a
// 2-D feasible-region plot needs
nlohmann::json geometryJson(const Model &model);

std::string formatValue(const std::optional<double> &value);

} // namespace lpkit
