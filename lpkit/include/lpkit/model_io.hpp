#pragma once
#include "lpkit/common.hpp"
#include "lpkit/model.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace lpkit {

// ── Model files ──────────────────────────────────────────────────────
// {
//   "name": "farm",
//   "variables":   [{"name": "x1", "lower": 0, "upper": null,
//                    "domain": "continuous"}],
//   "objective":   {"sense": "maximize", "constant": 0,
//                   "terms": [{"var": "x1", "coef": 1000}]},
//   "constraints": [{"name": "land", "op": "<=", "rhs": 24,
//                    "terms": [{"var": "x1", "coef": 4}]}]
// }
Model modelFromJson(const nlohmann::json &doc);
Model loadModel(const std::string &path);

// Structure only; solution values are in reportJson()
nlohmann::json modelToJson(const Model &model);

// ── Configuration files ──────────────────────────────────────────────
// Keys absent from the document keep the values already in cfg.
void applyConfigJson(const nlohmann::json &doc, Config &cfg);
Config loadConfig(const std::string &path, Config cfg = {});

} // namespace lpkit
