#include "lpkit/model_io.hpp"
#include "lpkit/errors.hpp"
#include <cmath>
#include <fstream>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace lpkit {

// Bound value: number, null (→ fallback), or "inf"/"-inf"/"infinity"
static double boundFromJson(const json &j, double fallback) {
  if (j.is_null())
    return fallback;
  if (j.is_number())
    return j.get<double>();
  if (j.is_string()) {
    auto s = j.get<std::string>();
    if (s == "inf" || s == "+inf" || s == "infinity" || s == "+infinity")
      return kInfinity;
    if (s == "-inf" || s == "-infinity")
      return -kInfinity;
  }
  throw ModelIoError("invalid bound: " + j.dump());
}

static json boundToJson(double v) {
  if (std::isinf(v))
    return v > 0 ? json("inf") : json("-inf");
  return v;
}

static LinearExpression exprFromJson(const Model &model, const json &doc,
                                     const std::string &where) {
  LinearExpression expr;
  if (doc.contains("terms")) {
    if (!doc["terms"].is_array())
      throw ModelIoError(where + ": 'terms' must be an array");
    for (auto &t : doc["terms"]) {
      auto name = t.at("var").get<std::string>();
      if (!model.hasVariable(name))
        throw UnknownVariableError(where + ": unknown variable '" + name +
                                   "'");
      expr.add(t.at("coef").get<double>(), model.variable(name));
    }
  }
  expr.setConstant(doc.value("constant", 0.0));
  return expr;
}

static json exprToJson(const LinearExpression &expr) {
  json terms = json::array();
  for (auto &t : expr.terms())
    terms.push_back({{"var", t.var.name()}, {"coef", t.coef}});
  return {{"terms", terms}, {"constant", expr.constant()}};
}

// ── Model files ──────────────────────────────────────────────────────
Model modelFromJson(const json &doc) {
  if (!doc.is_object())
    throw ModelIoError("model document must be a JSON object");

  try {
    Model model(doc.value("name", std::string("model")));

    for (auto &v : doc.value("variables", json::array())) {
      double lower = v.contains("lower") ? boundFromJson(v["lower"], 0.0) : 0.0;
      double upper =
          v.contains("upper") ? boundFromJson(v["upper"], kInfinity) : kInfinity;
      Domain domain =
          parseDomain(v.value("domain", std::string("continuous")));
      model.addVariable(v.at("name").get<std::string>(), lower, upper, domain);
    }

    if (doc.contains("objective")) {
      const auto &o = doc["objective"];
      Sense sense = parseSense(o.value("sense", std::string("minimize")));
      model.setObjective(exprFromJson(model, o, "objective"), sense);
    }

    for (auto &c : doc.value("constraints", json::array())) {
      std::string name = c.value("name", std::string());
      auto expr = exprFromJson(model, c, name.empty() ? "constraint" : name);
      model.addConstraint(std::move(expr),
                          parseOperator(c.at("op").get<std::string>()),
                          c.at("rhs").get<double>(), name);
    }

    spdlog::debug("[ModelIO] Loaded '{}': {} variables, {} constraints",
                  model.name(), model.variables().size(),
                  model.constraints().size());
    return model;
  } catch (const json::exception &e) {
    throw ModelIoError(std::string("malformed model document: ") + e.what());
  }
}

Model loadModel(const std::string &path) {
  std::ifstream f(path);
  if (!f.is_open())
    throw ModelIoError("cannot open model file '" + path + "'");

  json doc;
  try {
    doc = json::parse(f);
  } catch (const json::parse_error &e) {
    throw ModelIoError("cannot parse '" + path + "': " + e.what());
  }
  return modelFromJson(doc);
}

json modelToJson(const Model &model) {
  json vars = json::array();
  for (auto &v : model.variables()) {
    vars.push_back({{"name", v.name()},
                    {"lower", boundToJson(v.lower())},
                    {"upper", boundToJson(v.upper())},
                    {"domain", toString(v.domain())}});
  }

  json obj = exprToJson(model.objective().expression);
  obj["sense"] = toString(model.objective().sense);

  json cons = json::array();
  for (auto &c : model.constraints()) {
    json jc = exprToJson(c.expression());
    jc["name"] = c.name();
    jc["op"] = toString(c.op());
    jc["rhs"] = c.rhs();
    cons.push_back(jc);
  }

  return {{"name", model.name()},
          {"variables", vars},
          {"objective", obj},
          {"constraints", cons}};
}

// ── Configuration files ──────────────────────────────────────────────
void applyConfigJson(const json &doc, Config &cfg) {
  if (!doc.is_object())
    throw ModelIoError("config document must be a JSON object");

  try {
    if (doc.contains("solver")) {
      const auto &s = doc["solver"];
      cfg.solver.time_limit_ms =
          s.value("time_limit_ms", cfg.solver.time_limit_ms);
      cfg.solver.presolve = s.value("presolve", cfg.solver.presolve);
      cfg.solver.verbose = s.value("verbose", cfg.solver.verbose);
    }
    cfg.log_level = doc.value("log_level", cfg.log_level);
    cfg.log_dir = doc.value("log_dir", cfg.log_dir);
    cfg.model_path = doc.value("model", cfg.model_path);
    cfg.write_lp_path = doc.value("write_lp", cfg.write_lp_path);
    cfg.json_report = doc.value("json", cfg.json_report);
    cfg.geometry = doc.value("geometry", cfg.geometry);
  } catch (const json::exception &e) {
    throw ModelIoError(std::string("malformed config: ") + e.what());
  }

  if (cfg.solver.time_limit_ms < 0)
    throw ModelIoError("solver.time_limit_ms must be >= 0");
  if (!isLogLevel(cfg.log_level))
    throw ModelIoError("unknown log_level '" + cfg.log_level + "'");
}

Config loadConfig(const std::string &path, Config cfg) {
  std::ifstream f(path);
  if (!f.is_open())
    throw ModelIoError("cannot open config file '" + path + "'");

  try {
    applyConfigJson(json::parse(f), cfg);
  } catch (const json::parse_error &e) {
    throw ModelIoError("cannot parse '" + path + "': " + e.what());
  }
  return cfg;
}

} // namespace lpkit
