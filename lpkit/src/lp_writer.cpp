#include "lpkit/lp_writer.hpp"
#include "lpkit/errors.hpp"
#include <cmath>
#include <fstream>
#include <sstream>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace lpkit {

static constexpr int kTermsPerLine = 8;

// Aux column name that does not clash with a model variable
static std::string auxName(const Model &model) {
  std::string name = LpWriter::kObjConstName;
  while (model.hasVariable(name))
    name += "_";
  return name;
}

// " + 4 x1 - 1.5 x2 ..." (zero coefficients skipped); an empty form is
// written as "0 <fallback>" because the format needs at least one term
static void writeLinear(std::ostream &f, const LinearExpression &expr,
                        const std::string &fallback,
                        const std::string *aux_term) {
  int written = 0;
  auto term = [&](double coef, const std::string &name) {
    if (written > 0 && written % kTermsPerLine == 0)
      f << "\n   ";
    f << (coef < 0 ? " - " : " + ") << LpWriter::formatNumber(std::abs(coef))
      << " " << name;
    written++;
  };

  for (auto &t : expr.terms()) {
    if (t.coef != 0.0)
      term(t.coef, t.var.name());
  }
  if (aux_term != nullptr && expr.constant() != 0.0)
    term(expr.constant(), *aux_term);

  if (written == 0)
    f << " 0 " << fallback;
}

std::string LpWriter::formatNumber(double value) {
  if (std::isinf(value))
    return value > 0 ? "inf" : "-inf";
  return fmt::format("{}", value);
}

void LpWriter::write(const Model &model, std::ostream &f) {
  const auto &vars = model.variables();
  const auto &obj = model.objective();

  const bool need_aux = obj.expression.constant() != 0.0 || vars.empty();
  const std::string aux = auxName(model);
  const std::string fallback = vars.empty() ? aux : vars.front().name();

  f << "\\ Problem: " << model.name() << "\n\n";

  // ── Objective ──
  f << (obj.sense == Sense::MAXIMIZE ? "Maximize" : "Minimize") << "\n";
  f << " obj:";
  writeLinear(f, obj.expression, fallback, &aux);
  f << "\n\n";

  // ── Constraints (constants moved to the right-hand side) ──
  f << "Subject To\n";
  for (auto &con : model.constraints()) {
    f << " " << con.name() << ":";
    writeLinear(f, con.expression(), fallback, nullptr);
    f << " " << lpkit::toString(con.op()) << " "
      << formatNumber(con.effectiveRhs()) << "\n";
  }
  if (model.constraints().empty()) {
    // glp_read_lp rejects an empty Subject To section
    f << " dummy_row: 0 " << fallback << " >= 0\n";
  }
  f << "\n";

  // ── Bounds (non-default only) ──
  std::ostringstream bounds;
  for (auto &v : vars) {
    double lb = v.lower(), ub = v.upper();
    if (lb == 0.0 && std::isinf(ub))
      continue;
    bounds << " ";
    if (lb == ub)
      bounds << v.name() << " = " << formatNumber(lb);
    else if (std::isinf(lb) && std::isinf(ub))
      bounds << v.name() << " free";
    else if (std::isinf(ub))
      bounds << v.name() << " >= " << formatNumber(lb);
    else
      bounds << formatNumber(lb) << " <= " << v.name()
             << " <= " << formatNumber(ub);
    bounds << "\n";
  }
  if (need_aux)
    bounds << " " << aux << " = 1\n";
  if (!bounds.str().empty())
    f << "Bounds\n" << bounds.str() << "\n";

  // ── Integer columns ──
  bool any_int = false;
  for (auto &v : vars) {
    if (!v.isInteger())
      continue;
    if (!any_int)
      f << "General\n";
    any_int = true;
    f << " " << v.name() << "\n";
  }
  if (any_int)
    f << "\n";

  f << "End\n";
}

std::string LpWriter::toString(const Model &model) {
  std::ostringstream ss;
  write(model, ss);
  return ss.str();
}

void LpWriter::writeFile(const Model &model, const std::string &path) {
  std::ofstream f(path);
  if (!f.is_open())
    throw ModelIoError("cannot open '" + path + "' for writing");

  write(model, f);
  f.flush();
  if (!f.good())
    throw ModelIoError("write to '" + path + "' failed");

  spdlog::info("[LpWriter] Wrote '{}' to {} ({} variables, {} constraints)",
               model.name(), path, model.variables().size(),
               model.constraints().size());
}

} // namespace lpkit
