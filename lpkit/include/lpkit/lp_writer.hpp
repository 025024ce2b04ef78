#pragma once
#include "lpkit/model.hpp"
#include <ostream>
#include <string>

namespace lpkit {

// CPLEX LP dialect writer (Maximize/Minimize, Subject To, Bounds, General,
// End). Output re-parses with glp_read_lp.
class LpWriter {
public:
  // Auxiliary column carrying a non-zero objective constant
  static constexpr const char *kObjConstName = "obj_const";

  static void write(const Model &model, std::ostream &out);
  static std::string toString(const Model &model);

  // Throws ModelIoError when the file cannot be written
  static void writeFile(const Model &model, const std::string &path);

  // Shortest round-trip decimal form, "inf"/"-inf" for infinities
  static std::string formatNumber(double value);
};

} // namespace lpkit
