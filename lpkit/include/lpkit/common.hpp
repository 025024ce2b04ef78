#pragma once
#include <chrono>
#include <limits>
#include <string>

namespace lpkit {

constexpr double kInfinity = std::numeric_limits<double>::infinity();

// ── Enumerations ─────────────────────────────────────────────────────
enum class Sense { MAXIMIZE, MINIMIZE };

enum class Operator {
  LE, // <=
  GE, // >=
  EQ  // =
};

enum class Domain { CONTINUOUS, INTEGER };

enum class SolutionStatus { OPTIMAL, INFEASIBLE, UNBOUNDED, NOT_SOLVED };

enum class ModelState { UNSOLVED, SOLVING, OPTIMAL, INFEASIBLE, UNBOUNDED, ERROR };

std::string toString(Sense sense);
std::string toString(Operator op);
std::string toString(Domain domain);
std::string toString(SolutionStatus status);
std::string toString(ModelState state);

// Parse "<=", ">=", "=" (also "=<", "=>", "==")
Operator parseOperator(const std::string &text);
Sense parseSense(const std::string &text);
Domain parseDomain(const std::string &text);

// True for a name spdlog::level::from_str knows ("info", "warn", "off", ...)
bool isLogLevel(const std::string &name);

// ── Configuration ────────────────────────────────────────────────────
struct SolverOptions {
  int time_limit_ms = 0; // 0 = unbounded
  bool presolve = false;
  bool verbose = false; // GLPK terminal output
};

struct Config {
  SolverOptions solver;
  std::string log_level = "info";
  std::string log_dir;     // empty = no CSV solve log
  std::string model_path;  // empty = built-in farm example
  std::string write_lp_path;
  bool json_report = false;
  bool geometry = false;
};

// ── Timing helper ────────────────────────────────────────────────────
inline double elapsed_ms(std::chrono::steady_clock::time_point start) {
  auto now = std::chrono::steady_clock::now();
  return std::chrono::duration<double, std::milli>(now - start).count();
}

} // namespace lpkit
