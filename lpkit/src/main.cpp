#include "lpkit/common.hpp"
#include "lpkit/errors.hpp"
#include "lpkit/glpk_backend.hpp"
#include "lpkit/logger.hpp"
#include "lpkit/model.hpp"
#include "lpkit/model_io.hpp"
#include "lpkit/report.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

using namespace lpkit;

// Exit codes
constexpr int EXIT_USAGE = 1;         // bad flags, bad model/config file
constexpr int EXIT_SOLVER_FAILED = 2; // solver could not run

// ── Built-in worked example ─────────────────────────────────────────
// x1 = steers (contract: at least 2), x2 = lots of trees
static Model buildFarmModel() {
  Model m("farm");
  auto x1 = m.addVariable("x1");
  auto x2 = m.addVariable("x2");

  m.setObjective(LinearExpression().add(1000, x1).add(500, x2),
                 Sense::MAXIMIZE);
  m.addConstraint(LinearExpression().add(4, x1).add(1.5, x2), Operator::LE,
                  24, "land");
  m.addConstraint(LinearExpression().add(240, x1).add(30, x2), Operator::LE,
                  1200, "budget");
  m.addConstraint(LinearExpression().add(20, x1).add(20, x2), Operator::LE,
                  200, "labour");
  m.addConstraint(LinearExpression().add(1, x1), Operator::GE, 2,
                  "contract");
  return m;
}

static void printUsage() {
  std::cout << R"(
╔═══════════════════════════════════════════════════════════╗
║          LPKIT — Linear Program Solve & Sensitivity       ║
║              GLPK simplex · duals · reduced costs         ║
╚═══════════════════════════════════════════════════════════╝

Usage: lpkit [OPTIONS]

Options:
  --model <PATH>        Model JSON file (default: built-in farm example)
  --config <PATH>       Config JSON file (flags override it)
  --write-lp <PATH>     Write the model in CPLEX LP format
  --time-limit <MS>     Solver time limit in ms (default: 0 = none)
  --presolve            Enable the GLPK presolver
  --verbose-solver      Show GLPK terminal output
  --log-dir <DIR>       Append solve results to <DIR>/solves.csv
  --log-level <LEVEL>   trace|debug|info|warn|error|off (default: info)
  --json                Print the report as JSON
  --geometry            Print constraint geometry as JSON (for plotting)
  --help, -h            Show this help

Exit codes:
  0  model solved (optimal, infeasible or unbounded are all reported)
  1  usage, model or config error
  2  solver failed to run
)";
}

// ── Parse CLI args ──────────────────────────────────────────────────
// --config is applied first so that explicit flags override it
static Config parseArgs(int argc, char *argv[]) {
  Config cfg;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc)
      cfg = loadConfig(argv[i + 1], cfg);
  }

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];

    if (arg == "--config" && i + 1 < argc)
      ++i;
    else if (arg == "--model" && i + 1 < argc)
      cfg.model_path = argv[++i];
    else if (arg == "--write-lp" && i + 1 < argc)
      cfg.write_lp_path = argv[++i];
    else if (arg == "--time-limit" && i + 1 < argc)
      cfg.solver.time_limit_ms = std::stoi(argv[++i]);
    else if (arg == "--presolve")
      cfg.solver.presolve = true;
    else if (arg == "--verbose-solver")
      cfg.solver.verbose = true;
    else if (arg == "--log-dir" && i + 1 < argc)
      cfg.log_dir = argv[++i];
    else if (arg == "--log-level" && i + 1 < argc)
      cfg.log_level = argv[++i];
    else if (arg == "--json")
      cfg.json_report = true;
    else if (arg == "--geometry")
      cfg.geometry = true;
    else if (arg == "--help" || arg == "-h") {
      printUsage();
      std::exit(0);
    } else {
      throw std::invalid_argument("unknown or incomplete option '" + arg +
                                  "'");
    }
  }

  if (cfg.solver.time_limit_ms < 0)
    throw std::invalid_argument("--time-limit must be >= 0");
  if (!isLogLevel(cfg.log_level))
    throw std::invalid_argument("unknown log level '" + cfg.log_level + "'");
  return cfg;
}

// ── Main ─────────────────────────────────────────────────────────────
int main(int argc, char *argv[]) {
  // Setup logging (stderr keeps stdout clean for the report)
  auto console = spdlog::stderr_color_mt("lpkit");
  spdlog::set_default_logger(console);
  spdlog::set_level(spdlog::level::info);
  spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

  Config cfg;
  try {
    cfg = parseArgs(argc, argv);
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    printUsage();
    return EXIT_USAGE;
  }
  spdlog::set_level(spdlog::level::from_str(cfg.log_level));

  // ── Build or load the model ──────────────────────────────────────
  std::unique_ptr<Model> model;
  try {
    if (cfg.model_path.empty()) {
      spdlog::info("No --model given, solving the built-in farm example");
      model = std::make_unique<Model>(buildFarmModel());
    } else {
      model = std::make_unique<Model>(loadModel(cfg.model_path));
    }

    if (!cfg.write_lp_path.empty())
      model->writeFormat(cfg.write_lp_path);
  } catch (const LpError &e) {
    spdlog::error("{}", e.what());
    return EXIT_USAGE;
  }

  std::unique_ptr<SolveLogger> solveLog;
  if (!cfg.log_dir.empty()) {
    try {
      solveLog = std::make_unique<SolveLogger>(cfg.log_dir);
    } catch (const ModelIoError &e) {
      spdlog::error("{}", e.what());
      return EXIT_USAGE;
    }
  }

  // ── Solve ────────────────────────────────────────────────────────
  GlpkBackend backend(cfg.solver);
  try {
    model->solve(backend);
  } catch (const SolverInvocationError &e) {
    // Distinct from "solver ran and found the model infeasible"
    std::cout << "Model: " << model->name() << "\n";
    std::cout << "Solver failed: " << e.what() << "\n";
    if (solveLog)
      solveLog->logFailure(*model, e.what());
    return EXIT_SOLVER_FAILED;
  }

  if (solveLog)
    solveLog->logSolve(*model);

  // ── Report ───────────────────────────────────────────────────────
  if (cfg.json_report)
    std::cout << reportJson(*model).dump(2) << "\n";
  else
    printReport(*model, std::cout);

  if (cfg.geometry)
    std::cout << geometryJson(*model).dump(2) << "\n";

  return 0;
}
