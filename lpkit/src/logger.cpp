#include "lpkit/logger.hpp"
#include "lpkit/errors.hpp"
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <spdlog/spdlog.h>
#include <sstream>

namespace lpkit {

static std::string timestamp() {
  auto now = std::chrono::system_clock::now();
  auto t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;
  std::ostringstream ss;
  ss << std::put_time(std::localtime(&t), "%Y-%m-%dT%H:%M:%S") << '.'
     << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

// RFC 4180 field: quoted when it holds a comma, quote or line break
static std::string csvField(const std::string &text) {
  if (text.find_first_of(",\"\r\n") == std::string::npos)
    return text;
  std::string quoted = "\"";
  for (char c : text) {
    if (c == '"')
      quoted += '"';
    quoted += c;
  }
  return quoted + "\"";
}

SolveLogger::SolveLogger(const std::string &log_dir) : log_dir_(log_dir) {
  std::error_code ec;
  std::filesystem::create_directories(log_dir_, ec);
  if (ec)
    throw ModelIoError("cannot create log directory '" + log_dir_ +
                       "': " + ec.message());

  solve_csv_.open(csvPath(), std::ios::app);
  if (!solve_csv_.is_open())
    throw ModelIoError("cannot open '" + csvPath() + "'");
  ensureHeader();
}

SolveLogger::~SolveLogger() {
  if (solve_csv_.is_open())
    solve_csv_.close();
}

std::string SolveLogger::csvPath() const {
  return (std::filesystem::path(log_dir_) / "solves.csv").string();
}

void SolveLogger::ensureHeader() {
  // tellp() is unreliable with ios::app
  if (std::filesystem::file_size(csvPath()) == 0) {
    solve_csv_ << "timestamp,model,status,objective,variables,constraints,"
                  "elapsed_ms\n";
    solve_csv_.flush();
  }
}

void SolveLogger::logSolve(const Model &model) {
  std::lock_guard<std::mutex> lock(mtx_);
  const auto &sol = model.solution();

  solve_csv_ << timestamp() << "," << csvField(model.name()) << ","
             << toString(model.status()) << ",";
  if (sol.objective)
    solve_csv_ << std::setprecision(12) << *sol.objective;
  solve_csv_ << "," << model.variables().size() << ","
             << model.constraints().size() << "," << std::fixed
             << std::setprecision(3) << sol.elapsed_ms << "\n";
  solve_csv_ << std::defaultfloat;
  solve_csv_.flush();

  if (model.status() == SolutionStatus::OPTIMAL) {
    spdlog::info("[SolveLog] {} optimal, objective={}", model.name(),
                 sol.objective.value_or(0.0));
  } else {
    spdlog::warn("[SolveLog] {}: {}", model.name(),
                 toString(model.status()));
  }
}

void SolveLogger::logFailure(const Model &model, const std::string &reason) {
  std::lock_guard<std::mutex> lock(mtx_);
  solve_csv_ << timestamp() << "," << csvField(model.name())
             << ",SolverError,,"
             << model.variables().size() << "," << model.constraints().size()
             << ",\n";
  solve_csv_.flush();
  spdlog::error("[SolveLog] {}: solver failed: {}", model.name(), reason);
}

} // namespace lpkit
