#pragma once
#include "lpkit/common.hpp"
#include "lpkit/model.hpp"
#include <fstream>
#include <mutex>
#include <string>

namespace lpkit {

// Appends one CSV row per solved model to <log_dir>/solves.csv
class SolveLogger {
public:
  explicit SolveLogger(const std::string &log_dir = "logs");
  ~SolveLogger();

  void logSolve(const Model &model);
  void logFailure(const Model &model, const std::string &reason);

  std::string csvPath() const;

private:
  std::string log_dir_;
  std::ofstream solve_csv_;
  std::mutex mtx_;

  void ensureHeader();
};

} // namespace lpkit
