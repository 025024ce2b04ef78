#pragma once
#include <stdexcept>
#include <string>

namespace lpkit {

// Base of every error raised by lpkit. Infeasible and unbounded models are
// NOT errors: they come back from Model::solve() as a SolutionStatus.
class LpError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Variable or constraint name already used in the model
class DuplicateNameError : public LpError {
public:
  using LpError::LpError;
};

// Expression references a variable that does not belong to the model
class UnknownVariableError : public LpError {
public:
  using LpError::LpError;
};

// Structural mutation (or a second solve) after the model left UNSOLVED
class InvalidStateError : public LpError {
public:
  using LpError::LpError;
};

// Solver failed to run or returned a malformed response. Never retried.
class SolverInvocationError : public LpError {
public:
  using LpError::LpError;
};

// Bad name, inverted bounds, non-finite coefficient
class InvalidModelError : public LpError {
public:
  using LpError::LpError;
};

// Model / config file could not be read, parsed or written
class ModelIoError : public LpError {
public:
  using LpError::LpError;
};

} // namespace lpkit
