#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ovsql {

/// Base class for every failure reported by the compiler.
/// MUST carry the byte offset of the offending input (0 when not tied to the query).
class Error : public std::runtime_error {
 public:
  Error(const std::string& message, size_t position)
      : std::runtime_error(message), position_(position) {}

  size_t position() const { return position_; }

 private:
  size_t position_ = 0;
};

/// Raised when the query text does not match the grammar.
/// Inputs are the parser message, location and the token kinds that would have been accepted.
class SyntaxError : public Error {
 public:
  SyntaxError(const std::string& message, size_t position, size_t line, size_t column,
              std::vector<std::string> expected)
      : Error(message, position), line_(line), column_(column), expected_(std::move(expected)) {}

  size_t line() const { return line_; }
  size_t column() const { return column_; }
  const std::vector<std::string>& expected() const { return expected_; }

 private:
  size_t line_ = 1;
  size_t column_ = 1;
  std::vector<std::string> expected_;
};

/// Raised when a statement references a binding that no earlier statement assigned.
class UnboundNameError : public Error {
 public:
  UnboundNameError(const std::string& name, size_t position)
      : Error("Unbound set '." + name + "'", position), name_(name) {}

  const std::string& name() const { return name_; }

 private:
  std::string name_;
};

/// Raised when a filter cannot apply to the set it references (e.g. area filter on non-area set).
class FilterApplicabilityError : public Error {
 public:
  using Error::Error;
};

/// Raised when the dialect selector names no known backend.
/// MUST be detected before any query text is read or parsed.
class UnsupportedDialectError : public Error {
 public:
  explicit UnsupportedDialectError(const std::string& name)
      : Error("Unsupported SQL dialect: " + name, 0), name_(name) {}

  const std::string& name() const { return name_; }

 private:
  std::string name_;
};

}  // namespace ovsql
