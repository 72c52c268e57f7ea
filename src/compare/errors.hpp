/*
 *
 * errors.hpp
 * Exceptions raised when two sketches cannot be compared
 *
 */
#pragma once

#include <stdexcept>
#include <string>

class ComparisonError : public std::runtime_error {
public:
  explicit ComparisonError(const std::string &msg) : std::runtime_error(msg) {}
};

// No usable comparison resolution, or an out of range option
class ConfigurationError : public ComparisonError {
public:
  explicit ConfigurationError(const std::string &msg) : ComparisonError(msg) {}
};

// One sketch is 'num', the other 'scaled'
class TypeMismatchError : public ComparisonError {
public:
  explicit TypeMismatchError(const std::string &msg) : ComparisonError(msg) {}
};

// k-mer size, molecule type or resolution differ after downsampling
class IncompatibleSketchError : public ComparisonError {
public:
  explicit IncompatibleSketchError(const std::string &msg)
      : ComparisonError(msg) {}
};

// Statistic not defined for this comparison (e.g. angular similarity
// with abundances ignored)
class UnsupportedOperationError : public ComparisonError {
public:
  explicit UnsupportedOperationError(const std::string &msg)
      : ComparisonError(msg) {}
};
