/*
 *
 * minhash.cpp
 * Sketch resolution tags
 *
 */

#include "minhash.hpp"

#include "compare/errors.hpp"

SketchResolution SketchResolution::num(const uint64_t n) {
  if (n == 0) {
    throw ConfigurationError("Sketch num must be positive");
  }
  return SketchResolution(SketchKind::FixedSize, n);
}

SketchResolution SketchResolution::scaled(const uint64_t s) {
  if (s == 0) {
    throw ConfigurationError("Sketch scaled must be positive");
  }
  return SketchResolution(SketchKind::FixedRate, s);
}

std::string SketchResolution::to_string() const {
  if (is_num()) {
    return "num=" + std::to_string(_value);
  } else {
    return "scaled=" + std::to_string(_value);
  }
}
