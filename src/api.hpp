/*
 *
 * api.hpp
 * main functions for comparing many sketches
 *
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "compare/comparison.hpp"
#include "dist/matrix.hpp"
#include "sketch/minhash.hpp"

// Borrowed sketches; must outlive the call
typedef std::vector<const MinHashSketch *> SketchList;

enum class CompareStat {
  Jaccard,
  JaccardANI,
  AngularSimilarity,
  Containment, // row contained by column
  MaxContainment,
  AvgContainment,
  MaxContainmentANI,
  AvgContainmentANI,
  IntersectBp
};

struct CompareOptions {
  bool ignore_abundance = false;
  // 0 = default resolution for each pair
  uint64_t cmp_num = 0;
  uint64_t cmp_scaled = 0;
  uint64_t threshold_bp = default_threshold_bp;
  bool estimate_ani_ci = false;
  double ani_confidence = default_ani_confidence;
  bool quiet = false;
};

CompareStat stat_from_name(const std::string &name);
std::string stat_name(const CompareStat stat);
// stat(a, b) == stat(b, a)
bool is_symmetric(const CompareStat stat);
// Only defined for 'scaled' sketches
bool needs_scaled(const CompareStat stat);

double compare_pair(const MinHashSketch &mh1, const MinHashSketch &mh2,
                    const CompareStat stat, const CompareOptions &options);

// Square matrix of stat between every pair of sketches
NumpyMatrix compare_all(const SketchList &sketches, const CompareStat stat,
                        const CompareOptions &options,
                        const size_t num_threads);

// Query rows by reference columns
NumpyMatrix compare_query(const SketchList &ref_sketches,
                          const SketchList &query_sketches,
                          const CompareStat stat,
                          const CompareOptions &options,
                          const size_t num_threads);
