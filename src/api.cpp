/*
 * api.cpp
 * Main functions for running many comparisons
 *
 */

#include <algorithm>
#include <exception>
#include <iostream>
#include <utility>

#include <omp.h>

#include "api.hpp"
#include "sketch/progress.hpp"

const std::vector<std::pair<std::string, CompareStat>> stat_names = {
    {"jaccard", CompareStat::Jaccard},
    {"jaccard_ani", CompareStat::JaccardANI},
    {"angular_similarity", CompareStat::AngularSimilarity},
    {"containment", CompareStat::Containment},
    {"max_containment", CompareStat::MaxContainment},
    {"avg_containment", CompareStat::AvgContainment},
    {"max_containment_ani", CompareStat::MaxContainmentANI},
    {"avg_containment_ani", CompareStat::AvgContainmentANI},
    {"intersect_bp", CompareStat::IntersectBp}};

CompareStat stat_from_name(const std::string &name) {
  if (name == "cosine_similarity") {
    return CompareStat::AngularSimilarity;
  }
  for (auto stat_it = stat_names.cbegin(); stat_it != stat_names.cend();
       ++stat_it) {
    if (stat_it->first == name) {
      return stat_it->second;
    }
  }
  throw ConfigurationError("Unknown comparison statistic '" + name + "'");
}

std::string stat_name(const CompareStat stat) {
  for (auto stat_it = stat_names.cbegin(); stat_it != stat_names.cend();
       ++stat_it) {
    if (stat_it->second == stat) {
      return stat_it->first;
    }
  }
  throw std::runtime_error("Unnamed comparison statistic");
}

bool is_symmetric(const CompareStat stat) {
  return stat != CompareStat::Containment;
}

bool needs_scaled(const CompareStat stat) {
  switch (stat) {
  case CompareStat::Jaccard:
  case CompareStat::JaccardANI:
  case CompareStat::AngularSimilarity:
    return false;
  default:
    return true;
  }
}

double base_stat(const BaseMinHashComparison &cmp, const CompareStat stat) {
  switch (stat) {
  case CompareStat::Jaccard:
    return cmp.jaccard();
  case CompareStat::JaccardANI:
    return cmp.jaccard_ani().ani;
  case CompareStat::AngularSimilarity:
    return cmp.angular_similarity();
  default:
    throw UnsupportedOperationError(stat_name(stat) +
                                    " is only defined for 'scaled' sketches");
  }
}

double frac_stat(const FracMinHashComparison &cmp, const CompareStat stat) {
  switch (stat) {
  case CompareStat::Containment:
    return cmp.mh1_containment();
  case CompareStat::MaxContainment:
    return cmp.max_containment();
  case CompareStat::AvgContainment:
    return cmp.avg_containment();
  case CompareStat::MaxContainmentANI:
    return cmp.max_containment_ani().ani;
  case CompareStat::AvgContainmentANI:
    return cmp.avg_containment_ani();
  case CompareStat::IntersectBp:
    return static_cast<double>(cmp.intersect_bp());
  default:
    return base_stat(cmp, stat);
  }
}

double compare_pair(const MinHashSketch &mh1, const MinHashSketch &mh2,
                    const CompareStat stat, const CompareOptions &options) {
  // Kind mismatches are thrown by the comparison constructors
  if (mh1.resolution().is_num()) {
    NumMinHashComparison cmp(mh1, mh2, options.ignore_abundance,
                             options.cmp_num);
    return base_stat(cmp, stat);
  } else {
    FracMinHashComparison cmp(mh1, mh2, options.ignore_abundance,
                              options.cmp_scaled, options.threshold_bp,
                              options.estimate_ani_ci, options.ani_confidence);
    return frac_stat(cmp, stat);
  }
}

void check_inputs(const SketchList &sketches, const CompareStat stat,
                  const CompareOptions &options) {
  if (sketches.size() < 1) {
    throw std::runtime_error("Comparison with an empty sketch list!");
  }
  if (std::find(sketches.cbegin(), sketches.cend(), nullptr) !=
      sketches.cend()) {
    throw std::runtime_error("Comparison with a null sketch");
  }
  if (stat == CompareStat::AngularSimilarity && options.ignore_abundance) {
    throw UnsupportedOperationError(
        "Angular similarity requires abundances, which are being ignored");
  }
}

// Mixed resolutions are legal but are worth pointing out
void note_resolutions(const SketchList &sketches,
                      const CompareOptions &options) {
  const SketchResolution first = sketches.front()->resolution();
  for (auto sketch_it = sketches.cbegin(); sketch_it != sketches.cend();
       ++sketch_it) {
    if ((*sketch_it)->resolution() != first) {
      if (first.is_scaled() && options.cmp_scaled == 0) {
        std::cerr << "NOTE: sketches have different scaled values; each pair "
                     "is compared at the larger of the two"
                  << std::endl;
      } else if (first.is_num() && options.cmp_num == 0) {
        std::cerr << "NOTE: sketches have different num values; each pair "
                     "is compared at the smaller of the two"
                  << std::endl;
      }
      break;
    }
  }
}

// Log every error from the threads, then rethrow the first so callers
// still see its type
void rethrow_errors(const std::vector<std::exception_ptr> &errors) {
  for (auto error_it = errors.cbegin(); error_it != errors.cend();
       ++error_it) {
    try {
      std::rethrow_exception(*error_it);
    } catch (const std::exception &e) {
      std::cerr << e.what() << std::endl;
    }
  }
  if (errors.size()) {
    std::rethrow_exception(errors.front());
  }
}

// At least one thread, and no more than there is work for
size_t comparison_threads(const size_t num_threads, const size_t n_jobs) {
  size_t cmp_threads = num_threads;
  if (n_jobs < cmp_threads) {
    cmp_threads = n_jobs;
  }
  if (cmp_threads < 1) {
    cmp_threads = 1;
  }
  return cmp_threads;
}

NumpyMatrix compare_all(const SketchList &sketches, const CompareStat stat,
                        const CompareOptions &options,
                        const size_t num_threads) {
  check_inputs(sketches, stat, options);
  note_resolutions(sketches, options);

  const size_t n_sketches = sketches.size();
  const bool symmetric = is_symmetric(stat);
  const size_t cmp_threads = comparison_threads(num_threads, n_sketches);
  if (!options.quiet) {
    std::cerr << "Comparing " << n_sketches << " sketches ("
              << stat_name(stat) << ") using " << cmp_threads << " thread(s)"
              << std::endl;
  }

  NumpyMatrix cmpMat(n_sketches, n_sketches);
  size_t n_pairs = symmetric ? (n_sketches * (n_sketches + 1)) >> 1
                             : n_sketches * n_sketches;
  ProgressMeter cmp_progress(n_pairs, options.quiet);
  size_t done_count = 0;

  // Exceptions cannot leave an omp region, so keep them for later
  bool interrupt = false;
  std::vector<std::exception_ptr> errors;
#pragma omp parallel for schedule(dynamic, 5) num_threads(cmp_threads)
  for (size_t i = 0; i < n_sketches; i++) {
    if (!interrupt) {
      try {
        // Iterate upper triangle, including self comparisons, if symmetric
        const size_t j_start = symmetric ? i : 0;
        for (size_t j = j_start; j < n_sketches; j++) {
          const double value =
              compare_pair(*sketches[i], *sketches[j], stat, options);
          cmpMat(i, j) = value;
          if (symmetric) {
            cmpMat(j, i) = value;
          }
        }
#pragma omp atomic
        done_count += n_sketches - j_start;
      } catch (const std::exception &) {
#pragma omp critical
        {
          errors.push_back(std::current_exception());
          interrupt = true;
        }
      }
    }

    if (omp_get_thread_num() == 0) {
      cmp_progress.tick_count(done_count);
    }
  }

  cmp_progress.finalise();
  rethrow_errors(errors);

  return (cmpMat);
}

NumpyMatrix compare_query(const SketchList &ref_sketches,
                          const SketchList &query_sketches,
                          const CompareStat stat,
                          const CompareOptions &options,
                          const size_t num_threads) {
  check_inputs(ref_sketches, stat, options);
  check_inputs(query_sketches, stat, options);

  const size_t n_pairs = query_sketches.size() * ref_sketches.size();
  const size_t cmp_threads = comparison_threads(num_threads, n_pairs);
  if (!options.quiet) {
    std::cerr << "Comparing " << query_sketches.size() << " queries against "
              << ref_sketches.size() << " references (" << stat_name(stat)
              << ") using " << cmp_threads << " thread(s)" << std::endl;
  }

  NumpyMatrix cmpMat(query_sketches.size(), ref_sketches.size());
  ProgressMeter cmp_progress(n_pairs, options.quiet);
  size_t done_count = 0;

  bool interrupt = false;
  std::vector<std::exception_ptr> errors;
#pragma omp parallel for collapse(2) schedule(static) num_threads(cmp_threads)
  for (size_t q_idx = 0; q_idx < query_sketches.size(); q_idx++) {
    for (size_t r_idx = 0; r_idx < ref_sketches.size(); r_idx++) {
      if (!interrupt) {
        try {
          cmpMat(q_idx, r_idx) = compare_pair(
              *query_sketches[q_idx], *ref_sketches[r_idx], stat, options);
#pragma omp atomic
          ++done_count;
        } catch (const std::exception &) {
#pragma omp critical
          {
            errors.push_back(std::current_exception());
            interrupt = true;
          }
        }
      }
      if (omp_get_thread_num() == 0) {
        cmp_progress.tick_count(done_count);
      }
    }
  }

  cmp_progress.finalise();
  rethrow_errors(errors);

  return (cmpMat);
}
