/*
 *
 * comparison.hpp
 * Pairwise MinHash comparisons at a common resolution
 *
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "compare/errors.hpp"
#include "sketch/minhash.hpp"

const double default_ani_confidence = 0.95;
const uint64_t default_threshold_bp = 0;
// Abundance given to intersection hashes missing from the abundance source
const uint64_t default_missing_abundance = 1;

/*
 * Holds two comparison-ready copies of a sketch pair: same kind, same
 * resolution, flattened if abundances are ignored, and checked for
 * compatibility. The originals are borrowed and must outlive the comparison.
 * Everything is set up in the constructor, which throws (see errors.hpp)
 * if the pair cannot be compared.
 */
class BaseMinHashComparison {
public:
  virtual ~BaseMinHashComparison() = default;

  const MinHashSketch &mh1() const { return _mh1; }
  const MinHashSketch &mh2() const { return _mh2; }
  const MinHashSketch &mh1_cmp() const { return *_mh1_cmp; }
  const MinHashSketch &mh2_cmp() const { return *_mh2_cmp; }

  bool ignore_abundance() const { return _ignore_abundance; }
  SketchResolution cmp_resolution() const { return _cmp_resolution; }
  size_t ksize() const { return _ksize; }
  std::string moltype() const { return _moltype; }

  // Flattened intersection of the two comparison sketches
  std::unique_ptr<MinHashSketch> intersect_mh() const;
  double jaccard() const;
  ANIResult jaccard_ani() const;
  double angular_similarity() const;
  double cosine_similarity() const { return angular_similarity(); }

protected:
  // Exactly one of cmp_num and cmp_scaled must be non-zero
  BaseMinHashComparison(const MinHashSketch &mh1, const MinHashSketch &mh2,
                        const bool ignore_abundance, const uint64_t cmp_num,
                        const uint64_t cmp_scaled);

private:
  static SketchResolution select_resolution(const MinHashSketch &mh1,
                                            const MinHashSketch &mh2,
                                            const uint64_t cmp_num,
                                            const uint64_t cmp_scaled);
  void downsample_and_handle_ignore_abundance();
  void check_compatibility_and_downsample();

  const MinHashSketch &_mh1;
  const MinHashSketch &_mh2;
  bool _ignore_abundance;

  SketchResolution _cmp_resolution;
  std::unique_ptr<MinHashSketch> _mh1_cmp;
  std::unique_ptr<MinHashSketch> _mh2_cmp;

  size_t _ksize;
  std::string _moltype;
};

// Two 'num' sketches, compared at the smaller num unless cmp_num is given
class NumMinHashComparison : public BaseMinHashComparison {
public:
  NumMinHashComparison(const MinHashSketch &mh1, const MinHashSketch &mh2,
                       const bool ignore_abundance = false,
                       const uint64_t cmp_num = 0);

  uint64_t cmp_num() const { return cmp_resolution().num(); }
};

// Two 'scaled' sketches, compared at the larger scaled unless cmp_scaled
// is given. Adds containment and base-pair level statistics.
class FracMinHashComparison : public BaseMinHashComparison {
public:
  FracMinHashComparison(const MinHashSketch &mh1, const MinHashSketch &mh2,
                        const bool ignore_abundance = false,
                        const uint64_t cmp_scaled = 0,
                        const uint64_t threshold_bp = default_threshold_bp,
                        const bool estimate_ani_ci = false,
                        const double ani_confidence = default_ani_confidence);

  uint64_t cmp_scaled() const { return cmp_resolution().scaled(); }
  uint64_t threshold_bp() const { return _threshold_bp; }
  bool estimate_ani_ci() const { return _estimate_ani_ci; }
  double ani_confidence() const { return _ani_confidence; }

  // Estimated number of shared base pairs
  uint64_t intersect_bp() const;
  bool pass_threshold() const;

  double mh1_containment() const;
  ANIResult mh1_containment_ani() const;
  double mh2_containment() const;
  ANIResult mh2_containment_ani() const;
  double max_containment() const;
  ANIResult max_containment_ani() const;
  double avg_containment() const;
  // Mean of the two point estimates; CI bounds are not averaged
  double avg_containment_ani() const;

  /*
   * Intersection with abundances attached. Abundances come from from_mh if
   * it tracks them, otherwise from from_abunds. Hashes absent from the
   * source are given missing_abundance. With no source the plain
   * intersection is returned.
   */
  std::unique_ptr<MinHashSketch> weighted_intersection(
      const MinHashSketch *from_mh = nullptr,
      const AbundanceMap &from_abunds = AbundanceMap(),
      const uint64_t missing_abundance = default_missing_abundance) const;

private:
  uint64_t _threshold_bp;
  bool _estimate_ani_ci;
  double _ani_confidence;
};
