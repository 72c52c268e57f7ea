/*
 *
 * comparison.cpp
 * Bring two sketches to a common resolution and compare them
 *
 */

#include <algorithm>

#include "comparison.hpp"

namespace {

std::string kind_name(const SketchResolution &res) {
  return res.is_num() ? "num" : "scaled";
}

// Smallest num of the pair: both sketches hold at least this many hashes
uint64_t default_cmp_num(const MinHashSketch &mh1, const MinHashSketch &mh2,
                         const uint64_t cmp_num) {
  if (cmp_num > 0) {
    return cmp_num;
  }
  return std::min(mh1.resolution().num(), mh2.resolution().num());
}

// Largest scaled of the pair: resolution can only be coarsened
uint64_t default_cmp_scaled(const MinHashSketch &mh1, const MinHashSketch &mh2,
                            const uint64_t cmp_scaled) {
  if (cmp_scaled > 0) {
    return cmp_scaled;
  }
  return std::max(mh1.resolution().scaled(), mh2.resolution().scaled());
}

} // namespace

BaseMinHashComparison::BaseMinHashComparison(const MinHashSketch &mh1,
                                             const MinHashSketch &mh2,
                                             const bool ignore_abundance,
                                             const uint64_t cmp_num,
                                             const uint64_t cmp_scaled)
    : _mh1(mh1), _mh2(mh2), _ignore_abundance(ignore_abundance),
      _cmp_resolution(select_resolution(mh1, mh2, cmp_num, cmp_scaled)),
      _ksize(0) {
  check_compatibility_and_downsample();
}

SketchResolution BaseMinHashComparison::select_resolution(
    const MinHashSketch &mh1, const MinHashSketch &mh2, const uint64_t cmp_num,
    const uint64_t cmp_scaled) {
  const SketchResolution res1 = mh1.resolution();
  const SketchResolution res2 = mh2.resolution();
  if (res1.kind() != res2.kind()) {
    throw TypeMismatchError("Both sketches must be 'num' or 'scaled' (got " +
                            res1.to_string() + " and " + res2.to_string() +
                            ")");
  }

  if ((cmp_num > 0) == (cmp_scaled > 0)) {
    throw ConfigurationError(
        "Must specify a comparison resolution (exactly one of num or scaled)");
  }
  SketchResolution cmp_res = cmp_scaled > 0 ? SketchResolution::scaled(cmp_scaled)
                                            : SketchResolution::num(cmp_num);
  if (cmp_res.kind() != res1.kind()) {
    throw TypeMismatchError("Cannot compare " + kind_name(res1) +
                            " sketches at " + cmp_res.to_string());
  }
  return cmp_res;
}

void BaseMinHashComparison::downsample_and_handle_ignore_abundance() {
  std::unique_ptr<MinHashSketch> mh1_base, mh2_base;
  if (_ignore_abundance) {
    mh1_base = _mh1.flatten();
    mh2_base = _mh2.flatten();
  } else {
    mh1_base = _mh1.copy();
    mh2_base = _mh2.copy();
  }
  _mh1_cmp = mh1_base->downsample(_cmp_resolution);
  _mh2_cmp = mh2_base->downsample(_cmp_resolution);
}

void BaseMinHashComparison::check_compatibility_and_downsample() {
  // Resolutions must match before compatibility can be checked
  downsample_and_handle_ignore_abundance();
  if (_mh1_cmp->resolution() != _mh2_cmp->resolution() ||
      !_mh1_cmp->is_compatible(*_mh2_cmp)) {
    throw IncompatibleSketchError(
        "Cannot compare incompatible sketches (k=" +
        std::to_string(_mh1_cmp->ksize()) + " " + _mh1_cmp->moltype() + " " +
        _mh1_cmp->resolution().to_string() + " vs k=" +
        std::to_string(_mh2_cmp->ksize()) + " " + _mh2_cmp->moltype() + " " +
        _mh2_cmp->resolution().to_string() + ")");
  }
  _ksize = _mh1.ksize();
  _moltype = _mh1.moltype();
}

std::unique_ptr<MinHashSketch> BaseMinHashComparison::intersect_mh() const {
  return _mh1_cmp->flatten()->intersection(*_mh2_cmp->flatten());
}

double BaseMinHashComparison::jaccard() const {
  return _mh1_cmp->jaccard(*_mh2_cmp);
}

ANIResult BaseMinHashComparison::jaccard_ani() const {
  return _mh1_cmp->jaccard_ani(*_mh2_cmp);
}

double BaseMinHashComparison::angular_similarity() const {
  if (_ignore_abundance) {
    throw UnsupportedOperationError(
        "Angular similarity requires abundances, which are being ignored");
  }
  if (!_mh1_cmp->track_abundance() || !_mh2_cmp->track_abundance()) {
    throw UnsupportedOperationError(
        "Angular similarity requires both sketches to track abundance");
  }
  return _mh1_cmp->angular_similarity(*_mh2_cmp);
}

NumMinHashComparison::NumMinHashComparison(const MinHashSketch &mh1,
                                           const MinHashSketch &mh2,
                                           const bool ignore_abundance,
                                           const uint64_t cmp_num)
    : BaseMinHashComparison(mh1, mh2, ignore_abundance,
                            default_cmp_num(mh1, mh2, cmp_num), 0) {}

FracMinHashComparison::FracMinHashComparison(
    const MinHashSketch &mh1, const MinHashSketch &mh2,
    const bool ignore_abundance, const uint64_t cmp_scaled,
    const uint64_t threshold_bp, const bool estimate_ani_ci,
    const double ani_confidence)
    : BaseMinHashComparison(mh1, mh2, ignore_abundance, 0,
                            default_cmp_scaled(mh1, mh2, cmp_scaled)),
      _threshold_bp(threshold_bp), _estimate_ani_ci(estimate_ani_ci),
      _ani_confidence(ani_confidence) {
  // Only used when a confidence interval is requested
  if (estimate_ani_ci && !(ani_confidence > 0.0 && ani_confidence < 1.0)) {
    throw ConfigurationError("ANI confidence must be between 0 and 1 (got " +
                             std::to_string(ani_confidence) + ")");
  }
}

uint64_t FracMinHashComparison::intersect_bp() const {
  return intersect_mh()->size() * cmp_scaled();
}

bool FracMinHashComparison::pass_threshold() const {
  return intersect_bp() >= _threshold_bp;
}

double FracMinHashComparison::mh1_containment() const {
  return mh1_cmp().contained_by(mh2_cmp());
}

ANIResult FracMinHashComparison::mh1_containment_ani() const {
  return mh1_cmp().containment_ani(mh2_cmp(), _ani_confidence,
                                   _estimate_ani_ci);
}

double FracMinHashComparison::mh2_containment() const {
  return mh2_cmp().contained_by(mh1_cmp());
}

ANIResult FracMinHashComparison::mh2_containment_ani() const {
  return mh2_cmp().containment_ani(mh1_cmp(), _ani_confidence,
                                   _estimate_ani_ci);
}

double FracMinHashComparison::max_containment() const {
  return mh1_cmp().max_containment(mh2_cmp());
}

ANIResult FracMinHashComparison::max_containment_ani() const {
  return mh1_cmp().max_containment_ani(mh2_cmp(), _ani_confidence,
                                       _estimate_ani_ci);
}

double FracMinHashComparison::avg_containment() const {
  return (mh1_containment() + mh2_containment()) / 2.0;
}

double FracMinHashComparison::avg_containment_ani() const {
  return (mh1_containment_ani().ani + mh2_containment_ani().ani) / 2.0;
}

std::unique_ptr<MinHashSketch> FracMinHashComparison::weighted_intersection(
    const MinHashSketch *from_mh, const AbundanceMap &from_abunds,
    const uint64_t missing_abundance) const {
  std::unique_ptr<MinHashSketch> intersect = intersect_mh();

  // from_mh takes precedence over from_abunds
  AbundanceMap mh_abunds;
  const AbundanceMap *source = nullptr;
  if (from_mh != nullptr && from_mh->track_abundance()) {
    mh_abunds = from_mh->hashes();
    source = &mh_abunds;
  } else if (!from_abunds.empty()) {
    source = &from_abunds;
  }
  if (source == nullptr) {
    return intersect;
  }

  AbundanceMap abunds;
  const AbundanceMap intersect_hashes = intersect->hashes();
  abunds.reserve(intersect_hashes.size());
  for (auto hash_it = intersect_hashes.cbegin();
       hash_it != intersect_hashes.cend(); ++hash_it) {
    auto source_it = source->find(hash_it->first);
    abunds[hash_it->first] =
        source_it != source->end() ? source_it->second : missing_abundance;
  }

  std::unique_ptr<MinHashSketch> abund_mh = intersect->copy_and_clear();
  abund_mh->set_track_abundance(true);
  abund_mh->set_abundances(abunds);
  return abund_mh;
}
