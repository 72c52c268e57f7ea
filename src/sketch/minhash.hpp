/*
 *
 * minhash.hpp
 * Contract for the MinHash engine used by the comparisons
 *
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>

#include "robin_hood.h"

// hash -> abundance
typedef robin_hood::unordered_flat_map<uint64_t, uint64_t> AbundanceMap;

enum class SketchKind { FixedSize, FixedRate };

// A sketch is either 'num' (keeps the N smallest hashes) or 'scaled'
// (keeps hashes below max_hash / scaled). Never both, never neither.
class SketchResolution {
public:
  static SketchResolution num(const uint64_t n);
  static SketchResolution scaled(const uint64_t s);

  SketchKind kind() const { return _kind; }
  uint64_t value() const { return _value; }
  bool is_num() const { return _kind == SketchKind::FixedSize; }
  bool is_scaled() const { return _kind == SketchKind::FixedRate; }

  // 0 if the sketch is of the other kind
  uint64_t num() const { return is_num() ? _value : 0; }
  uint64_t scaled() const { return is_scaled() ? _value : 0; }

  std::string to_string() const;

  bool operator==(const SketchResolution &rhs) const {
    return _kind == rhs._kind && _value == rhs._value;
  }
  bool operator!=(const SketchResolution &rhs) const { return !(*this == rhs); }

private:
  SketchResolution(const SketchKind kind, const uint64_t value)
      : _kind(kind), _value(value) {}

  SketchKind _kind;
  uint64_t _value;
};

// ANI estimate as returned by the engine. CI bounds are only meaningful
// when ci_estimated is set.
struct ANIResult {
  double ani = 0.0;
  bool ci_estimated = false;
  double ani_low = std::numeric_limits<double>::quiet_NaN();
  double ani_high = std::numeric_limits<double>::quiet_NaN();
  double p_nothing_in_common = 0.0;
  bool p_exceeds_threshold = false;
  bool size_is_inaccurate = false;

  double dist() const { return 1.0 - ani; }
};

class MinHashSketch {
public:
  virtual ~MinHashSketch() = default;

  // Info
  virtual SketchResolution resolution() const = 0;
  virtual size_t ksize() const = 0;
  virtual std::string moltype() const = 0;
  virtual bool track_abundance() const = 0;
  virtual size_t size() const = 0;

  // Abundance of every hash (1 when abundance is not tracked)
  virtual AbundanceMap hashes() const = 0;
  virtual void set_abundances(const AbundanceMap &abunds) = 0;
  // Only valid on an empty sketch
  virtual void set_track_abundance(const bool track) = 0;

  // New sketches, owned by the caller
  virtual std::unique_ptr<MinHashSketch> copy() const = 0;
  virtual std::unique_ptr<MinHashSketch> copy_and_clear() const = 0;
  virtual std::unique_ptr<MinHashSketch> flatten() const = 0;
  // Throws if the requested resolution is finer than this sketch holds
  virtual std::unique_ptr<MinHashSketch>
  downsample(const SketchResolution &resolution) const = 0;
  virtual std::unique_ptr<MinHashSketch>
  intersection(const MinHashSketch &other) const = 0;

  // Same k-mer size, molecule type and resolution
  virtual bool is_compatible(const MinHashSketch &other) const = 0;

  virtual double jaccard(const MinHashSketch &other) const = 0;
  virtual ANIResult jaccard_ani(const MinHashSketch &other) const = 0;
  virtual double contained_by(const MinHashSketch &other) const = 0;
  virtual ANIResult containment_ani(const MinHashSketch &other,
                                    const double confidence,
                                    const bool estimate_ci) const = 0;
  virtual double max_containment(const MinHashSketch &other) const = 0;
  virtual ANIResult max_containment_ani(const MinHashSketch &other,
                                        const double confidence,
                                        const bool estimate_ci) const = 0;
  // Requires abundances on both sketches
  virtual double angular_similarity(const MinHashSketch &other) const = 0;
};
