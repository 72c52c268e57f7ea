
#include <algorithm>
#include <iostream>

#include "compare/comparison.hpp"
#include "test_sketch.hpp"

const size_t test_ksize = 31;

std::vector<uint64_t> sorted_keys(const AbundanceMap &abunds) {
  std::vector<uint64_t> keys;
  for (auto it = abunds.cbegin(); it != abunds.cend(); ++it) {
    keys.push_back(it->first);
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

void test_identical_data_different_scaled() {
  std::vector<uint64_t> hashes = random_hashes(20000, 11);
  TestSketch mh10(SketchResolution::scaled(10), test_ksize);
  TestSketch mh20(SketchResolution::scaled(20), test_ksize);
  mh10.add_many(hashes);
  mh20.add_many(hashes);
  check(mh10.size() > mh20.size(), "scaled=10 holds more hashes");

  FracMinHashComparison cmp(mh10, mh20);
  check(cmp.cmp_scaled() == 20, "scaled defaults to the larger scaled");
  check_close(cmp.jaccard(), 1.0, "jaccard of identical data");
  check_close(cmp.max_containment(), 1.0, "max containment of identical data");
  check_close(cmp.mh1_containment(), 1.0, "containment 1 in 2");
  check_close(cmp.mh2_containment(), 1.0, "containment 2 in 1");
  check_close(cmp.max_containment_ani().ani, 1.0, "ANI of identical data");
  check(cmp.intersect_bp() == cmp.intersect_mh()->size() * 20,
        "intersect_bp is intersection size times scaled");
  check(cmp.intersect_bp() == mh20.size() * 20,
        "whole of the coarser sketch is shared");

  FracMinHashComparison reversed(mh20, mh10);
  check(reversed.cmp_scaled() == 20, "scaled selection is symmetric");
  check(mh10.resolution().scaled() == 10, "original keeps its scaled");
}

void test_scaled_override() {
  std::vector<uint64_t> hashes = random_hashes(20000, 12);
  TestSketch mh10(SketchResolution::scaled(10), test_ksize);
  TestSketch mh20(SketchResolution::scaled(20), test_ksize);
  mh10.add_many(hashes);
  mh20.add_many(hashes);

  FracMinHashComparison coarser(mh10, mh20, false, 100);
  check(coarser.cmp_scaled() == 100, "explicit scaled is used");
  check(coarser.mh1_cmp().size() < mh20.size(), "downsampled to scaled=100");
  check(coarser.intersect_bp() == coarser.intersect_mh()->size() * 100,
        "intersect_bp uses the comparison scaled");

  check_throws<std::runtime_error>(
      [&]() { FracMinHashComparison finer(mh10, mh20, false, 5); },
      "scaled finer than the data");
}

void test_containment() {
  std::vector<uint64_t> hashes = random_hashes(20000, 13);
  TestSketch mh_a(SketchResolution::scaled(10), test_ksize);
  TestSketch mh_b(SketchResolution::scaled(10), test_ksize);
  mh_a.add_many(std::vector<uint64_t>(hashes.begin(), hashes.begin() + 16000));
  mh_b.add_many(std::vector<uint64_t>(hashes.begin() + 8000, hashes.end()));

  FracMinHashComparison cmp(mh_a, mh_b);
  FracMinHashComparison cmp_rev(mh_b, mh_a);
  const double c12 = cmp.mh1_containment();
  const double c21 = cmp.mh2_containment();
  check(c12 >= 0 && c12 <= 1 && c21 >= 0 && c21 <= 1, "containment bounds");
  check(c12 < c21, "larger sketch is less contained");
  check_close(cmp.max_containment(), std::max(c12, c21),
              "max containment is the larger direction");
  check_close(cmp.max_containment(), cmp_rev.max_containment(),
              "max containment commutes");
  check_close(cmp.jaccard(), cmp_rev.jaccard(), "jaccard commutes");
  check_close(cmp.avg_containment(), (c12 + c21) / 2, "avg containment");
  check_close(cmp_rev.mh1_containment(), c21, "directions swap");

  const ANIResult ani12 = cmp.mh1_containment_ani();
  const ANIResult ani21 = cmp.mh2_containment_ani();
  check(ani12.ani > 0 && ani12.ani < ani21.ani, "ANI follows containment");
  check_close(cmp.avg_containment_ani(), (ani12.ani + ani21.ani) / 2,
              "avg containment ANI is the mean of point estimates");
  check_close(cmp.max_containment_ani().ani, std::max(ani12.ani, ani21.ani),
              "max containment ANI");
  check_close(ani12.dist(), 1 - ani12.ani, "ANI distance");
  check(!ani12.ci_estimated, "no CI unless requested");
}

void test_ani_confidence() {
  std::vector<uint64_t> hashes = random_hashes(20000, 14);
  TestSketch mh_a(SketchResolution::scaled(10), test_ksize);
  TestSketch mh_b(SketchResolution::scaled(10), test_ksize);
  mh_a.add_many(std::vector<uint64_t>(hashes.begin(), hashes.begin() + 15000));
  mh_b.add_many(std::vector<uint64_t>(hashes.begin() + 5000, hashes.end()));

  FracMinHashComparison cmp(mh_a, mh_b, false, 0, 0, true, 0.9);
  check(cmp.estimate_ani_ci(), "CI option stored");
  check_close(cmp.ani_confidence(), 0.9, "confidence stored");
  const ANIResult ani = cmp.mh1_containment_ani();
  check(ani.ci_estimated, "CI requested from the engine");
  check(ani.ani_low <= ani.ani && ani.ani <= ani.ani_high, "CI brackets ANI");

  FracMinHashComparison wider(mh_a, mh_b, false, 0, 0, true, 0.99);
  check(wider.mh1_containment_ani().ani_low < ani.ani_low,
        "confidence level passed to the engine");

  check_throws<ConfigurationError>(
      [&]() { FracMinHashComparison bad(mh_a, mh_b, false, 0, 0, true, 1.0); },
      "confidence of 1");
  check_throws<ConfigurationError>(
      [&]() { FracMinHashComparison bad(mh_a, mh_b, false, 0, 0, true, 0.0); },
      "confidence of 0");

  // Confidence is only checked when an interval is requested
  FracMinHashComparison unused(mh_a, mh_b, false, 0, 0, false, 1.5);
  check_close(unused.ani_confidence(), 1.5, "unused confidence stored");
  check(!unused.mh1_containment_ani().ci_estimated, "no CI estimated");
}

void test_threshold() {
  std::vector<uint64_t> hashes = random_hashes(20000, 15);
  TestSketch mh_a(SketchResolution::scaled(10), test_ksize);
  TestSketch mh_b(SketchResolution::scaled(10), test_ksize);
  mh_a.add_many(std::vector<uint64_t>(hashes.begin(), hashes.begin() + 12000));
  mh_b.add_many(std::vector<uint64_t>(hashes.begin() + 6000, hashes.end()));

  FracMinHashComparison no_threshold(mh_a, mh_b);
  const uint64_t bp = no_threshold.intersect_bp();
  check(bp > 0, "some overlap");
  check(no_threshold.threshold_bp() == 0, "default threshold");
  check(no_threshold.pass_threshold(), "zero threshold always passes");

  FracMinHashComparison at(mh_a, mh_b, false, 0, bp);
  check(at.pass_threshold(), "threshold equal to intersect_bp passes");
  FracMinHashComparison above(mh_a, mh_b, false, 0, bp + 1);
  check(!above.pass_threshold(), "threshold above intersect_bp fails");
  FracMinHashComparison huge(mh_a, mh_b, false, 0, 1000000000ULL);
  check(!huge.pass_threshold(), "unreachable threshold fails");

  TestSketch empty(SketchResolution::scaled(10), test_ksize);
  FracMinHashComparison disjoint(mh_a, empty);
  check(disjoint.intersect_bp() == 0, "nothing shared");
  check(disjoint.pass_threshold(), "zero threshold passes with no overlap");
}

void test_weighted_intersection() {
  std::vector<uint64_t> hashes = random_hashes(20000, 16);
  TestSketch mh_a(SketchResolution::scaled(10), test_ksize);
  TestSketch mh_b(SketchResolution::scaled(10), test_ksize);
  mh_a.add_many(std::vector<uint64_t>(hashes.begin(), hashes.begin() + 14000));
  mh_b.add_many(std::vector<uint64_t>(hashes.begin() + 6000, hashes.end()));
  FracMinHashComparison cmp(mh_a, mh_b, true);

  const std::vector<uint64_t> common = sorted_keys(cmp.intersect_mh()->hashes());
  check(common.size() > 10, "enough overlap to test");
  const size_t half = common.size() / 2;

  // Abundance source that only knows about the first half
  TestSketch from_mh(SketchResolution::scaled(10), test_ksize, "DNA", true);
  AbundanceMap from_abunds;
  for (size_t i = 0; i < half; ++i) {
    from_mh.add_hash(common[i], 5);
    from_abunds[common[i]] = 7;
  }

  std::unique_ptr<MinHashSketch> weighted = cmp.weighted_intersection(&from_mh);
  check(weighted->track_abundance(), "weighted intersection has abundances");
  AbundanceMap abunds = weighted->hashes();
  check(abunds.size() == common.size(), "every intersection hash kept");
  for (size_t i = 0; i < common.size(); ++i) {
    check(abunds.at(common[i]) == (i < half ? 5 : 1),
          "abundance from sketch, 1 when missing");
  }

  abunds = cmp.weighted_intersection(nullptr, from_abunds)->hashes();
  for (size_t i = 0; i < common.size(); ++i) {
    check(abunds.at(common[i]) == (i < half ? 7 : 1),
          "abundance from map, 1 when missing");
  }

  abunds = cmp.weighted_intersection(&from_mh, from_abunds)->hashes();
  check(abunds.at(common[0]) == 5, "sketch takes precedence over map");

  TestSketch flat_mh(SketchResolution::scaled(10), test_ksize);
  flat_mh.add_many(common);
  abunds = cmp.weighted_intersection(&flat_mh, from_abunds)->hashes();
  check(abunds.at(common[0]) == 7, "sketch without abundance is skipped");

  abunds = cmp.weighted_intersection(nullptr, from_abunds, 2)->hashes();
  check(abunds.at(common.back()) == 2, "missing abundance can be overridden");

  std::unique_ptr<MinHashSketch> plain = cmp.weighted_intersection();
  check(!plain->track_abundance(), "no source gives the plain intersection");
  check(sorted_keys(plain->hashes()) == common, "plain intersection hashes");
  check(!cmp.weighted_intersection(&flat_mh)->track_abundance(),
        "sketch without abundance and no map gives the plain intersection");
}

void test_ignore_abundance() {
  std::vector<uint64_t> hashes = random_hashes(20000, 17);
  TestSketch mh1(SketchResolution::scaled(10), test_ksize, "DNA", true);
  TestSketch mh2(SketchResolution::scaled(20), test_ksize, "DNA", true);
  for (size_t i = 0; i < hashes.size(); ++i) {
    mh1.add_hash(hashes[i], 1 + i % 3);
    mh2.add_hash(hashes[i], 1 + i % 5);
  }

  FracMinHashComparison with_abund(mh1, mh2);
  const double angular = with_abund.angular_similarity();
  check(angular > 0 && angular < 1, "different abundances, same hashes");

  FracMinHashComparison flat(mh1, mh2, true);
  check(!flat.mh1_cmp().track_abundance(), "abundance stripped");
  check_throws<UnsupportedOperationError>(
      [&]() { flat.angular_similarity(); }, "angular with ignored abundance");
  check_close(flat.jaccard(), 1.0, "jaccard on flattened sketches");
  check_close(flat.max_containment(), 1.0, "containment on flattened sketches");
  check(flat.pass_threshold(), "threshold on flattened sketches");
}

int main(int argc, char *argv[]) {
  test_identical_data_different_scaled();
  test_scaled_override();
  test_containment();
  test_ani_confidence();
  test_threshold();
  test_weighted_intersection();
  test_ignore_abundance();

  std::cout << "scaled comparison tests passed" << std::endl;
  return 0;
}
