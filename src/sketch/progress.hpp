#pragma once

#include <cstddef>
#include <cstdio>

class ProgressMeter {
public:
  ProgressMeter(size_t total, bool quiet = false)
      : total_(total), count_(0), quiet_(quiet) {
    tick_count(0);
  }

  void tick_count(size_t count) {
    count_ = count;
    if (!quiet_ && total_ > 0) {
      double progress = count_ / static_cast<double>(total_);
      progress = progress > 1 ? 1 : progress;
      fprintf(stderr, "%cProgress (comparisons): %.1lf%%", 13, progress * 100);
    }
  }

  void finalise() {
    if (!quiet_) {
      fprintf(stderr, "%cProgress (comparisons): 100.0%%\n", 13);
    }
  }

private:
  size_t total_;
  volatile size_t count_;
  bool quiet_;
};
