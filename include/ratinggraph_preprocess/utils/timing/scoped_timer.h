#pragma once

#include <string>

#include "ratinggraph_preprocess/utils/timing/timer.h"

namespace ratinggraph::utils::timing {

// Records the lifetime of a scope under `name` when timing is enabled.
class ScopedTimer {
 public:
  explicit ScopedTimer(std::string name);
  ~ScopedTimer();

  ScopedTimer(const ScopedTimer&) = delete;
  ScopedTimer& operator=(const ScopedTimer&) = delete;

 private:
  std::string name_;
  Timer timer_;
  bool enabled_{false};
};

// True when enabled through TimingRegistry or RATINGGRAPH_PREPROCESS_TIMING (not "0").
bool TimingEnabled();

}  // namespace ratinggraph::utils::timing
