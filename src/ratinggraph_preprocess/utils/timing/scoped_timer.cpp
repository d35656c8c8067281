#include "ratinggraph_preprocess/utils/timing/scoped_timer.h"

#include <cstdlib>
#include <utility>

#include "ratinggraph_preprocess/utils/timing/timing_registry.h"

namespace ratinggraph::utils::timing {

ScopedTimer::ScopedTimer(std::string name)
    : name_(std::move(name)), timer_(), enabled_(TimingEnabled()) {}

ScopedTimer::~ScopedTimer() {
  if (!enabled_) {
    return;
  }
  TimingRegistry::Instance().Record(name_, timer_.ElapsedMs());
}

bool TimingEnabled() {
  if (TimingRegistry::Instance().Enabled()) {
    return true;
  }
  const char* env = std::getenv("RATINGGRAPH_PREPROCESS_TIMING");
  if (!env) {
    return false;
  }
  return std::string(env) != "0";
}

}  // namespace ratinggraph::utils::timing
