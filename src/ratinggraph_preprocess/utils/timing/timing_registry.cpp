#include "ratinggraph_preprocess/utils/timing/timing_registry.h"

#include <algorithm>
#include <vector>

#include <spdlog/spdlog.h>

namespace ratinggraph::utils::timing {

TimingRegistry& TimingRegistry::Instance() {
  static TimingRegistry registry;
  return registry;
}

void TimingRegistry::SetEnabled(bool enabled) {
  enabled_.store(enabled, std::memory_order_relaxed);
}

bool TimingRegistry::Enabled() const {
  return enabled_.load(std::memory_order_relaxed);
}

void TimingRegistry::Record(const std::string& name, double elapsed_ms) {
  std::lock_guard<std::mutex> guard(mutex_);
  auto& stat = stats_[name];
  stat.count += 1;
  stat.total_ms += elapsed_ms;
  if (stat.count == 1) {
    stat.min_ms = elapsed_ms;
    stat.max_ms = elapsed_ms;
  } else {
    stat.min_ms = std::min(stat.min_ms, elapsed_ms);
    stat.max_ms = std::max(stat.max_ms, elapsed_ms);
  }
}

std::unordered_map<std::string, TimingStats> TimingRegistry::Snapshot() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return stats_;
}

void TimingRegistry::Reset() {
  std::lock_guard<std::mutex> guard(mutex_);
  stats_.clear();
}

void TimingRegistry::Log() const {
  auto stats = Snapshot();
  if (stats.empty()) {
    spdlog::debug("timing: no stats collected");
    return;
  }
  std::vector<std::string> names;
  names.reserve(stats.size());
  for (const auto& entry : stats) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());

  spdlog::debug("timing: {} entries", stats.size());
  for (const auto& name : names) {
    const auto& stat = stats.at(name);
    spdlog::debug("timing: {} count={} total_ms={:.3f} avg_ms={:.3f} min_ms={:.3f} max_ms={:.3f}",
                  name, stat.count, stat.total_ms, stat.AverageMs(), stat.min_ms, stat.max_ms);
  }
}

}  // namespace ratinggraph::utils::timing
