#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ratinggraph::utils::timing {

struct TimingStats {
  uint64_t count{0};
  double total_ms{0.0};
  double min_ms{0.0};
  double max_ms{0.0};

  double AverageMs() const { return count ? total_ms / static_cast<double>(count) : 0.0; }
};

// Process-wide store of named durations plus the switch that enables collection.
class TimingRegistry {
 public:
  static TimingRegistry& Instance();

  void SetEnabled(bool enabled);
  bool Enabled() const;

  void Record(const std::string& name, double elapsed_ms);
  std::unordered_map<std::string, TimingStats> Snapshot() const;
  void Reset();

  // Writes every entry to the default logger at debug level.
  void Log() const;

 private:
  TimingRegistry() = default;
  TimingRegistry(const TimingRegistry&) = delete;
  TimingRegistry& operator=(const TimingRegistry&) = delete;

  std::atomic<bool> enabled_{false};
  mutable std::mutex mutex_;
  std::unordered_map<std::string, TimingStats> stats_;
};

}  // namespace ratinggraph::utils::timing
