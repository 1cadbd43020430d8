#pragma once

#include "ctxcpp/context_store.hpp"
#include "ctxcpp/types.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace ctxcpp {

enum class SweeperState {
  kStopped,
  kRunning,
  kPaused,
};

struct SweepReport {
  // True when another sweep was in flight or the sweeper is paused.
  bool skipped = false;
  std::size_t expired_found = 0;
  std::size_t removed = 0;
  std::size_t failed = 0;
  std::size_t batches = 0;
};

// Removes TTL-expired entries from a ContextStore, either on its own thread
// (Start/Stop) or driven by a host loop through Tick(). Sweeps never overlap
// and never throw.
class ExpirationSweeper {
 public:
  // Called on the sweeping thread after each batch with the running totals.
  using BatchObserver = std::function<void(const SweepReport&)>;

  explicit ExpirationSweeper(ContextStore& store, const SweeperConfig& config = {});
  ~ExpirationSweeper();
  ExpirationSweeper(const ExpirationSweeper&) = delete;
  ExpirationSweeper& operator=(const ExpirationSweeper&) = delete;

  void Start();
  void Stop();
  void Pause();
  void Resume();
  [[nodiscard]] SweeperState state() const;
  void SetBatchObserver(BatchObserver observer);

  // Runs a sweep when `interval` has passed since the last one.
  // Returns nullopt when no sweep was due.
  std::optional<SweepReport> Tick(TimePoint now);
  SweepReport RunCleanup();
  SweepReport RunCleanup(TimePoint now);

  [[nodiscard]] std::uint64_t TotalRemoved() const;
  [[nodiscard]] std::uint64_t SweepCount() const;
  [[nodiscard]] const SweeperConfig& config() const { return config_; }

 private:
  void ThreadMain();
  SweepReport Sweep(TimePoint now);
  void PurgeBatch(const std::vector<std::string>& batch, TimePoint now, SweepReport& report);

  ContextStore& store_;
  SweeperConfig config_;
  std::atomic<SweeperState> state_{SweeperState::kStopped};
  std::atomic<bool> sweeping_{false};
  std::atomic<std::uint64_t> total_removed_{0};
  std::atomic<std::uint64_t> sweep_count_{0};

  std::mutex mutex_{};
  std::condition_variable wake_{};
  bool stop_requested_ = false;
  std::optional<TimePoint> last_tick_{};
  BatchObserver batch_observer_{};
  std::thread thread_{};
};

}  // namespace ctxcpp
