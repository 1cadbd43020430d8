#include "ctxcpp/expiration_sweeper.hpp"

#include "ctxcpp/context_entry.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ctxcpp {
namespace {

void ValidateConfig(const SweeperConfig& config) {
  if (config.interval.count() <= 0) {
    throw std::invalid_argument("sweeper interval must be positive");
  }
  if (config.batch_size == 0) {
    throw std::invalid_argument("sweeper batch_size must be positive");
  }
}

class SweepGuard final {
 public:
  explicit SweepGuard(std::atomic<bool>& flag) : flag_(flag) {
    bool expected = false;
    acquired_ = flag_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
  }
  ~SweepGuard() {
    if (acquired_) {
      flag_.store(false, std::memory_order_release);
    }
  }
  SweepGuard(const SweepGuard&) = delete;
  SweepGuard& operator=(const SweepGuard&) = delete;

  [[nodiscard]] bool acquired() const { return acquired_; }

 private:
  std::atomic<bool>& flag_;
  bool acquired_ = false;
};

}  // namespace

ExpirationSweeper::ExpirationSweeper(ContextStore& store, const SweeperConfig& config)
    : store_(store), config_(config) {
  ValidateConfig(config_);
}

ExpirationSweeper::~ExpirationSweeper() {
  Stop();
}

void ExpirationSweeper::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (thread_.joinable()) {
    return;
  }
  stop_requested_ = false;
  if (state_.load() != SweeperState::kPaused) {
    state_.store(SweeperState::kRunning);
  }
  thread_ = std::thread([this]() { ThreadMain(); });
  spdlog::debug("expiration sweeper: started (interval={}ms, batch_size={})",
                config_.interval.count(),
                config_.batch_size);
}

void ExpirationSweeper::Stop() {
  std::thread worker{};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = true;
    worker = std::move(thread_);
  }
  wake_.notify_all();
  if (worker.joinable()) {
    worker.join();
    spdlog::debug("expiration sweeper: stopped after {} sweeps", sweep_count_.load());
  }
  state_.store(SweeperState::kStopped);
}

void ExpirationSweeper::Pause() {
  std::lock_guard<std::mutex> lock(mutex_);
  state_.store(SweeperState::kPaused);
}

void ExpirationSweeper::Resume() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_.load() != SweeperState::kPaused) {
    return;
  }
  state_.store(thread_.joinable() ? SweeperState::kRunning : SweeperState::kStopped);
}

SweeperState ExpirationSweeper::state() const {
  return state_.load();
}

void ExpirationSweeper::SetBatchObserver(BatchObserver observer) {
  std::lock_guard<std::mutex> lock(mutex_);
  batch_observer_ = std::move(observer);
}

void ExpirationSweeper::ThreadMain() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stop_requested_) {
    if (wake_.wait_for(lock, config_.interval, [this]() { return stop_requested_; })) {
      break;
    }
    lock.unlock();
    if (state_.load() != SweeperState::kPaused) {
      Sweep(Now());
    }
    lock.lock();
  }
}

std::optional<SweepReport> ExpirationSweeper::Tick(TimePoint now) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (last_tick_.has_value() && now - *last_tick_ < config_.interval) {
      return std::nullopt;
    }
    last_tick_ = now;
  }
  return RunCleanup(now);
}

SweepReport ExpirationSweeper::RunCleanup() {
  return RunCleanup(Now());
}

SweepReport ExpirationSweeper::RunCleanup(TimePoint now) {
  if (state_.load() == SweeperState::kPaused) {
    SweepReport report{};
    report.skipped = true;
    return report;
  }
  return Sweep(now);
}

void ExpirationSweeper::PurgeBatch(const std::vector<std::string>& batch, TimePoint now, SweepReport& report) {
  try {
    report.removed += store_.PurgeExpired(batch, now);
    return;
  } catch (const std::exception& ex) {
    spdlog::warn("expiration sweeper: batch of {} failed ({}); retrying entry by entry", batch.size(), ex.what());
  }
  for (const auto& id : batch) {
    try {
      report.removed += store_.PurgeExpired({id}, now);
    } catch (const std::exception& ex) {
      ++report.failed;
      spdlog::warn("expiration sweeper: failed to remove {}: {}", id, ex.what());
    }
  }
}

SweepReport ExpirationSweeper::Sweep(TimePoint now) {
  SweepReport report{};
  SweepGuard guard(sweeping_);
  if (!guard.acquired()) {
    spdlog::debug("expiration sweeper: sweep already in progress; skipping");
    report.skipped = true;
    return report;
  }

  std::vector<std::string> expired{};
  try {
    expired = store_.ExpiredIds(now);
  } catch (const std::exception& ex) {
    spdlog::warn("expiration sweeper: cannot list expired entries: {}", ex.what());
    sweep_count_.fetch_add(1);
    return report;
  }
  report.expired_found = expired.size();
  BatchObserver observer{};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    observer = batch_observer_;
  }

  for (std::size_t offset = 0; offset < expired.size(); offset += config_.batch_size) {
    const auto end = std::min(expired.size(), offset + config_.batch_size);
    const std::vector<std::string> batch(expired.begin() + static_cast<std::ptrdiff_t>(offset),
                                         expired.begin() + static_cast<std::ptrdiff_t>(end));
    ++report.batches;
    PurgeBatch(batch, now, report);
    if (observer) {
      try {
        observer(report);
      } catch (const std::exception& ex) {
        spdlog::warn("expiration sweeper: batch observer failed: {}", ex.what());
      }
    }
  }

  total_removed_.fetch_add(report.removed);
  sweep_count_.fetch_add(1);
  if (report.expired_found > 0) {
    spdlog::info("expiration sweeper: removed {} of {} expired entries in {} batches ({} failed)",
                 report.removed,
                 report.expired_found,
                 report.batches,
                 report.failed);
  }
  return report;
}

std::uint64_t ExpirationSweeper::TotalRemoved() const {
  return total_removed_.load();
}

std::uint64_t ExpirationSweeper::SweepCount() const {
  return sweep_count_.load();
}

}  // namespace ctxcpp
