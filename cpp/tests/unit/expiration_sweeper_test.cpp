#include "ctxcpp/context_entry.hpp"
#include "ctxcpp/context_store.hpp"
#include "ctxcpp/expiration_sweeper.hpp"

#include "../test_logger.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <future>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

void AddEntries(ctxcpp::ContextStore& store, std::size_t count, std::optional<std::chrono::milliseconds> ttl) {
  for (std::size_t i = 0; i < count; ++i) {
    ctxcpp::ContextEntry entry{};
    entry.entry_type = ctxcpp::EntryType::kSearchResult;
    entry.source = "grep";
    entry.content = "match " + std::to_string(i);
    entry.summary = "search hit";
    entry.ttl = ttl;
    (void)store.Add(entry);
  }
}

void ScenarioConfigValidation() {
  ctxcpp::tests::Log("scenario: config validation");
  ctxcpp::ContextStore store;
  bool threw = false;
  try {
    ctxcpp::ExpirationSweeper sweeper(store, ctxcpp::SweeperConfig{0ms, 10});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  Require(threw, "zero interval must be rejected");

  threw = false;
  try {
    ctxcpp::ExpirationSweeper sweeper(store, ctxcpp::SweeperConfig{1000ms, 0});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  Require(threw, "zero batch size must be rejected");
}

void ScenarioManualCleanup() {
  ctxcpp::tests::Log("scenario: manual cleanup in batches");
  ctxcpp::ContextStore store;
  AddEntries(store, 5, 50ms);
  AddEntries(store, 1, std::nullopt);
  ctxcpp::ExpirationSweeper sweeper(store, ctxcpp::SweeperConfig{60'000ms, 2});

  const auto early = sweeper.RunCleanup();
  Require(!early.skipped && early.expired_found == 0 && early.removed == 0, "nothing should expire yet");

  std::this_thread::sleep_for(80ms);
  const auto report = sweeper.RunCleanup();
  ctxcpp::tests::LogKV("removed", static_cast<std::uint64_t>(report.removed));
  Require(!report.skipped, "manual sweep should run");
  Require(report.expired_found == 5, "expired count mismatch");
  Require(report.removed == 5, "removed count mismatch");
  Require(report.batches == 3, "five ids in batches of two need three batches");
  Require(report.failed == 0, "no removal should fail");
  Require(store.Size() == 1, "durable entry must survive");
  Require(sweeper.TotalRemoved() == 5, "total removed mismatch");
  Require(sweeper.SweepCount() == 2, "sweep count mismatch");
}

void ScenarioSnapshotNeverRemovesReplacedEntries() {
  ctxcpp::tests::Log("scenario: replaced entries survive a stale snapshot");
  ctxcpp::ContextStore store;
  ctxcpp::ContextEntry entry{};
  entry.id = "ctx_refresh1";
  entry.source = "grep";
  entry.content = "stale";
  entry.summary = "stale hit";
  entry.ttl = 30ms;
  (void)store.Add(entry);
  std::this_thread::sleep_for(60ms);

  const auto now = ctxcpp::Now();
  const auto snapshot = store.ExpiredIds(now);
  Require(snapshot.size() == 1, "entry should be listed as expired");

  entry.content = "fresh";
  entry.created_at = now;
  entry.ttl = 60'000ms;
  (void)store.Add(entry);
  Require(store.PurgeExpired(snapshot, now) == 0, "refreshed entry must not be purged");
  Require(store.Get("ctx_refresh1").has_value(), "refreshed entry should remain live");
}

void ScenarioPauseResume() {
  ctxcpp::tests::Log("scenario: pause and resume");
  ctxcpp::ContextStore store;
  AddEntries(store, 3, 20ms);
  ctxcpp::ExpirationSweeper sweeper(store, ctxcpp::SweeperConfig{60'000ms, 10});
  std::this_thread::sleep_for(50ms);

  sweeper.Pause();
  Require(sweeper.state() == ctxcpp::SweeperState::kPaused, "state should be paused");
  const auto paused = sweeper.RunCleanup();
  Require(paused.skipped, "paused sweeper must skip manual sweeps");
  Require(store.Size() == 3, "paused sweeper must not remove entries");

  sweeper.Resume();
  Require(sweeper.state() == ctxcpp::SweeperState::kStopped, "resume without a thread returns to stopped");
  Require(sweeper.RunCleanup().removed == 3, "resumed sweeper should remove expired entries");
}

void ScenarioHostDrivenTick() {
  ctxcpp::tests::Log("scenario: host driven tick");
  ctxcpp::ContextStore store;
  ctxcpp::ExpirationSweeper sweeper(store, ctxcpp::SweeperConfig{1000ms, 10});
  const auto t0 = ctxcpp::Now();

  Require(sweeper.Tick(t0).has_value(), "first tick should sweep");
  Require(!sweeper.Tick(t0 + 500ms).has_value(), "tick before the interval should not sweep");
  Require(sweeper.Tick(t0 + 1000ms).has_value(), "tick at the interval should sweep");
  Require(sweeper.SweepCount() == 2, "tick sweep count mismatch");
}

void ScenarioBackgroundThread() {
  ctxcpp::tests::Log("scenario: background thread");
  ctxcpp::ContextStore store;
  AddEntries(store, 10, 30ms);
  AddEntries(store, 2, std::nullopt);

  ctxcpp::ExpirationSweeper sweeper(store, ctxcpp::SweeperConfig{20ms, 4});
  sweeper.Start();
  Require(sweeper.state() == ctxcpp::SweeperState::kRunning, "started sweeper should be running");

  const auto deadline = std::chrono::steady_clock::now() + 3s;
  while (store.Size() != 2 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(10ms);
  }
  sweeper.Stop();
  Require(sweeper.state() == ctxcpp::SweeperState::kStopped, "stopped sweeper should report stopped");
  Require(store.Size() == 2, "background sweeps should remove every expired entry");
  Require(sweeper.TotalRemoved() == 10, "background total removed mismatch");
  Require(sweeper.SweepCount() >= 1, "background thread should have swept");
}

void ScenarioConcurrentSweeps() {
  ctxcpp::tests::Log("scenario: concurrent sweeps");
  ctxcpp::ContextStore store;
  AddEntries(store, 200, 10ms);
  std::this_thread::sleep_for(40ms);
  ctxcpp::ExpirationSweeper sweeper(store, ctxcpp::SweeperConfig{60'000ms, 7});

  std::promise<void> inside_sweep{};
  std::promise<void> release_sweep{};
  auto release = release_sweep.get_future().share();
  std::size_t batches_seen = 0;
  std::size_t removed_after_first_batch = 0;
  sweeper.SetBatchObserver([&](const ctxcpp::SweepReport& progress) {
    if (++batches_seen == 1) {
      removed_after_first_batch = progress.removed;
      inside_sweep.set_value();
      release.wait();
    }
  });

  ctxcpp::SweepReport first{};
  std::thread worker([&]() { first = sweeper.RunCleanup(); });
  inside_sweep.get_future().wait();

  const auto second = sweeper.RunCleanup();
  const auto ticked = sweeper.Tick(ctxcpp::Now());
  release_sweep.set_value();
  worker.join();

  Require(second.skipped && second.removed == 0, "a sweep triggered mid-sweep should be skipped");
  Require(ticked.has_value() && ticked->skipped, "a tick during a sweep should be skipped");
  Require(!first.skipped && first.removed == 200, "the running sweep should remove everything");
  Require(removed_after_first_batch == 7, "observer should see the running totals");
  Require(first.batches == 29 && batches_seen == 29, "observer should see every batch");
  Require(store.Size() == 0, "store should be empty after sweeping");
  Require(sweeper.TotalRemoved() == 200, "total removed should count each entry once");
  Require(sweeper.SweepCount() == 1, "skipped sweeps must not be counted");
}

}  // namespace

int main() {
  try {
    ctxcpp::tests::InitLogging();
    ctxcpp::tests::Log("expiration_sweeper_test: start");
    ScenarioConfigValidation();
    ScenarioManualCleanup();
    ScenarioSnapshotNeverRemovesReplacedEntries();
    ScenarioPauseResume();
    ScenarioHostDrivenTick();
    ScenarioBackgroundThread();
    ScenarioConcurrentSweeps();
    ctxcpp::tests::Log("expiration_sweeper_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    ctxcpp::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
