#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ctxcpp {

using Clock = std::chrono::system_clock;
using TimePoint = std::chrono::time_point<Clock, std::chrono::milliseconds>;

enum class EntryType {
  kFile,
  kCommand,
  kCommandResult,
  kTask,
  kTaskResult,
  kSearchResult,
  kSummary,
  kContextRequest,
};

inline constexpr std::size_t kEntryTypeCount = 8;

struct ContextEntry {
  std::string id;
  EntryType entry_type = EntryType::kFile;
  std::string source;
  std::optional<std::string> content;
  std::string summary;
  // Epoch means "unset"; ContextStore::Add stamps the insertion time.
  TimePoint created_at{};
  std::vector<std::string> references;
  bool searchable = true;
  bool compressed = false;
  std::optional<std::chrono::milliseconds> ttl;
  std::optional<std::string> parent_id;
  std::vector<std::string> derived_from;

  [[nodiscard]] bool HasTtl() const { return ttl.has_value(); }
  [[nodiscard]] std::optional<TimePoint> ExpiresAt() const {
    if (!ttl.has_value()) {
      return std::nullopt;
    }
    // Saturate instead of overflowing for very long ttls.
    const auto since_epoch = created_at.time_since_epoch();
    if (since_epoch.count() > 0 && *ttl > TimePoint::duration::max() - since_epoch) {
      return TimePoint::max();
    }
    return created_at + *ttl;
  }

  friend bool operator==(const ContextEntry&, const ContextEntry&) = default;
};

struct SearchHit {
  std::string entry_id;
  double score = 0.0;
  EntryType entry_type = EntryType::kFile;
};

struct SearchOptions {
  std::optional<double> min_score;
  std::vector<EntryType> entry_types;
};

struct StoreStats {
  std::size_t total = 0;
  std::unordered_map<EntryType, std::size_t> by_type;
  std::size_t compressed = 0;
};

struct StoreConfig {
  // Seed for generated entry ids; 0 seeds from std::random_device.
  std::uint64_t id_seed = 0;
  bool enable_fts_prefilter = true;
};

struct SweeperConfig {
  std::chrono::milliseconds interval{60'000};
  std::size_t batch_size = 100;
};

struct BudgetConfig {
  std::size_t max_entries = 200;
  std::size_t chars_per_token = 4;
};

}  // namespace ctxcpp
