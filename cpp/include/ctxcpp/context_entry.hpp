#pragma once

#include "ctxcpp/types.hpp"

#include <nlohmann/json.hpp>

#include <random>
#include <string>
#include <string_view>

namespace ctxcpp {

inline constexpr std::string_view kEntryIdPrefix = "ctx_";
inline constexpr std::size_t kEntryIdSuffixLength = 8;

[[nodiscard]] std::string_view EntryTypeName(EntryType type);
// Throws ValidationError listing the accepted names.
[[nodiscard]] EntryType ParseEntryType(std::string_view name);
[[nodiscard]] const std::vector<EntryType>& AllEntryTypes();

[[nodiscard]] bool IsValidEntryId(std::string_view id);
[[nodiscard]] std::string GenerateEntryId(std::mt19937_64& rng);

// Field-level checks that do not need the owning store: id format, non-empty
// source and summary, compressed entries carry no content, positive ttl.
void ValidateEntryShape(const ContextEntry& entry);

// Empty parent_id becomes absent.
void NormalizeEntry(ContextEntry& entry);

[[nodiscard]] bool IsExpired(const ContextEntry& entry, TimePoint now);
[[nodiscard]] TimePoint Now();

// ISO-8601 UTC with millisecond precision, e.g. 2026-10-19T08:30:00.123Z.
[[nodiscard]] std::string FormatTimestamp(TimePoint time);
// Accepts an optional fractional part and an optional trailing 'Z' or +HH:MM offset.
[[nodiscard]] TimePoint ParseTimestamp(std::string_view text);

[[nodiscard]] nlohmann::json EntryToJson(const ContextEntry& entry);
[[nodiscard]] ContextEntry EntryFromJson(const nlohmann::json& object);

}  // namespace ctxcpp
