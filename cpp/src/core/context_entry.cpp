#include "ctxcpp/context_entry.hpp"

#include "ctxcpp/errors.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <utility>

namespace ctxcpp {
namespace {

inline constexpr std::string_view kIdAlphabet =
    "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

bool IsBlank(std::string_view text) {
  return std::all_of(text.begin(), text.end(), [](unsigned char ch) { return std::isspace(ch) != 0; });
}

class TimestampCursor {
 public:
  explicit TimestampCursor(std::string_view text) : text_(text) {}

  std::int64_t ReadDigits(std::size_t count) {
    if (pos_ + count > text_.size()) {
      Fail();
    }
    const auto* begin = text_.data() + pos_;
    if (!std::all_of(begin, begin + count, [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
      Fail();
    }
    std::int64_t value = 0;
    const auto [ptr, ec] = std::from_chars(begin, begin + count, value);
    if (ec != std::errc{} || ptr != begin + count) {
      Fail();
    }
    pos_ += count;
    return value;
  }

  void Expect(char ch) {
    if (pos_ >= text_.size() || text_[pos_] != ch) {
      Fail();
    }
    ++pos_;
  }

  bool Consume(char ch) {
    if (pos_ < text_.size() && text_[pos_] == ch) {
      ++pos_;
      return true;
    }
    return false;
  }

  [[nodiscard]] bool AtEnd() const { return pos_ >= text_.size(); }
  [[nodiscard]] char Peek() const { return AtEnd() ? '\0' : text_[pos_]; }

  [[noreturn]] void Fail() const {
    throw ValidationError("invalid ISO-8601 timestamp: '" + std::string(text_) + "'");
  }

 private:
  std::string_view text_;
  std::size_t pos_ = 0;
};

const nlohmann::json& RequireField(const nlohmann::json& object, const char* key) {
  const auto it = object.find(key);
  if (it == object.end()) {
    throw ValidationError(std::string("context entry field '") + key + "' is missing");
  }
  return *it;
}

std::string RequireString(const nlohmann::json& object, const char* key) {
  const auto& value = RequireField(object, key);
  if (!value.is_string()) {
    throw ValidationError(std::string("context entry field '") + key + "' must be a string");
  }
  return value.get<std::string>();
}

std::optional<std::string> OptionalString(const nlohmann::json& object, const char* key) {
  const auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    throw ValidationError(std::string("context entry field '") + key + "' must be a string or null");
  }
  return it->get<std::string>();
}

bool OptionalBool(const nlohmann::json& object, const char* key, bool fallback) {
  const auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_boolean()) {
    throw ValidationError(std::string("context entry field '") + key + "' must be a boolean");
  }
  return it->get<bool>();
}

std::vector<std::string> StringArray(const nlohmann::json& object, const char* key) {
  const auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return {};
  }
  if (!it->is_array()) {
    throw ValidationError(std::string("context entry field '") + key + "' must be an array of strings");
  }
  std::vector<std::string> out{};
  out.reserve(it->size());
  for (const auto& element : *it) {
    if (!element.is_string()) {
      throw ValidationError(std::string("context entry field '") + key + "' must be an array of strings");
    }
    out.push_back(element.get<std::string>());
  }
  return out;
}

}  // namespace

std::string_view EntryTypeName(EntryType type) {
  switch (type) {
    case EntryType::kFile:
      return "file";
    case EntryType::kCommand:
      return "command";
    case EntryType::kCommandResult:
      return "command_result";
    case EntryType::kTask:
      return "task";
    case EntryType::kTaskResult:
      return "task_result";
    case EntryType::kSearchResult:
      return "search_result";
    case EntryType::kSummary:
      return "summary";
    case EntryType::kContextRequest:
      return "context_request";
  }
  return "unknown";
}

const std::vector<EntryType>& AllEntryTypes() {
  static const std::vector<EntryType> kTypes = {
      EntryType::kFile,       EntryType::kCommand,      EntryType::kCommandResult, EntryType::kTask,
      EntryType::kTaskResult, EntryType::kSearchResult, EntryType::kSummary,       EntryType::kContextRequest,
  };
  return kTypes;
}

EntryType ParseEntryType(std::string_view name) {
  for (const auto type : AllEntryTypes()) {
    if (EntryTypeName(type) == name) {
      return type;
    }
  }
  std::string valid{};
  for (const auto type : AllEntryTypes()) {
    if (!valid.empty()) {
      valid.append(", ");
    }
    valid.append(EntryTypeName(type));
  }
  throw ValidationError("invalid entry type '" + std::string(name) + "'. Must be one of: " + valid);
}

bool IsValidEntryId(std::string_view id) {
  if (id.size() != kEntryIdPrefix.size() + kEntryIdSuffixLength) {
    return false;
  }
  if (id.substr(0, kEntryIdPrefix.size()) != kEntryIdPrefix) {
    return false;
  }
  const auto suffix = id.substr(kEntryIdPrefix.size());
  return std::all_of(suffix.begin(), suffix.end(), [](char ch) {
    return (ch >= '0' && ch <= '9') || (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z');
  });
}

std::string GenerateEntryId(std::mt19937_64& rng) {
  std::uniform_int_distribution<std::size_t> pick(0, kIdAlphabet.size() - 1);
  std::string id(kEntryIdPrefix);
  id.reserve(kEntryIdPrefix.size() + kEntryIdSuffixLength);
  for (std::size_t i = 0; i < kEntryIdSuffixLength; ++i) {
    id.push_back(kIdAlphabet[pick(rng)]);
  }
  return id;
}

void ValidateEntryShape(const ContextEntry& entry) {
  if (!IsValidEntryId(entry.id)) {
    throw ValidationError("invalid entry id '" + entry.id + "': expected 'ctx_' followed by 8 alphanumerics");
  }
  if (IsBlank(entry.source)) {
    throw ValidationError("entry " + entry.id + ": source must not be empty");
  }
  if (IsBlank(entry.summary)) {
    throw ValidationError("entry " + entry.id + ": summary must not be empty");
  }
  if (entry.compressed && entry.content.has_value()) {
    throw ValidationError("entry " + entry.id + ": compressed entry must not carry content");
  }
  if (entry.ttl.has_value() && entry.ttl->count() <= 0) {
    throw ValidationError("entry " + entry.id + ": ttl must be a positive number of milliseconds");
  }
  if (entry.parent_id.has_value() && IsBlank(*entry.parent_id)) {
    throw ValidationError("entry " + entry.id + ": parent_id must not be blank");
  }
  for (const auto& source_id : entry.derived_from) {
    if (IsBlank(source_id)) {
      throw ValidationError("entry " + entry.id + ": derived_from must not contain blank ids");
    }
  }
}

void NormalizeEntry(ContextEntry& entry) {
  if (entry.parent_id.has_value() && entry.parent_id->empty()) {
    entry.parent_id.reset();
  }
}

bool IsExpired(const ContextEntry& entry, TimePoint now) {
  const auto expires_at = entry.ExpiresAt();
  return expires_at.has_value() && now > *expires_at;
}

TimePoint Now() {
  return std::chrono::floor<std::chrono::milliseconds>(Clock::now());
}

std::string FormatTimestamp(TimePoint time) {
  const auto days = std::chrono::floor<std::chrono::days>(time);
  const std::chrono::year_month_day date{days};
  const std::chrono::hh_mm_ss clock{time - days};
  return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                     static_cast<int>(date.year()),
                     static_cast<unsigned>(date.month()),
                     static_cast<unsigned>(date.day()),
                     clock.hours().count(),
                     clock.minutes().count(),
                     clock.seconds().count(),
                     clock.subseconds().count());
}

TimePoint ParseTimestamp(std::string_view text) {
  TimestampCursor cursor(text);
  const auto year = cursor.ReadDigits(4);
  cursor.Expect('-');
  const auto month = cursor.ReadDigits(2);
  cursor.Expect('-');
  const auto day = cursor.ReadDigits(2);
  if (!cursor.Consume('T') && !cursor.Consume(' ')) {
    cursor.Fail();
  }
  const auto hour = cursor.ReadDigits(2);
  cursor.Expect(':');
  const auto minute = cursor.ReadDigits(2);
  cursor.Expect(':');
  const auto second = cursor.ReadDigits(2);
  const std::chrono::year_month_day date{std::chrono::year{static_cast<int>(year)},
                                         std::chrono::month{static_cast<unsigned>(month)},
                                         std::chrono::day{static_cast<unsigned>(day)}};
  if (!date.ok() || hour > 23 || minute > 59 || second > 60) {
    cursor.Fail();
  }

  std::int64_t millis = 0;
  if (cursor.Consume('.')) {
    // Keep millisecond precision; extra digits (microseconds) are truncated.
    std::size_t digits = 0;
    while (!cursor.AtEnd() && std::isdigit(static_cast<unsigned char>(cursor.Peek())) != 0) {
      const auto digit = cursor.ReadDigits(1);
      if (digits < 3) {
        millis = millis * 10 + digit;
      }
      ++digits;
    }
    if (digits == 0) {
      cursor.Fail();
    }
    for (; digits < 3; ++digits) {
      millis *= 10;
    }
  }

  std::int64_t offset_minutes = 0;
  if (!cursor.Consume('Z') && !cursor.AtEnd()) {
    const char sign = cursor.Peek();
    if (sign != '+' && sign != '-') {
      cursor.Fail();
    }
    (void)cursor.Consume(sign);
    const auto offset_hours = cursor.ReadDigits(2);
    cursor.Expect(':');
    const auto offset_mins = cursor.ReadDigits(2);
    offset_minutes = (offset_hours * 60 + offset_mins) * (sign == '-' ? -1 : 1);
  }
  if (!cursor.AtEnd()) {
    cursor.Fail();
  }

  return TimePoint(std::chrono::sys_days{date}) + std::chrono::hours(hour) +
         std::chrono::minutes(minute - offset_minutes) + std::chrono::seconds(second) +
         std::chrono::milliseconds(millis);
}

nlohmann::json EntryToJson(const ContextEntry& entry) {
  nlohmann::json object = nlohmann::json::object();
  object["id"] = entry.id;
  object["entry_type"] = std::string(EntryTypeName(entry.entry_type));
  object["source"] = entry.source;
  object["content"] = entry.content.has_value() ? nlohmann::json(*entry.content) : nlohmann::json(nullptr);
  object["summary"] = entry.summary;
  object["created_at"] = FormatTimestamp(entry.created_at);
  object["references"] = entry.references;
  object["searchable"] = entry.searchable;
  object["compressed"] = entry.compressed;
  object["ttl"] = entry.ttl.has_value() ? nlohmann::json(entry.ttl->count()) : nlohmann::json(nullptr);
  object["parent_id"] = entry.parent_id.has_value() ? nlohmann::json(*entry.parent_id) : nlohmann::json(nullptr);
  object["derived_from"] = entry.derived_from;
  return object;
}

ContextEntry EntryFromJson(const nlohmann::json& object) {
  if (!object.is_object()) {
    throw ValidationError("context entry must be a JSON object");
  }
  ContextEntry entry{};
  entry.id = RequireString(object, "id");
  entry.entry_type = ParseEntryType(RequireString(object, "entry_type"));
  entry.source = RequireString(object, "source");
  entry.content = OptionalString(object, "content");
  entry.summary = RequireString(object, "summary");
  if (const auto created_at = OptionalString(object, "created_at"); created_at.has_value()) {
    entry.created_at = ParseTimestamp(*created_at);
  }
  entry.references = StringArray(object, "references");
  entry.searchable = OptionalBool(object, "searchable", true);
  entry.compressed = OptionalBool(object, "compressed", false);
  if (const auto it = object.find("ttl"); it != object.end() && !it->is_null()) {
    if (!it->is_number_integer()) {
      throw ValidationError("context entry field 'ttl' must be an integer or null");
    }
    entry.ttl = std::chrono::milliseconds(it->get<std::int64_t>());
  }
  entry.parent_id = OptionalString(object, "parent_id");
  entry.derived_from = StringArray(object, "derived_from");
  NormalizeEntry(entry);
  ValidateEntryShape(entry);
  return entry;
}

}  // namespace ctxcpp
