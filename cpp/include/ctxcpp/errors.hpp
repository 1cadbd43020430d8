#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace ctxcpp {

class ContextError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Malformed entry on Add / ImportJson.
class ValidationError : public ContextError {
 public:
  using ContextError::ContextError;
};

// Dangling parent_id / derived_from reference, or a link that would close a cycle.
class RelationshipError : public ContextError {
 public:
  using ContextError::ContextError;
};

class EntryBoundsError : public ContextError {
 public:
  EntryBoundsError(std::size_t current, std::size_t limit)
      : ContextError("context request resolves to " + std::to_string(current) +
                     " entries; limit is fewer than " + std::to_string(limit)),
        current_(current),
        limit_(limit) {}

  [[nodiscard]] std::size_t current() const noexcept { return current_; }
  [[nodiscard]] std::size_t limit() const noexcept { return limit_; }

 private:
  std::size_t current_;
  std::size_t limit_;
};

class NotFoundError : public ContextError {
 public:
  explicit NotFoundError(std::string entry_id)
      : ContextError("context entry not found: " + entry_id), entry_id_(std::move(entry_id)) {}

  [[nodiscard]] const std::string& entry_id() const noexcept { return entry_id_; }

 private:
  std::string entry_id_;
};

class ContextCompressedError : public ContextError {
 public:
  explicit ContextCompressedError(std::string entry_id)
      : ContextError("context entry " + entry_id + " is compressed; content is not available"),
        entry_id_(std::move(entry_id)) {}

  [[nodiscard]] const std::string& entry_id() const noexcept { return entry_id_; }

 private:
  std::string entry_id_;
};

}  // namespace ctxcpp
