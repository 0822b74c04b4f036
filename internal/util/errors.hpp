#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace coord::util {

/*
  Central error types.

  These get translated later to structured tool errors and gRPC status codes.
  Conflict-type errors carry the context a caller needs to retry.
*/

class ProjectNotFound : public std::runtime_error {
 public:
  explicit ProjectNotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RequiredFieldMissing : public std::runtime_error {
 public:
  explicit RequiredFieldMissing(const std::string& field)
      : std::runtime_error("required field missing: " + field), field_(field) {
  }

  const std::string& Field() const {
    return field_;
  }

 private:
  std::string field_;
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

struct LockHolder {
  std::string resource;
  std::string owner_agent_id;
  uint64_t    acquired_at_ms = 0;
  uint64_t    expires_at_ms  = 0;
  uint64_t    remaining_ms   = 0;
};

class LockConflict : public std::runtime_error {
 public:
  LockConflict(const std::string& msg, LockHolder holder) : std::runtime_error(msg), holder_(std::move(holder)) {
  }

  const LockHolder& Holder() const {
    return holder_;
  }

 private:
  LockHolder holder_;
};

class UnlockNotOwner : public std::runtime_error {
 public:
  UnlockNotOwner(const std::string& msg, std::string resource, std::string owner_agent_id)
      : std::runtime_error(msg), resource_(std::move(resource)), owner_agent_id_(std::move(owner_agent_id)) {
  }

  const std::string& Resource() const {
    return resource_;
  }
  const std::string& OwnerAgentId() const {
    return owner_agent_id_;
  }

 private:
  std::string resource_;
  std::string owner_agent_id_;
};

class MessageNotFound : public std::runtime_error {
 public:
  explicit MessageNotFound(const std::string& message_id)
      : std::runtime_error("message not found: " + message_id), message_id_(message_id) {
  }

  const std::string& MessageId() const {
    return message_id_;
  }

 private:
  std::string message_id_;
};

class MessageWrongRecipient : public std::runtime_error {
 public:
  MessageWrongRecipient(const std::string& msg, std::string message_id, std::string recipient)
      : std::runtime_error(msg), message_id_(std::move(message_id)), recipient_(std::move(recipient)) {
  }

  const std::string& MessageId() const {
    return message_id_;
  }
  const std::string& Recipient() const {
    return recipient_;
  }

 private:
  std::string message_id_;
  std::string recipient_;
};

// Store failure surfaced from db::Result. Busy means another writer held the
// store past the busy timeout; the call can be retried as-is.
class StoreError : public std::runtime_error {
 public:
  StoreError(const std::string& msg, bool busy) : std::runtime_error(msg), busy_(busy) {
  }

  bool Busy() const {
    return busy_;
  }

 private:
  bool busy_;
};

} // namespace coord::util
