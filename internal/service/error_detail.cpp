#include "error_detail.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace coord::service {

namespace {

void SetString(google::protobuf::Struct& s, const std::string& key, const std::string& value) {
  (*s.mutable_fields())[key].set_string_value(value);
}

ErrorDescription Describe(const char* code, const std::exception& e) {
  ErrorDescription out;
  out.detail.set_code(code);
  out.detail.mutable_details();
  out.message = e.what();
  return out;
}

} // namespace

ErrorDescription DescribeError(const std::exception& e) {
  if (dynamic_cast<const util::ProjectNotFound*>(&e)) {
    return Describe("PROJECT_NOT_FOUND", e);
  }
  if (const auto* ex = dynamic_cast<const util::RequiredFieldMissing*>(&e)) {
    auto out = Describe("AGENT_REQUIRED_FIELD_MISSING", e);
    SetString(*out.detail.mutable_details(), "field", ex->Field());
    return out;
  }
  if (dynamic_cast<const util::InvalidArgument*>(&e)) {
    return Describe("INVALID_ARGUMENT", e);
  }
  if (const auto* ex = dynamic_cast<const util::LockConflict*>(&e)) {
    auto        out     = Describe("LOCK_CONFLICT", e);
    auto&       details = *out.detail.mutable_details();
    const auto& holder  = ex->Holder();
    SetString(details, "resource", holder.resource);
    SetString(details, "holder", holder.owner_agent_id);
    SetString(details, "held_since", util::FormatMillis(holder.acquired_at_ms));
    SetString(details, "expires_at", util::FormatMillis(holder.expires_at_ms));
    (*details.mutable_fields())["remaining_ms"].set_number_value(static_cast<double>(holder.remaining_ms));
    return out;
  }
  if (const auto* ex = dynamic_cast<const util::UnlockNotOwner*>(&e)) {
    auto out = Describe("UNLOCK_NOT_OWNER", e);
    SetString(*out.detail.mutable_details(), "resource", ex->Resource());
    SetString(*out.detail.mutable_details(), "holder", ex->OwnerAgentId());
    return out;
  }
  if (const auto* ex = dynamic_cast<const util::MessageNotFound*>(&e)) {
    auto out = Describe("MESSAGE_NOT_FOUND", e);
    SetString(*out.detail.mutable_details(), "message_id", ex->MessageId());
    return out;
  }
  if (const auto* ex = dynamic_cast<const util::MessageWrongRecipient*>(&e)) {
    auto out = Describe("MESSAGE_WRONG_RECIPIENT", e);
    SetString(*out.detail.mutable_details(), "message_id", ex->MessageId());
    SetString(*out.detail.mutable_details(), "recipient", ex->Recipient());
    return out;
  }
  if (const auto* ex = dynamic_cast<const util::StoreError*>(&e)) {
    auto out = Describe("STORE_ERROR", e);
    (*out.detail.mutable_details()->mutable_fields())["retryable"].set_bool_value(ex->Busy());
    return out;
  }
  return Describe("INTERNAL", e);
}

} // namespace coord::service
