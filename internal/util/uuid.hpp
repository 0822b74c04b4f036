#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace coord::util {

/*
  Message identifiers: "msg-" followed by a random RFC4122 v4 UUID in
  canonical lowercase form, e.g. msg-3f0c2a9e-41d7-4c8b-9a51-0e6f2b7c1d44.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

std::string NewMessageId();

// Shape check only; says nothing about whether the message exists.
bool IsMessageId(std::string_view id);

} // namespace coord::util
