#include "uuid.hpp"

#include <random>

namespace coord::util {

namespace {

constexpr std::string_view kMessagePrefix = "msg-";
constexpr char             kHex[]         = "0123456789abcdef";

bool IsDash(std::size_t pos) {
  return pos == 8 || pos == 13 || pos == 18 || pos == 23;
}

} // namespace

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (std::size_t i = 0; i < id.size(); i += 8) {
    auto word = rng();
    for (std::size_t j = 0; j < 8; ++j, word >>= 8) id[i + j] = static_cast<uint8_t>(word);
  }

  // version 4, RFC4122 variant
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;
  return id;
}

std::string ToString(const UUID& id) {
  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < id.size(); ++i) {
    if (IsDash(out.size())) out.push_back('-');
    out.push_back(kHex[id[i] >> 4]);
    out.push_back(kHex[id[i] & 0x0F]);
  }
  return out;
}

std::string NewMessageId() {
  return std::string(kMessagePrefix) + ToString(GenerateUUID());
}

bool IsMessageId(std::string_view id) {
  if (id.size() != kMessagePrefix.size() + 36 || id.substr(0, kMessagePrefix.size()) != kMessagePrefix) return false;

  const auto uuid = id.substr(kMessagePrefix.size());
  for (std::size_t pos = 0; pos < uuid.size(); ++pos) {
    const char c = uuid[pos];
    if (IsDash(pos)) {
      if (c != '-') return false;
    } else if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
      return false;
    }
  }
  return true;
}

} // namespace coord::util
