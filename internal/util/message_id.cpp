#include "message_id.hpp"

#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace meshdispatch::util {

MessageId GenerateMessageId() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  const std::uint64_t value = rng();
  MessageId           id{};
  for (size_t i = 0; i < id.size(); ++i)
    id[i] = static_cast<std::uint8_t>(value >> (8 * i));

  return id;
}

std::string ToString(const MessageId& id) {
  std::ostringstream oss;

  for (auto b : id)
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);

  return oss.str();
}

MessageId FromString(const std::string& str) {
  if (str.size() != 16)
    throw std::runtime_error("Invalid message id string");

  MessageId id{};
  for (size_t i = 0; i < id.size(); ++i)
    id[i] = static_cast<std::uint8_t>(std::stoul(str.substr(i * 2, 2), nullptr, 16));

  return id;
}

std::string NewMessageIdString() {
  return ToString(GenerateMessageId());
}

} // namespace meshdispatch::util
