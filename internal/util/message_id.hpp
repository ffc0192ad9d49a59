#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace meshdispatch::util {

/*
  Message id helpers

  Radio frames carry a 64-bit random id as 16 lowercase hex chars. Short
  enough for the envelope, wide enough that collisions with live pending
  acks are not a practical concern (the store rejects one anyway).
*/

using MessageId = std::array<std::uint8_t, 8>;

MessageId GenerateMessageId();

std::string ToString(const MessageId& id);
MessageId   FromString(const std::string& str);

std::string NewMessageIdString();

} // namespace meshdispatch::util
