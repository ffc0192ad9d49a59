#pragma once

#include <cstdint>
#include <string>

namespace meshdispatch::db::model {

enum class PendingAckKind : std::uint8_t {
  kAssign   = 1,
  kComplete = 2,
};

/*
  Outbound message awaiting acknowledgment.

  payload is the exact encoded frame; retransmissions resend it byte for
  byte so the unit sees the same msg_id every time.
*/
struct PendingAckRecord {
  std::string msg_id;
  std::string unit_id;
  std::int64_t delivery_id = 0;

  PendingAckKind kind = PendingAckKind::kAssign;
  std::string    payload;

  std::int64_t  created_at_ms = 0;
  std::uint32_t attempts      = 0;
  std::int64_t  next_retry_ms = 0;
};

} // namespace meshdispatch::db::model
