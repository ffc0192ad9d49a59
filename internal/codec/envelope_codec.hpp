#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "meshdispatch/v1/envelope.pb.h"

namespace meshdispatch::codec {

enum class FrameType {
  kAssign,
  kAck,
  kTelemetry,
  kArrival,
  kStatus,
  kComplete,
};

std::optional<FrameType> ParseFrameType(std::string_view type);
std::string_view         ToString(FrameType type);

/*
  JSON envelope codec for the radio link.

  Decode validates the fields each frame type needs and throws
  util::MalformedFrame otherwise. Unknown keys are ignored so newer unit
  firmware can add fields. Encode emits compact single-line JSON with
  snake_case keys; a frame never contains a newline.
*/
class EnvelopeCodec {
 public:
  static meshdispatch::v1::Envelope Decode(std::string_view frame);
  static std::string                Encode(const meshdispatch::v1::Envelope& envelope);

  static meshdispatch::v1::Envelope MakeAssign(const std::string& msg_id, std::int64_t delivery_id, const std::string& unit_id, double lat, double lon,
                                               const std::string& address, std::optional<double> distance_m, std::int64_t unix_seconds);

  static meshdispatch::v1::Envelope MakeComplete(const std::string& msg_id, std::int64_t delivery_id, const std::string& unit_id, std::int64_t unix_seconds);

  static meshdispatch::v1::Envelope MakeAck(const std::string& msg_id, const std::string& unit_id);
};

} // namespace meshdispatch::codec
