#include "envelope_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <limits>

#include "internal/util/errors.hpp"

namespace meshdispatch::codec {

using meshdispatch::v1::Envelope;
using meshdispatch::util::MalformedFrame;

namespace {

bool ValidLatLon(const Envelope& e) {
  return e.lat() >= -90.0 && e.lat() <= 90.0 && e.lon() >= -180.0 && e.lon() <= 180.0;
}

void Require(bool condition, FrameType type, const char* what) {
  if (!condition) {
    throw MalformedFrame(std::string(ToString(type)) + " frame " + what);
  }
}

std::uint32_t NarrowDeliveryId(std::int64_t delivery_id) {
  if (delivery_id <= 0 || delivery_id > std::numeric_limits<std::uint32_t>::max()) {
    throw std::out_of_range("delivery id does not fit the radio envelope");
  }
  return static_cast<std::uint32_t>(delivery_id);
}

std::uint32_t NarrowTimestamp(std::int64_t unix_seconds) {
  if (unix_seconds < 0) return 0;
  if (unix_seconds > std::numeric_limits<std::uint32_t>::max()) return std::numeric_limits<std::uint32_t>::max();
  return static_cast<std::uint32_t>(unix_seconds);
}

} // namespace

std::optional<FrameType> ParseFrameType(std::string_view type) {
  if (type == "assign") return FrameType::kAssign;
  if (type == "ack") return FrameType::kAck;
  if (type == "telemetry") return FrameType::kTelemetry;
  if (type == "arrival") return FrameType::kArrival;
  if (type == "status") return FrameType::kStatus;
  if (type == "complete") return FrameType::kComplete;
  return std::nullopt;
}

std::string_view ToString(FrameType type) {
  switch (type) {
    case FrameType::kAssign:
      return "assign";
    case FrameType::kAck:
      return "ack";
    case FrameType::kTelemetry:
      return "telemetry";
    case FrameType::kArrival:
      return "arrival";
    case FrameType::kStatus:
      return "status";
    case FrameType::kComplete:
      return "complete";
  }
  return "unknown";
}

Envelope EnvelopeCodec::Decode(std::string_view frame) {
  if (frame.empty()) {
    throw MalformedFrame("empty frame");
  }

  Envelope envelope;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(std::string(frame), &envelope, options);
  if (!status.ok()) {
    throw MalformedFrame("invalid envelope json: " + std::string(status.message()));
  }

  const auto type = ParseFrameType(envelope.type());
  if (!type) {
    throw MalformedFrame("unknown frame type '" + envelope.type() + "'");
  }

  switch (*type) {
    case FrameType::kAck:
      Require(!envelope.msg_id().empty(), *type, "without msg_id");
      break;
    case FrameType::kTelemetry:
      Require(!envelope.unit_id().empty(), *type, "without unit_id");
      Require(envelope.has_lat() && envelope.has_lon(), *type, "without position");
      Require(ValidLatLon(envelope), *type, "with position out of range");
      break;
    case FrameType::kArrival:
      Require(!envelope.unit_id().empty(), *type, "without unit_id");
      Require(envelope.delivery_id() != 0, *type, "without delivery_id");
      Require(envelope.has_lat() == envelope.has_lon(), *type, "with half a position");
      Require(!envelope.has_lat() || ValidLatLon(envelope), *type, "with position out of range");
      break;
    case FrameType::kStatus:
      Require(!envelope.unit_id().empty(), *type, "without unit_id");
      Require(!envelope.status().empty(), *type, "without status");
      break;
    case FrameType::kAssign:
    case FrameType::kComplete:
      Require(!envelope.msg_id().empty(), *type, "without msg_id");
      Require(envelope.delivery_id() != 0, *type, "without delivery_id");
      break;
  }

  return envelope;
}

std::string EnvelopeCodec::Encode(const Envelope& envelope) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  options.add_whitespace             = false;

  std::string out;
  auto        status = google::protobuf::util::MessageToJsonString(envelope, &out, options);
  if (!status.ok()) {
    throw std::runtime_error("envelope encode failed: " + std::string(status.message()));
  }
  return out;
}

Envelope EnvelopeCodec::MakeAssign(const std::string& msg_id, std::int64_t delivery_id, const std::string& unit_id, double lat, double lon,
                                   const std::string& address, std::optional<double> distance_m, std::int64_t unix_seconds) {
  Envelope e;
  e.set_type("assign");
  e.set_msg_id(msg_id);
  e.set_delivery_id(NarrowDeliveryId(delivery_id));
  e.set_unit_id(unit_id);
  e.set_lat(lat);
  e.set_lon(lon);
  e.set_address(address);
  if (distance_m) {
    e.set_distance_m(*distance_m);
  }
  e.set_timestamp(NarrowTimestamp(unix_seconds));
  return e;
}

Envelope EnvelopeCodec::MakeComplete(const std::string& msg_id, std::int64_t delivery_id, const std::string& unit_id, std::int64_t unix_seconds) {
  Envelope e;
  e.set_type("complete");
  e.set_msg_id(msg_id);
  e.set_delivery_id(NarrowDeliveryId(delivery_id));
  e.set_unit_id(unit_id);
  e.set_timestamp(NarrowTimestamp(unix_seconds));
  return e;
}

Envelope EnvelopeCodec::MakeAck(const std::string& msg_id, const std::string& unit_id) {
  Envelope e;
  e.set_type("ack");
  e.set_msg_id(msg_id);
  e.set_unit_id(unit_id);
  return e;
}

} // namespace meshdispatch::codec
