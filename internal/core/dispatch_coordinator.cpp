#include "dispatch_coordinator.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <stdexcept>

#include "internal/codec/envelope_codec.hpp"
#include "internal/model/delivery_state.hpp"
#include "internal/model/unit_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace meshdispatch::core {

using db::model::DeliveryRecord;
using db::model::PendingAckKind;
using db::model::PendingAckRecord;
using db::model::UnitRecord;
using namespace meshdispatch::v1;

namespace {

bool IsBlank(const std::string& text) {
  return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

std::int64_t UnixSeconds(util::TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::optional<util::LatLon> Position(const Envelope& envelope) {
  if (envelope.has_lat() && envelope.has_lon()) {
    return util::LatLon{envelope.lat(), envelope.lon()};
  }
  return std::nullopt;
}

} // namespace

DispatchCoordinator::DispatchCoordinator(std::shared_ptr<db::Repository> repository, std::shared_ptr<reliable::ReliableOutbound> outbound,
                                         std::shared_ptr<geocode::Geocoder> geocoder, const util::Clock& clock, CoordinatorOptions options)
    : repository_(repository),
      outbound_(std::move(outbound)),
      geocoder_(std::move(geocoder)),
      clock_(clock),
      options_(options),
      deliveries_(repository, clock),
      units_(repository, clock, options.offline_timeout) {
  outbound_->SetExhaustionHandler([this](db::Transaction& tx, const PendingAckRecord& record) { OnExhausted(tx, record); });
}

// ---------------------------------------------------------------------------
// Dispatcher commands
// ---------------------------------------------------------------------------

DeliveryRecord DispatchCoordinator::CreateDelivery(const std::string& address) {
  if (IsBlank(address)) {
    throw std::invalid_argument("create delivery: address is required");
  }

  // resolved before the writer lock is taken; the geocoder may sleep
  const auto resolved = geocoder_->Resolve(address);

  DeliveryRecord delivery;
  {
    auto tx  = repository_->Begin();
    delivery = deliveries_.Create(*tx, address, resolved.coordinates);
    tx->Commit();
  }

  MESHDISPATCH_LOG_INFO("delivery created", {observability::IntField("delivery_id", delivery.id), observability::StringField("address", address),
                                             observability::BoolField("geocoded", delivery.HasCoordinates())});

  if (!resolved.Ok()) {
    throw util::GeocodeError("create delivery: could not geocode '" + address + "': " + resolved.message + "; delivery " +
                                 std::to_string(delivery.id) + " created without coordinates",
                             delivery.id);
  }
  return delivery;
}

DeliveryRecord DispatchCoordinator::RetryGeocode(std::int64_t delivery_id) {
  std::string address;
  {
    auto tx       = repository_->Begin();
    auto delivery = deliveries_.Load(*tx, delivery_id, "retry geocode");
    tx->Commit();
    if (delivery.HasCoordinates()) {
      return delivery;
    }
    address = delivery.address;
  }

  const auto resolved = geocoder_->Resolve(address);
  if (!resolved.Ok()) {
    throw util::GeocodeError("retry geocode: could not geocode '" + address + "': " + resolved.message, delivery_id);
  }

  auto tx       = repository_->Begin();
  auto delivery = deliveries_.Load(*tx, delivery_id, "retry geocode");
  if (!delivery.HasCoordinates()) {
    deliveries_.SetCoordinates(*tx, delivery, *resolved.coordinates);
  }
  tx->Commit();
  return delivery;
}

DeliveryRecord DispatchCoordinator::AssignDelivery(std::int64_t delivery_id, const std::string& unit_id) {
  PendingAckRecord staged;
  DeliveryRecord   delivery;
  {
    auto tx  = repository_->Begin();
    delivery = deliveries_.Load(*tx, delivery_id, "assign delivery");
    auto unit = units_.Load(*tx, unit_id, "assign delivery");

    if (delivery.status != DELIVERY_STATUS_PENDING) {
      throw util::InvalidTransition("assign delivery: delivery " + std::to_string(delivery_id) + " is " +
                                    std::string(model::ToString(delivery.status)) + ", must be pending");
    }
    if (unit.status != UNIT_STATUS_IDLE || !repository_->FindActiveDeliveriesForUnit(*tx, unit_id).empty()) {
      throw util::UnitBusy("assign delivery: unit '" + unit_id + "' is " + std::string(model::ToString(unit.status)) + ", must be idle");
    }

    deliveries_.Assign(*tx, delivery, unit_id);
    units_.Assign(*tx, unit, delivery_id);

    std::optional<double> distance_m;
    if (unit.last_lat && unit.last_lon) {
      distance_m = util::DistanceMeters({*unit.last_lat, *unit.last_lon}, {*delivery.lat, *delivery.lon});
    }

    const auto sent_at = UnixSeconds(clock_.Now());
    staged             = outbound_->Stage(*tx, unit_id, delivery_id, PendingAckKind::kAssign, [&](const std::string& msg_id) {
      return codec::EnvelopeCodec::Encode(
          codec::EnvelopeCodec::MakeAssign(msg_id, delivery_id, unit_id, *delivery.lat, *delivery.lon, delivery.address, distance_m, sent_at));
    });
    tx->Commit();
  }

  MESHDISPATCH_LOG_INFO("delivery assigned", {observability::IntField("delivery_id", delivery_id), observability::StringField("unit_id", unit_id),
                                              observability::StringField("msg_id", staged.msg_id)});
  outbound_->Transmit(staged);
  return delivery;
}

DeliveryRecord DispatchCoordinator::ConfirmComplete(std::int64_t delivery_id) {
  std::optional<PendingAckRecord> staged;
  std::vector<std::string>        superseded;
  DeliveryRecord                  delivery;
  {
    auto tx                  = repository_->Begin();
    delivery                 = deliveries_.Load(*tx, delivery_id, "confirm complete");
    const auto unit_id       = delivery.assigned_unit_id;
    deliveries_.Complete(*tx, delivery);
    superseded = outbound_->CancelForDelivery(*tx, delivery_id);

    if (unit_id) {
      auto unit = repository_->GetUnit(*tx, *unit_id);
      if (unit) {
        units_.Release(*tx, *unit, delivery_id);

        const auto sent_at = UnixSeconds(clock_.Now());
        staged = outbound_->Stage(*tx, *unit_id, delivery_id, PendingAckKind::kComplete, [&](const std::string& msg_id) {
          return codec::EnvelopeCodec::Encode(codec::EnvelopeCodec::MakeComplete(msg_id, delivery_id, *unit_id, sent_at));
        });
      }
    }
    tx->Commit();
  }

  outbound_->Disarm(superseded);
  if (staged) {
    outbound_->Transmit(*staged);
  }
  return delivery;
}

DeliveryRecord DispatchCoordinator::MarkFailed(std::int64_t delivery_id, const std::string& reason) {
  std::vector<std::string> superseded;
  DeliveryRecord           delivery;
  {
    auto tx            = repository_->Begin();
    delivery           = deliveries_.Load(*tx, delivery_id, "mark failed");
    const auto unit_id = delivery.assigned_unit_id;
    deliveries_.Fail(*tx, delivery, reason);
    superseded = outbound_->CancelForDelivery(*tx, delivery_id);

    if (unit_id) {
      auto unit = repository_->GetUnit(*tx, *unit_id);
      // an offline unit has already dropped its back-reference
      if (unit && (!unit->assigned_delivery_id || *unit->assigned_delivery_id == delivery_id)) {
        units_.Fault(*tx, *unit, "delivery " + std::to_string(delivery_id) + " failed: " + *delivery.failure_reason);
      }
    }
    tx->Commit();
  }

  outbound_->Disarm(superseded);
  return delivery;
}

DeliveryRecord DispatchCoordinator::Reopen(std::int64_t delivery_id) {
  std::vector<std::string> superseded;
  DeliveryRecord           delivery;
  {
    auto tx  = repository_->Begin();
    delivery = deliveries_.Load(*tx, delivery_id, "reopen");
    deliveries_.Reopen(*tx, delivery);
    superseded = outbound_->CancelForDelivery(*tx, delivery_id);
    tx->Commit();
  }

  outbound_->Disarm(superseded);
  return delivery;
}

UnitRecord DispatchCoordinator::RegisterUnit(const std::string& unit_id) {
  auto tx   = repository_->Begin();
  auto unit = units_.Register(*tx, unit_id, UNIT_STATUS_OFFLINE);
  tx->Commit();
  return unit;
}

UnitRecord DispatchCoordinator::ClearUnitError(const std::string& unit_id) {
  auto tx   = repository_->Begin();
  auto unit = units_.Load(*tx, unit_id, "clear unit error");
  units_.ClearError(*tx, unit);
  tx->Commit();
  return unit;
}

std::size_t DispatchCoordinator::SweepOffline() {
  return units_.SweepOffline();
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

DeliveryRecord DispatchCoordinator::GetDelivery(std::int64_t delivery_id) {
  auto tx       = repository_->Begin();
  auto delivery = deliveries_.Load(*tx, delivery_id, "get delivery");
  tx->Commit();
  return delivery;
}

std::vector<DeliveryRecord> DispatchCoordinator::ListDeliveries() {
  auto tx     = repository_->Begin();
  auto result = repository_->ListDeliveries(*tx);
  tx->Commit();
  return result;
}

UnitRecord DispatchCoordinator::GetUnit(const std::string& unit_id) {
  auto tx   = repository_->Begin();
  auto unit = units_.Load(*tx, unit_id, "get unit");
  tx->Commit();
  return unit;
}

std::vector<UnitRecord> DispatchCoordinator::ListUnits() {
  auto tx     = repository_->Begin();
  auto result = repository_->ListUnits(*tx);
  tx->Commit();
  return result;
}

// ---------------------------------------------------------------------------
// Unit frames
// ---------------------------------------------------------------------------

void DispatchCoordinator::Ingest(const std::string& frame) {
  Envelope envelope;
  try {
    envelope = codec::EnvelopeCodec::Decode(frame);
  } catch (const util::MalformedFrame& e) {
    observability::Metrics::Instance().RecordMalformedFrame();
    MESHDISPATCH_LOG_WARN("dropping malformed frame", {observability::StringField("error", e.what()), observability::StringField("frame", frame)});
    return;
  }

  const auto type = codec::ParseFrameType(envelope.type());
  try {
    switch (*type) {
      case codec::FrameType::kAck:
        HandleAck(envelope);
        break;
      case codec::FrameType::kTelemetry:
        HandleTelemetry(envelope);
        break;
      case codec::FrameType::kArrival:
        HandleArrival(envelope);
        break;
      case codec::FrameType::kStatus:
        HandleStatus(envelope);
        break;
      case codec::FrameType::kAssign:
      case codec::FrameType::kComplete:
        MESHDISPATCH_LOG_WARN("ignoring server-bound command frame", {observability::StringField("type", envelope.type()),
                                                                      observability::StringField("unit_id", envelope.unit_id())});
        break;
    }
  } catch (const std::exception& e) {
    MESHDISPATCH_LOG_ERROR("frame handling failed", {observability::StringField("type", envelope.type()),
                                                     observability::StringField("unit_id", envelope.unit_id()),
                                                     observability::StringField("error", e.what())});
  }
}

void DispatchCoordinator::HandleAck(const Envelope& envelope) {
  const auto retired = outbound_->OnAck(envelope.msg_id());
  if (!retired) {
    MESHDISPATCH_LOG_DEBUG("ack for no pending message", {observability::StringField("msg_id", envelope.msg_id()),
                                                          observability::StringField("unit_id", envelope.unit_id())});
    return;
  }

  auto tx = repository_->Begin();
  units_.Touch(*tx, retired->unit_id, Position(envelope));
  tx->Commit();
}

void DispatchCoordinator::HandleTelemetry(const Envelope& envelope) {
  const util::LatLon       position{envelope.lat(), envelope.lon()};
  std::vector<std::string> superseded;
  {
    auto tx   = repository_->Begin();
    auto unit = units_.Touch(*tx, envelope.unit_id(), position);

    auto delivery = ActiveDelivery(*tx, unit);
    if (delivery && delivery->status != DELIVERY_STATUS_ARRIVED_DEST && delivery->HasCoordinates() &&
        WithinProximity(position, {*delivery->lat, *delivery->lon})) {
      MESHDISPATCH_LOG_INFO("unit within arrival proximity", {observability::StringField("unit_id", unit.id),
                                                              observability::IntField("delivery_id", delivery->id)});
      Arrive(*tx, *delivery, unit, superseded);
    } else if (unit.status == UNIT_STATUS_RETURNING && options_.base && WithinProximity(position, *options_.base)) {
      ReturnToBase(*tx, unit, superseded);
    }
    tx->Commit();
  }
  outbound_->Disarm(superseded);
}

void DispatchCoordinator::HandleArrival(const Envelope& envelope) {
  const auto               position = Position(envelope);
  std::vector<std::string> superseded;
  {
    auto tx   = repository_->Begin();
    auto unit = units_.Touch(*tx, envelope.unit_id(), position);

    auto delivery = repository_->GetDelivery(*tx, envelope.delivery_id());
    if (!delivery || delivery->assigned_unit_id != unit.id) {
      MESHDISPATCH_LOG_WARN("arrival for a delivery the unit does not hold", {observability::StringField("unit_id", unit.id),
                                                                             observability::IntField("delivery_id", envelope.delivery_id())});
    } else if (delivery->status == DELIVERY_STATUS_ARRIVED_DEST) {
      MESHDISPATCH_LOG_DEBUG("duplicate arrival", {observability::StringField("unit_id", unit.id),
                                                  observability::IntField("delivery_id", delivery->id)});
    } else if (position && delivery->HasCoordinates() && !WithinProximity(*position, {*delivery->lat, *delivery->lon})) {
      MESHDISPATCH_LOG_WARN("arrival rejected, unit is away from the destination",
                            {observability::StringField("unit_id", unit.id), observability::IntField("delivery_id", delivery->id),
                             observability::DoubleField("distance_m", util::DistanceMeters(*position, {*delivery->lat, *delivery->lon}))});
    } else {
      Arrive(*tx, *delivery, unit, superseded);
    }
    tx->Commit();
  }
  outbound_->Disarm(superseded);
}

void DispatchCoordinator::HandleStatus(const Envelope& envelope) {
  const auto reported = model::UnitStatusFromString(envelope.status());
  if (!reported) {
    MESHDISPATCH_LOG_WARN("unknown unit status reported", {observability::StringField("unit_id", envelope.unit_id()),
                                                           observability::StringField("status", envelope.status())});
  }

  std::vector<std::string> superseded;
  {
    auto tx   = repository_->Begin();
    auto unit = units_.Touch(*tx, envelope.unit_id(), Position(envelope));

    if (reported == UNIT_STATUS_EN_ROUTE) {
      auto delivery = ActiveDelivery(*tx, unit);
      if (delivery && delivery->status == DELIVERY_STATUS_ASSIGNED) {
        Depart(*tx, *delivery, unit, superseded);
      }
    } else if (reported == UNIT_STATUS_IDLE) {
      if (unit.status == UNIT_STATUS_RETURNING) {
        ReturnToBase(*tx, unit, superseded);
      }
    } else if (reported == UNIT_STATUS_ERROR) {
      MESHDISPATCH_LOG_WARN("unit reports a fault", {observability::StringField("unit_id", unit.id),
                                                     observability::StringField("status", model::ToString(unit.status))});
    }
    tx->Commit();
  }
  outbound_->Disarm(superseded);
}

std::optional<DeliveryRecord> DispatchCoordinator::ActiveDelivery(db::Transaction& tx, const UnitRecord& unit) {
  if (!unit.assigned_delivery_id) {
    return std::nullopt;
  }
  auto delivery = repository_->GetDelivery(tx, *unit.assigned_delivery_id);
  if (!delivery || delivery->assigned_unit_id != unit.id || !model::IsActive(delivery->status)) {
    return std::nullopt;
  }
  return delivery;
}

void DispatchCoordinator::Depart(db::Transaction& tx, DeliveryRecord& delivery, UnitRecord& unit, std::vector<std::string>& superseded) {
  deliveries_.Depart(tx, delivery);
  if (unit.status == UNIT_STATUS_ASSIGNED) {
    units_.Depart(tx, unit);
  }

  // moving means the assign frame got through
  auto cancelled = outbound_->CancelForDelivery(tx, delivery.id, PendingAckKind::kAssign);
  superseded.insert(superseded.end(), cancelled.begin(), cancelled.end());
}

void DispatchCoordinator::Arrive(db::Transaction& tx, DeliveryRecord& delivery, UnitRecord& unit, std::vector<std::string>& superseded) {
  if (delivery.status == DELIVERY_STATUS_ASSIGNED) {
    Depart(tx, delivery, unit, superseded);
  }

  deliveries_.Arrive(tx, delivery);
  if (unit.status == UNIT_STATUS_EN_ROUTE) {
    units_.Arrive(tx, unit);
  }
}

void DispatchCoordinator::ReturnToBase(db::Transaction& tx, UnitRecord& unit, std::vector<std::string>& superseded) {
  units_.ReturnToBase(tx, unit);
  auto cancelled = outbound_->CancelForUnit(tx, unit.id, PendingAckKind::kComplete);
  superseded.insert(superseded.end(), cancelled.begin(), cancelled.end());
}

bool DispatchCoordinator::WithinProximity(const util::LatLon& a, const util::LatLon& b) const {
  return util::DistanceMeters(a, b) <= options_.arrival_proximity_m;
}

// ---------------------------------------------------------------------------
// Exhaustion
// ---------------------------------------------------------------------------

void DispatchCoordinator::OnExhausted(db::Transaction& tx, const PendingAckRecord& record) {
  auto unit = repository_->GetUnit(tx, record.unit_id);

  if (record.kind == PendingAckKind::kAssign) {
    auto delivery = repository_->GetDelivery(tx, record.delivery_id);
    if (!delivery || delivery->status != DELIVERY_STATUS_ASSIGNED || delivery->assigned_unit_id != record.unit_id) {
      return;
    }

    deliveries_.Fail(tx, *delivery, "assignment not acknowledged after " + std::to_string(record.attempts) + " attempts");
    if (unit) {
      units_.Fault(tx, *unit, "assignment not acknowledged");
    }
    return;
  }

  // the delivery stays completed
  if (unit && !unit->assigned_delivery_id && unit->status != UNIT_STATUS_IDLE) {
    units_.Fault(tx, *unit, "completion not acknowledged");
  }
}

} // namespace meshdispatch::core
