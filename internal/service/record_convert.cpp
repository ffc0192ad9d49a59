#include "record_convert.hpp"

#include "internal/util/time.hpp"

namespace meshdispatch::service {

namespace {

void SetIfSet(std::int64_t unix_ms, google::protobuf::Timestamp* out) {
  if (unix_ms > 0) {
    *out = util::ToProto(util::FromUnixMillis(unix_ms));
  }
}

} // namespace

meshdispatch::v1::Delivery ToProto(const db::model::DeliveryRecord& record) {
  meshdispatch::v1::Delivery delivery;
  delivery.set_id(record.id);
  delivery.set_address(record.address);
  if (record.HasCoordinates()) {
    delivery.mutable_coordinates()->set_lat(*record.lat);
    delivery.mutable_coordinates()->set_lon(*record.lon);
  }
  delivery.set_status(record.status);
  if (record.assigned_unit_id) {
    delivery.set_assigned_unit_id(*record.assigned_unit_id);
  }
  if (record.failure_reason) {
    delivery.set_failure_reason(*record.failure_reason);
  }

  SetIfSet(record.created_at_ms, delivery.mutable_created_at());
  SetIfSet(record.status_changed_at_ms, delivery.mutable_status_changed_at());
  SetIfSet(record.assigned_at_ms, delivery.mutable_assigned_at());
  SetIfSet(record.en_route_at_ms, delivery.mutable_en_route_at());
  SetIfSet(record.arrived_at_ms, delivery.mutable_arrived_at());
  SetIfSet(record.completed_at_ms, delivery.mutable_completed_at());

  delivery.set_version(record.version);
  return delivery;
}

meshdispatch::v1::Unit ToProto(const db::model::UnitRecord& record) {
  meshdispatch::v1::Unit unit;
  unit.set_id(record.id);
  unit.set_status(record.status);
  if (record.assigned_delivery_id) {
    unit.set_assigned_delivery_id(*record.assigned_delivery_id);
  }
  if (record.last_lat && record.last_lon) {
    unit.mutable_last_position()->set_lat(*record.last_lat);
    unit.mutable_last_position()->set_lon(*record.last_lon);
  }
  SetIfSet(record.last_contact_ms, unit.mutable_last_contact_at());
  unit.set_version(record.version);
  return unit;
}

} // namespace meshdispatch::service
