#include "delivery_state_machine.hpp"

#include "internal/db/api/db_error.hpp"
#include "internal/model/delivery_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace meshdispatch::core {

using db::model::DeliveryRecord;
using namespace meshdispatch::v1;

DeliveryStateMachine::DeliveryStateMachine(std::shared_ptr<db::Repository> repository, const util::Clock& clock)
    : repository_(std::move(repository)), clock_(clock) {
}

DeliveryRecord DeliveryStateMachine::Load(db::Transaction& tx, std::int64_t delivery_id, std::string_view op) const {
  auto record = repository_->GetDelivery(tx, delivery_id);
  if (!record) {
    throw util::NotFound(std::string(op) + ": delivery " + std::to_string(delivery_id) + " not found");
  }
  return *record;
}

DeliveryRecord DeliveryStateMachine::Create(db::Transaction& tx, const std::string& address, std::optional<util::LatLon> coordinates) const {
  const auto now = util::ToUnixMillis(clock_.Now());

  DeliveryRecord record;
  record.address = address;
  if (coordinates) {
    record.lat = coordinates->lat;
    record.lon = coordinates->lon;
  }
  record.status               = DELIVERY_STATUS_PENDING;
  record.created_at_ms        = now;
  record.status_changed_at_ms = now;

  db::ThrowIfDbError(repository_->InsertDelivery(tx, record), "create delivery");
  return record;
}

void DeliveryStateMachine::Guard(const DeliveryRecord& delivery, DeliveryStatus to, std::string_view op) const {
  if (!model::CanTransition(delivery.status, to)) {
    throw util::InvalidTransition(std::string(op) + ": delivery " + std::to_string(delivery.id) + " is " +
                                  std::string(model::ToString(delivery.status)) + ", cannot become " + std::string(model::ToString(to)));
  }
}

void DeliveryStateMachine::Store(db::Transaction& tx, DeliveryRecord& delivery, const DeliveryRecord& next) const {
  db::ThrowIfDbError(repository_->UpdateDelivery(tx, next, delivery.version), "update delivery " + std::to_string(delivery.id));

  if (next.status != delivery.status) {
    MESHDISPATCH_LOG_INFO("delivery status changed", {observability::IntField("delivery_id", delivery.id),
                                                      observability::StringField("from", model::ToString(delivery.status)),
                                                      observability::StringField("to", model::ToString(next.status))});
  }

  const auto version = delivery.version + 1;
  delivery           = next;
  delivery.version   = version;
}

void DeliveryStateMachine::Assign(db::Transaction& tx, DeliveryRecord& delivery, const std::string& unit_id) const {
  Guard(delivery, DELIVERY_STATUS_ASSIGNED, "assign delivery");
  if (!delivery.HasCoordinates()) {
    throw util::InvalidTransition("assign delivery: delivery " + std::to_string(delivery.id) + " has no coordinates; retry geocoding first");
  }

  const auto now            = util::ToUnixMillis(clock_.Now());
  auto       next           = delivery;
  next.status               = DELIVERY_STATUS_ASSIGNED;
  next.assigned_unit_id     = unit_id;
  next.status_changed_at_ms = now;
  next.assigned_at_ms       = now;
  Store(tx, delivery, next);
}

void DeliveryStateMachine::Depart(db::Transaction& tx, DeliveryRecord& delivery) const {
  Guard(delivery, DELIVERY_STATUS_EN_ROUTE, "depart");

  const auto now            = util::ToUnixMillis(clock_.Now());
  auto       next           = delivery;
  next.status               = DELIVERY_STATUS_EN_ROUTE;
  next.status_changed_at_ms = now;
  next.en_route_at_ms       = now;
  Store(tx, delivery, next);
}

void DeliveryStateMachine::Arrive(db::Transaction& tx, DeliveryRecord& delivery) const {
  Guard(delivery, DELIVERY_STATUS_ARRIVED_DEST, "arrive");

  const auto now            = util::ToUnixMillis(clock_.Now());
  auto       next           = delivery;
  next.status               = DELIVERY_STATUS_ARRIVED_DEST;
  next.status_changed_at_ms = now;
  next.arrived_at_ms        = now;
  Store(tx, delivery, next);
}

void DeliveryStateMachine::Complete(db::Transaction& tx, DeliveryRecord& delivery) const {
  Guard(delivery, DELIVERY_STATUS_COMPLETED, "confirm complete");

  const auto now            = util::ToUnixMillis(clock_.Now());
  auto       next           = delivery;
  next.status               = DELIVERY_STATUS_COMPLETED;
  next.assigned_unit_id.reset();
  next.status_changed_at_ms = now;
  next.completed_at_ms      = now;
  Store(tx, delivery, next);
}

void DeliveryStateMachine::Fail(db::Transaction& tx, DeliveryRecord& delivery, const std::string& reason) const {
  Guard(delivery, DELIVERY_STATUS_FAILED, "mark failed");

  auto next   = delivery;
  next.status = DELIVERY_STATUS_FAILED;
  next.assigned_unit_id.reset();
  next.failure_reason       = reason.empty() ? std::string("unspecified") : reason;
  next.status_changed_at_ms = util::ToUnixMillis(clock_.Now());
  Store(tx, delivery, next);
}

void DeliveryStateMachine::Reopen(db::Transaction& tx, DeliveryRecord& delivery) const {
  if (!model::IsTerminal(delivery.status)) {
    throw util::InvalidTransition("reopen: delivery " + std::to_string(delivery.id) + " is " + std::string(model::ToString(delivery.status)) +
                                  ", only completed or failed deliveries can be reopened");
  }

  auto next   = delivery;
  next.status = DELIVERY_STATUS_PENDING;
  next.assigned_unit_id.reset();
  next.failure_reason.reset();
  next.status_changed_at_ms = util::ToUnixMillis(clock_.Now());
  next.assigned_at_ms       = 0;
  next.en_route_at_ms       = 0;
  next.arrived_at_ms        = 0;
  next.completed_at_ms      = 0;
  Store(tx, delivery, next);
}

void DeliveryStateMachine::SetCoordinates(db::Transaction& tx, DeliveryRecord& delivery, util::LatLon at) const {
  auto next = delivery;
  next.lat  = at.lat;
  next.lon  = at.lon;
  Store(tx, delivery, next);
}

} // namespace meshdispatch::core
