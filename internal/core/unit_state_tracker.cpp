#include "unit_state_tracker.hpp"

#include "internal/db/api/db_error.hpp"
#include "internal/model/unit_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace meshdispatch::core {

using db::model::UnitRecord;
using namespace meshdispatch::v1;

UnitStateTracker::UnitStateTracker(std::shared_ptr<db::Repository> repository, const util::Clock& clock, std::chrono::milliseconds offline_timeout)
    : repository_(std::move(repository)), clock_(clock), offline_timeout_(offline_timeout) {
}

UnitRecord UnitStateTracker::Load(db::Transaction& tx, const std::string& unit_id, std::string_view op) const {
  auto record = repository_->GetUnit(tx, unit_id);
  if (!record) {
    throw util::NotFound(std::string(op) + ": unit '" + unit_id + "' not found");
  }
  return *record;
}

UnitRecord UnitStateTracker::Register(db::Transaction& tx, const std::string& unit_id, UnitStatus initial) const {
  if (unit_id.empty()) {
    throw std::invalid_argument("register unit: unit id is required");
  }

  UnitRecord record;
  record.id     = unit_id;
  record.status = initial;
  if (initial != UNIT_STATUS_OFFLINE) {
    record.last_contact_ms = util::ToUnixMillis(clock_.Now());
  }

  db::ThrowIfDbError(repository_->InsertUnit(tx, record), "register unit '" + unit_id + "'");
  MESHDISPATCH_LOG_INFO("unit registered", {observability::StringField("unit_id", unit_id), observability::StringField("status", model::ToString(initial))});
  return record;
}

void UnitStateTracker::Guard(const UnitRecord& unit, UnitStatus to, std::string_view op) const {
  if (!model::CanTransition(unit.status, to)) {
    throw util::InvalidTransition(std::string(op) + ": unit '" + unit.id + "' is " + std::string(model::ToString(unit.status)) + ", cannot become " +
                                  std::string(model::ToString(to)));
  }
}

void UnitStateTracker::Store(db::Transaction& tx, UnitRecord& unit, const UnitRecord& next) const {
  db::ThrowIfDbError(repository_->UpdateUnit(tx, next, unit.version), "update unit '" + unit.id + "'");

  if (next.status != unit.status) {
    MESHDISPATCH_LOG_INFO("unit status changed", {observability::StringField("unit_id", unit.id),
                                                  observability::StringField("from", model::ToString(unit.status)),
                                                  observability::StringField("to", model::ToString(next.status))});
  }

  const auto version = unit.version + 1;
  unit               = next;
  unit.version       = version;
}

UnitStatus UnitStateTracker::RestoredStatus(db::Transaction& tx, UnitRecord& next) const {
  const auto active = repository_->FindActiveDeliveriesForUnit(tx, next.id);
  if (!active.empty()) {
    const auto& delivery      = active.front();
    next.assigned_delivery_id = delivery.id;
    switch (delivery.status) {
      case DELIVERY_STATUS_EN_ROUTE:
        return UNIT_STATUS_EN_ROUTE;
      case DELIVERY_STATUS_ARRIVED_DEST:
        return UNIT_STATUS_ARRIVED_DEST;
      default:
        return UNIT_STATUS_ASSIGNED;
    }
  }

  next.assigned_delivery_id.reset();
  if (next.status_before_offline == UNIT_STATUS_RETURNING || next.status_before_offline == UNIT_STATUS_ERROR) {
    return next.status_before_offline;
  }
  return UNIT_STATUS_IDLE;
}

UnitRecord UnitStateTracker::Touch(db::Transaction& tx, const std::string& unit_id, std::optional<util::LatLon> position) const {
  auto existing = repository_->GetUnit(tx, unit_id);
  if (!existing) {
    MESHDISPATCH_LOG_INFO("first contact from unknown unit", {observability::StringField("unit_id", unit_id)});
    existing = Register(tx, unit_id, UNIT_STATUS_IDLE);
  }

  auto unit = *existing;
  auto next = unit;
  next.last_contact_ms = util::ToUnixMillis(clock_.Now());
  if (position) {
    next.last_lat = position->lat;
    next.last_lon = position->lon;
  }

  if (unit.status == UNIT_STATUS_OFFLINE) {
    next.status                = RestoredStatus(tx, next);
    next.status_before_offline = UNIT_STATUS_UNSPECIFIED;
    MESHDISPATCH_LOG_INFO("unit back online", {observability::StringField("unit_id", unit_id),
                                               observability::StringField("restored", model::ToString(next.status))});
  }

  Store(tx, unit, next);
  return unit;
}

void UnitStateTracker::Assign(db::Transaction& tx, UnitRecord& unit, std::int64_t delivery_id) const {
  if (unit.status != UNIT_STATUS_IDLE || unit.assigned_delivery_id.has_value()) {
    throw util::UnitBusy("assign delivery: unit '" + unit.id + "' is " + std::string(model::ToString(unit.status)) + ", must be idle");
  }

  auto next                 = unit;
  next.status               = UNIT_STATUS_ASSIGNED;
  next.assigned_delivery_id = delivery_id;
  Store(tx, unit, next);
}

void UnitStateTracker::Depart(db::Transaction& tx, UnitRecord& unit) const {
  Guard(unit, UNIT_STATUS_EN_ROUTE, "depart");

  auto next   = unit;
  next.status = UNIT_STATUS_EN_ROUTE;
  Store(tx, unit, next);
}

void UnitStateTracker::Arrive(db::Transaction& tx, UnitRecord& unit) const {
  Guard(unit, UNIT_STATUS_ARRIVED_DEST, "arrive");

  auto next   = unit;
  next.status = UNIT_STATUS_ARRIVED_DEST;
  Store(tx, unit, next);
}

void UnitStateTracker::Release(db::Transaction& tx, UnitRecord& unit, std::int64_t delivery_id) const {
  auto next = unit;
  if (unit.assigned_delivery_id == delivery_id) {
    next.assigned_delivery_id.reset();
  }

  if (unit.status == UNIT_STATUS_OFFLINE) {
    // picked up again when the unit reconnects
    next.status_before_offline = UNIT_STATUS_RETURNING;
  } else if (model::CanTransition(unit.status, UNIT_STATUS_RETURNING)) {
    next.status = UNIT_STATUS_RETURNING;
  } else {
    MESHDISPATCH_LOG_WARN("released unit not at destination", {observability::StringField("unit_id", unit.id),
                                                               observability::StringField("status", model::ToString(unit.status)),
                                                               observability::IntField("delivery_id", delivery_id)});
  }

  Store(tx, unit, next);
}

void UnitStateTracker::Fault(db::Transaction& tx, UnitRecord& unit, std::string_view reason) const {
  auto next   = unit;
  next.status = UNIT_STATUS_ERROR;
  next.assigned_delivery_id.reset();
  next.status_before_offline = UNIT_STATUS_UNSPECIFIED;

  MESHDISPATCH_LOG_WARN("unit moved to error", {observability::StringField("unit_id", unit.id), observability::StringField("reason", reason)});
  Store(tx, unit, next);
}

void UnitStateTracker::ClearError(db::Transaction& tx, UnitRecord& unit) const {
  if (unit.status != UNIT_STATUS_ERROR) {
    throw util::InvalidTransition("clear unit error: unit '" + unit.id + "' is " + std::string(model::ToString(unit.status)) + ", not error");
  }

  auto next   = unit;
  next.status = UNIT_STATUS_IDLE;
  Store(tx, unit, next);
}

void UnitStateTracker::ReturnToBase(db::Transaction& tx, UnitRecord& unit) const {
  Guard(unit, UNIT_STATUS_IDLE, "return to base");

  auto next   = unit;
  next.status = UNIT_STATUS_IDLE;
  next.assigned_delivery_id.reset();
  Store(tx, unit, next);
}

std::size_t UnitStateTracker::SweepOffline() const {
  const auto now    = util::ToUnixMillis(clock_.Now());
  const auto cutoff = now - offline_timeout_.count();

  std::size_t marked = 0;
  auto        tx     = repository_->Begin();
  for (auto unit : repository_->ListUnits(*tx)) {
    if (!model::IsSweepable(unit.status) || unit.last_contact_ms >= cutoff) {
      continue;
    }

    auto next                  = unit;
    next.status_before_offline = unit.status;
    next.status                = UNIT_STATUS_OFFLINE;
    next.assigned_delivery_id.reset();
    Store(*tx, unit, next);

    ++marked;
    observability::Metrics::Instance().RecordUnitOffline();
    MESHDISPATCH_LOG_WARN("unit offline", {observability::StringField("unit_id", unit.id),
                                           observability::StringField("was", model::ToString(next.status_before_offline)),
                                           observability::IntField("silent_ms", now - next.last_contact_ms)});
  }
  tx->Commit();
  return marked;
}

} // namespace meshdispatch::core
