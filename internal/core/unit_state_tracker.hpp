#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/db/api/repository.hpp"
#include "internal/util/geo.hpp"
#include "internal/util/time.hpp"

namespace meshdispatch::core {

/*
  Unit lifecycle.

    idle -> assigned -> en_route -> arrived_dest -> returning -> idle
    any -> error -> idle (dispatcher clears)
    any but idle/offline -> offline (no contact for offline_timeout)

  An offline unit drops its delivery back-reference; the delivery keeps
  assigned_unit_id. The next frame from the unit restores the state
  implied by that delivery.

  Same contract as DeliveryStateMachine: compare-and-set writes inside
  the caller's transaction, records updated in place.
*/
class UnitStateTracker {
 public:
  UnitStateTracker(std::shared_ptr<db::Repository> repository, const util::Clock& clock, std::chrono::milliseconds offline_timeout);

  db::model::UnitRecord Load(db::Transaction& tx, const std::string& unit_id, std::string_view op) const;

  db::model::UnitRecord Register(db::Transaction& tx, const std::string& unit_id, meshdispatch::v1::UnitStatus initial) const;

  // Contact from the unit: refreshes position and last contact, registers
  // unknown units as idle and brings offline units back.
  db::model::UnitRecord Touch(db::Transaction& tx, const std::string& unit_id, std::optional<util::LatLon> position) const;

  void Assign(db::Transaction& tx, db::model::UnitRecord& unit, std::int64_t delivery_id) const;
  void Depart(db::Transaction& tx, db::model::UnitRecord& unit) const;
  void Arrive(db::Transaction& tx, db::model::UnitRecord& unit) const;

  // Delivery completed: the unit heads back to base.
  void Release(db::Transaction& tx, db::model::UnitRecord& unit, std::int64_t delivery_id) const;

  // Delivery failed or a command was never acknowledged.
  void Fault(db::Transaction& tx, db::model::UnitRecord& unit, std::string_view reason) const;

  void ClearError(db::Transaction& tx, db::model::UnitRecord& unit) const;
  void ReturnToBase(db::Transaction& tx, db::model::UnitRecord& unit) const;

  // Marks stale units offline in one transaction. Returns how many.
  std::size_t SweepOffline() const;

 private:
  void Guard(const db::model::UnitRecord& unit, meshdispatch::v1::UnitStatus to, std::string_view op) const;
  void Store(db::Transaction& tx, db::model::UnitRecord& unit, const db::model::UnitRecord& next) const;

  meshdispatch::v1::UnitStatus RestoredStatus(db::Transaction& tx, db::model::UnitRecord& next) const;

  std::shared_ptr<db::Repository> repository_;
  const util::Clock&              clock_;
  std::chrono::milliseconds       offline_timeout_;
};

} // namespace meshdispatch::core
