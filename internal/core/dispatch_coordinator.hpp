#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/delivery_state_machine.hpp"
#include "internal/core/unit_state_tracker.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/geocode/geocoder.hpp"
#include "internal/reliable/reliable_outbound.hpp"
#include "internal/util/geo.hpp"
#include "internal/util/time.hpp"

namespace meshdispatch::v1 {
class Envelope;
}

namespace meshdispatch::core {

struct CoordinatorOptions {
  double                      arrival_proximity_m = 50.0;
  std::optional<util::LatLon> base;
  std::chrono::milliseconds   offline_timeout{std::chrono::minutes(5)};
};

/*
  DispatchCoordinator

  Entry point for dispatcher commands and unit frames. Each command runs
  in one store transaction: delivery and unit transitions plus any staged
  outbound frame commit together, and the frame goes out after commit.

  Errors:
    util::NotFound / util::InvalidTransition / util::UnitBusy /
    util::AlreadyExists / util::GeocodeError / std::invalid_argument

  Ingest never throws.
*/
class DispatchCoordinator {
 public:
  DispatchCoordinator(std::shared_ptr<db::Repository> repository, std::shared_ptr<reliable::ReliableOutbound> outbound,
                      std::shared_ptr<geocode::Geocoder> geocoder, const util::Clock& clock, CoordinatorOptions options);

  // Created even when geocoding fails; GeocodeError then carries the id.
  db::model::DeliveryRecord CreateDelivery(const std::string& address);
  db::model::DeliveryRecord RetryGeocode(std::int64_t delivery_id);

  db::model::DeliveryRecord AssignDelivery(std::int64_t delivery_id, const std::string& unit_id);
  db::model::DeliveryRecord ConfirmComplete(std::int64_t delivery_id);
  db::model::DeliveryRecord MarkFailed(std::int64_t delivery_id, const std::string& reason);
  db::model::DeliveryRecord Reopen(std::int64_t delivery_id);

  db::model::UnitRecord RegisterUnit(const std::string& unit_id);
  db::model::UnitRecord ClearUnitError(const std::string& unit_id);

  // One raw frame from the radio link.
  void Ingest(const std::string& frame);

  std::size_t SweepOffline();

  db::model::DeliveryRecord              GetDelivery(std::int64_t delivery_id);
  std::vector<db::model::DeliveryRecord> ListDeliveries();
  db::model::UnitRecord                  GetUnit(const std::string& unit_id);
  std::vector<db::model::UnitRecord>     ListUnits();

  const CoordinatorOptions& Options() const {
    return options_;
  }

 private:
  void HandleAck(const meshdispatch::v1::Envelope& envelope);
  void HandleTelemetry(const meshdispatch::v1::Envelope& envelope);
  void HandleArrival(const meshdispatch::v1::Envelope& envelope);
  void HandleStatus(const meshdispatch::v1::Envelope& envelope);

  // Assigned -> en_route for the pair. Outstanding assign frames count as
  // acknowledged; their ids are appended to superseded.
  void Depart(db::Transaction& tx, db::model::DeliveryRecord& delivery, db::model::UnitRecord& unit, std::vector<std::string>& superseded);

  // Passes through en_route when the departure was never reported.
  void Arrive(db::Transaction& tx, db::model::DeliveryRecord& delivery, db::model::UnitRecord& unit, std::vector<std::string>& superseded);

  // The unit's active delivery, when the back-references agree.
  std::optional<db::model::DeliveryRecord> ActiveDelivery(db::Transaction& tx, const db::model::UnitRecord& unit);

  // Returning -> idle. Outstanding complete frames count as acknowledged.
  void ReturnToBase(db::Transaction& tx, db::model::UnitRecord& unit, std::vector<std::string>& superseded);

  bool WithinProximity(const util::LatLon& a, const util::LatLon& b) const;

  void OnExhausted(db::Transaction& tx, const db::model::PendingAckRecord& record);

  std::shared_ptr<db::Repository>             repository_;
  std::shared_ptr<reliable::ReliableOutbound> outbound_;
  std::shared_ptr<geocode::Geocoder>          geocoder_;
  const util::Clock&                          clock_;
  CoordinatorOptions                          options_;

  DeliveryStateMachine deliveries_;
  UnitStateTracker     units_;
};

} // namespace meshdispatch::core
