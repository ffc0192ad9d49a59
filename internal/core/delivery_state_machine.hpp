#pragma once

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
  Delivery lifecycle.

    pending -> assigned -> en_route -> arrived_dest -> completed
    assigned | en_route | arrived_dest -> failed
    completed | failed -> pending (reopen)

  Every method validates the transition, writes the row with a
  compare-and-set on its version inside the caller's transaction and
  updates the record in place. A rejected transition throws
  util::InvalidTransition and writes nothing.

  Side effects on units and outbound frames belong to the caller.
*/
class DeliveryStateMachine {
 public:
  DeliveryStateMachine(std::shared_ptr<db::Repository> repository, const util::Clock& clock);

  db::model::DeliveryRecord Load(db::Transaction& tx, std::int64_t delivery_id, std::string_view op) const;

  db::model::DeliveryRecord Create(db::Transaction& tx, const std::string& address, std::optional<util::LatLon> coordinates) const;

  void Assign(db::Transaction& tx, db::model::DeliveryRecord& delivery, const std::string& unit_id) const;
  void Depart(db::Transaction& tx, db::model::DeliveryRecord& delivery) const;
  void Arrive(db::Transaction& tx, db::model::DeliveryRecord& delivery) const;
  void Complete(db::Transaction& tx, db::model::DeliveryRecord& delivery) const;
  void Fail(db::Transaction& tx, db::model::DeliveryRecord& delivery, const std::string& reason) const;
  void Reopen(db::Transaction& tx, db::model::DeliveryRecord& delivery) const;

  void SetCoordinates(db::Transaction& tx, db::model::DeliveryRecord& delivery, util::LatLon at) const;

 private:
  void Guard(const db::model::DeliveryRecord& delivery, meshdispatch::v1::DeliveryStatus to, std::string_view op) const;
  void Store(db::Transaction& tx, db::model::DeliveryRecord& delivery, const db::model::DeliveryRecord& next) const;

  std::shared_ptr<db::Repository> repository_;
  const util::Clock&              clock_;
};

} // namespace meshdispatch::core
