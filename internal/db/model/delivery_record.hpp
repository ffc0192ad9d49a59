#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "meshdispatch/v1/types.pb.h"

namespace meshdispatch::db::model {

/*
  Persistent delivery row.

  IMPORTANT:
  - This is the authoritative delivery state machine record.
  - version is bumped on every write and used as the compare-and-set
    token (UPDATE ... WHERE id=? AND version=?).
  - Timestamps are unix milliseconds; 0 means unset.
*/

struct DeliveryRecord {
  std::int64_t id = 0; // assigned by the store on insert

  std::string address;

  std::optional<double> lat;
  std::optional<double> lon;

  meshdispatch::v1::DeliveryStatus status = meshdispatch::v1::DELIVERY_STATUS_PENDING;

  std::optional<std::string> assigned_unit_id;
  std::optional<std::string> failure_reason;

  std::int64_t created_at_ms        = 0;
  std::int64_t status_changed_at_ms = 0;
  std::int64_t assigned_at_ms       = 0;
  std::int64_t en_route_at_ms       = 0;
  std::int64_t arrived_at_ms        = 0;
  std::int64_t completed_at_ms      = 0;

  std::uint64_t version = 0;

  bool HasCoordinates() const {
    return lat.has_value() && lon.has_value();
  }
};

} // namespace meshdispatch::db::model
