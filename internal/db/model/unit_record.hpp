#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "meshdispatch/v1/types.pb.h"

namespace meshdispatch::db::model {

struct UnitRecord {
  std::string id;

  meshdispatch::v1::UnitStatus status = meshdispatch::v1::UNIT_STATUS_OFFLINE;

  std::optional<std::int64_t> assigned_delivery_id;

  std::optional<double> last_lat;
  std::optional<double> last_lon;

  std::int64_t last_contact_ms = 0;

  // Status held when the offline sweep fired; restored on reconnection.
  meshdispatch::v1::UnitStatus status_before_offline = meshdispatch::v1::UNIT_STATUS_UNSPECIFIED;

  std::uint64_t version = 0;
};

} // namespace meshdispatch::db::model
