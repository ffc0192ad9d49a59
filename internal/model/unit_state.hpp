#pragma once

#include <optional>
#include <string_view>

#include "meshdispatch/v1/types.pb.h"

namespace meshdispatch::model {

using meshdispatch::v1::UnitStatus;

// Statuses that must not carry an assigned delivery.
constexpr bool IsUnassignedStatus(UnitStatus status) {
  return status == meshdispatch::v1::UNIT_STATUS_IDLE || status == meshdispatch::v1::UNIT_STATUS_OFFLINE ||
         status == meshdispatch::v1::UNIT_STATUS_ERROR;
}

// Units the offline sweep looks at.
constexpr bool IsSweepable(UnitStatus status) {
  return status != meshdispatch::v1::UNIT_STATUS_OFFLINE && status != meshdispatch::v1::UNIT_STATUS_IDLE;
}

constexpr bool CanTransition(UnitStatus from, UnitStatus to) {
  using namespace meshdispatch::v1;

  if (from == to || to == UNIT_STATUS_UNSPECIFIED) {
    return false;
  }
  // Failure and staleness apply from anywhere.
  if (to == UNIT_STATUS_ERROR || to == UNIT_STATUS_OFFLINE) {
    return true;
  }

  switch (from) {
    case UNIT_STATUS_IDLE:
      return to == UNIT_STATUS_ASSIGNED;
    case UNIT_STATUS_ASSIGNED:
      return to == UNIT_STATUS_EN_ROUTE;
    case UNIT_STATUS_EN_ROUTE:
      return to == UNIT_STATUS_ARRIVED_DEST;
    case UNIT_STATUS_ARRIVED_DEST:
      return to == UNIT_STATUS_RETURNING;
    case UNIT_STATUS_RETURNING:
      return to == UNIT_STATUS_IDLE;
    case UNIT_STATUS_ERROR:
      return to == UNIT_STATUS_IDLE;
    case UNIT_STATUS_OFFLINE:
      // reconnection restores whatever the unit was doing
      return true;
    default:
      return false;
  }
}

constexpr std::string_view ToString(UnitStatus status) {
  using namespace meshdispatch::v1;

  switch (status) {
    case UNIT_STATUS_IDLE:
      return "idle";
    case UNIT_STATUS_ASSIGNED:
      return "assigned";
    case UNIT_STATUS_EN_ROUTE:
      return "en_route";
    case UNIT_STATUS_ARRIVED_DEST:
      return "arrived_dest";
    case UNIT_STATUS_RETURNING:
      return "returning";
    case UNIT_STATUS_OFFLINE:
      return "offline";
    case UNIT_STATUS_ERROR:
      return "error";
    default:
      return "unspecified";
  }
}

inline std::optional<UnitStatus> UnitStatusFromString(std::string_view value) {
  using namespace meshdispatch::v1;

  for (auto status : {UNIT_STATUS_IDLE, UNIT_STATUS_ASSIGNED, UNIT_STATUS_EN_ROUTE, UNIT_STATUS_ARRIVED_DEST, UNIT_STATUS_RETURNING,
                      UNIT_STATUS_OFFLINE, UNIT_STATUS_ERROR}) {
    if (ToString(status) == value) {
      return status;
    }
  }
  return std::nullopt;
}

} // namespace meshdispatch::model
