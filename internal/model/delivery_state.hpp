#pragma once

#include <string_view>

#include "meshdispatch/v1/types.pb.h"

namespace meshdispatch::model {

using meshdispatch::v1::DeliveryStatus;

constexpr bool IsTerminal(DeliveryStatus status) {
  return status == meshdispatch::v1::DELIVERY_STATUS_COMPLETED || status == meshdispatch::v1::DELIVERY_STATUS_FAILED;
}

// Statuses in which a delivery holds a unit.
constexpr bool IsActive(DeliveryStatus status) {
  return status == meshdispatch::v1::DELIVERY_STATUS_ASSIGNED || status == meshdispatch::v1::DELIVERY_STATUS_EN_ROUTE ||
         status == meshdispatch::v1::DELIVERY_STATUS_ARRIVED_DEST;
}

constexpr bool CanTransition(DeliveryStatus from, DeliveryStatus to) {
  using namespace meshdispatch::v1;

  if (to == DELIVERY_STATUS_UNSPECIFIED) {
    return false;
  }
  if (IsTerminal(from)) {
    return to == DELIVERY_STATUS_PENDING;
  }

  switch (from) {
    case DELIVERY_STATUS_PENDING:
      return to == DELIVERY_STATUS_ASSIGNED;
    case DELIVERY_STATUS_ASSIGNED:
      return to == DELIVERY_STATUS_EN_ROUTE || to == DELIVERY_STATUS_FAILED;
    case DELIVERY_STATUS_EN_ROUTE:
      return to == DELIVERY_STATUS_ARRIVED_DEST || to == DELIVERY_STATUS_FAILED;
    case DELIVERY_STATUS_ARRIVED_DEST:
      return to == DELIVERY_STATUS_COMPLETED || to == DELIVERY_STATUS_FAILED;
    default:
      return false;
  }
}

constexpr std::string_view ToString(DeliveryStatus status) {
  using namespace meshdispatch::v1;

  switch (status) {
    case DELIVERY_STATUS_PENDING:
      return "pending";
    case DELIVERY_STATUS_ASSIGNED:
      return "assigned";
    case DELIVERY_STATUS_EN_ROUTE:
      return "en_route";
    case DELIVERY_STATUS_ARRIVED_DEST:
      return "arrived_dest";
    case DELIVERY_STATUS_COMPLETED:
      return "completed";
    case DELIVERY_STATUS_FAILED:
      return "failed";
    default:
      return "unspecified";
  }
}

} // namespace meshdispatch::model
