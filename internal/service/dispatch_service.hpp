#pragma once

#include "meshdispatch/services/v1/dispatch_service.pb.h"
#include "service_context.hpp"

namespace meshdispatch::service {

class DispatchService {
 public:
  explicit DispatchService(ServiceContext ctx);

  meshdispatch::services::v1::CreateDeliveryResponse CreateDelivery(const meshdispatch::services::v1::CreateDeliveryRequest& req);

  meshdispatch::services::v1::DeliveryResponse RetryGeocode(const meshdispatch::services::v1::DeliveryRef& req);

  meshdispatch::services::v1::DeliveryResponse AssignDelivery(const meshdispatch::services::v1::AssignDeliveryRequest& req);

  meshdispatch::services::v1::DeliveryResponse ConfirmComplete(const meshdispatch::services::v1::DeliveryRef& req);

  meshdispatch::services::v1::DeliveryResponse MarkFailed(const meshdispatch::services::v1::MarkFailedRequest& req);

  meshdispatch::services::v1::DeliveryResponse Reopen(const meshdispatch::services::v1::DeliveryRef& req);

  meshdispatch::services::v1::UnitResponse RegisterUnit(const meshdispatch::services::v1::UnitRef& req);

  meshdispatch::services::v1::UnitResponse ClearUnitError(const meshdispatch::services::v1::UnitRef& req);

  meshdispatch::services::v1::DeliveryResponse GetDelivery(const meshdispatch::services::v1::DeliveryRef& req);

  meshdispatch::services::v1::ListDeliveriesResponse ListDeliveries();

  meshdispatch::services::v1::UnitResponse GetUnit(const meshdispatch::services::v1::UnitRef& req);

  meshdispatch::services::v1::ListUnitsResponse ListUnits();

 private:
  ServiceContext ctx_;
};

} // namespace meshdispatch::service
