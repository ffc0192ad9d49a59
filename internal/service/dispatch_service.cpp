#include "dispatch_service.hpp"

#include <chrono>
#include <stdexcept>
#include <string_view>
#include <type_traits>

#include "internal/core/dispatch_coordinator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/service/record_convert.hpp"

namespace meshdispatch::service {

using namespace meshdispatch::services::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto result = fn();
    observability::Metrics::Instance().RecordRequest(route, true);
    observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    return result;
  } catch (const std::exception& ex) {
    MESHDISPATCH_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what())});
    observability::Metrics::Instance().RecordRequest(route, false);
    observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    throw;
  }
}

void RequireDeliveryId(std::int64_t delivery_id) {
  if (delivery_id <= 0) {
    throw std::invalid_argument("delivery_id must be positive");
  }
}

void RequireUnitId(const std::string& unit_id) {
  if (unit_id.empty()) {
    throw std::invalid_argument("unit_id is required");
  }
}

DeliveryResponse Wrap(const db::model::DeliveryRecord& record) {
  DeliveryResponse resp;
  *resp.mutable_delivery() = ToProto(record);
  return resp;
}

UnitResponse Wrap(const db::model::UnitRecord& record) {
  UnitResponse resp;
  *resp.mutable_unit() = ToProto(record);
  return resp;
}

} // namespace

DispatchService::DispatchService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateDeliveryResponse DispatchService::CreateDelivery(const CreateDeliveryRequest& req) {
  return ObserveRpc("DispatchService.CreateDelivery", [&] {
    CreateDeliveryResponse resp;
    *resp.mutable_delivery() = ToProto(ctx_.coordinator->CreateDelivery(req.address()));
    return resp;
  });
}

DeliveryResponse DispatchService::RetryGeocode(const DeliveryRef& req) {
  return ObserveRpc("DispatchService.RetryGeocode", [&] {
    RequireDeliveryId(req.delivery_id());
    return Wrap(ctx_.coordinator->RetryGeocode(req.delivery_id()));
  });
}

DeliveryResponse DispatchService::AssignDelivery(const AssignDeliveryRequest& req) {
  return ObserveRpc("DispatchService.AssignDelivery", [&] {
    RequireDeliveryId(req.delivery_id());
    RequireUnitId(req.unit_id());
    return Wrap(ctx_.coordinator->AssignDelivery(req.delivery_id(), req.unit_id()));
  });
}

DeliveryResponse DispatchService::ConfirmComplete(const DeliveryRef& req) {
  return ObserveRpc("DispatchService.ConfirmComplete", [&] {
    RequireDeliveryId(req.delivery_id());
    return Wrap(ctx_.coordinator->ConfirmComplete(req.delivery_id()));
  });
}

DeliveryResponse DispatchService::MarkFailed(const MarkFailedRequest& req) {
  return ObserveRpc("DispatchService.MarkFailed", [&] {
    RequireDeliveryId(req.delivery_id());
    return Wrap(ctx_.coordinator->MarkFailed(req.delivery_id(), req.reason()));
  });
}

DeliveryResponse DispatchService::Reopen(const DeliveryRef& req) {
  return ObserveRpc("DispatchService.Reopen", [&] {
    RequireDeliveryId(req.delivery_id());
    return Wrap(ctx_.coordinator->Reopen(req.delivery_id()));
  });
}

UnitResponse DispatchService::RegisterUnit(const UnitRef& req) {
  return ObserveRpc("DispatchService.RegisterUnit", [&] {
    RequireUnitId(req.unit_id());
    return Wrap(ctx_.coordinator->RegisterUnit(req.unit_id()));
  });
}

UnitResponse DispatchService::ClearUnitError(const UnitRef& req) {
  return ObserveRpc("DispatchService.ClearUnitError", [&] {
    RequireUnitId(req.unit_id());
    return Wrap(ctx_.coordinator->ClearUnitError(req.unit_id()));
  });
}

DeliveryResponse DispatchService::GetDelivery(const DeliveryRef& req) {
  return ObserveRpc("DispatchService.GetDelivery", [&] {
    RequireDeliveryId(req.delivery_id());
    return Wrap(ctx_.coordinator->GetDelivery(req.delivery_id()));
  });
}

ListDeliveriesResponse DispatchService::ListDeliveries() {
  return ObserveRpc("DispatchService.ListDeliveries", [&] {
    ListDeliveriesResponse resp;
    for (const auto& record : ctx_.coordinator->ListDeliveries()) {
      *resp.add_deliveries() = ToProto(record);
    }
    return resp;
  });
}

UnitResponse DispatchService::GetUnit(const UnitRef& req) {
  return ObserveRpc("DispatchService.GetUnit", [&] {
    RequireUnitId(req.unit_id());
    return Wrap(ctx_.coordinator->GetUnit(req.unit_id()));
  });
}

ListUnitsResponse DispatchService::ListUnits() {
  return ObserveRpc("DispatchService.ListUnits", [&] {
    ListUnitsResponse resp;
    for (const auto& record : ctx_.coordinator->ListUnits()) {
      *resp.add_units() = ToProto(record);
    }
    return resp;
  });
}

} // namespace meshdispatch::service
