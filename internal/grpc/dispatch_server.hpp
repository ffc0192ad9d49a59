#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/dispatch_service.hpp"
#include "meshdispatch/services/v1/dispatch_service.grpc.pb.h"

namespace meshdispatch::grpc {

// Trailing metadata key carrying the id of a delivery created without coordinates.
inline constexpr char kDeliveryIdTrailer[] = "meshdispatch-delivery-id";

class DispatchServer final : public meshdispatch::services::v1::DispatchService::Service {
 public:
  explicit DispatchServer(std::shared_ptr<meshdispatch::service::DispatchService> svc);

  ::grpc::Status CreateDelivery(::grpc::ServerContext*, const meshdispatch::services::v1::CreateDeliveryRequest*,
                                meshdispatch::services::v1::CreateDeliveryResponse*) override;

  ::grpc::Status RetryGeocode(::grpc::ServerContext*, const meshdispatch::services::v1::DeliveryRef*,
                              meshdispatch::services::v1::DeliveryResponse*) override;

  ::grpc::Status AssignDelivery(::grpc::ServerContext*, const meshdispatch::services::v1::AssignDeliveryRequest*,
                                meshdispatch::services::v1::DeliveryResponse*) override;

  ::grpc::Status ConfirmComplete(::grpc::ServerContext*, const meshdispatch::services::v1::DeliveryRef*,
                                 meshdispatch::services::v1::DeliveryResponse*) override;

  ::grpc::Status MarkFailed(::grpc::ServerContext*, const meshdispatch::services::v1::MarkFailedRequest*,
                            meshdispatch::services::v1::DeliveryResponse*) override;

  ::grpc::Status Reopen(::grpc::ServerContext*, const meshdispatch::services::v1::DeliveryRef*, meshdispatch::services::v1::DeliveryResponse*) override;

  ::grpc::Status RegisterUnit(::grpc::ServerContext*, const meshdispatch::services::v1::UnitRef*, meshdispatch::services::v1::UnitResponse*) override;

  ::grpc::Status ClearUnitError(::grpc::ServerContext*, const meshdispatch::services::v1::UnitRef*, meshdispatch::services::v1::UnitResponse*) override;

  ::grpc::Status GetDelivery(::grpc::ServerContext*, const meshdispatch::services::v1::DeliveryRef*,
                             meshdispatch::services::v1::DeliveryResponse*) override;

  ::grpc::Status ListDeliveries(::grpc::ServerContext*, const google::protobuf::Empty*, meshdispatch::services::v1::ListDeliveriesResponse*) override;

  ::grpc::Status GetUnit(::grpc::ServerContext*, const meshdispatch::services::v1::UnitRef*, meshdispatch::services::v1::UnitResponse*) override;

  ::grpc::Status ListUnits(::grpc::ServerContext*, const google::protobuf::Empty*, meshdispatch::services::v1::ListUnitsResponse*) override;

 private:
  std::shared_ptr<meshdispatch::service::DispatchService> service_;
};

} // namespace meshdispatch::grpc
