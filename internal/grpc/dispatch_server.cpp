#include "dispatch_server.hpp"

#include <string>

#include "grpc_error.hpp"
#include "internal/util/errors.hpp"

namespace meshdispatch::grpc {

using namespace meshdispatch::services::v1;

namespace {

template <typename Fn>
::grpc::Status Invoke(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

DispatchServer::DispatchServer(std::shared_ptr<meshdispatch::service::DispatchService> svc) : service_(std::move(svc)) {
}

::grpc::Status DispatchServer::CreateDelivery(::grpc::ServerContext* ctx, const CreateDeliveryRequest* req, CreateDeliveryResponse* resp) {
  try {
    *resp = service_->CreateDelivery(*req);
    return ::grpc::Status::OK;
  } catch (const util::GeocodeError& e) {
    ctx->AddTrailingMetadata(kDeliveryIdTrailer, std::to_string(e.DeliveryId()));
    return ToStatus(e);
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DispatchServer::RetryGeocode(::grpc::ServerContext*, const DeliveryRef* req, DeliveryResponse* resp) {
  return Invoke([&] { *resp = service_->RetryGeocode(*req); });
}

::grpc::Status DispatchServer::AssignDelivery(::grpc::ServerContext*, const AssignDeliveryRequest* req, DeliveryResponse* resp) {
  return Invoke([&] { *resp = service_->AssignDelivery(*req); });
}

::grpc::Status DispatchServer::ConfirmComplete(::grpc::ServerContext*, const DeliveryRef* req, DeliveryResponse* resp) {
  return Invoke([&] { *resp = service_->ConfirmComplete(*req); });
}

::grpc::Status DispatchServer::MarkFailed(::grpc::ServerContext*, const MarkFailedRequest* req, DeliveryResponse* resp) {
  return Invoke([&] { *resp = service_->MarkFailed(*req); });
}

::grpc::Status DispatchServer::Reopen(::grpc::ServerContext*, const DeliveryRef* req, DeliveryResponse* resp) {
  return Invoke([&] { *resp = service_->Reopen(*req); });
}

::grpc::Status DispatchServer::RegisterUnit(::grpc::ServerContext*, const UnitRef* req, UnitResponse* resp) {
  return Invoke([&] { *resp = service_->RegisterUnit(*req); });
}

::grpc::Status DispatchServer::ClearUnitError(::grpc::ServerContext*, const UnitRef* req, UnitResponse* resp) {
  return Invoke([&] { *resp = service_->ClearUnitError(*req); });
}

::grpc::Status DispatchServer::GetDelivery(::grpc::ServerContext*, const DeliveryRef* req, DeliveryResponse* resp) {
  return Invoke([&] { *resp = service_->GetDelivery(*req); });
}

::grpc::Status DispatchServer::ListDeliveries(::grpc::ServerContext*, const google::protobuf::Empty*, ListDeliveriesResponse* resp) {
  return Invoke([&] { *resp = service_->ListDeliveries(); });
}

::grpc::Status DispatchServer::GetUnit(::grpc::ServerContext*, const UnitRef* req, UnitResponse* resp) {
  return Invoke([&] { *resp = service_->GetUnit(*req); });
}

::grpc::Status DispatchServer::ListUnits(::grpc::ServerContext*, const google::protobuf::Empty*, ListUnitsResponse* resp) {
  return Invoke([&] { *resp = service_->ListUnits(); });
}

} // namespace meshdispatch::grpc
