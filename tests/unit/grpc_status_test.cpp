#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/grpc/dispatch_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/service/dispatch_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "meshdispatch/v1.hpp"
#include "support/dispatch_harness.hpp"

namespace {

using namespace meshdispatch::services::v1;
using meshdispatch::testing::DispatchHarness;

struct ServerFixture {
  DispatchHarness                    harness;
  meshdispatch::grpc::DispatchServer server;

  ServerFixture()
      : server(std::make_shared<meshdispatch::service::DispatchService>(meshdispatch::service::ServiceContext{harness.coordinator})) {
  }
};

void TestMissingDeliveryReturnsNotFound() {
  ServerFixture f;

  DeliveryRef req;
  req.set_delivery_id(404);
  DeliveryResponse      resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = f.server.GetDelivery(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestBadArgumentsReturnInvalidArgument() {
  ServerFixture f;

  {
    DeliveryRef req;
    req.set_delivery_id(0);
    DeliveryResponse      resp;
    ::grpc::ServerContext grpc_ctx;
    assert(f.server.ConfirmComplete(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  }
  {
    UnitRef               req;
    UnitResponse          resp;
    ::grpc::ServerContext grpc_ctx;
    assert(f.server.RegisterUnit(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  }
  {
    CreateDeliveryRequest  req;
    CreateDeliveryResponse resp;
    ::grpc::ServerContext  grpc_ctx;
    req.set_address("  ");
    assert(f.server.CreateDelivery(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  }
}

void TestUngeocodedCreateStillStoresDelivery() {
  ServerFixture f;

  CreateDeliveryRequest req;
  req.set_address("Unmapped Alley 3");
  CreateDeliveryResponse resp;
  ::grpc::ServerContext  grpc_ctx;

  const auto status = f.server.CreateDelivery(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(!resp.has_delivery());

  const auto stored = f.harness.coordinator->ListDeliveries();
  assert(stored.size() == 1);
  assert(stored.front().address == "Unmapped Alley 3");
  assert(!stored.front().HasCoordinates());
}

void TestGuardViolationsReturnFailedPrecondition() {
  ServerFixture f;
  f.harness.BringOnline("Truck-01");
  const auto first  = f.harness.coordinator->CreateDelivery("Downtown Plaza 1").id;
  const auto second = f.harness.coordinator->CreateDelivery("Harbor Gate 7").id;
  f.harness.coordinator->AssignDelivery(first, "Truck-01");

  {
    AssignDeliveryRequest req;
    req.set_delivery_id(second);
    req.set_unit_id("Truck-01");
    DeliveryResponse      resp;
    ::grpc::ServerContext grpc_ctx;
    assert(f.server.AssignDelivery(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  }
  {
    DeliveryRef req;
    req.set_delivery_id(second);
    DeliveryResponse      resp;
    ::grpc::ServerContext grpc_ctx;
    assert(f.server.ConfirmComplete(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  }
}

void TestDuplicateUnitReturnsAlreadyExists() {
  ServerFixture f;

  UnitRef req;
  req.set_unit_id("Truck-07");
  UnitResponse resp;
  {
    ::grpc::ServerContext grpc_ctx;
    assert(f.server.RegisterUnit(&grpc_ctx, &req, &resp).ok());
    assert(resp.unit().status() == meshdispatch::v1::UNIT_STATUS_OFFLINE);
  }
  {
    ::grpc::ServerContext grpc_ctx;
    assert(f.server.RegisterUnit(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  }
}

void TestRemainingErrorMapping() {
  using meshdispatch::grpc::ToStatus;

  assert(ToStatus(meshdispatch::util::Conflict("version moved")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(meshdispatch::util::TransportError("link down")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(meshdispatch::util::GeocodeError("no match", 3)).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(meshdispatch::util::UnitBusy("busy")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);

  const auto internal = ToStatus(std::runtime_error("disk on fire"));
  assert(internal.error_code() == ::grpc::StatusCode::INTERNAL);
  assert(internal.error_message() == "disk on fire");
}

} // namespace

int main() {
  TestMissingDeliveryReturnsNotFound();
  TestBadArgumentsReturnInvalidArgument();
  TestUngeocodedCreateStillStoresDelivery();
  TestGuardViolationsReturnFailedPrecondition();
  TestDuplicateUnitReturnsAlreadyExists();
  TestRemainingErrorMapping();

  std::cout << "meshdispatch_unit_grpc_status: pass\n";
  return 0;
}
