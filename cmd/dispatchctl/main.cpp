#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

#include "api/meshdispatch/v1.hpp"

using namespace meshdispatch::services::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  dispatchctl <addr> create <address...>\n"
            << "  dispatchctl <addr> geocode <delivery_id>\n"
            << "  dispatchctl <addr> assign <delivery_id> <unit_id>\n"
            << "  dispatchctl <addr> complete <delivery_id>\n"
            << "  dispatchctl <addr> fail <delivery_id> [reason...]\n"
            << "  dispatchctl <addr> reopen <delivery_id>\n"
            << "  dispatchctl <addr> delivery <delivery_id>\n"
            << "  dispatchctl <addr> deliveries\n"
            << "  dispatchctl <addr> register <unit_id>\n"
            << "  dispatchctl <addr> clear-error <unit_id>\n"
            << "  dispatchctl <addr> unit <unit_id>\n"
            << "  dispatchctl <addr> units\n";
}

static std::string StatusName(meshdispatch::v1::DeliveryStatus status) {
  auto name = meshdispatch::v1::DeliveryStatus_Name(status);
  return name.substr(sizeof("DELIVERY_STATUS_") - 1);
}

static std::string StatusName(meshdispatch::v1::UnitStatus status) {
  auto name = meshdispatch::v1::UnitStatus_Name(status);
  return name.substr(sizeof("UNIT_STATUS_") - 1);
}

static void Print(const meshdispatch::v1::Delivery& d) {
  std::cout << "delivery=" << d.id() << " status=" << StatusName(d.status()) << " address=\"" << d.address() << "\"";
  if (d.has_coordinates()) {
    std::cout << " lat=" << d.coordinates().lat() << " lon=" << d.coordinates().lon();
  }
  if (!d.assigned_unit_id().empty()) {
    std::cout << " unit=" << d.assigned_unit_id();
  }
  if (!d.failure_reason().empty()) {
    std::cout << " reason=\"" << d.failure_reason() << "\"";
  }
  std::cout << " version=" << d.version() << "\n";
}

static void Print(const meshdispatch::v1::Unit& u) {
  std::cout << "unit=" << u.id() << " status=" << StatusName(u.status());
  if (u.assigned_delivery_id() != 0) {
    std::cout << " delivery=" << u.assigned_delivery_id();
  }
  if (u.has_last_position()) {
    std::cout << " lat=" << u.last_position().lat() << " lon=" << u.last_position().lon();
  }
  if (u.has_last_contact_at()) {
    std::cout << " last_contact=" << u.last_contact_at().seconds();
  }
  std::cout << "\n";
}

static std::string JoinArgs(int argc, char** argv, int first) {
  std::string out;
  for (int i = first; i < argc; ++i) {
    if (!out.empty()) out.push_back(' ');
    out += argv[i];
  }
  return out;
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = DispatchService::NewStub(channel);

  grpc::ClientContext ctx;

  try {
    // ------------------------------------------------------------

    if (cmd == "create") {
      if (argc < 4) return 1;

      CreateDeliveryRequest req;
      req.set_address(JoinArgs(argc, argv, 3));

      CreateDeliveryResponse resp;
      auto                   status = stub->CreateDelivery(&ctx, req, &resp);
      if (!status.ok()) {
        const auto& trailers = ctx.GetServerTrailingMetadata();
        auto        it       = trailers.find("meshdispatch-delivery-id");
        if (it != trailers.end()) {
          std::cerr << "created delivery " << std::string(it->second.data(), it->second.size()) << " without coordinates\n";
        }
        return Fail(status);
      }

      Print(resp.delivery());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "geocode" || cmd == "complete" || cmd == "reopen" || cmd == "delivery") {
      if (argc < 4) return 1;

      DeliveryRef req;
      req.set_delivery_id(std::stoll(argv[3]));

      DeliveryResponse resp;
      grpc::Status     status;
      if (cmd == "geocode") {
        status = stub->RetryGeocode(&ctx, req, &resp);
      } else if (cmd == "complete") {
        status = stub->ConfirmComplete(&ctx, req, &resp);
      } else if (cmd == "reopen") {
        status = stub->Reopen(&ctx, req, &resp);
      } else {
        status = stub->GetDelivery(&ctx, req, &resp);
      }
      if (!status.ok()) return Fail(status);

      Print(resp.delivery());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "assign") {
      if (argc < 5) return 1;

      AssignDeliveryRequest req;
      req.set_delivery_id(std::stoll(argv[3]));
      req.set_unit_id(argv[4]);

      DeliveryResponse resp;
      auto             status = stub->AssignDelivery(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      Print(resp.delivery());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "fail") {
      if (argc < 4) return 1;

      MarkFailedRequest req;
      req.set_delivery_id(std::stoll(argv[3]));
      req.set_reason(JoinArgs(argc, argv, 4));

      DeliveryResponse resp;
      auto             status = stub->MarkFailed(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      Print(resp.delivery());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "deliveries") {
      ListDeliveriesResponse resp;
      auto                   status = stub->ListDeliveries(&ctx, google::protobuf::Empty{}, &resp);
      if (!status.ok()) return Fail(status);

      for (const auto& d : resp.deliveries()) Print(d);
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "register" || cmd == "clear-error" || cmd == "unit") {
      if (argc < 4) return 1;

      UnitRef req;
      req.set_unit_id(argv[3]);

      UnitResponse resp;
      grpc::Status status;
      if (cmd == "register") {
        status = stub->RegisterUnit(&ctx, req, &resp);
      } else if (cmd == "clear-error") {
        status = stub->ClearUnitError(&ctx, req, &resp);
      } else {
        status = stub->GetUnit(&ctx, req, &resp);
      }
      if (!status.ok()) return Fail(status);

      Print(resp.unit());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "units") {
      ListUnitsResponse resp;
      auto              status = stub->ListUnits(&ctx, google::protobuf::Empty{}, &resp);
      if (!status.ok()) return Fail(status);

      for (const auto& u : resp.units()) Print(u);
      return 0;
    }
  } catch (const std::exception& e) {
    // std::stoll on a bad id
    std::cerr << "invalid argument: " << e.what() << "\n";
    return 1;
  }

  Usage();
  return 1;
}
