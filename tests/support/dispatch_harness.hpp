#pragma once

#include <cassert>
#include <chrono>
#include <memory>
#include <sstream>
#include <string>

#include "internal/codec/envelope_codec.hpp"
#include "internal/core/dispatch_coordinator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/geocode/static_geocoder.hpp"
#include "internal/reliable/reliable_outbound.hpp"
#include "internal/util/time.hpp"
#include "support/fake_transport.hpp"

namespace meshdispatch::testing {

// Depot and two destinations roughly 1 km apart.
inline constexpr util::LatLon kBase{52.5000, 13.4000};
inline constexpr util::LatLon kDowntown{52.5200, 13.4050};
inline constexpr util::LatLon kHarbor{52.5100, 13.3900};

/*
  Coordinator wired to an in-memory store, a fake radio and a manual
  clock. Time only moves through Advance(); Tick() drives the retry
  scheduler the way the background task does.
*/
struct DispatchHarness {
  std::shared_ptr<db::Repository>             repository;
  std::shared_ptr<FakeTransport>              transport = std::make_shared<FakeTransport>();
  util::ManualClock                           clock;
  std::shared_ptr<geocode::StaticGeocoder>    geocoder = std::make_shared<geocode::StaticGeocoder>();
  std::shared_ptr<reliable::ReliableOutbound> outbound;
  std::shared_ptr<core::DispatchCoordinator>  coordinator;

  explicit DispatchHarness(std::shared_ptr<db::Repository> repo = std::make_shared<db::memory::MemoryRepository>(),
                           reliable::RetryPolicy policy = {}) : repository(std::move(repo)) {
    geocoder->Add("Downtown Plaza 1", kDowntown);
    geocoder->Add("Harbor Gate 7", kHarbor);

    core::CoordinatorOptions options;
    options.arrival_proximity_m = 50.0;
    options.base                = kBase;
    options.offline_timeout     = std::chrono::minutes(5);

    outbound    = std::make_shared<reliable::ReliableOutbound>(repository, transport, policy, clock);
    coordinator = std::make_shared<core::DispatchCoordinator>(repository, outbound, geocoder, clock, options);
  }

  void Advance(std::chrono::milliseconds delta) {
    clock.Advance(delta);
  }

  void Tick() {
    outbound->Tick();
  }

  // Unit id registered and online at the depot.
  void BringOnline(const std::string& unit_id, util::LatLon at = kBase) {
    coordinator->RegisterUnit(unit_id);
    Telemetry(unit_id, at);
  }

  void Telemetry(const std::string& unit_id, util::LatLon at) {
    std::ostringstream frame;
    frame.precision(10);
    frame << R"({"type":"telemetry","unit_id":")" << unit_id << R"(","lat":)" << at.lat << R"(,"lon":)" << at.lon << "}";
    coordinator->Ingest(frame.str());
  }

  void Status(const std::string& unit_id, const std::string& status) {
    coordinator->Ingest(R"({"type":"status","unit_id":")" + unit_id + R"(","status":")" + status + R"("})");
  }

  void Arrival(const std::string& unit_id, std::int64_t delivery_id) {
    coordinator->Ingest(R"({"type":"arrival","unit_id":")" + unit_id + R"(","delivery_id":)" + std::to_string(delivery_id) + "}");
  }

  void Ack(const std::string& unit_id, const std::string& msg_id) {
    coordinator->Ingest(codec::EnvelopeCodec::Encode(codec::EnvelopeCodec::MakeAck(msg_id, unit_id)));
  }

  meshdispatch::v1::Envelope LastSent() const {
    auto sent = transport->Sent();
    assert(!sent.empty());
    return codec::EnvelopeCodec::Decode(sent.back());
  }

  std::size_t PendingAcks() {
    auto tx   = repository->Begin();
    auto rows = repository->ListPendingAcks(*tx);
    tx->Commit();
    return rows.size();
  }

  meshdispatch::v1::DeliveryStatus DeliveryStatus(std::int64_t delivery_id) {
    return coordinator->GetDelivery(delivery_id).status;
  }

  meshdispatch::v1::UnitStatus UnitStatus(const std::string& unit_id) {
    return coordinator->GetUnit(unit_id).status;
  }
};

} // namespace meshdispatch::testing
