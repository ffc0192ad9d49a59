#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"
#include "support/dispatch_harness.hpp"

namespace {

using namespace std::chrono_literals;
using namespace meshdispatch::v1;
using meshdispatch::testing::DispatchHarness;
using meshdispatch::testing::kBase;
using meshdispatch::testing::kDowntown;
using meshdispatch::testing::kHarbor;

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

// Delivery assigned to Truck-01 with the assign frame on air.
std::int64_t AssignedDelivery(DispatchHarness& h, const std::string& unit_id = "Truck-01") {
  h.BringOnline(unit_id);
  const auto id = h.coordinator->CreateDelivery("Downtown Plaza 1").id;
  h.coordinator->AssignDelivery(id, unit_id);
  return id;
}

void TestScenarioCreateGeocodes() {
  DispatchHarness h;
  h.geocoder->Add("123 Main St", {40.7128, -74.0060});

  auto delivery = h.coordinator->CreateDelivery("123 Main St");
  assert(delivery.id > 0);
  assert(delivery.status == DELIVERY_STATUS_PENDING);
  assert(delivery.HasCoordinates());
  assert(*delivery.lat == 40.7128);
  assert(!delivery.assigned_unit_id.has_value());
  assert(delivery.created_at_ms == meshdispatch::util::ToUnixMillis(h.clock.Now()));
}

void TestScenarioAssignSendsOneFrame() {
  DispatchHarness h;
  h.BringOnline("Truck-01");
  const auto id = h.coordinator->CreateDelivery("Downtown Plaza 1").id;

  auto delivery = h.coordinator->AssignDelivery(id, "Truck-01");
  assert(delivery.status == DELIVERY_STATUS_ASSIGNED);
  assert(delivery.assigned_unit_id == std::string("Truck-01"));
  assert(h.UnitStatus("Truck-01") == UNIT_STATUS_ASSIGNED);
  assert(h.coordinator->GetUnit("Truck-01").assigned_delivery_id == id);
  assert(h.PendingAcks() == 1);
  assert(h.transport->SentCount() == 1);

  auto frame = h.LastSent();
  assert(frame.type() == "assign");
  assert(frame.delivery_id() == static_cast<std::uint32_t>(id));
  assert(frame.unit_id() == "Truck-01");
  assert(frame.lat() == kDowntown.lat);
  assert(frame.address() == "Downtown Plaza 1");
  assert(frame.has_distance_m());
  assert(frame.distance_m() > 2000.0 && frame.distance_m() < 2500.0);
  assert(frame.msg_id().size() == 16);
}

void TestScenarioAckExhaustionFailsDeliveryAndUnit() {
  DispatchHarness h;
  const auto      id = AssignedDelivery(h);

  for (int i = 0; i < 5; ++i) {
    h.Advance(45s);
    h.Tick();
  }

  assert(h.transport->SentCount() == 5);
  assert(h.PendingAcks() == 0);

  auto delivery = h.coordinator->GetDelivery(id);
  assert(delivery.status == DELIVERY_STATUS_FAILED);
  assert(!delivery.assigned_unit_id.has_value());
  assert(delivery.failure_reason.has_value());

  auto unit = h.coordinator->GetUnit("Truck-01");
  assert(unit.status == UNIT_STATUS_ERROR);
  assert(!unit.assigned_delivery_id.has_value());

  // a late ack changes nothing
  h.Ack("Truck-01", h.LastSent().msg_id());
  assert(h.DeliveryStatus(id) == DELIVERY_STATUS_FAILED);
}

void TestScenarioArrivalCompleteAndReturn() {
  DispatchHarness h;
  const auto      id = AssignedDelivery(h);
  h.Ack("Truck-01", h.LastSent().msg_id());
  assert(h.PendingAcks() == 0);
  assert(h.DeliveryStatus(id) == DELIVERY_STATUS_ASSIGNED);

  h.Telemetry("Truck-01", {kDowntown.lat + 0.0002, kDowntown.lon});
  auto delivery = h.coordinator->GetDelivery(id);
  assert(delivery.status == DELIVERY_STATUS_ARRIVED_DEST);
  assert(delivery.en_route_at_ms > 0);
  assert(delivery.arrived_at_ms > 0);
  assert(h.UnitStatus("Truck-01") == UNIT_STATUS_ARRIVED_DEST);

  delivery = h.coordinator->ConfirmComplete(id);
  assert(delivery.status == DELIVERY_STATUS_COMPLETED);
  assert(!delivery.assigned_unit_id.has_value());
  assert(delivery.completed_at_ms > 0);

  auto unit = h.coordinator->GetUnit("Truck-01");
  assert(unit.status == UNIT_STATUS_RETURNING);
  assert(!unit.assigned_delivery_id.has_value());

  auto frame = h.LastSent();
  assert(frame.type() == "complete");
  assert(frame.delivery_id() == static_cast<std::uint32_t>(id));
  assert(h.PendingAcks() == 1);
  h.Ack("Truck-01", frame.msg_id());
  assert(h.PendingAcks() == 0);

  h.Telemetry("Truck-01", kHarbor);
  assert(h.UnitStatus("Truck-01") == UNIT_STATUS_RETURNING);
  h.Telemetry("Truck-01", kBase);
  assert(h.UnitStatus("Truck-01") == UNIT_STATUS_IDLE);
}

void TestScenarioOfflineWhileEnRouteRestores() {
  DispatchHarness h;
  const auto      id = AssignedDelivery(h);
  h.Status("Truck-01", "en_route");
  assert(h.DeliveryStatus(id) == DELIVERY_STATUS_EN_ROUTE);
  assert(h.UnitStatus("Truck-01") == UNIT_STATUS_EN_ROUTE);

  h.Advance(4min);
  assert(h.coordinator->SweepOffline() == 0);
  h.Advance(2min);
  assert(h.coordinator->SweepOffline() == 1);

  auto unit = h.coordinator->GetUnit("Truck-01");
  assert(unit.status == UNIT_STATUS_OFFLINE);
  assert(!unit.assigned_delivery_id.has_value());
  auto delivery = h.coordinator->GetDelivery(id);
  assert(delivery.status == DELIVERY_STATUS_EN_ROUTE);
  assert(delivery.assigned_unit_id == std::string("Truck-01"));

  h.Telemetry("Truck-01", kHarbor);
  unit = h.coordinator->GetUnit("Truck-01");
  assert(unit.status == UNIT_STATUS_EN_ROUTE);
  assert(unit.assigned_delivery_id == id);
  assert(h.DeliveryStatus(id) == DELIVERY_STATUS_EN_ROUTE);
}

void TestDepartureCountsAsAcknowledgment() {
  DispatchHarness h;
  const auto      id = AssignedDelivery(h);
  assert(h.PendingAcks() == 1);

  h.Status("Truck-01", "en_route");
  assert(h.PendingAcks() == 0);
  assert(h.outbound->Armed() == 0);

  for (int i = 0; i < 6; ++i) {
    h.Advance(45s);
    h.Tick();
  }
  assert(h.transport->SentCount() == 1);
  assert(h.DeliveryStatus(id) == DELIVERY_STATUS_EN_ROUTE);
}

void TestGeocodeFailureStillCreates() {
  DispatchHarness h;

  std::int64_t failed_id = 0;
  try {
    h.coordinator->CreateDelivery("Unknown Lane 99");
    assert(false);
  } catch (const meshdispatch::util::GeocodeError& e) {
    failed_id = e.DeliveryId();
  }
  assert(failed_id > 0);

  auto delivery = h.coordinator->GetDelivery(failed_id);
  assert(delivery.status == DELIVERY_STATUS_PENDING);
  assert(!delivery.HasCoordinates());

  h.BringOnline("Truck-01");
  assert(Throws<meshdispatch::util::InvalidTransition>([&] { h.coordinator->AssignDelivery(failed_id, "Truck-01"); }));
  assert(h.UnitStatus("Truck-01") == UNIT_STATUS_IDLE);
  assert(h.transport->SentCount() == 0);

  assert(Throws<meshdispatch::util::GeocodeError>([&] { h.coordinator->RetryGeocode(failed_id); }));

  h.geocoder->Add("Unknown Lane 99", kHarbor);
  delivery = h.coordinator->RetryGeocode(failed_id);
  assert(delivery.HasCoordinates());
  assert(*delivery.lon == kHarbor.lon);

  h.coordinator->AssignDelivery(failed_id, "Truck-01");
  assert(h.DeliveryStatus(failed_id) == DELIVERY_STATUS_ASSIGNED);
}

void TestAssignGuards() {
  DispatchHarness h;
  const auto      first = AssignedDelivery(h);
  const auto      second = h.coordinator->CreateDelivery("Harbor Gate 7").id;
  h.BringOnline("Truck-02");

  assert(Throws<meshdispatch::util::UnitBusy>([&] { h.coordinator->AssignDelivery(second, "Truck-01"); }));
  assert(Throws<meshdispatch::util::InvalidTransition>([&] { h.coordinator->AssignDelivery(first, "Truck-02"); }));
  assert(Throws<meshdispatch::util::NotFound>([&] { h.coordinator->AssignDelivery(9999, "Truck-01"); }));
  assert(Throws<meshdispatch::util::NotFound>([&] { h.coordinator->AssignDelivery(second, "Ghost"); }));

  // registered but never heard from
  h.coordinator->RegisterUnit("Truck-03");
  assert(Throws<meshdispatch::util::UnitBusy>([&] { h.coordinator->AssignDelivery(second, "Truck-03"); }));

  assert(h.DeliveryStatus(second) == DELIVERY_STATUS_PENDING);
  assert(h.PendingAcks() == 1);
  assert(h.transport->SentCount() == 1);

  assert(Throws<std::invalid_argument>([&] { h.coordinator->CreateDelivery("   "); }));
}

void TestMarkFailedReleasesUnitToError() {
  DispatchHarness h;
  const auto      id = AssignedDelivery(h);

  auto delivery = h.coordinator->MarkFailed(id, "road closed");
  assert(delivery.status == DELIVERY_STATUS_FAILED);
  assert(*delivery.failure_reason == "road closed");
  assert(!delivery.assigned_unit_id.has_value());
  assert(h.UnitStatus("Truck-01") == UNIT_STATUS_ERROR);
  assert(h.PendingAcks() == 0);
  assert(h.outbound->Armed() == 0);

  assert(Throws<meshdispatch::util::InvalidTransition>([&] { h.coordinator->MarkFailed(id, "again"); }));
  assert(Throws<meshdispatch::util::InvalidTransition>([&] { h.coordinator->ConfirmComplete(id); }));

  const auto pending = h.coordinator->CreateDelivery("Harbor Gate 7").id;
  assert(Throws<meshdispatch::util::InvalidTransition>([&] { h.coordinator->MarkFailed(pending, "nope"); }));

  assert(Throws<meshdispatch::util::UnitBusy>([&] { h.coordinator->AssignDelivery(pending, "Truck-01"); }));

  auto unit = h.coordinator->ClearUnitError("Truck-01");
  assert(unit.status == UNIT_STATUS_IDLE);
  assert(Throws<meshdispatch::util::InvalidTransition>([&] { h.coordinator->ClearUnitError("Truck-01"); }));
  h.coordinator->AssignDelivery(pending, "Truck-01");
}

void TestReopenClearsAssignment() {
  DispatchHarness h;
  const auto      id = AssignedDelivery(h);
  h.coordinator->MarkFailed(id, "customer absent");

  auto delivery = h.coordinator->Reopen(id);
  assert(delivery.status == DELIVERY_STATUS_PENDING);
  assert(!delivery.assigned_unit_id.has_value());
  assert(!delivery.failure_reason.has_value());
  assert(delivery.assigned_at_ms == 0);
  assert(delivery.HasCoordinates());

  assert(Throws<meshdispatch::util::InvalidTransition>([&] { h.coordinator->Reopen(id); }));
}

void TestArrivalChecks() {
  DispatchHarness h;
  const auto      id = AssignedDelivery(h);
  h.BringOnline("Truck-02");

  // wrong unit
  h.Arrival("Truck-02", id);
  assert(h.DeliveryStatus(id) == DELIVERY_STATUS_ASSIGNED);

  // reported away from the destination
  h.coordinator->Ingest(R"({"type":"arrival","unit_id":"Truck-01","delivery_id":)" + std::to_string(id) + R"(,"lat":52.51,"lon":13.39})");
  assert(h.DeliveryStatus(id) == DELIVERY_STATUS_ASSIGNED);

  h.Arrival("Truck-01", id);
  assert(h.DeliveryStatus(id) == DELIVERY_STATUS_ARRIVED_DEST);
  assert(h.UnitStatus("Truck-01") == UNIT_STATUS_ARRIVED_DEST);
  const auto version = h.coordinator->GetDelivery(id).version;

  h.Arrival("Truck-01", id);
  assert(h.coordinator->GetDelivery(id).version == version);
}

void TestTelemetryNeverResurrectsTerminalDelivery() {
  DispatchHarness h;
  const auto      id = AssignedDelivery(h);
  h.coordinator->MarkFailed(id, "cancelled");

  h.Telemetry("Truck-01", kDowntown);
  h.Arrival("Truck-01", id);
  assert(h.DeliveryStatus(id) == DELIVERY_STATUS_FAILED);

  auto unit = h.coordinator->GetUnit("Truck-01");
  assert(unit.last_lat.has_value());
  assert(*unit.last_lat == kDowntown.lat);
}

void TestCompletionAckExhaustionFaultsUnitOnly() {
  DispatchHarness h;
  const auto      id = AssignedDelivery(h);
  h.Arrival("Truck-01", id);
  h.coordinator->ConfirmComplete(id);

  for (int i = 0; i < 5; ++i) {
    h.Advance(45s);
    h.Tick();
  }

  assert(h.DeliveryStatus(id) == DELIVERY_STATUS_COMPLETED);
  assert(h.UnitStatus("Truck-01") == UNIT_STATUS_ERROR);
  assert(h.PendingAcks() == 0);
}

void TestDuplicateAckChangesNothing() {
  DispatchHarness h;
  AssignedDelivery(h);
  const auto msg_id = h.LastSent().msg_id();
  h.Ack("Truck-01", msg_id);

  h.Advance(30s);
  const auto before = h.coordinator->GetUnit("Truck-01");

  h.Ack("Truck-01", msg_id);
  h.Ack("Ghost-99", msg_id);
  h.Ack("Ghost-99", "0123456789abcdef");

  auto units = h.coordinator->ListUnits();
  assert(units.size() == 1);
  assert(units[0].id == "Truck-01");
  assert(units[0].version == before.version);
  assert(units[0].last_contact_ms == before.last_contact_ms);
}

void TestAckCreditsTheAddressedUnit() {
  DispatchHarness h;
  AssignedDelivery(h);
  const auto version = h.coordinator->GetUnit("Truck-01").version;

  // relayed by a neighbour that put its own id on the frame
  h.Advance(10s);
  h.Ack("Relay-5", h.LastSent().msg_id());

  assert(h.PendingAcks() == 0);
  assert(h.coordinator->ListUnits().size() == 1);
  auto unit = h.coordinator->GetUnit("Truck-01");
  assert(unit.version > version);
  assert(unit.last_contact_ms == meshdispatch::util::ToUnixMillis(h.clock.Now()));
}

void TestReturnToBaseRetiresCompletionFrame() {
  DispatchHarness h;
  const auto      id = AssignedDelivery(h);
  h.Arrival("Truck-01", id);
  h.coordinator->ConfirmComplete(id);
  assert(h.PendingAcks() == 1);

  h.Telemetry("Truck-01", kBase);
  assert(h.UnitStatus("Truck-01") == UNIT_STATUS_IDLE);
  assert(h.PendingAcks() == 0);
  assert(h.outbound->Armed() == 0);

  const auto sent = h.transport->SentCount();
  for (int i = 0; i < 10; ++i) {
    h.Advance(10min);
    h.Tick();
  }
  assert(h.transport->SentCount() == sent);
  assert(h.UnitStatus("Truck-01") == UNIT_STATUS_IDLE);

  const auto next = h.coordinator->CreateDelivery("Harbor Gate 7").id;
  assert(h.coordinator->AssignDelivery(next, "Truck-01").status == DELIVERY_STATUS_ASSIGNED);
}

void TestOfflineUnitCompletedReturnsAsReturning() {
  DispatchHarness h;
  const auto      id = AssignedDelivery(h);
  h.Arrival("Truck-01", id);

  h.Advance(6min);
  assert(h.coordinator->SweepOffline() == 1);
  h.coordinator->ConfirmComplete(id);
  assert(h.UnitStatus("Truck-01") == UNIT_STATUS_OFFLINE);

  h.Status("Truck-01", "returning");
  assert(h.UnitStatus("Truck-01") == UNIT_STATUS_RETURNING);
  h.Status("Truck-01", "idle");
  assert(h.UnitStatus("Truck-01") == UNIT_STATUS_IDLE);
  assert(h.PendingAcks() == 0);
}

void TestMalformedAndUnexpectedFramesAreDropped() {
  DispatchHarness h;
  h.BringOnline("Truck-01");
  const auto before = h.coordinator->GetUnit("Truck-01").version;

  h.coordinator->Ingest("");
  h.coordinator->Ingest("{{{{");
  h.coordinator->Ingest(R"({"type":"telemetry","unit_id":"Truck-01","lat":"north","lon":1})");
  h.coordinator->Ingest(R"({"type":"warp","unit_id":"Truck-01"})");
  h.coordinator->Ingest(R"({"type":"assign","msg_id":"abc","delivery_id":1,"unit_id":"Truck-01"})");
  h.coordinator->Ingest(R"({"type":"arrival","unit_id":"Truck-01","delivery_id":4242})");
  h.coordinator->Ingest(R"({"type":"ack","msg_id":"ffffffffffffffff"})");

  assert(h.UnitStatus("Truck-01") == UNIT_STATUS_IDLE);
  assert(h.coordinator->GetUnit("Truck-01").version >= before);
  assert(h.coordinator->ListDeliveries().empty());
}

void TestUnknownUnitRegistersOnFirstContact() {
  DispatchHarness h;
  h.Telemetry("Scout-9", kHarbor);

  auto unit = h.coordinator->GetUnit("Scout-9");
  assert(unit.status == UNIT_STATUS_IDLE);
  assert(*unit.last_lon == kHarbor.lon);
  assert(unit.last_contact_ms == meshdispatch::util::ToUnixMillis(h.clock.Now()));

  assert(Throws<meshdispatch::util::AlreadyExists>([&] { h.coordinator->RegisterUnit("Scout-9"); }));
  assert(h.coordinator->ListUnits().size() == 1);
}

void TestIdleUnitsAreNotSweptOffline() {
  DispatchHarness h;
  h.BringOnline("Truck-01");
  h.Advance(1h);
  assert(h.coordinator->SweepOffline() == 0);
  assert(h.UnitStatus("Truck-01") == UNIT_STATUS_IDLE);
}

} // namespace

int main() {
  TestScenarioCreateGeocodes();
  TestScenarioAssignSendsOneFrame();
  TestScenarioAckExhaustionFailsDeliveryAndUnit();
  TestScenarioArrivalCompleteAndReturn();
  TestScenarioOfflineWhileEnRouteRestores();
  TestDepartureCountsAsAcknowledgment();
  TestGeocodeFailureStillCreates();
  TestAssignGuards();
  TestMarkFailedReleasesUnitToError();
  TestReopenClearsAssignment();
  TestArrivalChecks();
  TestTelemetryNeverResurrectsTerminalDelivery();
  TestCompletionAckExhaustionFaultsUnitOnly();
  TestDuplicateAckChangesNothing();
  TestAckCreditsTheAddressedUnit();
  TestReturnToBaseRetiresCompletionFrame();
  TestOfflineUnitCompletedReturnsAsReturning();
  TestMalformedAndUnexpectedFramesAreDropped();
  TestUnknownUnitRegistersOnFirstContact();
  TestIdleUnitsAreNotSweptOffline();

  std::cout << "meshdispatch_unit_dispatch_coordinator: pass\n";
  return 0;
}
