#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <map>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/model/delivery_state.hpp"
#include "internal/model/unit_state.hpp"
#include "internal/util/errors.hpp"
#include "support/dispatch_harness.hpp"

namespace {

using namespace std::chrono_literals;
using namespace meshdispatch::v1;
using meshdispatch::testing::DispatchHarness;
using meshdispatch::testing::kBase;
using meshdispatch::testing::kDowntown;
using meshdispatch::testing::kHarbor;

const std::vector<std::string> kUnits{"Truck-01", "Truck-02", "Truck-03"};
const std::vector<std::string> kAddresses{"Downtown Plaza 1", "Harbor Gate 7", "Nowhere Street 0"};
const std::vector<std::string> kReports{"en_route", "idle", "returning", "error", "bogus"};

void CheckInvariants(DispatchHarness& h, std::size_t step) {
  const auto deliveries = h.coordinator->ListDeliveries();
  const auto units      = h.coordinator->ListUnits();

  std::map<std::string, std::int64_t> holder;
  std::map<std::int64_t, meshdispatch::db::model::DeliveryRecord> by_id;
  for (const auto& d : deliveries) {
    by_id[d.id] = d;

    // a delivery holds a unit exactly while it is active
    if (meshdispatch::model::IsActive(d.status) != d.assigned_unit_id.has_value()) {
      std::cerr << "step " << step << ": delivery " << d.id << " assignment does not match status\n";
      assert(false);
    }
    if (d.assigned_unit_id) {
      // no unit serves two deliveries
      assert(holder.find(*d.assigned_unit_id) == holder.end());
      holder[*d.assigned_unit_id] = d.id;
    }
    if (d.status != DELIVERY_STATUS_PENDING) {
      assert(d.HasCoordinates());
    }
  }

  for (const auto& u : units) {
    if (u.assigned_delivery_id) {
      assert(!meshdispatch::model::IsUnassignedStatus(u.status));
      auto it = by_id.find(*u.assigned_delivery_id);
      assert(it != by_id.end());
      assert(it->second.assigned_unit_id == u.id);
    }
    if (u.status != UNIT_STATUS_OFFLINE) {
      assert(u.status_before_offline == UNIT_STATUS_UNSPECIFIED);
    }
    if (u.status == UNIT_STATUS_ASSIGNED || u.status == UNIT_STATUS_EN_ROUTE || u.status == UNIT_STATUS_ARRIVED_DEST) {
      assert(holder.count(u.id) == 1);
    }
  }

  // stored messages and armed deadlines agree
  assert(h.PendingAcks() == h.outbound->Armed());
}

void RunSequence(unsigned seed, std::size_t steps) {
  DispatchHarness h;
  std::mt19937    rng(seed);

  auto pick = [&](std::size_t n) { return std::uniform_int_distribution<std::size_t>(0, n - 1)(rng); };
  auto some_delivery = [&]() -> std::int64_t {
    auto all = h.coordinator->ListDeliveries();
    if (all.empty()) return 1;
    return all[pick(all.size())].id;
  };

  for (const auto& unit : kUnits) {
    h.BringOnline(unit);
  }

  for (std::size_t step = 0; step < steps; ++step) {
    const auto& unit = kUnits[pick(kUnits.size())];
    try {
      switch (pick(12)) {
        case 0:
          h.coordinator->CreateDelivery(kAddresses[pick(kAddresses.size())]);
          break;
        case 1:
        case 2:
          h.coordinator->AssignDelivery(some_delivery(), unit);
          break;
        case 3:
          h.coordinator->ConfirmComplete(some_delivery());
          break;
        case 4:
          h.coordinator->MarkFailed(some_delivery(), "dispatcher");
          break;
        case 5:
          h.coordinator->Reopen(some_delivery());
          break;
        case 6: {
          const std::vector<meshdispatch::util::LatLon> spots{kBase, kDowntown, kHarbor};
          h.Telemetry(unit, spots[pick(spots.size())]);
          break;
        }
        case 7:
          h.Status(unit, kReports[pick(kReports.size())]);
          break;
        case 8:
          h.Arrival(unit, some_delivery());
          break;
        case 9:
          if (h.transport->SentCount() > 0) {
            h.Ack(unit, h.LastSent().msg_id());
          }
          break;
        case 10:
          h.Advance(std::chrono::seconds(pick(120)));
          h.Tick();
          break;
        case 11:
          h.Advance(std::chrono::seconds(pick(400)));
          h.coordinator->SweepOffline();
          if (pick(2) == 0) {
            h.coordinator->ClearUnitError(unit);
          }
          break;
      }
    } catch (const meshdispatch::util::InvalidTransition&) {
    } catch (const meshdispatch::util::UnitBusy&) {
    } catch (const meshdispatch::util::NotFound&) {
    } catch (const meshdispatch::util::GeocodeError&) {
    }
    CheckInvariants(h, step);
  }
}

void RunConcurrentDispatchAndRadio(std::size_t rounds) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  const auto path  = (std::filesystem::temp_directory_path() / ("meshdispatch_race_" + std::to_string(stamp) + ".db")).string();
  {
    auto db = std::make_shared<meshdispatch::db::sqlite::SqliteDB>(path);
    meshdispatch::db::sqlite::BootstrapSchema(*db);
    DispatchHarness h(std::make_shared<meshdispatch::db::sqlite::SqliteRepository>(std::move(db)));
    h.BringOnline("Truck-01");

    // dispatcher thread
    std::thread dispatcher([&] {
      for (std::size_t i = 0; i < rounds; ++i) {
        try {
          const auto id = h.coordinator->CreateDelivery("Downtown Plaza 1").id;
          h.coordinator->AssignDelivery(id, "Truck-01");
          if (i % 3 == 0) {
            h.coordinator->MarkFailed(id, "dispatcher");
            h.coordinator->ClearUnitError("Truck-01");
          } else {
            h.coordinator->ConfirmComplete(id);
          }
        } catch (const meshdispatch::util::InvalidTransition&) {
        } catch (const meshdispatch::util::UnitBusy&) {
        }
      }
    });

    // the unit driving itself through its lifecycle over the radio
    std::thread radio([&] {
      for (std::size_t i = 0; i < rounds * 5; ++i) {
        switch (i % 5) {
          case 0:
            if (h.transport->SentCount() > 0) {
              h.Ack("Truck-01", h.LastSent().msg_id());
            }
            break;
          case 1:
            h.Status("Truck-01", "en_route");
            break;
          case 2:
            h.Telemetry("Truck-01", kDowntown);
            break;
          case 3:
            h.Telemetry("Truck-01", kBase);
            break;
          case 4:
            h.Status("Truck-01", "idle");
            break;
        }
      }
    });

    dispatcher.join();
    radio.join();

    // every stored message is armed; a deadline armed after a racing
    // ack retired its row lingers until it fires
    assert(h.outbound->Armed() >= h.PendingAcks());
    h.Advance(46s);
    h.Tick();
    CheckInvariants(h, rounds);
  }
  std::filesystem::remove(path);
  std::filesystem::remove(path + "-wal");
  std::filesystem::remove(path + "-shm");
}

} // namespace

int main() {
  for (unsigned seed = 1; seed <= 20; ++seed) {
    RunSequence(seed, 400);
  }
  RunConcurrentDispatchAndRadio(150);

  std::cout << "meshdispatch_unit_dispatch_invariants: pass\n";
  return 0;
}
