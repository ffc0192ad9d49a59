#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <vector>

#include "internal/geocode/retrying_geocoder.hpp"
#include "internal/geocode/static_geocoder.hpp"

namespace {

using namespace std::chrono_literals;
using namespace meshdispatch::geocode;

// Fails with kUnavailable a fixed number of times, then answers.
class FlakyGeocoder final : public Geocoder {
 public:
  explicit FlakyGeocoder(int failures, GeocodeResult answer) : failures_(failures), answer_(std::move(answer)) {
  }

  GeocodeResult Resolve(const std::string&) override {
    ++calls;
    if (failures_ > 0) {
      --failures_;
      return GeocodeResult::Unavailable("backend timeout");
    }
    return answer_;
  }

  int calls = 0;

 private:
  int           failures_;
  GeocodeResult answer_;
};

void TestGazetteerLookupIsNormalized() {
  meshdispatch::runtime::config::GeocoderConfig config;
  auto* entry = config.add_gazetteer();
  entry->set_address("Hauptstrasse 5,  Dorf");
  entry->set_lat(48.1);
  entry->set_lon(11.5);

  StaticGeocoder geocoder(config);
  auto           result = geocoder.Resolve("  hauptstrasse 5, DORF ");
  assert(result.Ok());
  assert(result.coordinates->lat == 48.1);

  assert(geocoder.Resolve("Nowhere 1").status == GeocodeStatus::kNotFound);
}

void TestLiteralCoordinates() {
  StaticGeocoder geocoder;
  auto           result = geocoder.Resolve("52.5200, 13.4050");
  assert(result.Ok());
  assert(result.coordinates->lon == 13.405);

  assert(!geocoder.Resolve("95.0, 13.4").Ok());
  assert(!geocoder.Resolve("52.5 north, 13.4").Ok());
}

void TestRetriesTransientFailuresWithBackoff() {
  auto                                   flaky = std::make_shared<FlakyGeocoder>(2, GeocodeResult::Found({1.0, 2.0}));
  std::vector<std::chrono::milliseconds> sleeps;
  RetryingGeocoder geocoder(flaky, 3, 100ms, [&](std::chrono::milliseconds d) { sleeps.push_back(d); });

  auto result = geocoder.Resolve("x");
  assert(result.Ok());
  assert(flaky->calls == 3);
  assert(sleeps.size() == 2);
  assert(sleeps[0] == 100ms);
  assert(sleeps[1] == 200ms);
}

void TestGivesUpAfterAttempts() {
  auto             flaky = std::make_shared<FlakyGeocoder>(10, GeocodeResult::Found({1.0, 2.0}));
  int              slept = 0;
  RetryingGeocoder geocoder(flaky, 3, 1ms, [&](std::chrono::milliseconds) { ++slept; });

  auto result = geocoder.Resolve("x");
  assert(result.status == GeocodeStatus::kUnavailable);
  assert(flaky->calls == 3);
  assert(slept == 2);
}

void TestNotFoundIsNotRetried() {
  auto             flaky = std::make_shared<FlakyGeocoder>(0, GeocodeResult::NotFound("no match"));
  RetryingGeocoder geocoder(flaky, 3, 1ms, [](std::chrono::milliseconds) {});

  auto result = geocoder.Resolve("x");
  assert(result.status == GeocodeStatus::kNotFound);
  assert(flaky->calls == 1);
}

} // namespace

int main() {
  TestGazetteerLookupIsNormalized();
  TestLiteralCoordinates();
  TestRetriesTransientFailuresWithBackoff();
  TestGivesUpAfterAttempts();
  TestNotFoundIsNotRetried();

  std::cout << "meshdispatch_unit_geocoder: pass\n";
  return 0;
}
