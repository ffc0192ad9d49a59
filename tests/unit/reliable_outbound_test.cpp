#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/reliable/reliable_outbound.hpp"
#include "internal/util/time.hpp"
#include "support/fake_transport.hpp"

namespace {

using namespace std::chrono_literals;
using meshdispatch::db::model::PendingAckKind;
using meshdispatch::db::model::PendingAckRecord;
using meshdispatch::reliable::ReliableOutbound;
using meshdispatch::reliable::RetryPolicy;
using meshdispatch::testing::FakeTransport;

struct Harness {
  std::shared_ptr<meshdispatch::db::memory::MemoryRepository> repository = std::make_shared<meshdispatch::db::memory::MemoryRepository>();
  std::shared_ptr<FakeTransport>                             transport  = std::make_shared<FakeTransport>();
  meshdispatch::util::ManualClock                            clock;
  std::int64_t                                               delivery_id = 0;

  Harness() {
    auto                                    tx = repository->Begin();
    meshdispatch::db::model::DeliveryRecord delivery;
    delivery.address = "Depot Road 1";
    const auto inserted = repository->InsertDelivery(*tx, delivery);
    assert(inserted);
    tx->Commit();
    delivery_id = delivery.id;
  }

  std::unique_ptr<ReliableOutbound> MakeOutbound(RetryPolicy policy = {}) {
    return std::make_unique<ReliableOutbound>(repository, transport, policy, clock);
  }

  std::size_t StoredAcks() {
    auto tx   = repository->Begin();
    auto rows = repository->ListPendingAcks(*tx);
    tx->Commit();
    return rows.size();
  }

  std::optional<PendingAckRecord> Stored(const std::string& msg_id) {
    auto tx  = repository->Begin();
    auto row = repository->GetPendingAck(*tx, msg_id);
    tx->Commit();
    return row;
  }
};

ReliableOutbound::FrameBuilder Frame(const std::string& body) {
  return [body](const std::string& msg_id) { return "{\"msg_id\":\"" + msg_id + "\",\"body\":\"" + body + "\"}"; };
}

void TestSendPersistsBeforeTransmitting() {
  Harness h;
  auto    outbound = h.MakeOutbound();

  auto record = outbound->SendReliable("U-1", h.delivery_id, PendingAckKind::kAssign, Frame("go"));

  assert(record.msg_id.size() == 16);
  assert(record.attempts == 1);
  assert(record.next_retry_ms == meshdispatch::util::ToUnixMillis(h.clock.Now() + 45s));
  assert(h.transport->SentCount() == 1);
  assert(h.transport->Sent()[0].find(record.msg_id) != std::string::npos);
  assert(h.StoredAcks() == 1);
  assert(outbound->Armed() == 1);
}

void TestRetransmitsSameFrameUntilExhausted() {
  Harness h;
  auto    outbound = h.MakeOutbound();

  std::vector<PendingAckRecord> exhausted;
  outbound->SetExhaustionHandler([&](meshdispatch::db::Transaction&, const PendingAckRecord& r) { exhausted.push_back(r); });

  auto record = outbound->SendReliable("U-1", h.delivery_id, PendingAckKind::kAssign, Frame("go"));

  h.clock.Advance(44s);
  outbound->Tick();
  assert(h.transport->SentCount() == 1);

  for (int attempt = 2; attempt <= 5; ++attempt) {
    h.clock.Advance(1s);
    outbound->Tick();
    assert(h.transport->SentCount() == static_cast<std::size_t>(attempt));
    assert(h.Stored(record.msg_id)->attempts == static_cast<std::uint32_t>(attempt));
    h.clock.Advance(44s);
  }

  auto sent = h.transport->Sent();
  for (const auto& frame : sent) {
    assert(frame == sent.front());
  }
  assert(exhausted.empty());

  h.clock.Advance(1s);
  outbound->Tick();

  assert(h.transport->SentCount() == 5);
  assert(exhausted.size() == 1);
  assert(exhausted[0].msg_id == record.msg_id);
  assert(exhausted[0].attempts == 5);
  assert(h.StoredAcks() == 0);
  assert(outbound->Armed() == 0);

  h.clock.Advance(10min);
  outbound->Tick();
  assert(h.transport->SentCount() == 5);
  assert(exhausted.size() == 1);
}

void TestAckStopsRetriesAndDuplicateAckIsNoop() {
  Harness h;
  auto    outbound = h.MakeOutbound();

  int exhausted = 0;
  outbound->SetExhaustionHandler([&](meshdispatch::db::Transaction&, const PendingAckRecord&) { ++exhausted; });

  auto record = outbound->SendReliable("U-1", h.delivery_id, PendingAckKind::kComplete, Frame("done"));

  auto retired = outbound->OnAck(record.msg_id);
  assert(retired.has_value());
  assert(retired->unit_id == "U-1");
  assert(retired->kind == PendingAckKind::kComplete);
  assert(!outbound->OnAck(record.msg_id).has_value());
  assert(!outbound->OnAck("0000000000000000").has_value());

  h.clock.Advance(1h);
  outbound->Tick();
  assert(h.transport->SentCount() == 1);
  assert(exhausted == 0);
  assert(h.StoredAcks() == 0);
}

void TestFailedSendStillCountsAsAttempt() {
  Harness h;
  auto    outbound = h.MakeOutbound();

  h.transport->SetResult(meshdispatch::transport::SendResult::kDisconnected);
  auto record = outbound->SendReliable("U-1", h.delivery_id, PendingAckKind::kAssign, Frame("go"));
  assert(h.Stored(record.msg_id)->attempts == 1);

  h.transport->SetResult(meshdispatch::transport::SendResult::kSent);
  h.clock.Advance(45s);
  outbound->Tick();
  assert(h.Stored(record.msg_id)->attempts == 2);
  assert(h.transport->SentCount() == 2);
}

void TestExponentialScheduleFollowsPolicy() {
  Harness     h;
  RetryPolicy policy;
  policy.backoff = RetryPolicy::Backoff::kExponential;
  policy.base    = 10s;
  auto outbound  = h.MakeOutbound(policy);

  auto record = outbound->SendReliable("U-1", h.delivery_id, PendingAckKind::kAssign, Frame("go"));
  h.clock.Advance(10s);
  outbound->Tick();
  assert(h.Stored(record.msg_id)->next_retry_ms == meshdispatch::util::ToUnixMillis(h.clock.Now() + 20s));

  h.clock.Advance(19s);
  outbound->Tick();
  assert(h.transport->SentCount() == 2);
  h.clock.Advance(1s);
  outbound->Tick();
  assert(h.transport->SentCount() == 3);
}

void TestRestartResumesAttemptCount() {
  Harness     h;
  std::string msg_id;
  {
    auto outbound = h.MakeOutbound();
    msg_id        = outbound->SendReliable("U-1", h.delivery_id, PendingAckKind::kAssign, Frame("go")).msg_id;
    h.clock.Advance(45s);
    outbound->Tick();
    assert(h.Stored(msg_id)->attempts == 2);
  }

  // process restarts; the store survives
  h.clock.Advance(2min);
  auto restarted = h.MakeOutbound();
  assert(restarted->Recover() == 1);
  assert(restarted->Armed() == 1);

  restarted->Tick();
  assert(h.Stored(msg_id)->attempts == 3);
  assert(h.transport->SentCount() == 3);

  for (int i = 0; i < 2; ++i) {
    h.clock.Advance(45s);
    restarted->Tick();
  }
  assert(h.Stored(msg_id)->attempts == 5);

  h.clock.Advance(45s);
  restarted->Tick();
  assert(!h.Stored(msg_id).has_value());
  assert(h.transport->SentCount() == 5);
}

void TestFailingExhaustionHandlerKeepsMessage() {
  Harness     h;
  RetryPolicy policy;
  policy.max_attempts = 1;
  auto outbound       = h.MakeOutbound(policy);

  bool fail = true;
  int  calls = 0;
  outbound->SetExhaustionHandler([&](meshdispatch::db::Transaction&, const PendingAckRecord&) {
    ++calls;
    if (fail) {
      throw std::runtime_error("store unavailable");
    }
  });

  auto record = outbound->SendReliable("U-1", h.delivery_id, PendingAckKind::kAssign, Frame("go"));
  h.clock.Advance(45s);
  outbound->Tick();
  assert(calls == 1);
  assert(h.Stored(record.msg_id).has_value());
  assert(outbound->Armed() == 1);

  fail = false;
  h.clock.Advance(45s);
  outbound->Tick();
  assert(calls == 2);
  assert(!h.Stored(record.msg_id).has_value());
}

void TestCancelForDeliveryFiltersByKind() {
  Harness h;
  auto    outbound = h.MakeOutbound();

  auto assign   = outbound->SendReliable("U-1", h.delivery_id, PendingAckKind::kAssign, Frame("go"));
  auto complete = outbound->SendReliable("U-1", h.delivery_id, PendingAckKind::kComplete, Frame("done"));

  std::vector<std::string> cancelled;
  {
    auto tx   = h.repository->Begin();
    cancelled = outbound->CancelForDelivery(*tx, h.delivery_id, PendingAckKind::kAssign);
    tx->Commit();
  }
  outbound->Disarm(cancelled);

  assert(cancelled.size() == 1);
  assert(cancelled[0] == assign.msg_id);
  assert(!h.Stored(assign.msg_id).has_value());
  assert(h.Stored(complete.msg_id).has_value());
  assert(outbound->Armed() == 1);
  assert(!outbound->OnAck(assign.msg_id).has_value());
}

} // namespace

int main() {
  TestSendPersistsBeforeTransmitting();
  TestRetransmitsSameFrameUntilExhausted();
  TestAckStopsRetriesAndDuplicateAckIsNoop();
  TestFailedSendStillCountsAsAttempt();
  TestExponentialScheduleFollowsPolicy();
  TestRestartResumesAttemptCount();
  TestFailingExhaustionHandlerKeepsMessage();
  TestCancelForDeliveryFiltersByKind();

  std::cout << "meshdispatch_unit_reliable_outbound: pass\n";
  return 0;
}
