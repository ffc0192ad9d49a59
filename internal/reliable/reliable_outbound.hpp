#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/reliable/retry_policy.hpp"
#include "internal/reliable/retry_scheduler.hpp"
#include "internal/transport/transport.hpp"
#include "internal/util/time.hpp"

namespace meshdispatch::reliable {

std::string_view ToString(db::model::PendingAckKind kind);

/*
  Acknowledged delivery of critical outbound frames.

  Sole owner of the pending_acks table. Every message is durable before
  it is sent and is removed exactly once, either by its ACK or by
  exhaustion; both removals are a delete inside a store transaction and
  the loser of a race sees NotFound and does nothing.

  Transport sends never happen inside a store transaction.
*/
class ReliableOutbound {
 public:
  // Builds the wire frame once the msg_id is known.
  using FrameBuilder = std::function<std::string(const std::string& msg_id)>;

  // Runs inside the transaction that deletes the exhausted row.
  // Must not open another transaction or send.
  using ExhaustionHandler = std::function<void(db::Transaction&, const db::model::PendingAckRecord&)>;

  ReliableOutbound(std::shared_ptr<db::Repository> repository, std::shared_ptr<transport::Transport> transport, RetryPolicy policy,
                   const util::Clock& clock);

  void SetExhaustionHandler(ExhaustionHandler handler);

  // Persists a new PendingAck inside the caller's transaction. The row
  // commits or rolls back with the caller's state transition.
  db::model::PendingAckRecord Stage(db::Transaction& tx, const std::string& unit_id, std::int64_t delivery_id, db::model::PendingAckKind kind,
                                    const FrameBuilder& build);

  // First transmission of a staged message. Call after commit.
  void Transmit(const db::model::PendingAckRecord& record);

  // Stage + commit + Transmit in one call.
  db::model::PendingAckRecord SendReliable(const std::string& unit_id, std::int64_t delivery_id, db::model::PendingAckKind kind,
                                           const FrameBuilder& build);

  // Retires a message. Unknown or already retired ids return nullopt.
  std::optional<db::model::PendingAckRecord> OnAck(const std::string& msg_id);

  // Retires the delivery's pending messages inside the caller's
  // transaction, optionally only those of one kind. Returns their ids;
  // pass them to Disarm after commit.
  std::vector<std::string> CancelForDelivery(db::Transaction& tx, std::int64_t delivery_id, std::optional<db::model::PendingAckKind> kind = std::nullopt);

  // Same, for every pending message of one kind addressed to a unit.
  std::vector<std::string> CancelForUnit(db::Transaction& tx, const std::string& unit_id, db::model::PendingAckKind kind);

  void Disarm(const std::vector<std::string>& msg_ids);

  // Handles every deadline that has passed. Driven by the scheduler task.
  void Tick();

  // Re-arms stored messages from their persisted deadlines. Returns how many.
  std::size_t Recover();

  std::size_t Armed() const {
    return scheduler_.Size();
  }

  const RetryPolicy& Policy() const {
    return policy_;
  }

 private:
  void HandleDeadline(const std::string& msg_id);
  void SendFrame(const db::model::PendingAckRecord& record);

  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<transport::Transport> transport_;
  RetryPolicy                           policy_;
  const util::Clock&                    clock_;
  RetryScheduler                        scheduler_;

  std::mutex        handler_mutex_;
  ExhaustionHandler on_exhausted_;
};

} // namespace meshdispatch::reliable
