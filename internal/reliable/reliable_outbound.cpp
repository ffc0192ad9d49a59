#include "reliable_outbound.hpp"

#include <exception>

#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/message_id.hpp"

namespace meshdispatch::reliable {

using db::model::PendingAckKind;
using db::model::PendingAckRecord;

std::string_view ToString(PendingAckKind kind) {
  switch (kind) {
    case PendingAckKind::kAssign:
      return "assign";
    case PendingAckKind::kComplete:
      return "complete";
  }
  return "unknown";
}

ReliableOutbound::ReliableOutbound(std::shared_ptr<db::Repository> repository, std::shared_ptr<transport::Transport> transport, RetryPolicy policy,
                                   const util::Clock& clock)
    : repository_(std::move(repository)), transport_(std::move(transport)), policy_(policy), clock_(clock) {
}

void ReliableOutbound::SetExhaustionHandler(ExhaustionHandler handler) {
  std::lock_guard lock(handler_mutex_);
  on_exhausted_ = std::move(handler);
}

PendingAckRecord ReliableOutbound::Stage(db::Transaction& tx, const std::string& unit_id, std::int64_t delivery_id, PendingAckKind kind,
                                         const FrameBuilder& build) {
  const auto now = clock_.Now();

  PendingAckRecord record;
  record.msg_id        = util::NewMessageIdString();
  record.unit_id       = unit_id;
  record.delivery_id   = delivery_id;
  record.kind          = kind;
  record.payload       = build(record.msg_id);
  record.created_at_ms = util::ToUnixMillis(now);
  record.attempts      = 1;
  record.next_retry_ms = util::ToUnixMillis(now + policy_.DelayAfter(1));

  db::ThrowIfDbError(repository_->InsertPendingAck(tx, record), "insert pending ack " + record.msg_id);
  return record;
}

void ReliableOutbound::Transmit(const PendingAckRecord& record) {
  scheduler_.Arm(record.msg_id, util::FromUnixMillis(record.next_retry_ms));
  SendFrame(record);
}

PendingAckRecord ReliableOutbound::SendReliable(const std::string& unit_id, std::int64_t delivery_id, PendingAckKind kind, const FrameBuilder& build) {
  auto tx     = repository_->Begin();
  auto record = Stage(*tx, unit_id, delivery_id, kind, build);
  tx->Commit();

  Transmit(record);
  return record;
}

void ReliableOutbound::SendFrame(const PendingAckRecord& record) {
  const auto result = transport_->Send(record.payload);
  if (result == transport::SendResult::kSent) {
    MESHDISPATCH_LOG_DEBUG("reliable frame sent", {observability::StringField("msg_id", record.msg_id),
                                                   observability::IntField("attempt", record.attempts)});
    return;
  }

  // the attempt still counts; the retry timer covers it
  MESHDISPATCH_LOG_WARN("reliable frame send failed",
                        {observability::StringField("msg_id", record.msg_id), observability::StringField("unit_id", record.unit_id),
                         observability::IntField("attempt", record.attempts), observability::StringField("result", transport::ToString(result))});
}

std::optional<PendingAckRecord> ReliableOutbound::OnAck(const std::string& msg_id) {
  std::optional<PendingAckRecord> record;
  {
    auto tx = repository_->Begin();
    record  = repository_->GetPendingAck(*tx, msg_id);
    if (!record) {
      MESHDISPATCH_LOG_DEBUG("ack for unknown or retired message", {observability::StringField("msg_id", msg_id)});
      return std::nullopt;
    }

    const auto deleted = repository_->DeletePendingAck(*tx, msg_id);
    if (deleted.code == db::ErrorCode::NotFound) {
      return std::nullopt;
    }
    db::ThrowIfDbError(deleted, "delete pending ack " + msg_id);
    tx->Commit();
  }

  scheduler_.Cancel(msg_id);
  MESHDISPATCH_LOG_INFO("message acknowledged",
                        {observability::StringField("msg_id", msg_id), observability::StringField("unit_id", record->unit_id),
                         observability::StringField("kind", ToString(record->kind)), observability::IntField("attempts", record->attempts)});
  return record;
}

std::vector<std::string> ReliableOutbound::CancelForDelivery(db::Transaction& tx, std::int64_t delivery_id, std::optional<PendingAckKind> kind) {
  std::vector<std::string> cancelled;
  for (const auto& record : repository_->FindPendingAcksForDelivery(tx, delivery_id)) {
    if (kind && record.kind != *kind) {
      continue;
    }
    const auto deleted = repository_->DeletePendingAck(tx, record.msg_id);
    if (deleted.code == db::ErrorCode::NotFound) {
      continue;
    }
    db::ThrowIfDbError(deleted, "delete pending ack " + record.msg_id);

    MESHDISPATCH_LOG_INFO("pending message superseded", {observability::StringField("msg_id", record.msg_id),
                                                         observability::IntField("delivery_id", delivery_id),
                                                         observability::StringField("kind", ToString(record.kind))});
    cancelled.push_back(record.msg_id);
  }
  return cancelled;
}

std::vector<std::string> ReliableOutbound::CancelForUnit(db::Transaction& tx, const std::string& unit_id, PendingAckKind kind) {
  std::vector<std::string> cancelled;
  for (const auto& record : repository_->ListPendingAcks(tx)) {
    if (record.unit_id != unit_id || record.kind != kind) {
      continue;
    }
    const auto deleted = repository_->DeletePendingAck(tx, record.msg_id);
    if (deleted.code == db::ErrorCode::NotFound) {
      continue;
    }
    db::ThrowIfDbError(deleted, "delete pending ack " + record.msg_id);

    MESHDISPATCH_LOG_INFO("pending message superseded", {observability::StringField("msg_id", record.msg_id),
                                                         observability::StringField("unit_id", unit_id),
                                                         observability::StringField("kind", ToString(record.kind))});
    cancelled.push_back(record.msg_id);
  }
  return cancelled;
}

void ReliableOutbound::Disarm(const std::vector<std::string>& msg_ids) {
  for (const auto& msg_id : msg_ids) {
    scheduler_.Cancel(msg_id);
  }
}

void ReliableOutbound::Tick() {
  for (const auto& msg_id : scheduler_.PopDue(clock_.Now())) {
    try {
      HandleDeadline(msg_id);
    } catch (const std::exception& e) {
      // keep the message alive; the row is still in the store
      MESHDISPATCH_LOG_ERROR("retry deadline handling failed",
                             {observability::StringField("msg_id", msg_id), observability::StringField("error", e.what())});
      scheduler_.Arm(msg_id, clock_.Now() + policy_.DelayAfter(1));
    }
  }
}

void ReliableOutbound::HandleDeadline(const std::string& msg_id) {
  const auto now = clock_.Now();

  std::optional<PendingAckRecord> resend;
  {
    auto tx     = repository_->Begin();
    auto record = repository_->GetPendingAck(*tx, msg_id);
    if (!record) {
      // acknowledged in the meantime
      return;
    }

    if (policy_.Exhausted(record->attempts)) {
      const auto deleted = repository_->DeletePendingAck(*tx, msg_id);
      if (deleted.code == db::ErrorCode::NotFound) {
        return;
      }
      db::ThrowIfDbError(deleted, "delete pending ack " + msg_id);

      ExhaustionHandler handler;
      {
        std::lock_guard lock(handler_mutex_);
        handler = on_exhausted_;
      }
      if (handler) {
        handler(*tx, *record);
      }
      tx->Commit();

      observability::Metrics::Instance().RecordAckExhausted(ToString(record->kind));
      MESHDISPATCH_LOG_WARN("message exhausted without ack",
                            {observability::StringField("msg_id", msg_id), observability::StringField("unit_id", record->unit_id),
                             observability::IntField("delivery_id", record->delivery_id), observability::StringField("kind", ToString(record->kind)),
                             observability::IntField("attempts", record->attempts)});
      return;
    }

    record->attempts += 1;
    record->next_retry_ms = util::ToUnixMillis(now + policy_.DelayAfter(record->attempts));
    db::ThrowIfDbError(repository_->UpdatePendingAck(*tx, *record), "update pending ack " + msg_id);
    tx->Commit();
    resend = std::move(record);
  }

  scheduler_.Arm(resend->msg_id, util::FromUnixMillis(resend->next_retry_ms));
  observability::Metrics::Instance().RecordRetransmit(ToString(resend->kind));
  MESHDISPATCH_LOG_INFO("retransmitting unacknowledged message",
                        {observability::StringField("msg_id", resend->msg_id), observability::StringField("unit_id", resend->unit_id),
                         observability::IntField("attempt", resend->attempts), observability::IntField("max_attempts", policy_.max_attempts)});
  SendFrame(*resend);
}

std::size_t ReliableOutbound::Recover() {
  std::vector<PendingAckRecord> records;
  {
    auto tx = repository_->Begin();
    records = repository_->ListPendingAcks(*tx);
    tx->Commit();
  }

  for (const auto& record : records) {
    scheduler_.Arm(record.msg_id, util::FromUnixMillis(record.next_retry_ms));
  }

  MESHDISPATCH_LOG_INFO("recovered pending acknowledgments", {observability::IntField("count", static_cast<std::int64_t>(records.size()))});
  return records.size();
}

} // namespace meshdispatch::reliable
