#include "memory_repository.hpp"

#include "internal/model/delivery_state.hpp"
#include "memory_tx.hpp"

namespace meshdispatch::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertDelivery(Transaction& t, model::DeliveryRecord& r) {
  auto& s   = TX(t).Mutable();
  r.id      = s.next_delivery_id++;
  r.version = 1;
  s.deliveries[r.id] = r;
  return Result::Ok();
}

std::optional<model::DeliveryRecord> MemoryRepository::GetDelivery(Transaction& t, std::int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.deliveries.find(id);
  if (it == s.deliveries.end()) return std::nullopt;
  return it->second;
}

std::vector<model::DeliveryRecord> MemoryRepository::ListDeliveries(Transaction& t) {
  const auto&                        s = TX(t).View();
  std::vector<model::DeliveryRecord> records;
  records.reserve(s.deliveries.size());
  for (const auto& [_, record] : s.deliveries) {
    records.push_back(record);
  }
  return records;
}

std::vector<model::DeliveryRecord> MemoryRepository::FindActiveDeliveriesForUnit(Transaction& t, const std::string& unit_id) {
  std::vector<model::DeliveryRecord> out;
  for (const auto& [_, record] : TX(t).View().deliveries)
    if (record.assigned_unit_id == unit_id && meshdispatch::model::IsActive(record.status)) out.push_back(record);
  return out;
}

Result MemoryRepository::UpdateDelivery(Transaction& t, const model::DeliveryRecord& r, std::uint64_t expected_version) {
  auto& s  = TX(t).Mutable();
  auto  it = s.deliveries.find(r.id);
  if (it == s.deliveries.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.version != expected_version) return Result::Err(ErrorCode::Conflict, "delivery version changed");
  it->second         = r;
  it->second.version = expected_version + 1;
  return Result::Ok();
}

Result MemoryRepository::InsertUnit(Transaction& t, model::UnitRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.units.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  r.version     = 1;
  s.units[r.id] = r;
  return Result::Ok();
}

std::optional<model::UnitRecord> MemoryRepository::GetUnit(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.units.find(id);
  if (it == s.units.end()) return std::nullopt;
  return it->second;
}

std::vector<model::UnitRecord> MemoryRepository::ListUnits(Transaction& t) {
  std::vector<model::UnitRecord> out;
  for (const auto& [_, record] : TX(t).View().units) out.push_back(record);
  return out;
}

Result MemoryRepository::UpdateUnit(Transaction& t, const model::UnitRecord& r, std::uint64_t expected_version) {
  auto& s  = TX(t).Mutable();
  auto  it = s.units.find(r.id);
  if (it == s.units.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.version != expected_version) return Result::Err(ErrorCode::Conflict, "unit version changed");
  it->second         = r;
  it->second.version = expected_version + 1;
  return Result::Ok();
}

Result MemoryRepository::InsertPendingAck(Transaction& t, const model::PendingAckRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.pending_acks.contains(r.msg_id)) return Result::Err(ErrorCode::AlreadyExists);
  if (!s.deliveries.contains(r.delivery_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown delivery");
  s.pending_acks[r.msg_id] = r;
  return Result::Ok();
}

std::optional<model::PendingAckRecord> MemoryRepository::GetPendingAck(Transaction& t, const std::string& msg_id) {
  const auto& s  = TX(t).View();
  auto        it = s.pending_acks.find(msg_id);
  if (it == s.pending_acks.end()) return std::nullopt;
  return it->second;
}

std::vector<model::PendingAckRecord> MemoryRepository::ListPendingAcks(Transaction& t) {
  std::vector<model::PendingAckRecord> out;
  for (const auto& [_, record] : TX(t).View().pending_acks) out.push_back(record);
  return out;
}

std::vector<model::PendingAckRecord> MemoryRepository::FindPendingAcksForDelivery(Transaction& t, std::int64_t delivery_id) {
  std::vector<model::PendingAckRecord> out;
  for (const auto& [_, record] : TX(t).View().pending_acks)
    if (record.delivery_id == delivery_id) out.push_back(record);
  return out;
}

Result MemoryRepository::UpdatePendingAck(Transaction& t, const model::PendingAckRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.pending_acks.find(r.msg_id);
  if (it == s.pending_acks.end()) return Result::Err(ErrorCode::NotFound);
  it->second.attempts      = r.attempts;
  it->second.next_retry_ms = r.next_retry_ms;
  return Result::Ok();
}

Result MemoryRepository::DeletePendingAck(Transaction& t, const std::string& msg_id) {
  auto& s = TX(t).Mutable();
  if (s.pending_acks.erase(msg_id) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

} // namespace meshdispatch::db::memory
