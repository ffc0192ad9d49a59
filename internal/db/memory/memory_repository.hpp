#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace meshdispatch::db::memory {

class MemoryTransaction;

/*
  In-process backend with the same transactional contract as SQLite.
  Each transaction works on a private copy of the state and swaps it in
  on commit. Nothing survives the process.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertDelivery(Transaction&, model::DeliveryRecord&) override;
  std::optional<model::DeliveryRecord> GetDelivery(Transaction&, std::int64_t) override;
  std::vector<model::DeliveryRecord> ListDeliveries(Transaction&) override;
  std::vector<model::DeliveryRecord> FindActiveDeliveriesForUnit(Transaction&, const std::string&) override;
  Result UpdateDelivery(Transaction&, const model::DeliveryRecord&, std::uint64_t expected_version) override;

  Result InsertUnit(Transaction&, model::UnitRecord&) override;
  std::optional<model::UnitRecord> GetUnit(Transaction&, const std::string&) override;
  std::vector<model::UnitRecord> ListUnits(Transaction&) override;
  Result UpdateUnit(Transaction&, const model::UnitRecord&, std::uint64_t expected_version) override;

  Result InsertPendingAck(Transaction&, const model::PendingAckRecord&) override;
  std::optional<model::PendingAckRecord> GetPendingAck(Transaction&, const std::string&) override;
  std::vector<model::PendingAckRecord> ListPendingAcks(Transaction&) override;
  std::vector<model::PendingAckRecord> FindPendingAcksForDelivery(Transaction&, std::int64_t) override;
  Result UpdatePendingAck(Transaction&, const model::PendingAckRecord&) override;
  Result DeletePendingAck(Transaction&, const std::string&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::int64_t, model::DeliveryRecord> deliveries;
    std::map<std::string, model::UnitRecord> units;
    std::unordered_map<std::string, model::PendingAckRecord> pending_acks;
    std::int64_t next_delivery_id = 1;
  };

  // held by each open transaction
  std::mutex writer_mutex_;
  State committed_;
};

}
