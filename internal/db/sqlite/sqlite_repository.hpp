#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace meshdispatch::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
