#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/delivery_record.hpp"
#include "internal/db/model/pending_ack_record.hpp"
#include "internal/db/model/unit_record.hpp"

namespace meshdispatch::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - Update* is a compare-and-set: it succeeds only if the stored row
    still carries expected_version, then stores record with
    version = expected_version + 1. A mismatch returns Conflict and
    changes nothing.
  - DeletePendingAck returns NotFound when the row is already gone;
    callers rely on this to retire a message exactly once.

  The DB is the source of truth for:
    deliveries
    units
    pending acknowledgments
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Deliveries
  // ---------------------------------------------------------------------

  // Assigns record.id and record.version (1).
  virtual Result InsertDelivery(Transaction&, model::DeliveryRecord& record) = 0;

  virtual std::optional<model::DeliveryRecord> GetDelivery(Transaction&, std::int64_t id) = 0;

  virtual std::vector<model::DeliveryRecord> ListDeliveries(Transaction&) = 0;

  // Deliveries in assigned/en_route/arrived_dest held by unit_id.
  virtual std::vector<model::DeliveryRecord> FindActiveDeliveriesForUnit(Transaction&, const std::string& unit_id) = 0;

  virtual Result UpdateDelivery(Transaction&, const model::DeliveryRecord& record, std::uint64_t expected_version) = 0;

  // ---------------------------------------------------------------------
  // Units
  // ---------------------------------------------------------------------

  virtual Result InsertUnit(Transaction&, model::UnitRecord& record) = 0;

  virtual std::optional<model::UnitRecord> GetUnit(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::UnitRecord> ListUnits(Transaction&) = 0;

  virtual Result UpdateUnit(Transaction&, const model::UnitRecord& record, std::uint64_t expected_version) = 0;

  // ---------------------------------------------------------------------
  // Pending acknowledgments
  // ---------------------------------------------------------------------

  virtual Result InsertPendingAck(Transaction&, const model::PendingAckRecord& record) = 0;

  virtual std::optional<model::PendingAckRecord> GetPendingAck(Transaction&, const std::string& msg_id) = 0;

  virtual std::vector<model::PendingAckRecord> ListPendingAcks(Transaction&) = 0;

  virtual std::vector<model::PendingAckRecord> FindPendingAcksForDelivery(Transaction&, std::int64_t delivery_id) = 0;

  virtual Result UpdatePendingAck(Transaction&, const model::PendingAckRecord& record) = 0;

  virtual Result DeletePendingAck(Transaction&, const std::string& msg_id) = 0;
};

} // namespace meshdispatch::db
