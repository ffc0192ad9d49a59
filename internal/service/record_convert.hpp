#pragma once

#include "internal/db/model/delivery_record.hpp"
#include "internal/db/model/unit_record.hpp"
#include "meshdispatch/v1/types.pb.h"

namespace meshdispatch::service {

// Unset optionals and zero timestamps stay unset on the wire.
meshdispatch::v1::Delivery ToProto(const db::model::DeliveryRecord& record);
meshdispatch::v1::Unit     ToProto(const db::model::UnitRecord& record);

} // namespace meshdispatch::service
