#pragma once

#include <string>

#include <google/protobuf/message.h>

#include "internal/db/model/audit_record.hpp"
#include "internal/db/model/check_record.hpp"
#include "internal/db/model/fiscal_period_record.hpp"
#include "internal/db/model/payment_record.hpp"
#include "internal/db/model/property_record.hpp"
#include "internal/db/model/replay_item_record.hpp"
#include "internal/db/model/time_entry_record.hpp"
#include "resync/v1/types.pb.h"

namespace resync::db::model {

/*
  Record <-> wire message mapping.

  Replay payloads carry the JSON encoding of the entity message so the
  queue stays readable in the local database.
*/

resync::v1::Check     ToProto(const CheckRecord& record);
resync::v1::Payment   ToProto(const PaymentRecord& record);
resync::v1::TimeEntry ToProto(const TimeEntryRecord& record);
resync::v1::ReplayItem ToProto(const ReplayItemRecord& record);

CheckRecord      CheckFromProto(const resync::v1::Check& check);
PaymentRecord    PaymentFromProto(const resync::v1::Payment& payment);
TimeEntryRecord  TimeEntryFromProto(const resync::v1::TimeEntry& entry);
ReplayItemRecord ReplayItemFromProto(const resync::v1::ReplayItem& item);

// Throws util::InvalidArgument when the message cannot be encoded.
std::string ToJson(const google::protobuf::Message& message);

// Throws util::InvalidArgument on malformed JSON or unknown fields.
void FromJson(const std::string& json, google::protobuf::Message* message);

} // namespace resync::db::model
