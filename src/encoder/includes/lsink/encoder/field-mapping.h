#pragma once

#include "ledger.pb.h"
#include "lsink/common/record.h"

#include <cstdint>
#include <string>
#include <variant>

namespace lsink::encoder {

// Version written into every EventBatch / UpdateBatch
inline constexpr uint32_t LEDGER_SCHEMA_VERSION = 1;

// Why a record was left out of a chunk
struct SkipReason
{
    std::string message;
};

using MappedEvent = std::variant<ledger::Event, SkipReason>;
using MappedUpdate = std::variant<ledger::Update, SkipReason>;

/**
 * Map a record to an Event message.
 *
 * The identifier comes from `event_id`, falling back to `id`; a record
 * without a non-empty scalar identifier yields a SkipReason. Every other
 * field is coerced leniently: timestamps accept epoch millis or ISO-8601
 * (unparseable becomes 0), lists accept string lists only, JSON fields
 * accept JSON text or strings.
 */
MappedEvent
map_event(const common::Record& record);

/**
 * Map a record to an Update message. The identifier comes from
 * `update_id`, falling back to `id`.
 */
MappedUpdate
map_update(const common::Record& record);

}  // namespace lsink::encoder
