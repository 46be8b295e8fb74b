#include "lsink/encoder/field-mapping.h"
#include "lsink/common/record-json.h"

#include <initializer_list>

namespace lsink::encoder {

using common::Record;
using common::Value;

namespace {

// First field among `names` that is present, non-null and not ""
const Value*
first_of(const Record& record, std::initializer_list<const char*> names)
{
    for (const char* name : names)
    {
        const Value* v = record.find(name);
        if (!v || common::is_null(*v))
            continue;
        if (auto s = std::get_if<std::string>(v); s && s->empty())
            continue;
        return v;
    }
    return nullptr;
}

std::string
str(const Record& record, std::initializer_list<const char*> names)
{
    const Value* v = first_of(record, names);
    if (!v)
        return {};
    return common::value_as_string(*v).value_or(std::string());
}

int64_t
millis(const Record& record, std::initializer_list<const char*> names)
{
    const Value* v = first_of(record, names);
    if (!v)
        return 0;
    return common::value_as_timestamp(*v).value_or(0);
}

int64_t
int64(const Record& record, std::initializer_list<const char*> names)
{
    const Value* v = first_of(record, names);
    if (!v)
        return 0;
    return common::value_as_int(*v).value_or(0);
}

bool
flag(const Record& record, const char* name)
{
    const Value* v = first_of(record, {name});
    if (!v)
        return false;
    return common::value_as_bool(*v).value_or(false);
}

template <typename RepeatedField>
void
fill_list(
    RepeatedField* out,
    const Record& record,
    std::initializer_list<const char*> names)
{
    const Value* v = first_of(record, names);
    if (!v)
        return;
    if (auto list = common::value_as_string_list(*v))
    {
        for (auto& item : *list)
            out->Add(std::move(item));
    }
}

std::string
json(const Record& record, std::initializer_list<const char*> names)
{
    const Value* v = first_of(record, names);
    if (!v)
        return {};
    return common::value_as_json_text(*v).value_or(std::string());
}

// Identifier must be a non-empty scalar
std::variant<std::string, SkipReason>
identifier(const Record& record, const char* primary, const char* fallback)
{
    const Value* v = first_of(record, {primary, fallback});
    if (!v)
    {
        return SkipReason{
            std::string("missing ") + primary + " and " + fallback};
    }
    if (!common::is_scalar(*v))
    {
        return SkipReason{std::string(primary) + " is not a scalar value"};
    }
    return common::value_as_string(*v).value_or(std::string());
}

}  // namespace

MappedEvent
map_event(const Record& r)
{
    auto id = identifier(r, "event_id", "id");
    if (auto skip = std::get_if<SkipReason>(&id))
        return *skip;

    ledger::Event e;
    e.set_id(std::get<std::string>(id));
    e.set_update_id(str(r, {"update_id"}));
    e.set_type(str(r, {"event_type", "type"}));
    e.set_type_original(str(
        r, {"event_type_original", "type_original", "event_type", "type"}));
    e.set_synchronizer(str(r, {"synchronizer_id", "synchronizer"}));

    e.set_effective_at(millis(r, {"effective_at"}));
    e.set_recorded_at(millis(r, {"recorded_at", "timestamp"}));
    e.set_created_at_ts(millis(r, {"created_at_ts"}));

    e.set_contract_id(str(r, {"contract_id", "contractId"}));
    e.set_template_(str(r, {"template_id", "template"}));
    e.set_package_name(str(r, {"package_name"}));
    e.set_migration_id(int64(r, {"migration_id"}));

    fill_list(e.mutable_signatories(), r, {"signatories"});
    fill_list(e.mutable_observers(), r, {"observers"});
    fill_list(e.mutable_acting_parties(), r, {"acting_parties"});
    fill_list(e.mutable_witness_parties(), r, {"witness_parties"});

    e.set_payload_json(json(r, {"payload_json", "payload"}));
    e.set_contract_key_json(json(r, {"contract_key_json", "contract_key"}));

    e.set_choice(str(r, {"choice"}));
    e.set_consuming(flag(r, "consuming"));
    e.set_interface_id(str(r, {"interface_id"}));
    fill_list(e.mutable_child_event_ids(), r, {"child_event_ids"});
    e.set_exercise_result_json(
        json(r, {"exercise_result_json", "exercise_result"}));

    e.set_source_synchronizer(str(r, {"source_synchronizer"}));
    e.set_target_synchronizer(str(r, {"target_synchronizer"}));
    e.set_unassign_id(str(r, {"unassign_id"}));
    e.set_submitter(str(r, {"submitter"}));
    e.set_reassignment_counter(int64(r, {"reassignment_counter"}));

    e.set_raw_event(json(r, {"raw_event", "raw_json", "raw"}));
    e.set_party(str(r, {"party"}));
    return e;
}

MappedUpdate
map_update(const Record& r)
{
    auto id = identifier(r, "update_id", "id");
    if (auto skip = std::get_if<SkipReason>(&id))
        return *skip;

    ledger::Update u;
    u.set_id(std::get<std::string>(id));
    u.set_type(str(r, {"update_type", "type"}));
    u.set_synchronizer(str(r, {"synchronizer_id", "synchronizer"}));

    u.set_effective_at(millis(r, {"effective_at"}));
    u.set_recorded_at(millis(r, {"recorded_at", "timestamp"}));
    u.set_record_time(millis(r, {"record_time"}));

    u.set_command_id(str(r, {"command_id"}));
    u.set_workflow_id(str(r, {"workflow_id"}));
    u.set_kind(str(r, {"kind"}));

    u.set_migration_id(int64(r, {"migration_id"}));
    u.set_offset(int64(r, {"offset"}));
    u.set_event_count(static_cast<int32_t>(int64(r, {"event_count"})));

    fill_list(u.mutable_root_event_ids(), r, {"root_event_ids"});

    u.set_source_synchronizer(str(r, {"source_synchronizer"}));
    u.set_target_synchronizer(str(r, {"target_synchronizer"}));
    u.set_unassign_id(str(r, {"unassign_id"}));
    u.set_submitter(str(r, {"submitter"}));
    u.set_reassignment_counter(int64(r, {"reassignment_counter"}));

    u.set_trace_context_json(
        json(r, {"trace_context_json", "trace_context"}));
    u.set_update_data_json(json(r, {"update_data_json", "update_data"}));
    return u;
}

}  // namespace lsink::encoder
