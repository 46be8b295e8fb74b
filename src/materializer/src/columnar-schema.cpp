#include "lsink/materializer/columnar-schema.h"
#include "lsink/common/record-json.h"

#include <cstdint>
#include <limits>

namespace lsink::materializer {

using common::RecordKind;

namespace {

TableSpec
make_events_spec()
{
    return TableSpec{
        RecordKind::EVENTS,
        {
            {"event_id", ColumnType::UTF8},
            {"update_id", ColumnType::UTF8},
            {"event_type", ColumnType::UTF8},
            {"event_type_original", ColumnType::UTF8},
            {"synchronizer_id", ColumnType::UTF8},
            {"effective_at", ColumnType::UTF8},
            {"recorded_at", ColumnType::UTF8},
            {"created_at_ts", ColumnType::UTF8},
            {"contract_id", ColumnType::UTF8},
            {"template_id", ColumnType::UTF8},
            {"package_name", ColumnType::UTF8},
            {"migration_id", ColumnType::INT64},
            {"signatories", ColumnType::STRING_LIST},
            {"observers", ColumnType::STRING_LIST},
            {"acting_parties", ColumnType::STRING_LIST},
            {"witness_parties", ColumnType::STRING_LIST},
            {"child_event_ids", ColumnType::STRING_LIST},
            {"consuming", ColumnType::BOOL},
            {"reassignment_counter", ColumnType::INT64},
            {"payload", ColumnType::JSON_TEXT},
            {"contract_key", ColumnType::JSON_TEXT},
            {"exercise_result", ColumnType::JSON_TEXT},
            {"raw_event", ColumnType::JSON_TEXT},
            {"trace_context", ColumnType::JSON_TEXT},
        },
        {"event_id", "event_type", "raw_event"},
        "raw_event"};
}

TableSpec
make_updates_spec()
{
    return TableSpec{
        RecordKind::UPDATES,
        {
            {"update_id", ColumnType::UTF8},
            {"update_type", ColumnType::UTF8},
            {"synchronizer_id", ColumnType::UTF8},
            {"effective_at", ColumnType::UTF8},
            {"recorded_at", ColumnType::UTF8},
            {"record_time", ColumnType::UTF8},
            {"command_id", ColumnType::UTF8},
            {"workflow_id", ColumnType::UTF8},
            {"kind", ColumnType::UTF8},
            {"migration_id", ColumnType::INT64},
            {"offset", ColumnType::INT64},
            {"event_count", ColumnType::INT32},
            {"root_event_ids", ColumnType::STRING_LIST},
            {"source_synchronizer", ColumnType::UTF8},
            {"target_synchronizer", ColumnType::UTF8},
            {"unassign_id", ColumnType::UTF8},
            {"submitter", ColumnType::UTF8},
            {"reassignment_counter", ColumnType::INT64},
            {"trace_context", ColumnType::JSON_TEXT},
            {"update_data", ColumnType::JSON_TEXT},
        },
        {"update_id", "update_type", "update_data"},
        "update_data"};
}

TableSpec
make_contracts_spec()
{
    return TableSpec{
        RecordKind::CONTRACTS,
        {
            {"contract_id", ColumnType::UTF8},
            {"template_id", ColumnType::UTF8},
            {"package_name", ColumnType::UTF8},
            {"module_name", ColumnType::UTF8},
            {"entity_name", ColumnType::UTF8},
            {"migration_id", ColumnType::INT64},
            {"record_time", ColumnType::UTF8},
            {"snapshot_time", ColumnType::UTF8},
            {"signatories", ColumnType::STRING_LIST},
            {"observers", ColumnType::STRING_LIST},
            {"payload", ColumnType::JSON_TEXT},
        },
        {"contract_id", "template_id", "payload"},
        "payload"};
}

std::shared_ptr<arrow::DataType>
arrow_type(ColumnType type)
{
    switch (type)
    {
        case ColumnType::UTF8:
        case ColumnType::JSON_TEXT:
            return arrow::utf8();
        case ColumnType::INT64:
            return arrow::int64();
        case ColumnType::INT32:
            return arrow::int32();
        case ColumnType::BOOL:
            return arrow::boolean();
        case ColumnType::STRING_LIST:
            return arrow::list(arrow::utf8());
    }
    return arrow::utf8();
}

// Coerced JSON value, or null when the value does not fit the column
boost::json::value
coerce(const common::Value& value, ColumnType type)
{
    switch (type)
    {
        case ColumnType::UTF8:
            if (auto s = common::value_as_string(value))
                return boost::json::string(*s);
            break;
        case ColumnType::JSON_TEXT:
            if (auto s = common::value_as_json_text(value))
                return boost::json::string(*s);
            break;
        case ColumnType::INT64:
            if (auto i = common::value_as_int(value))
                return *i;
            break;
        case ColumnType::INT32:
            if (auto i = common::value_as_int(value);
                i && *i >= std::numeric_limits<int32_t>::min() &&
                *i <= std::numeric_limits<int32_t>::max())
            {
                return *i;
            }
            break;
        case ColumnType::BOOL:
            if (auto b = common::value_as_bool(value))
                return *b;
            break;
        case ColumnType::STRING_LIST:
            if (auto list = common::value_as_string_list(value))
            {
                boost::json::array arr;
                for (const auto& item : *list)
                    arr.emplace_back(boost::json::string(item));
                return arr;
            }
            break;
    }
    return nullptr;
}

}  // namespace

const TableSpec&
table_spec(RecordKind kind)
{
    static const TableSpec events = make_events_spec();
    static const TableSpec updates = make_updates_spec();
    static const TableSpec contracts = make_contracts_spec();

    switch (kind)
    {
        case RecordKind::UPDATES:
            return updates;
        case RecordKind::CONTRACTS:
            return contracts;
        case RecordKind::EVENTS:
            break;
    }
    return events;
}

std::shared_ptr<arrow::Schema>
arrow_schema(const TableSpec& spec)
{
    arrow::FieldVector fields;
    fields.reserve(spec.columns.size());
    for (const auto& column : spec.columns)
    {
        fields.push_back(
            arrow::field(column.name, arrow_type(column.type), true));
    }
    return arrow::schema(fields);
}

boost::json::object
stage_row(const common::Record& record, const TableSpec& spec)
{
    boost::json::object row;
    for (const auto& column : spec.columns)
    {
        const common::Value* v = record.find(column.name);
        if (!v || common::is_null(*v))
            continue;
        boost::json::value coerced = coerce(*v, column.type);
        if (!coerced.is_null())
            row[column.name] = std::move(coerced);
    }
    return row;
}

}  // namespace lsink::materializer
