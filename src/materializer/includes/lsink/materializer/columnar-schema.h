#pragma once

#include "lsink/common/record.h"

#include <arrow/api.h>
#include <boost/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace lsink::materializer {

enum class ColumnType {
    UTF8,
    JSON_TEXT,  // utf8 holding nested JSON verbatim
    INT64,
    INT32,
    BOOL,
    STRING_LIST
};

struct ColumnSpec
{
    std::string name;
    ColumnType type;
};

/**
 * Column layout of one record kind. Every column is nullable.
 */
struct TableSpec
{
    common::RecordKind kind;
    std::vector<ColumnSpec> columns;

    // Columns that must exist in a written file
    std::vector<std::string> required;

    // Column sampled for non-null content during validation
    std::string payload_column;
};

const TableSpec&
table_spec(common::RecordKind kind);

std::shared_ptr<arrow::Schema>
arrow_schema(const TableSpec& spec);

/**
 * Project a record onto the table's columns, coercing each value to its
 * column type. Fields outside the table are dropped; values that cannot be
 * coerced are left out, which the JSON reader turns into nulls.
 */
boost::json::object
stage_row(const common::Record& record, const TableSpec& spec);

}  // namespace lsink::materializer
