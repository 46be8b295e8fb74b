#pragma once

#include "lsink/common/record.h"

#include <boost/json.hpp>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lsink::common {

/**
 * Convert a JSON object into a Record.
 *
 * Arrays whose elements are all strings become string lists; any other
 * array or object is kept verbatim as JsonText. Strings stay strings.
 */
Record
record_from_json(const boost::json::object& obj);

// Timestamps are written as ISO-8601 strings, JsonText is re-parsed so
// nested structure survives a round trip
boost::json::object
record_to_json(const Record& record);

boost::json::value
value_to_json(const Value& value);

/**
 * Parse one JSON-lines record.
 * @throws LedgerSinkError when the line is not a JSON object
 */
Record
parse_record_line(std::string_view line);

std::string
serialize_record(const Record& record);

/**
 * JSON-ish text for payload style fields: JsonText verbatim, strings as-is,
 * lists and scalars serialized as JSON. Null yields std::nullopt.
 */
std::optional<std::string>
value_as_json_text(const Value& value);

/**
 * Read JSON-lines records from a stream. Blank lines are ignored; malformed
 * lines are logged, counted in `malformed` (when given) and skipped.
 */
std::vector<Record>
read_records_jsonl(std::istream& in, size_t* malformed = nullptr);

}  // namespace lsink::common
