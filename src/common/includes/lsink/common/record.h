#pragma once

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace lsink::common {

// Milliseconds since the Unix epoch
struct Timestamp
{
    int64_t unix_millis = 0;

    bool
    operator==(const Timestamp&) const = default;
};

// Nested JSON kept verbatim as text
struct JsonText
{
    std::string text;

    bool
    operator==(const JsonText&) const = default;
};

using StringList = std::vector<std::string>;

using Value = std::variant<
    std::monostate,
    bool,
    int64_t,
    double,
    std::string,
    Timestamp,
    StringList,
    JsonText>;

/**
 * An ordered mapping of field name to value.
 *
 * Field order is insertion order; setting an existing field replaces its
 * value in place. Lookups are linear, records carry a few dozen fields at
 * most.
 */
class Record
{
public:
    using Field = std::pair<std::string, Value>;

    Record() = default;
    Record(std::initializer_list<Field> fields);

    void
    set(std::string_view name, Value value);

    // nullptr when the field is absent
    const Value*
    find(std::string_view name) const;

    // True when the field is present and not null
    bool
    has(std::string_view name) const;

    const std::vector<Field>&
    fields() const
    {
        return fields_;
    }

    size_t
    size() const
    {
        return fields_.size();
    }

    bool
    empty() const
    {
        return fields_.empty();
    }

    bool
    operator==(const Record&) const = default;

private:
    std::vector<Field> fields_;
};

enum class RecordKind { EVENTS, UPDATES, CONTRACTS };

std::string_view
to_string(RecordKind kind);

std::optional<RecordKind>
parse_record_kind(std::string_view text);

// Immutable batch shared between the producer and the worker running a job
using RecordBatch = std::shared_ptr<const std::vector<Record>>;

inline RecordBatch
make_batch(std::vector<Record> records)
{
    return std::make_shared<const std::vector<Record>>(std::move(records));
}

/**
 * Lenient value coercions used by the field mappers and the columnar
 * staging step. Each returns std::nullopt when the value is null or cannot
 * represent the requested type.
 */

// Scalars only: string, integer, double, bool, timestamp (ISO-8601) and JSON
// text. Lists yield nullopt.
std::optional<std::string>
value_as_string(const Value& value);

// Integers, integral doubles, bools and decimal strings
std::optional<int64_t>
value_as_int(const Value& value);

std::optional<bool>
value_as_bool(const Value& value);

// Timestamps, epoch millis (integer or numeric string) and ISO-8601 strings
std::optional<int64_t>
value_as_timestamp(const Value& value);

// String lists only
std::optional<StringList>
value_as_string_list(const Value& value);

bool
is_scalar(const Value& value);

bool
is_null(const Value& value);

}  // namespace lsink::common
