#include "lsink/common/record-json.h"
#include "lsink/common/errors.h"
#include "lsink/common/utils.h"
#include "lsink/core/logger.h"

#include <limits>
#include <string>

namespace lsink::common {

namespace {

Value
json_to_value(const boost::json::value& jv)
{
    switch (jv.kind())
    {
        case boost::json::kind::null:
            return std::monostate{};
        case boost::json::kind::bool_:
            return jv.get_bool();
        case boost::json::kind::int64:
            return jv.get_int64();
        case boost::json::kind::uint64:
            if (jv.get_uint64() >
                static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
            {
                return static_cast<double>(jv.get_uint64());
            }
            return static_cast<int64_t>(jv.get_uint64());
        case boost::json::kind::double_:
            return jv.get_double();
        case boost::json::kind::string:
            return std::string(jv.get_string());
        case boost::json::kind::array: {
            const auto& arr = jv.get_array();
            StringList list;
            list.reserve(arr.size());
            for (const auto& item : arr)
            {
                if (!item.is_string())
                    return JsonText{boost::json::serialize(jv)};
                list.emplace_back(item.get_string());
            }
            return list;
        }
        case boost::json::kind::object:
            return JsonText{boost::json::serialize(jv)};
    }
    return std::monostate{};
}

}  // namespace

Record
record_from_json(const boost::json::object& obj)
{
    Record record;
    for (const auto& kv : obj)
    {
        record.set(kv.key(), json_to_value(kv.value()));
    }
    return record;
}

boost::json::value
value_to_json(const Value& value)
{
    if (std::holds_alternative<std::monostate>(value))
        return nullptr;
    if (auto b = std::get_if<bool>(&value))
        return *b;
    if (auto i = std::get_if<int64_t>(&value))
        return *i;
    if (auto d = std::get_if<double>(&value))
        return *d;
    if (auto s = std::get_if<std::string>(&value))
        return boost::json::string(*s);
    if (auto ts = std::get_if<Timestamp>(&value))
        return boost::json::string(format_iso_millis(ts->unix_millis));
    if (auto list = std::get_if<StringList>(&value))
    {
        boost::json::array arr;
        arr.reserve(list->size());
        for (const auto& s : *list)
            arr.emplace_back(boost::json::string(s));
        return arr;
    }

    const auto& text = std::get<JsonText>(value).text;
    boost::system::error_code ec;
    boost::json::value parsed = boost::json::parse(text, ec);
    if (ec)
        return boost::json::string(text);
    return parsed;
}

boost::json::object
record_to_json(const Record& record)
{
    boost::json::object obj;
    for (const auto& [name, value] : record.fields())
    {
        obj[name] = value_to_json(value);
    }
    return obj;
}

Record
parse_record_line(std::string_view line)
{
    boost::system::error_code ec;
    boost::json::value jv = boost::json::parse(line, ec);
    if (ec)
    {
        throw LedgerSinkError("Malformed JSON record: " + ec.message());
    }
    if (!jv.is_object())
    {
        throw LedgerSinkError("JSON record is not an object");
    }
    return record_from_json(jv.get_object());
}

std::string
serialize_record(const Record& record)
{
    return boost::json::serialize(record_to_json(record));
}

std::optional<std::string>
value_as_json_text(const Value& value)
{
    if (is_null(value))
        return std::nullopt;
    if (auto j = std::get_if<JsonText>(&value))
        return j->text;
    if (auto s = std::get_if<std::string>(&value))
        return *s;
    return boost::json::serialize(value_to_json(value));
}

std::vector<Record>
read_records_jsonl(std::istream& in, size_t* malformed)
{
    std::vector<Record> records;
    std::string line;
    size_t line_no = 0;
    size_t bad = 0;
    while (std::getline(in, line))
    {
        ++line_no;
        if (line.find_first_not_of(" \t\r") == std::string::npos)
            continue;
        try
        {
            records.push_back(parse_record_line(line));
        }
        catch (const LedgerSinkError& e)
        {
            ++bad;
            LOGW("Skipping line ", line_no, ": ", e.what());
        }
    }
    if (malformed)
        *malformed = bad;
    return records;
}

}  // namespace lsink::common
