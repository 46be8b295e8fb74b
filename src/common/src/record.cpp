#include "lsink/common/record.h"
#include "lsink/common/utils.h"

#include <charconv>
#include <cmath>
#include <limits>
#include <string>

namespace lsink::common {

namespace {

template <class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::optional<int64_t>
parse_int(std::string_view text)
{
    int64_t out = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    if (ec != std::errc() || ptr != text.data() + text.size() || text.empty())
        return std::nullopt;
    return out;
}

std::optional<int64_t>
double_to_int(double d)
{
    if (!std::isfinite(d) || std::trunc(d) != d ||
        d < static_cast<double>(std::numeric_limits<int64_t>::min()) ||
        d > static_cast<double>(std::numeric_limits<int64_t>::max()))
    {
        return std::nullopt;
    }
    return static_cast<int64_t>(d);
}

}  // namespace

Record::Record(std::initializer_list<Field> fields)
{
    for (const auto& field : fields)
        set(field.first, field.second);
}

void
Record::set(std::string_view name, Value value)
{
    for (auto& field : fields_)
    {
        if (field.first == name)
        {
            field.second = std::move(value);
            return;
        }
    }
    fields_.emplace_back(std::string(name), std::move(value));
}

const Value*
Record::find(std::string_view name) const
{
    for (const auto& field : fields_)
    {
        if (field.first == name)
            return &field.second;
    }
    return nullptr;
}

bool
Record::has(std::string_view name) const
{
    const Value* v = find(name);
    return v != nullptr && !is_null(*v);
}

std::string_view
to_string(RecordKind kind)
{
    switch (kind)
    {
        case RecordKind::EVENTS:
            return "events";
        case RecordKind::UPDATES:
            return "updates";
        case RecordKind::CONTRACTS:
            return "contracts";
    }
    return "unknown";
}

std::optional<RecordKind>
parse_record_kind(std::string_view text)
{
    if (text == "events")
        return RecordKind::EVENTS;
    if (text == "updates")
        return RecordKind::UPDATES;
    if (text == "contracts")
        return RecordKind::CONTRACTS;
    return std::nullopt;
}

std::optional<std::string>
value_as_string(const Value& value)
{
    return std::visit(
        overloaded{
            [](std::monostate) -> std::optional<std::string> {
                return std::nullopt;
            },
            [](bool b) -> std::optional<std::string> {
                return std::string(b ? "true" : "false");
            },
            [](int64_t i) -> std::optional<std::string> {
                return std::to_string(i);
            },
            [](double d) -> std::optional<std::string> {
                if (auto i = double_to_int(d))
                    return std::to_string(*i);
                char buf[32];
                auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
                if (ec != std::errc())
                    return std::nullopt;
                return std::string(buf, ptr);
            },
            [](const std::string& s) -> std::optional<std::string> {
                return s;
            },
            [](const Timestamp& ts) -> std::optional<std::string> {
                return format_iso_millis(ts.unix_millis);
            },
            [](const StringList&) -> std::optional<std::string> {
                return std::nullopt;
            },
            [](const JsonText& j) -> std::optional<std::string> {
                return j.text;
            }},
        value);
}

std::optional<int64_t>
value_as_int(const Value& value)
{
    if (auto i = std::get_if<int64_t>(&value))
        return *i;
    if (auto d = std::get_if<double>(&value))
        return double_to_int(*d);
    if (auto b = std::get_if<bool>(&value))
        return *b ? 1 : 0;
    if (auto s = std::get_if<std::string>(&value))
        return parse_int(*s);
    if (auto ts = std::get_if<Timestamp>(&value))
        return ts->unix_millis;
    return std::nullopt;
}

std::optional<bool>
value_as_bool(const Value& value)
{
    if (auto b = std::get_if<bool>(&value))
        return *b;
    if (auto i = std::get_if<int64_t>(&value))
        return *i != 0;
    if (auto s = std::get_if<std::string>(&value))
    {
        if (*s == "true")
            return true;
        if (*s == "false")
            return false;
    }
    return std::nullopt;
}

std::optional<int64_t>
value_as_timestamp(const Value& value)
{
    if (auto ts = std::get_if<Timestamp>(&value))
        return ts->unix_millis;
    if (auto i = std::get_if<int64_t>(&value))
        return *i;
    if (auto d = std::get_if<double>(&value))
    {
        if (!std::isfinite(*d))
            return std::nullopt;
        return static_cast<int64_t>(*d);
    }
    if (auto s = std::get_if<std::string>(&value))
    {
        if (auto millis = parse_int(*s))
            return millis;
        return parse_iso_millis(*s);
    }
    return std::nullopt;
}

std::optional<StringList>
value_as_string_list(const Value& value)
{
    if (auto list = std::get_if<StringList>(&value))
        return *list;
    return std::nullopt;
}

bool
is_scalar(const Value& value)
{
    return !is_null(value) && !std::holds_alternative<StringList>(value) &&
        !std::holds_alternative<JsonText>(value);
}

bool
is_null(const Value& value)
{
    return std::holds_alternative<std::monostate>(value);
}

}  // namespace lsink::common
