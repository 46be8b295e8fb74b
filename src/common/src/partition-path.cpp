#include "lsink/common/partition-path.h"
#include "lsink/common/utils.h"

#include <cstdio>
#include <ctime>
#include <vector>

namespace lsink::common {

namespace {

const std::vector<const char*>&
timestamp_fields(RecordKind kind)
{
    static const std::vector<const char*> events = {
        "effective_at", "recorded_at", "created_at_ts"};
    static const std::vector<const char*> updates = {
        "record_time", "effective_at", "recorded_at"};
    static const std::vector<const char*> contracts = {
        "snapshot_time", "record_time"};

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

}  // namespace

std::string
PartitionKey::path() const
{
    char buf[96];
    std::snprintf(
        buf,
        sizeof(buf),
        "migration=%lld/year=%04d/month=%02d/day=%02d",
        static_cast<long long>(migration_id),
        year,
        month,
        day);
    return buf;
}

PartitionKey
partition_from_millis(int64_t unix_millis, int64_t migration_id)
{
    time_t secs = static_cast<time_t>(unix_millis / 1000);
    std::tm tm_utc{};
    gmtime_r(&secs, &tm_utc);

    PartitionKey key;
    key.migration_id = migration_id;
    key.year = tm_utc.tm_year + 1900;
    key.month = tm_utc.tm_mon + 1;
    key.day = tm_utc.tm_mday;
    return key;
}

PartitionKey
partition_for(const Record& first, RecordKind kind, int64_t fallback_millis)
{
    int64_t millis = fallback_millis;
    for (const char* field : timestamp_fields(kind))
    {
        const Value* v = first.find(field);
        if (!v)
            continue;
        if (auto ts = value_as_timestamp(*v))
        {
            millis = *ts;
            break;
        }
    }

    int64_t migration_id = 0;
    if (const Value* v = first.find("migration_id"))
    {
        migration_id = value_as_int(*v).value_or(0);
    }
    return partition_from_millis(millis, migration_id);
}

FileNamer::FileNamer() : rng_(std::random_device{}())
{
}

int64_t
FileNamer::next_timestamp()
{
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t now = now_millis();
    last_millis_ = now > last_millis_ ? now : last_millis_ + 1;
    return last_millis_;
}

std::string
FileNamer::next_name(std::string_view prefix, std::string_view extension)
{
    int64_t ts = next_timestamp();
    uint32_t rand = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rand = static_cast<uint32_t>(rng_());
    }

    char suffix[16];
    std::snprintf(suffix, sizeof(suffix), "%08x", rand);

    std::string name;
    name.reserve(prefix.size() + extension.size() + 32);
    name.append(prefix);
    name.append("-");
    name.append(std::to_string(ts));
    name.append("-");
    name.append(suffix);
    name.append(".");
    name.append(extension);
    return name;
}

std::string
partition_file_path(
    std::string_view root,
    const PartitionKey& key,
    std::string_view file_name)
{
    std::string path;
    if (!root.empty())
    {
        path.append(root);
        if (path.back() != '/')
            path.push_back('/');
    }
    path.append(key.path());
    path.push_back('/');
    path.append(file_name);
    return path;
}

}  // namespace lsink::common
