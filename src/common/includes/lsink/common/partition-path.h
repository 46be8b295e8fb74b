#pragma once

#include "lsink/common/record.h"

#include <compare>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <string_view>

namespace lsink::common {

/**
 * The migration/year/month/day directory a file belongs to
 */
struct PartitionKey
{
    int64_t migration_id = 0;
    int year = 1970;
    int month = 1;
    int day = 1;

    auto
    operator<=>(const PartitionKey&) const = default;

    // "migration=<id>/year=YYYY/month=MM/day=DD"
    std::string
    path() const;
};

/**
 * Partition for a batch, derived from its first record.
 *
 * The date comes from the first present logical timestamp field for the
 * record kind (events: effective_at, recorded_at, created_at_ts; updates:
 * record_time, effective_at, recorded_at; contracts: snapshot_time,
 * record_time) and falls back to `fallback_millis`. The migration comes from
 * `migration_id`, 0 when absent.
 */
PartitionKey
partition_for(const Record& first, RecordKind kind, int64_t fallback_millis);

// Partition from a Unix timestamp in milliseconds (UTC)
PartitionKey
partition_from_millis(int64_t unix_millis, int64_t migration_id);

/**
 * Generates unique file names "<prefix>-<ts>-<rand>.<ext>".
 *
 * Timestamps are monotonic per namer: a repeated or earlier millisecond is
 * bumped past the last one issued. Thread safe.
 */
class FileNamer
{
public:
    FileNamer();

    std::string
    next_name(std::string_view prefix, std::string_view extension);

    int64_t
    next_timestamp();

private:
    std::mutex mutex_;
    int64_t last_millis_ = 0;
    std::mt19937 rng_;
};

// "[root/]<partition>/<name>", root may be empty
std::string
partition_file_path(
    std::string_view root,
    const PartitionKey& key,
    std::string_view file_name);

}  // namespace lsink::common
