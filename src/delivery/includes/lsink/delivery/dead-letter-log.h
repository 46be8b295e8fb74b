#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lsink::delivery {

/**
 * One failed delivery awaiting retry. Serialized as a JSON object with
 * keys localPath, remotePath, error, timestamp, lastRetry and retryError;
 * timestamps are ISO-8601 UTC with milliseconds.
 */
struct DeadLetterEntry
{
    std::string local_path;
    std::string remote_path;
    std::string error;
    int64_t timestamp_millis = 0;
    std::optional<int64_t> last_retry_millis;
    std::optional<std::string> retry_error;

    bool
    operator==(const DeadLetterEntry&) const = default;
};

boost::json::object
entry_to_json(const DeadLetterEntry& entry);

/**
 * Entries need localPath and remotePath (the older gcsPath key is read as
 * remotePath). Unparseable timestamps read as 0.
 */
std::optional<DeadLetterEntry>
entry_from_json(const boost::json::value& value);

/**
 * Append-only JSON-lines log of failed deliveries.
 *
 * append() writes each entry with one write(2) on an O_APPEND descriptor so
 * concurrent workers never interleave lines. rewrite() replaces the whole
 * log atomically (temp file, fsync, rename) and is used only by the
 * reconciler.
 */
class DeadLetterLog
{
public:
    explicit DeadLetterLog(std::string path);

    /**
     * @throws LedgerSinkError when the entry cannot be written
     */
    void
    append(const DeadLetterEntry& entry);

    /**
     * All entries in file order. A missing file reads as empty; malformed
     * lines are logged, counted in `malformed` (when given) and dropped.
     */
    std::vector<DeadLetterEntry>
    read_all(size_t* malformed = nullptr) const;

    /**
     * @throws LedgerSinkError when the replacement cannot be written; the
     * existing log is left untouched in that case
     */
    void
    rewrite(const std::vector<DeadLetterEntry>& entries);

    const std::string&
    path() const
    {
        return path_;
    }

private:
    std::string path_;
    mutable std::mutex mutex_;
};

}  // namespace lsink::delivery
