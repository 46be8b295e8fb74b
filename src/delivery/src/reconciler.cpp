#include "lsink/delivery/reconciler.h"
#include "lsink/common/errors.h"
#include "lsink/common/utils.h"

#include <boost/filesystem.hpp>
#include <cstddef>
#include <unordered_map>

namespace fs = boost::filesystem;

namespace lsink::delivery {

namespace {

constexpr size_t RECENT_FAILURES = 5;

bool
local_exists(const std::string& path)
{
    boost::system::error_code ec;
    return fs::exists(path, ec);
}

std::string
file_name(const std::string& path)
{
    return fs::path(path).filename().string();
}

}  // namespace

LogPartition&
Reconciler::get_log_partition()
{
    static LogPartition partition("RECONCILE", LogLevel::INHERIT);
    return partition;
}

Reconciler::Reconciler(
    std::shared_ptr<Uploader> uploader,
    std::shared_ptr<DeadLetterLog> log)
    : uploader_(std::move(uploader)), log_(std::move(log))
{
    if (!uploader_ || !log_)
    {
        throw ConfigError("Reconciler requires an uploader and a log");
    }
}

std::vector<DeadLetterEntry>
Reconciler::load(ReconcileResult& result) const
{
    auto entries = log_->read_all();
    result.total = entries.size();

    // Latest entry per remote path wins, first-seen order is kept
    std::vector<DeadLetterEntry> unique;
    std::unordered_map<std::string, size_t> index;
    for (auto& entry : entries)
    {
        auto it = index.find(entry.remote_path);
        if (it == index.end())
        {
            index.emplace(entry.remote_path, unique.size());
            unique.push_back(std::move(entry));
        }
        else if (entry.timestamp_millis >= unique[it->second].timestamp_millis)
        {
            unique[it->second] = std::move(entry);
        }
    }

    result.unique = unique.size();
    result.deduplicated = result.total - result.unique;
    if (result.deduplicated > 0)
    {
        OLOGI(
            "Collapsed ",
            result.deduplicated,
            " repeated entries for the same remote path");
    }
    return unique;
}

ReconcileResult
Reconciler::run()
{
    ReconcileResult result;
    auto entries = load(result);
    if (entries.empty())
    {
        OLOGI("No failed uploads to retry");
        return result;
    }

    OLOGI("Found ", entries.size(), " failed upload(s) to retry");

    std::vector<DeadLetterEntry> remaining;
    for (auto& entry : entries)
    {
        if (!local_exists(entry.local_path))
        {
            ++result.no_file;
            OLOGE(
                "Dropping ",
                entry.remote_path,
                ": local file ",
                entry.local_path,
                " is gone, its data is lost");
            continue;
        }

        auto attempt = uploader_->transfer(entry.local_path, entry.remote_path);
        if (attempt.ok)
        {
            ++result.retried;
            OLOGI(file_name(entry.local_path), " uploaded to ", entry.remote_path);
            boost::system::error_code ec;
            fs::remove(entry.local_path, ec);
            if (ec)
            {
                OLOGW(
                    "Uploaded but could not delete ",
                    entry.local_path,
                    ": ",
                    ec.message());
            }
            continue;
        }

        entry.last_retry_millis = common::now_millis();
        entry.retry_error = attempt.error.value_or("unknown error");
        OLOGW(
            file_name(entry.local_path),
            " still failing: ",
            *entry.retry_error);
        remaining.push_back(std::move(entry));
    }

    log_->rewrite(remaining);
    result.still_failed = remaining.size();

    OLOGI(
        "Results: ",
        result.retried,
        " retried, ",
        result.still_failed,
        " still failed, ",
        result.no_file,
        " files missing");
    return result;
}

ReconcileResult
Reconciler::dry_run() const
{
    ReconcileResult result;
    auto entries = load(result);
    for (const auto& entry : entries)
    {
        bool exists = local_exists(entry.local_path);
        if (!exists)
            ++result.no_file;
        OLOGI(
            exists ? "would retry " : "would drop (missing) ",
            file_name(entry.local_path),
            " -> ",
            entry.remote_path,
            " (failed ",
            common::format_iso_millis(entry.timestamp_millis),
            ")");
    }
    return result;
}

DeadLetterStatus
Reconciler::status() const
{
    DeadLetterStatus status;
    auto entries = log_->read_all();
    status.entries = entries.size();
    for (const auto& entry : entries)
    {
        if (local_exists(entry.local_path))
            ++status.files_present;
    }
    status.files_missing = status.entries - status.files_present;

    size_t first = entries.size() > RECENT_FAILURES
        ? entries.size() - RECENT_FAILURES
        : 0;
    status.recent.assign(
        entries.begin() + static_cast<std::ptrdiff_t>(first), entries.end());
    return status;
}

}  // namespace lsink::delivery
