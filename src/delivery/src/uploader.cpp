#include "lsink/delivery/uploader.h"
#include "lsink/common/errors.h"
#include "lsink/common/utils.h"
#include "lsink/delivery/checksum.h"

#include <boost/filesystem.hpp>

namespace fs = boost::filesystem;

namespace lsink::delivery {

LogPartition&
Uploader::get_log_partition()
{
    static LogPartition partition("UPLOAD", LogLevel::INHERIT);
    return partition;
}

Uploader::Uploader(
    std::shared_ptr<RemoteStore> store,
    std::shared_ptr<DeadLetterLog> dead_letters,
    UploaderOptions options)
    : store_(std::move(store))
    , dead_letters_(std::move(dead_letters))
    , options_(options)
{
    if (!store_)
    {
        throw ConfigError("Uploader requires a remote store");
    }
    if (!dead_letters_)
    {
        throw ConfigError("Uploader requires a dead-letter log");
    }
}

common::UploadResult
Uploader::transfer(const std::string& local_path, const std::string& remote_path)
{
    common::UploadResult result;
    result.local_path = local_path;
    result.remote_path = remote_path;

    boost::system::error_code ec;
    if (!fs::exists(local_path, ec))
    {
        result.error = "Local file not found: " + local_path;
        return result;
    }

    try
    {
        result.bytes = fs::file_size(local_path);
        result.local_md5 = md5_base64_file(local_path);

        store_->copy_to_remote(local_path, remote_path, options_.timeout);

        auto info = store_->stat(remote_path, options_.timeout);
        result.remote_md5 = info.md5_base64;
        if (!info.md5_base64)
        {
            result.error = "Could not retrieve remote hash for " + remote_path;
        }
        else if (*info.md5_base64 != *result.local_md5)
        {
            result.error = "Hash mismatch: local " + *result.local_md5 +
                ", remote " + *info.md5_base64;
        }
        else
        {
            result.ok = true;
        }
    }
    catch (const std::exception& e)
    {
        result.error = e.what();
    }
    return result;
}

common::UploadResult
Uploader::upload(const std::string& local_path, const std::string& remote_path)
{
    auto started = std::chrono::steady_clock::now();
    auto result = transfer(local_path, remote_path);

    if (result.ok)
    {
        OLOGI(
            "Uploaded ",
            fs::path(local_path).filename().string(),
            " to ",
            remote_path,
            " (",
            result.bytes,
            " bytes)");
    }
    else
    {
        OLOGE(
            "Failed to upload ",
            local_path,
            " to ",
            remote_path,
            ": ",
            result.error.value_or("unknown error"));
    }

    if (!result.ok)
    {
        record_dead_letter(result);
    }
    delete_local(local_path);

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.total_uploads;
        if (result.ok)
        {
            ++stats_.successful_uploads;
            stats_.total_bytes_uploaded += result.bytes;
        }
        else
        {
            ++stats_.failed_uploads;
        }
    }

    if (options_.metrics)
    {
        auto elapsed = std::chrono::duration<double, std::milli>(
                           std::chrono::steady_clock::now() - started)
                           .count();
        options_.metrics->counter(
            result.ok ? "upload.succeeded" : "upload.failed", 1);
        if (result.ok)
            options_.metrics->counter("upload.bytes", result.bytes);
        options_.metrics->timing("upload.duration_ms", elapsed);
    }
    return result;
}

void
Uploader::record_dead_letter(const common::UploadResult& result)
{
    DeadLetterEntry entry;
    entry.local_path = result.local_path;
    entry.remote_path = result.remote_path;
    entry.error = result.error.value_or("unknown error");
    entry.timestamp_millis = common::now_millis();
    try
    {
        dead_letters_->append(entry);
    }
    catch (const LedgerSinkError& e)
    {
        OLOGE(
            "DATA LOSS: could not record failed upload of ",
            result.local_path,
            " to ",
            result.remote_path,
            " in ",
            dead_letters_->path(),
            ": ",
            e.what());
    }
}

void
Uploader::delete_local(const std::string& local_path)
{
    boost::system::error_code ec;
    if (!fs::exists(local_path, ec))
        return;
    fs::remove(local_path, ec);
    if (ec)
    {
        OLOGE("Failed to delete ", local_path, ": ", ec.message());
    }
    else
    {
        OLOGD("Deleted local file ", local_path);
    }
}

UploadStats
Uploader::get_stats() const
{
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void
Uploader::reset_stats()
{
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_ = UploadStats{};
}

}  // namespace lsink::delivery
