#include "lsink/delivery/dead-letter-log.h"
#include "lsink/common/errors.h"
#include "lsink/common/utils.h"
#include "lsink/core/logger.h"

#include <boost/filesystem.hpp>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <unistd.h>

namespace fs = boost::filesystem;

namespace lsink::delivery {

namespace {

void
write_all(int fd, const std::string& data, const std::string& path)
{
    const char* p = data.data();
    size_t left = data.size();
    while (left > 0)
    {
        ssize_t n = ::write(fd, p, left);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            throw LedgerSinkError(
                "Write to " + path + " failed: " + std::strerror(errno));
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
}

void
ensure_parent(const std::string& path)
{
    fs::path parent = fs::path(path).parent_path();
    if (parent.empty())
        return;
    boost::system::error_code ec;
    fs::create_directories(parent, ec);
    if (ec)
    {
        throw LedgerSinkError(
            "Cannot create " + parent.string() + ": " + ec.message());
    }
}

std::optional<std::string>
string_field(const boost::json::object& obj, const char* key)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_string())
        return std::nullopt;
    return std::string(it->value().as_string());
}

}  // namespace

boost::json::object
entry_to_json(const DeadLetterEntry& entry)
{
    boost::json::object obj;
    obj["localPath"] = entry.local_path;
    obj["remotePath"] = entry.remote_path;
    obj["error"] = entry.error;
    obj["timestamp"] = common::format_iso_millis(entry.timestamp_millis);
    if (entry.last_retry_millis)
    {
        obj["lastRetry"] = common::format_iso_millis(*entry.last_retry_millis);
    }
    if (entry.retry_error)
    {
        obj["retryError"] = *entry.retry_error;
    }
    return obj;
}

std::optional<DeadLetterEntry>
entry_from_json(const boost::json::value& value)
{
    if (!value.is_object())
        return std::nullopt;
    const auto& obj = value.as_object();

    auto local = string_field(obj, "localPath");
    auto remote = string_field(obj, "remotePath");
    if (!remote)
        remote = string_field(obj, "gcsPath");
    if (!local || !remote)
        return std::nullopt;

    DeadLetterEntry entry;
    entry.local_path = std::move(*local);
    entry.remote_path = std::move(*remote);
    entry.error = string_field(obj, "error").value_or("");
    if (auto ts = string_field(obj, "timestamp"))
    {
        entry.timestamp_millis = common::parse_iso_millis(*ts).value_or(0);
    }
    if (auto ts = string_field(obj, "lastRetry"))
    {
        entry.last_retry_millis = common::parse_iso_millis(*ts);
    }
    entry.retry_error = string_field(obj, "retryError");
    return entry;
}

DeadLetterLog::DeadLetterLog(std::string path) : path_(std::move(path))
{
}

void
DeadLetterLog::append(const DeadLetterEntry& entry)
{
    std::string line = boost::json::serialize(entry_to_json(entry));
    line.push_back('\n');

    std::lock_guard<std::mutex> lock(mutex_);
    ensure_parent(path_);
    int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (fd < 0)
    {
        throw LedgerSinkError(
            "Cannot open dead-letter log " + path_ + ": " +
            std::strerror(errno));
    }
    try
    {
        write_all(fd, line, path_);
    }
    catch (const LedgerSinkError&)
    {
        ::close(fd);
        throw;
    }
    if (::close(fd) != 0)
    {
        throw LedgerSinkError(
            "Close of dead-letter log " + path_ + " failed: " +
            std::strerror(errno));
    }
}

std::vector<DeadLetterEntry>
DeadLetterLog::read_all(size_t* malformed) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeadLetterEntry> entries;
    if (malformed)
        *malformed = 0;

    std::ifstream in(path_);
    if (!in.is_open())
        return entries;

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line))
    {
        ++line_no;
        if (line.find_first_not_of(" \t\r") == std::string::npos)
            continue;

        boost::system::error_code ec;
        auto value = boost::json::parse(line, ec);
        std::optional<DeadLetterEntry> entry;
        if (!ec)
            entry = entry_from_json(value);
        if (!entry)
        {
            LOGW("Skipping malformed dead-letter line ", line_no, " in ", path_);
            if (malformed)
                ++*malformed;
            continue;
        }
        entries.push_back(std::move(*entry));
    }
    return entries;
}

void
DeadLetterLog::rewrite(const std::vector<DeadLetterEntry>& entries)
{
    std::string content;
    for (const auto& entry : entries)
    {
        content += boost::json::serialize(entry_to_json(entry));
        content.push_back('\n');
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ensure_parent(path_);
    std::string tmp = path_ + ".tmp";
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0)
    {
        throw LedgerSinkError(
            "Cannot create " + tmp + ": " + std::strerror(errno));
    }

    try
    {
        write_all(fd, content, tmp);
        if (::fsync(fd) != 0)
        {
            throw LedgerSinkError(
                "fsync of " + tmp + " failed: " + std::strerror(errno));
        }
    }
    catch (const LedgerSinkError&)
    {
        ::close(fd);
        ::unlink(tmp.c_str());
        throw;
    }

    if (::close(fd) != 0 || std::rename(tmp.c_str(), path_.c_str()) != 0)
    {
        std::string reason = std::strerror(errno);
        ::unlink(tmp.c_str());
        throw LedgerSinkError(
            "Cannot replace dead-letter log " + path_ + ": " + reason);
    }
}

}  // namespace lsink::delivery
