#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace lsink::delivery {

// What a remote store reports about one object
struct RemoteObjectInfo
{
    std::optional<std::string> md5_base64;
    std::optional<uint64_t> size;
};

/**
 * Abstract interface for durable remote storage
 *
 * Every operation carries an explicit timeout. Implementations raise
 * RemoteTimeoutError when it expires and LedgerSinkError for any other
 * failure. Implementations must be safe to call from several workers at
 * once.
 */
class RemoteStore
{
public:
    virtual ~RemoteStore() = default;

    virtual void
    copy_to_remote(
        const std::string& local_path,
        const std::string& remote_path,
        std::chrono::milliseconds timeout) = 0;

    virtual RemoteObjectInfo
    stat(const std::string& remote_path, std::chrono::milliseconds timeout) = 0;

    virtual void
    delete_remote(
        const std::string& remote_path,
        std::chrono::milliseconds timeout) = 0;
};

}  // namespace lsink::delivery
