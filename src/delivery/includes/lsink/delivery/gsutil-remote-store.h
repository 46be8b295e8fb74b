#pragma once

#include "lsink/delivery/remote-store.h"

#include <string>
#include <string_view>
#include <vector>

namespace lsink::delivery {

/**
 * Remote store backed by the gsutil command line tool.
 *
 * Each operation runs gsutil as a child process; the child is killed when
 * the timeout expires. Authentication is whatever gsutil is configured with.
 */
class GsutilRemoteStore : public RemoteStore
{
public:
    explicit GsutilRemoteStore(std::string gsutil = "gsutil");

    void
    copy_to_remote(
        const std::string& local_path,
        const std::string& remote_path,
        std::chrono::milliseconds timeout) override;

    RemoteObjectInfo
    stat(const std::string& remote_path, std::chrono::milliseconds timeout)
        override;

    void
    delete_remote(
        const std::string& remote_path,
        std::chrono::milliseconds timeout) override;

private:
    struct CommandOutput
    {
        int exit_code = 0;
        std::string out;
        std::string err;
    };

    CommandOutput
    run(const std::vector<std::string>& args,
        std::chrono::milliseconds timeout) const;

    std::string gsutil_;
};

/**
 * Extract "Hash (md5):" and "Content-Length:" from `gsutil stat` output.
 * Missing lines leave the fields empty.
 */
RemoteObjectInfo
parse_gsutil_stat(std::string_view output);

}  // namespace lsink::delivery
