#pragma once

#include "lsink/delivery/remote-store.h"

#include <boost/filesystem.hpp>
#include <string>

namespace lsink::delivery {

/**
 * Remote store that mirrors the bucket into a local directory tree.
 *
 * With an empty root, "file://<abs path>" remote paths map to that path.
 * With a root, "<scheme>://<rest>" maps to "<root>/<rest>". Stat recomputes
 * the MD5 of the stored copy. Timeouts are not enforced on local copies.
 */
class FilesystemRemoteStore : public RemoteStore
{
public:
    explicit FilesystemRemoteStore(std::string root = "");

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

    // Local location backing a remote path
    boost::filesystem::path
    resolve(const std::string& remote_path) const;

private:
    std::string root_;
};

}  // namespace lsink::delivery
