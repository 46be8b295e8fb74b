#include "lsink/delivery/filesystem-remote-store.h"
#include "lsink/common/errors.h"
#include "lsink/delivery/checksum.h"

namespace fs = boost::filesystem;

namespace lsink::delivery {

FilesystemRemoteStore::FilesystemRemoteStore(std::string root)
    : root_(std::move(root))
{
}

fs::path
FilesystemRemoteStore::resolve(const std::string& remote_path) const
{
    std::string rest = remote_path;
    auto scheme_end = remote_path.find("://");
    if (scheme_end != std::string::npos)
    {
        rest = remote_path.substr(scheme_end + 3);
    }

    if (root_.empty())
    {
        if (rest.empty() || rest.front() != '/')
        {
            throw LedgerSinkError(
                "Remote path " + remote_path +
                " does not name an absolute local path");
        }
        return fs::path(rest);
    }

    while (!rest.empty() && rest.front() == '/')
        rest.erase(0, 1);
    return fs::path(root_) / rest;
}

void
FilesystemRemoteStore::copy_to_remote(
    const std::string& local_path,
    const std::string& remote_path,
    std::chrono::milliseconds)
{
    fs::path target = resolve(remote_path);
    boost::system::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec)
    {
        throw LedgerSinkError(
            "Cannot create " + target.parent_path().string() + ": " +
            ec.message());
    }
    fs::copy_file(local_path, target, fs::copy_options::overwrite_existing, ec);
    if (ec)
    {
        throw LedgerSinkError(
            "Copy " + local_path + " to " + target.string() +
            " failed: " + ec.message());
    }
}

RemoteObjectInfo
FilesystemRemoteStore::stat(
    const std::string& remote_path,
    std::chrono::milliseconds)
{
    fs::path target = resolve(remote_path);
    boost::system::error_code ec;
    auto size = fs::file_size(target, ec);
    if (ec)
    {
        throw LedgerSinkError(
            "No such object " + remote_path + ": " + ec.message());
    }

    RemoteObjectInfo info;
    info.size = size;
    info.md5_base64 = md5_base64_file(target.string());
    return info;
}

void
FilesystemRemoteStore::delete_remote(
    const std::string& remote_path,
    std::chrono::milliseconds)
{
    boost::system::error_code ec;
    if (!fs::remove(resolve(remote_path), ec) || ec)
    {
        throw LedgerSinkError(
            "Cannot delete " + remote_path +
            (ec ? ": " + ec.message() : ": no such object"));
    }
}

}  // namespace lsink::delivery
