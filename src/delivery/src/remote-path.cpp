#include "lsink/delivery/remote-path.h"
#include "lsink/delivery/filesystem-remote-store.h"
#include "lsink/delivery/gsutil-remote-store.h"

#include <algorithm>

namespace lsink::delivery {

std::string
remote_path_for(
    std::string_view bucket,
    std::string_view relative,
    std::string_view prefix)
{
    std::string base(bucket);
    if (base.find("://") == std::string::npos)
    {
        base = "gs://" + base;
    }
    while (!base.empty() && base.back() == '/')
        base.pop_back();

    std::string rel(relative);
    std::replace(rel.begin(), rel.end(), '\\', '/');
    while (!rel.empty() && rel.front() == '/')
        rel.erase(0, 1);

    std::string path = base + "/";
    if (!prefix.empty())
    {
        std::string pfx = std::string(prefix) + "/";
        if (rel.compare(0, pfx.size(), pfx) != 0)
        {
            path += pfx;
        }
    }
    return path + rel;
}

std::shared_ptr<RemoteStore>
make_remote_store(std::string_view bucket)
{
    if (bucket.substr(0, 7) == "file://")
    {
        return std::make_shared<FilesystemRemoteStore>();
    }
    return std::make_shared<GsutilRemoteStore>();
}

}  // namespace lsink::delivery
