#pragma once

#include "lsink/delivery/remote-store.h"

#include <memory>
#include <string>
#include <string_view>

namespace lsink::delivery {

/**
 * Remote location for a file relative to the scratch directory:
 * "gs://<bucket>/<prefix>/<relative>". A bucket that already carries a
 * scheme ("file:///data/bucket") is used as the base unchanged. The prefix
 * is not repeated when `relative` already starts with it, and backslashes
 * are normalized to forward slashes.
 */
std::string
remote_path_for(
    std::string_view bucket,
    std::string_view relative,
    std::string_view prefix = "raw");

/**
 * Store for a configured bucket: FilesystemRemoteStore for "file://"
 * buckets, GsutilRemoteStore otherwise.
 */
std::shared_ptr<RemoteStore>
make_remote_store(std::string_view bucket);

}  // namespace lsink::delivery
