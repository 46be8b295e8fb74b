#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace lsink::common {

// Outcome of one delivery attempt for a local file
struct UploadResult
{
    bool ok = false;
    std::string local_path;
    std::string remote_path;
    uint64_t bytes = 0;
    std::optional<std::string> local_md5;
    std::optional<std::string> remote_md5;
    std::optional<std::string> error;
};

}  // namespace lsink::common
