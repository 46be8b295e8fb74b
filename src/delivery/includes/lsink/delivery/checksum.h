#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace lsink::delivery {

// RAII wrapper for the OpenSSL MD5 EVP API
class Md5Hasher
{
public:
    Md5Hasher();
    ~Md5Hasher();

    Md5Hasher(const Md5Hasher&) = delete;
    Md5Hasher&
    operator=(const Md5Hasher&) = delete;

    /**
     * @throws LedgerSinkError if the update fails
     */
    void
    update(const void* data, size_t len);

    /**
     * Finalize and return the digest as base64, the form object stores
     * report ("1B2M2Y8AsgTpgAmY7PhCfg==" for no input). The hasher cannot
     * be updated afterwards.
     */
    std::string
    final_base64();

private:
    void
    check_context() const;

    void
    cleanup_and_throw(const char* msg);

    void* ctx_;  // opaque pointer to avoid including openssl headers here
};

std::string
md5_base64(std::string_view data);

/**
 * MD5 of a file's contents, streamed in fixed-size blocks.
 * @throws LedgerSinkError when the file cannot be read
 */
std::string
md5_base64_file(const std::string& path);

}  // namespace lsink::delivery
