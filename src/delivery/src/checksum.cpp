#include "lsink/delivery/checksum.h"
#include "lsink/common/errors.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <openssl/evp.h>
#include <vector>

namespace lsink::delivery {

namespace {

constexpr size_t READ_BLOCK_SIZE = 1 << 20;

}  // namespace

Md5Hasher::Md5Hasher() : ctx_(nullptr)
{
    ctx_ = EVP_MD_CTX_new();
    if (!ctx_)
    {
        throw LedgerSinkError("Md5Hasher: EVP_MD_CTX_new() failed");
    }
    if (EVP_DigestInit_ex(static_cast<EVP_MD_CTX*>(ctx_), EVP_md5(), nullptr) !=
        1)
    {
        cleanup_and_throw("Md5Hasher: EVP_DigestInit_ex() failed");
    }
}

Md5Hasher::~Md5Hasher()
{
    if (ctx_)
    {
        EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
    }
}

void
Md5Hasher::check_context() const
{
    if (!ctx_)
    {
        throw LedgerSinkError("Md5Hasher: context is not valid");
    }
}

void
Md5Hasher::cleanup_and_throw(const char* msg)
{
    EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
    ctx_ = nullptr;
    throw LedgerSinkError(msg);
}

void
Md5Hasher::update(const void* data, size_t len)
{
    check_context();
    if (EVP_DigestUpdate(static_cast<EVP_MD_CTX*>(ctx_), data, len) != 1)
    {
        cleanup_and_throw("Md5Hasher: EVP_DigestUpdate failed");
    }
}

std::string
Md5Hasher::final_base64()
{
    check_context();
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(
            static_cast<EVP_MD_CTX*>(ctx_), digest, &digest_len) != 1)
    {
        cleanup_and_throw("Md5Hasher: EVP_DigestFinal_ex failed");
    }
    EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
    ctx_ = nullptr;

    // 4 output bytes per 3 input bytes, plus the terminator
    unsigned char encoded[4 * ((EVP_MAX_MD_SIZE + 2) / 3) + 1];
    int n = EVP_EncodeBlock(encoded, digest, static_cast<int>(digest_len));
    return std::string(reinterpret_cast<const char*>(encoded), n);
}

std::string
md5_base64(std::string_view data)
{
    Md5Hasher hasher;
    hasher.update(data.data(), data.size());
    return hasher.final_base64();
}

std::string
md5_base64_file(const std::string& path)
{
    errno = 0;
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
    {
        throw LedgerSinkError(
            "Cannot open " + path + " for hashing: " + std::strerror(errno));
    }

    Md5Hasher hasher;
    std::vector<char> buffer(READ_BLOCK_SIZE);
    while (in)
    {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto n = in.gcount();
        if (n > 0)
        {
            hasher.update(buffer.data(), static_cast<size_t>(n));
        }
    }
    if (in.bad())
    {
        throw LedgerSinkError(
            "Read error while hashing " + path + ": " + std::strerror(errno));
    }
    return hasher.final_base64();
}

}  // namespace lsink::delivery
