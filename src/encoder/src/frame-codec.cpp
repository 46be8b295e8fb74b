#include "lsink/encoder/frame-codec.h"
#include "lsink/common/errors.h"

#include <memory>
#include <new>
#include <vector>
#include <zstd.h>

namespace lsink::encoder {

namespace {

struct DCtxDeleter
{
    void
    operator()(ZSTD_DCtx* ctx) const
    {
        ZSTD_freeDCtx(ctx);
    }
};

}  // namespace

std::string
compress_payload(std::string_view payload, int level)
{
    size_t const bound = ZSTD_compressBound(payload.size());
    std::string compressed(bound, '\0');

    size_t const compressed_size = ZSTD_compress(
        compressed.data(), bound, payload.data(), payload.size(), level);
    if (ZSTD_isError(compressed_size))
    {
        throw FrameCompressionError(
            std::string("ZSTD compression failed: ") +
            ZSTD_getErrorName(compressed_size));
    }
    compressed.resize(compressed_size);
    return compressed;
}

std::string
decompress_payload(std::string_view compressed)
{
    std::unique_ptr<ZSTD_DCtx, DCtxDeleter> dctx(ZSTD_createDCtx());
    if (!dctx)
    {
        throw std::bad_alloc();
    }

    std::string payload;
    std::vector<char> out_buffer(ZSTD_DStreamOutSize());
    ZSTD_inBuffer input{compressed.data(), compressed.size(), 0};
    size_t remaining = 1;
    while (input.pos < input.size)
    {
        ZSTD_outBuffer output{out_buffer.data(), out_buffer.size(), 0};
        remaining = ZSTD_decompressStream(dctx.get(), &output, &input);
        if (ZSTD_isError(remaining))
        {
            throw CorruptFrameError(
                std::string("Frame payload is not valid zstd data: ") +
                ZSTD_getErrorName(remaining));
        }
        payload.append(out_buffer.data(), output.pos);
        if (remaining == 0 && input.pos < input.size)
        {
            throw CorruptFrameError(
                "Frame payload has " + std::to_string(input.size - input.pos) +
                " trailing bytes after its zstd frame");
        }
    }
    if (remaining != 0)
    {
        throw CorruptFrameError("Frame payload ends inside its zstd frame");
    }
    return payload;
}

}  // namespace lsink::encoder
