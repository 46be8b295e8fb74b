#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace lsink::encoder {

// Size of the big-endian length prefix in front of every frame
inline constexpr size_t FRAME_PREFIX_SIZE = 4;

// Largest payload a frame prefix can describe
inline constexpr uint64_t MAX_FRAME_SIZE = 0xFFFFFFFFull;

// zstd levels accepted for frames
inline constexpr int MIN_COMPRESSION_LEVEL = 1;
inline constexpr int MAX_COMPRESSION_LEVEL = 22;

/**
 * Compress one serialized chunk as a single standalone zstd frame.
 * @param level zstd level 1-22
 * @throws FrameCompressionError when ZSTD_compress reports an error
 */
std::string
compress_payload(std::string_view payload, int level);

/**
 * Decompress one frame payload. Output grows as data is produced, so a
 * forged content size in the zstd header allocates nothing up front.
 * @throws CorruptFrameError when the bytes are not exactly one valid zstd
 * frame
 */
std::string
decompress_payload(std::string_view compressed);

}  // namespace lsink::encoder
