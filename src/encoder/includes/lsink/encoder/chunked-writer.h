#pragma once

#include "lsink/common/record.h"
#include "lsink/core/logger.h"

#include <cstdint>
#include <fstream>
#include <span>
#include <string>
#include <vector>

namespace lsink::encoder {

struct EncodeStats
{
    uint64_t records_written = 0;
    uint64_t records_skipped = 0;
    uint64_t chunks_written = 0;
    uint64_t original_bytes = 0;    // serialized batch bytes
    uint64_t compressed_bytes = 0;  // file bytes, prefixes included
};

/**
 * Streams records into a chunked binary file.
 *
 * Each write_chunk() call maps its records to protobuf messages, serializes
 * them as one batch, compresses the bytes independently and appends
 * `[uint32 BE length][payload]`. Only one chunk is held in memory at a time.
 *
 * Records that fail mapping are skipped and counted; a chunk whose records
 * were all skipped writes nothing; a chunk that fails to serialize or
 * compress is logged and skipped. Open and write failures abort with
 * EncoderIoError.
 */
class ChunkedWriter
{
public:
    /**
     * @throws InvalidJobError for record kinds without a binary encoding
     * @throws EncoderIoError when the file cannot be created
     */
    ChunkedWriter(
        std::string path,
        common::RecordKind kind,
        int compression_level);

    void
    write_chunk(std::span<const common::Record> records);

    // Flush and close. Idempotent.
    EncodeStats
    finish();

    const EncodeStats&
    stats() const
    {
        return stats_;
    }

    const std::string&
    path() const
    {
        return path_;
    }

    static LogPartition&
    get_log_partition();

private:
    std::string
    build_payload(std::span<const common::Record> records, uint64_t& written);

    void
    append_frame(const std::string& compressed);

    std::string path_;
    common::RecordKind kind_;
    int compression_level_;
    std::ofstream out_;
    EncodeStats stats_;
    uint64_t chunk_index_ = 0;
    bool finished_ = false;
};

/**
 * Encode `records` into `path` in consecutive chunks of at most
 * `chunk_size` records, preserving order.
 */
EncodeStats
encode_to_file(
    const std::string& path,
    common::RecordKind kind,
    const std::vector<common::Record>& records,
    size_t chunk_size,
    int compression_level);

}  // namespace lsink::encoder
