#pragma once

#include "ledger.pb.h"
#include "lsink/common/record.h"

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace lsink::encoder {

/**
 * Reads a chunked binary file frame by frame:
 * `loop { read uint32 BE length; read length bytes; zstd-decompress; parse }` to EOF.
 *
 * A truncated prefix, a length prefix larger than the rest of the file, an
 * undecodable payload or a batch that does not parse raises
 * CorruptFrameError. The length is checked against the file size before any
 * payload buffer is allocated.
 */
class ChunkedReader
{
public:
    // @throws EncoderIoError when the file cannot be opened
    explicit ChunkedReader(const std::string& path);

    // Next frame's decompressed payload; false at a clean end of file
    bool
    next_payload(std::string& payload);

    bool
    next(ledger::EventBatch& batch);

    bool
    next(ledger::UpdateBatch& batch);

    uint64_t
    frames_read() const
    {
        return frames_read_;
    }

private:
    std::string path_;
    std::ifstream in_;
    uint64_t file_size_ = 0;
    uint64_t frames_read_ = 0;
};

std::vector<ledger::Event>
read_all_events(const std::string& path);

std::vector<ledger::Update>
read_all_updates(const std::string& path);

// Total records across every frame
uint64_t
count_records(const std::string& path, common::RecordKind kind);

}  // namespace lsink::encoder
