#include "lsink/encoder/chunked-writer.h"
#include "ledger.pb.h"
#include "lsink/common/errors.h"
#include "lsink/common/utils.h"
#include "lsink/encoder/field-mapping.h"
#include "lsink/encoder/frame-codec.h"

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace lsink::encoder {

namespace {

std::string
os_error()
{
    return errno != 0 ? std::strerror(errno) : "unknown error";
}

}  // namespace

LogPartition&
ChunkedWriter::get_log_partition()
{
    static LogPartition partition("ENCODER", LogLevel::INHERIT);
    return partition;
}

ChunkedWriter::ChunkedWriter(
    std::string path,
    common::RecordKind kind,
    int compression_level)
    : path_(std::move(path)), kind_(kind), compression_level_(compression_level)
{
    if (kind_ == common::RecordKind::CONTRACTS)
    {
        throw InvalidJobError(
            "Binary encoding supports events and updates, not contracts");
    }
    if (compression_level_ < MIN_COMPRESSION_LEVEL ||
        compression_level_ > MAX_COMPRESSION_LEVEL)
    {
        throw InvalidJobError(
            "zstd compression level must be 1-22, got " +
            std::to_string(compression_level_));
    }

    errno = 0;
    out_.open(path_, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!out_.is_open() || !out_.good())
    {
        throw EncoderIoError(
            "Failed to open output file " + path_ + ": " + os_error());
    }
}

std::string
ChunkedWriter::build_payload(
    std::span<const common::Record> records,
    uint64_t& written)
{
    written = 0;
    std::string serialized;

    auto note_skip = [&](size_t index, const SkipReason& reason) {
        ++stats_.records_skipped;
        OLOGW(
            "Skipping record ",
            index,
            " of chunk ",
            chunk_index_,
            " in ",
            path_,
            ": ",
            reason.message);
    };

    if (kind_ == common::RecordKind::EVENTS)
    {
        ledger::EventBatch batch;
        batch.set_schema_version(LEDGER_SCHEMA_VERSION);
        for (size_t i = 0; i < records.size(); ++i)
        {
            auto mapped = map_event(records[i]);
            if (auto skip = std::get_if<SkipReason>(&mapped))
            {
                note_skip(i, *skip);
                continue;
            }
            *batch.add_events() = std::move(std::get<ledger::Event>(mapped));
        }
        written = static_cast<uint64_t>(batch.events_size());
        if (written > 0 && !batch.SerializeToString(&serialized))
        {
            serialized.clear();
        }
    }
    else
    {
        ledger::UpdateBatch batch;
        batch.set_schema_version(LEDGER_SCHEMA_VERSION);
        for (size_t i = 0; i < records.size(); ++i)
        {
            auto mapped = map_update(records[i]);
            if (auto skip = std::get_if<SkipReason>(&mapped))
            {
                note_skip(i, *skip);
                continue;
            }
            *batch.add_updates() = std::move(std::get<ledger::Update>(mapped));
        }
        written = static_cast<uint64_t>(batch.updates_size());
        if (written > 0 && !batch.SerializeToString(&serialized))
        {
            serialized.clear();
        }
    }
    return serialized;
}

void
ChunkedWriter::write_chunk(std::span<const common::Record> records)
{
    if (finished_)
    {
        throw EncoderIoError("Writer for " + path_ + " is already finished");
    }

    uint64_t written = 0;
    std::string serialized = build_payload(records, written);
    uint64_t chunk = chunk_index_++;

    if (written == 0)
    {
        OLOGD("Chunk ", chunk, " of ", path_, " has no records to write");
        return;
    }
    if (serialized.empty())
    {
        OLOGE(
            "Failed to serialize chunk ",
            chunk,
            " of ",
            path_,
            ", dropping ",
            written,
            " records");
        stats_.records_skipped += written;
        return;
    }

    std::string compressed;
    try
    {
        compressed = compress_payload(serialized, compression_level_);
    }
    catch (const FrameCompressionError& e)
    {
        OLOGE(
            "Failed to compress chunk ",
            chunk,
            " of ",
            path_,
            ": ",
            e.what(),
            ", dropping ",
            written,
            " records");
        stats_.records_skipped += written;
        return;
    }

    if (compressed.size() > MAX_FRAME_SIZE)
    {
        OLOGE(
            "Chunk ",
            chunk,
            " of ",
            path_,
            " exceeds the frame size limit, dropping ",
            written,
            " records");
        stats_.records_skipped += written;
        return;
    }

    append_frame(compressed);

    stats_.records_written += written;
    stats_.chunks_written += 1;
    stats_.original_bytes += serialized.size();
    stats_.compressed_bytes += FRAME_PREFIX_SIZE + compressed.size();
}

void
ChunkedWriter::append_frame(const std::string& compressed)
{
    uint8_t prefix[FRAME_PREFIX_SIZE];
    common::put_uint32_be(prefix, static_cast<uint32_t>(compressed.size()));

    errno = 0;
    out_.write(reinterpret_cast<const char*>(prefix), sizeof(prefix));
    out_.write(compressed.data(), static_cast<std::streamsize>(compressed.size()));
    if (!out_.good())
    {
        throw EncoderIoError(
            "Failed writing chunk " + std::to_string(chunk_index_ - 1) +
            " to " + path_ + ": " + os_error());
    }
}

EncodeStats
ChunkedWriter::finish()
{
    if (finished_)
        return stats_;
    finished_ = true;

    errno = 0;
    out_.flush();
    bool flushed = out_.good();
    out_.close();
    if (!flushed || out_.fail())
    {
        throw EncoderIoError(
            "Failed to finalize " + path_ + ": " + os_error());
    }

    OLOGD(
        "Finished ",
        path_,
        ": ",
        stats_.records_written,
        " records in ",
        stats_.chunks_written,
        " chunks, ",
        stats_.compressed_bytes,
        " bytes (",
        stats_.records_skipped,
        " skipped)");
    return stats_;
}

EncodeStats
encode_to_file(
    const std::string& path,
    common::RecordKind kind,
    const std::vector<common::Record>& records,
    size_t chunk_size,
    int compression_level)
{
    if (chunk_size == 0)
    {
        throw InvalidJobError("chunk_size must be positive");
    }

    ChunkedWriter writer(path, kind, compression_level);
    std::span<const common::Record> all(records);
    for (size_t offset = 0; offset < all.size(); offset += chunk_size)
    {
        size_t count = std::min(chunk_size, all.size() - offset);
        writer.write_chunk(all.subspan(offset, count));
    }
    return writer.finish();
}

}  // namespace lsink::encoder
