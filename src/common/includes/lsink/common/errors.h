#pragma once

#include <stdexcept>
#include <string>

namespace lsink {

// Base exception for all ledger-sink errors
class LedgerSinkError : public std::runtime_error
{
public:
    explicit LedgerSinkError(const std::string& msg) : std::runtime_error(msg)
    {
    }
};

/**
 * Failures likely to succeed on retry. The pool retries these (and any
 * other exception whose message the transient classifier matches).
 */
class TransientError : public LedgerSinkError
{
public:
    explicit TransientError(const std::string& msg) : LedgerSinkError(msg)
    {
    }
};

// Failures that never succeed on retry
class PermanentError : public LedgerSinkError
{
public:
    explicit PermanentError(const std::string& msg) : LedgerSinkError(msg)
    {
    }
};

// A remote store operation exceeded its timeout
class RemoteTimeoutError : public TransientError
{
public:
    explicit RemoteTimeoutError(const std::string& msg) : TransientError(msg)
    {
    }
};

// A worker thread died while running a job
class WorkerCrashedError : public TransientError
{
public:
    explicit WorkerCrashedError(const std::string& msg) : TransientError(msg)
    {
    }
};

// Job shape the executor cannot run (e.g. encoding contracts)
class InvalidJobError : public PermanentError
{
public:
    explicit InvalidJobError(const std::string& msg) : PermanentError(msg)
    {
    }
};

// Destination file could not be opened or written
class EncoderIoError : public PermanentError
{
public:
    explicit EncoderIoError(const std::string& msg) : PermanentError(msg)
    {
    }
};

// One chunk could not be compressed; the writer drops that chunk only
class FrameCompressionError : public PermanentError
{
public:
    explicit FrameCompressionError(const std::string& msg)
        : PermanentError(msg)
    {
    }
};

class MaterializeError : public PermanentError
{
public:
    explicit MaterializeError(const std::string& msg) : PermanentError(msg)
    {
    }
};

// Raised only under the `fail` validation policy
class ValidationFailedError : public PermanentError
{
public:
    explicit ValidationFailedError(const std::string& msg)
        : PermanentError(msg)
    {
    }
};

class ConfigError : public PermanentError
{
public:
    explicit ConfigError(const std::string& msg) : PermanentError(msg)
    {
    }
};

// Truncated or undecodable frame in a chunked binary file
class CorruptFrameError : public PermanentError
{
public:
    explicit CorruptFrameError(const std::string& msg) : PermanentError(msg)
    {
    }
};

class PoolShutdownError : public PermanentError
{
public:
    explicit PoolShutdownError(const std::string& msg) : PermanentError(msg)
    {
    }
};

}  // namespace lsink
