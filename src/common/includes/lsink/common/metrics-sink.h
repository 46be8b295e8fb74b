#pragma once

#include <cstdint>
#include <string_view>

namespace lsink::common {

/**
 * Abstract interface for receiving pool and upload metrics
 *
 * Producers report without knowing what consumes the values. Implementations
 * must be thread safe: workers report concurrently.
 */
class MetricsSink
{
public:
    virtual ~MetricsSink() = default;

    // Monotonic counter increment (jobs completed, records, bytes)
    virtual void
    counter(std::string_view name, uint64_t delta) = 0;

    // Point-in-time value (active workers, queued jobs)
    virtual void
    gauge(std::string_view name, double value) = 0;

    // Duration of one operation
    virtual void
    timing(std::string_view name, double millis) = 0;
};

/**
 * No-op sink that discards all metrics
 */
class NullMetricsSink : public MetricsSink
{
public:
    void
    counter(std::string_view, uint64_t) override
    {
    }

    void
    gauge(std::string_view, double) override
    {
    }

    void
    timing(std::string_view, double) override
    {
    }
};

/**
 * Writes every metric as a DEBUG line in the METRICS partition
 */
class LoggingMetricsSink : public MetricsSink
{
public:
    void
    counter(std::string_view name, uint64_t delta) override;

    void
    gauge(std::string_view name, double value) override;

    void
    timing(std::string_view name, double millis) override;
};

}  // namespace lsink::common
