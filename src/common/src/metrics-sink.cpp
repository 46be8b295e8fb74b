#include "lsink/common/metrics-sink.h"
#include "lsink/core/logger.h"

namespace lsink::common {

namespace {
LogPartition metrics_log("METRICS", LogLevel::INHERIT);
}

void
LoggingMetricsSink::counter(std::string_view name, uint64_t delta)
{
    PLOGD(metrics_log, "counter ", name, " +", delta);
}

void
LoggingMetricsSink::gauge(std::string_view name, double value)
{
    PLOGD(metrics_log, "gauge ", name, " = ", value);
}

void
LoggingMetricsSink::timing(std::string_view name, double millis)
{
    PLOGD(metrics_log, "timing ", name, " ", millis, "ms");
}

}  // namespace lsink::common
