#pragma once

#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

#ifndef PROJECT_ROOT
#define PROJECT_ROOT ""
#define PROJECT_ROOT_LENGTH 0
#endif

#define LSINK_RELATIVE_FILEPATH                                \
    (strncmp(__FILE__, PROJECT_ROOT, PROJECT_ROOT_LENGTH) == 0 \
         ? &(__FILE__[PROJECT_ROOT_LENGTH])                    \
         : __FILE__)

namespace lsink {

enum class LogLevel {
    NONE = -2,     // Special level to disable all logging
    INHERIT = -1,  // Special level for partitions to inherit global level
    ERROR = 0,
    WARNING = 1,
    INFO = 2,
    DEBUG = 3
};

class Logger
{
private:
    static LogLevel current_level_;
    static std::mutex log_mutex_;
    static std::ostream* output_stream_;
    static std::ostream* error_stream_;

    static bool
    should_log(LogLevel level);

    static std::string
    format_timestamp()
    {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
            1000;

        std::tm tm_now;
        localtime_r(&time_t_now, &tm_now);

        std::ostringstream oss;
        oss << "[" << std::setfill('0') << std::setw(2) << tm_now.tm_hour << ":"
            << std::setw(2) << tm_now.tm_min << ":" << std::setw(2)
            << tm_now.tm_sec << "." << std::setw(3) << ms.count() << "] ";

        return oss.str();
    }

    static std::ostream&
    stream_for(LogLevel level)
    {
        if (level <= LogLevel::WARNING)
            return error_stream_ ? *error_stream_ : std::cerr;
        return output_stream_ ? *output_stream_ : std::cout;
    }

public:
    static void
    set_level(LogLevel level);

    static bool
    set_level(const std::string& level);

    static LogLevel
    get_level();

    // Redirect INFO/DEBUG output (nullptr restores std::cout)
    static void
    set_output_stream(std::ostream* output_stream);

    // Redirect ERROR/WARNING output (nullptr restores std::cerr)
    static void
    set_error_stream(std::ostream* error_stream);

    static void
    reset_streams();

    // Log with efficient formatting using variadic templates
    template <typename... Args>
    static void
    log(LogLevel level, const Args&... args)
    {
        if (!should_log(level))
            return;

        // Format the message before locking
        std::ostringstream oss;
        oss << format_timestamp();

        switch (level)
        {
            case LogLevel::ERROR:
                oss << "[ERROR] ";
                break;
            case LogLevel::WARNING:
                oss << "[WARN]  ";
                break;
            case LogLevel::INFO:
                oss << "[INFO]  ";
                break;
            case LogLevel::DEBUG:
                oss << "[DEBUG] ";
                break;
            case LogLevel::NONE:
            case LogLevel::INHERIT:
                return;  // Should not happen due to should_log
        }

        (oss << ... << args);

        // Lock only for the actual output operation
        std::lock_guard<std::mutex> lock(log_mutex_);
        stream_for(level) << oss.str() << std::endl;
    }
};

class LogPartition
{
public:
    LogPartition(const std::string& name, LogLevel level = LogLevel::INHERIT)
        : name_(name), level_(level)
    {
    }

    const std::string&
    name() const
    {
        return name_;
    }

    LogLevel
    level() const
    {
        return (level_ == LogLevel::INHERIT) ? Logger::get_level() : level_;
    }

    void
    enable(LogLevel level)
    {
        level_ = level;
    }

    void
    disable()
    {
        level_ = LogLevel::NONE;
    }

    bool
    should_log(LogLevel message_level) const
    {
        LogLevel effective_level = level();
        return effective_level != LogLevel::NONE &&
            message_level <= effective_level;
    }

private:
    std::string name_;
    LogLevel level_;
};

namespace detail {
template <typename T>
class has_log_partition
{
    template <typename C>
    static constexpr auto
    test(int) -> decltype(C::get_log_partition(), bool())
    {
        return true;
    }

    template <typename>
    static constexpr bool
    test(...)
    {
        return false;
    }

public:
    static constexpr bool value = test<T>(0);
};

template <typename T, typename... Args>
inline void
log_with_partition_check(
    LogLevel level,
    const char* file,
    int line,
    const T* /* obj */,
    const Args&... args)
{
    if constexpr (has_log_partition<T>::value)
    {
        auto& partition = T::get_log_partition();
        if (partition.should_log(level))
        {
            Logger::log(
                level,
                "[",
                partition.name(),
                "] ",
                args...,
                " (",
                file,
                ":",
                line,
                ")");
        }
    }
    else
    {
        if (Logger::get_level() >= level)
        {
            Logger::log(level, args..., " (", file, ":", line, ")");
        }
    }
}

template <typename... Args>
inline void
log_to_partition(
    const LogPartition& partition,
    LogLevel level,
    const char* file,
    int line,
    const Args&... args)
{
    if (partition.should_log(level))
    {
        Logger::log(
            level,
            "[",
            partition.name(),
            "] ",
            args...,
            " (",
            file,
            ":",
            line,
            ")");
    }
}
}  // namespace detail

}  // namespace lsink

// Class-aware logging macros (class provides static get_log_partition())
#define OLOGE(...)                           \
    lsink::detail::log_with_partition_check( \
        lsink::LogLevel::ERROR,              \
        LSINK_RELATIVE_FILEPATH,             \
        __LINE__,                            \
        this,                                \
        __VA_ARGS__)
#define OLOGW(...)                           \
    lsink::detail::log_with_partition_check( \
        lsink::LogLevel::WARNING,            \
        LSINK_RELATIVE_FILEPATH,             \
        __LINE__,                            \
        this,                                \
        __VA_ARGS__)
#define OLOGI(...)                           \
    lsink::detail::log_with_partition_check( \
        lsink::LogLevel::INFO,               \
        LSINK_RELATIVE_FILEPATH,             \
        __LINE__,                            \
        this,                                \
        __VA_ARGS__)
#define OLOGD(...)                           \
    lsink::detail::log_with_partition_check( \
        lsink::LogLevel::DEBUG,              \
        LSINK_RELATIVE_FILEPATH,             \
        __LINE__,                            \
        this,                                \
        __VA_ARGS__)

// Partition logging for free functions: PLOGW(encoder_log, "msg ", value)
#define PLOGW(partition, ...)       \
    lsink::detail::log_to_partition( \
        partition,                  \
        lsink::LogLevel::WARNING,   \
        LSINK_RELATIVE_FILEPATH,    \
        __LINE__,                   \
        __VA_ARGS__)
#define PLOGI(partition, ...)       \
    lsink::detail::log_to_partition( \
        partition,                  \
        lsink::LogLevel::INFO,      \
        LSINK_RELATIVE_FILEPATH,    \
        __LINE__,                   \
        __VA_ARGS__)
#define PLOGD(partition, ...)       \
    lsink::detail::log_to_partition( \
        partition,                  \
        lsink::LogLevel::DEBUG,     \
        LSINK_RELATIVE_FILEPATH,    \
        __LINE__,                   \
        __VA_ARGS__)

#define LOGE(...)                   \
    lsink::Logger::log(             \
        lsink::LogLevel::ERROR,     \
        __VA_ARGS__,                \
        " (",                       \
        LSINK_RELATIVE_FILEPATH,    \
        ":",                        \
        __LINE__,                   \
        ")")
#define LOGW(...)                                               \
    if (lsink::Logger::get_level() >= lsink::LogLevel::WARNING) \
    lsink::Logger::log(                                         \
        lsink::LogLevel::WARNING,                               \
        __VA_ARGS__,                                            \
        " (",                                                   \
        LSINK_RELATIVE_FILEPATH,                                \
        ":",                                                    \
        __LINE__,                                               \
        ")")
#define LOGI(...)                                            \
    if (lsink::Logger::get_level() >= lsink::LogLevel::INFO) \
    lsink::Logger::log(                                      \
        lsink::LogLevel::INFO,                               \
        __VA_ARGS__,                                         \
        " (",                                                \
        LSINK_RELATIVE_FILEPATH,                             \
        ":",                                                 \
        __LINE__,                                            \
        ")")
#define LOGD(...)                                             \
    if (lsink::Logger::get_level() >= lsink::LogLevel::DEBUG) \
    lsink::Logger::log(                                       \
        lsink::LogLevel::DEBUG,                               \
        __VA_ARGS__,                                          \
        " (",                                                 \
        LSINK_RELATIVE_FILEPATH,                              \
        ":",                                                  \
        __LINE__,                                             \
        ")")
