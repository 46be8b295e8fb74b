#include "lsink/core/logger.h"

#include <gtest/gtest.h>
#include <sstream>

using namespace lsink;

namespace {

class LoggerTest : public ::testing::Test
{
protected:
    void
    SetUp() override
    {
        saved_level_ = Logger::get_level();
        Logger::set_output_stream(&out_);
        Logger::set_error_stream(&err_);
    }

    void
    TearDown() override
    {
        Logger::reset_streams();
        Logger::set_level(saved_level_);
    }

    std::ostringstream out_;
    std::ostringstream err_;
    LogLevel saved_level_ = LogLevel::INFO;
};

struct Component
{
    static LogPartition&
    get_log_partition()
    {
        static LogPartition partition("COMPONENT", LogLevel::INHERIT);
        return partition;
    }

    void
    work() const
    {
        OLOGI("working on ", 3, " items");
    }
};

}  // namespace

TEST_F(LoggerTest, LevelsRouteToTheirStreams)
{
    Logger::set_level(LogLevel::INFO);
    LOGI("hello ", 42);
    LOGW("careful");
    LOGD("hidden");

    EXPECT_NE(out_.str().find("[INFO]  hello 42"), std::string::npos);
    EXPECT_NE(err_.str().find("[WARN]  careful"), std::string::npos);
    EXPECT_EQ(out_.str().find("hidden"), std::string::npos);
}

TEST_F(LoggerTest, SetLevelFromText)
{
    EXPECT_TRUE(Logger::set_level(std::string("debug")));
    EXPECT_EQ(Logger::get_level(), LogLevel::DEBUG);
    EXPECT_TRUE(Logger::set_level(std::string("WARN")));
    EXPECT_EQ(Logger::get_level(), LogLevel::WARNING);
    EXPECT_FALSE(Logger::set_level(std::string("loud")));
    EXPECT_EQ(Logger::get_level(), LogLevel::WARNING);
}

TEST_F(LoggerTest, NoneSilencesEverything)
{
    Logger::set_level(LogLevel::NONE);
    LOGE("nobody hears this");
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(LoggerTest, PartitionPrefixesAndFilters)
{
    Logger::set_level(LogLevel::INFO);
    Component c;
    c.work();
    EXPECT_NE(
        out_.str().find("[COMPONENT] working on 3 items"), std::string::npos);

    out_.str("");
    Component::get_log_partition().disable();
    c.work();
    EXPECT_TRUE(out_.str().empty());

    Component::get_log_partition().enable(LogLevel::INHERIT);
}

TEST_F(LoggerTest, PartitionLevelNarrowsGlobal)
{
    Logger::set_level(LogLevel::DEBUG);
    LogPartition partition("QUIET", LogLevel::WARNING);
    PLOGI(partition, "chatter");
    PLOGW(partition, "problem");

    EXPECT_EQ(out_.str().find("chatter"), std::string::npos);
    EXPECT_NE(err_.str().find("[QUIET] problem"), std::string::npos);
}
