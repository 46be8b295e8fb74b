#pragma once

#include "fake-remote-store.h"
#include "lsink/delivery/dead-letter-log.h"
#include "lsink/delivery/uploader.h"

#include <boost/filesystem.hpp>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>
#include <string>

namespace lsink::test {

class DeliveryTest : public ::testing::Test
{
protected:
    void
    SetUp() override
    {
        dir_ = boost::filesystem::temp_directory_path() /
            boost::filesystem::unique_path("delivery_%%%%%%");
        boost::filesystem::create_directories(dir_);

        store_ = std::make_shared<FakeRemoteStore>();
        log_ = std::make_shared<delivery::DeadLetterLog>(
            (dir_ / "failed-uploads.jsonl").string());
        delivery::UploaderOptions options;
        options.timeout = std::chrono::milliseconds(1000);
        uploader_ = std::make_shared<delivery::Uploader>(store_, log_, options);
    }

    void
    TearDown() override
    {
        boost::filesystem::remove_all(dir_);
    }

    std::string
    write_file(const std::string& name, const std::string& content)
    {
        auto path = dir_ / name;
        boost::filesystem::create_directories(path.parent_path());
        std::ofstream out(path.string(), std::ios::binary);
        out << content;
        return path.string();
    }

    boost::filesystem::path dir_;
    std::shared_ptr<FakeRemoteStore> store_;
    std::shared_ptr<delivery::DeadLetterLog> log_;
    std::shared_ptr<delivery::Uploader> uploader_;
};

}  // namespace lsink::test
