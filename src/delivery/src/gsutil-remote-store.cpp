#include "lsink/delivery/gsutil-remote-store.h"
#include "lsink/common/errors.h"
#include "lsink/core/logger.h"

#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>
#include <future>

namespace bp = boost::process;

namespace lsink::delivery {

namespace {

std::string_view
trim(std::string_view s)
{
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
        s.remove_prefix(1);
    while (!s.empty() &&
           (s.back() == ' ' || s.back() == '\t' || s.back() == '\r'))
        s.remove_suffix(1);
    return s;
}

std::string
describe(const std::vector<std::string>& args)
{
    std::string text;
    for (const auto& a : args)
    {
        if (!text.empty())
            text.push_back(' ');
        text += a;
    }
    return text;
}

}  // namespace

GsutilRemoteStore::GsutilRemoteStore(std::string gsutil)
    : gsutil_(std::move(gsutil))
{
}

GsutilRemoteStore::CommandOutput
GsutilRemoteStore::run(
    const std::vector<std::string>& args,
    std::chrono::milliseconds timeout) const
{
    auto exe = gsutil_.find('/') == std::string::npos
        ? bp::search_path(gsutil_)
        : boost::filesystem::path(gsutil_);
    if (exe.empty())
    {
        throw LedgerSinkError(gsutil_ + " not found in PATH");
    }

    boost::asio::io_context io;
    std::future<std::string> out;
    std::future<std::string> err;

    std::error_code launch_error;
    bp::child child(
        exe,
        bp::args(args),
        bp::std_in.close(),
        bp::std_out > out,
        bp::std_err > err,
        io,
        launch_error);
    if (launch_error)
    {
        throw LedgerSinkError(
            "Failed to start " + gsutil_ + ": " + launch_error.message());
    }

    // Returns early once the child exits and both pipes close
    io.run_for(timeout);

    if (!io.stopped())
    {
        std::error_code ec;
        child.terminate(ec);
        child.wait(ec);
        throw RemoteTimeoutError(
            gsutil_ + " " + describe(args) + " timed out after " +
            std::to_string(timeout.count()) + " ms");
    }

    child.wait();

    CommandOutput result;
    result.exit_code = child.exit_code();
    result.out = out.get();
    result.err = err.get();
    return result;
}

void
GsutilRemoteStore::copy_to_remote(
    const std::string& local_path,
    const std::string& remote_path,
    std::chrono::milliseconds timeout)
{
    auto result = run({"-q", "cp", local_path, remote_path}, timeout);
    if (result.exit_code != 0)
    {
        throw LedgerSinkError(
            "gsutil cp " + local_path + " " + remote_path + " failed (exit " +
            std::to_string(result.exit_code) + "): " +
            std::string(trim(result.err)));
    }
}

RemoteObjectInfo
GsutilRemoteStore::stat(
    const std::string& remote_path,
    std::chrono::milliseconds timeout)
{
    auto result = run({"stat", remote_path}, timeout);
    if (result.exit_code != 0)
    {
        throw LedgerSinkError(
            "gsutil stat " + remote_path + " failed (exit " +
            std::to_string(result.exit_code) + "): " +
            std::string(trim(result.err)));
    }
    return parse_gsutil_stat(result.out);
}

void
GsutilRemoteStore::delete_remote(
    const std::string& remote_path,
    std::chrono::milliseconds timeout)
{
    auto result = run({"-q", "rm", remote_path}, timeout);
    if (result.exit_code != 0)
    {
        throw LedgerSinkError(
            "gsutil rm " + remote_path + " failed (exit " +
            std::to_string(result.exit_code) + "): " +
            std::string(trim(result.err)));
    }
}

RemoteObjectInfo
parse_gsutil_stat(std::string_view output)
{
    static constexpr std::string_view HASH_KEY = "Hash (md5):";
    static constexpr std::string_view LENGTH_KEY = "Content-Length:";

    RemoteObjectInfo info;
    while (!output.empty())
    {
        auto eol = output.find('\n');
        std::string_view line = trim(output.substr(0, eol));
        output.remove_prefix(eol == std::string_view::npos ? output.size()
                                                           : eol + 1);

        if (line.substr(0, HASH_KEY.size()) == HASH_KEY)
        {
            auto value = trim(line.substr(HASH_KEY.size()));
            if (!value.empty())
                info.md5_base64 = std::string(value);
        }
        else if (line.substr(0, LENGTH_KEY.size()) == LENGTH_KEY)
        {
            auto value = trim(line.substr(LENGTH_KEY.size()));
            try
            {
                info.size = std::stoull(std::string(value));
            }
            catch (const std::exception& e)
            {
                LOGW("Unparseable Content-Length '", value, "': ", e.what());
            }
        }
    }
    return info;
}

}  // namespace lsink::delivery
