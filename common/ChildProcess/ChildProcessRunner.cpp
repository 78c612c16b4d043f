/*
 * Copyright (c) 2025, NVIDIA CORPORATION.  All rights reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

/* TODO: Remove the suppression once we migrate to Boost::Process:v2.
 */
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"

#include "ChildProcessRunner.hpp"

#include <ChdLogging.h>

#include <atomic>
#include <boost/filesystem.hpp>
#include <boost/process.hpp>
#include <fmt/format.h>
#include <istream>
#include <signal.h>
#include <thread>


namespace ChdNs::Common::Subprocess
{

namespace bp = boost::process;

namespace
{
    std::atomic<pid_t> g_activeProcessGroup { 0 };
    static_assert(std::atomic<pid_t>::is_always_lock_free);

    class ActiveProcessGroupGuard
    {
    public:
        explicit ActiveProcessGroupGuard(pid_t pgid)
        {
            g_activeProcessGroup.store(pgid);
        }

        ~ActiveProcessGroupGuard()
        {
            g_activeProcessGroup.store(0);
        }

        ActiveProcessGroupGuard(ActiveProcessGroupGuard const &)            = delete;
        ActiveProcessGroupGuard &operator=(ActiveProcessGroupGuard const &) = delete;
    };
} // namespace

pid_t ActiveProcessGroup() noexcept
{
    return g_activeProcessGroup.load();
}

void TerminateActiveProcessGroup() noexcept
{
    pid_t const pgid = g_activeProcessGroup.load();
    if (pgid > 0)
    {
        ::kill(-pgid, SIGTERM);
    }
}

std::expected<ProcessOutput, ProcessError> ChildProcessRunner::Run(std::string const &executable,
                                                                   std::vector<std::string> const &args,
                                                                   std::chrono::milliseconds timeout)
{
    boost::system::error_code ec;
    if (!boost::filesystem::exists(executable, ec))
    {
        return std::unexpected(ProcessError {
            CHD_ST_CHILD_SPAWN_FAILED, fmt::format("Could not exec '{}': No such file or directory", executable), {} });
    }

    bp::ipstream pipeStream;
    bp::group group;
    bp::child child;

    try
    {
        child = bp::child(bp::exe = executable,
                          bp::args = args,
                          (bp::std_out & bp::std_err) > pipeStream,
                          bp::std_in.close(),
                          group);
    }
    catch (bp::process_error const &e)
    {
        log_error("Failed to launch '{}': {}", executable, e.what());
        return std::unexpected(ProcessError { CHD_ST_CHILD_SPAWN_FAILED, e.what(), {} });
    }

    log_debug("Launched '{}' as pid {}", executable, child.id());
    ActiveProcessGroupGuard activeGroup(group.native_handle());

    std::string collected;
    std::thread reader([&pipeStream, &collected]() {
        std::string line;
        while (std::getline(pipeStream, line))
        {
            collected.append(line);
            collected.push_back('\n');
        }
    });

    std::error_code waitEc;
    bool const exited = child.wait_for(timeout, waitEc);

    if (!exited && !waitEc)
    {
        log_warning("Process {} did not finish within {} ms. Terminating.", child.id(), timeout.count());
        std::error_code termEc;
        group.terminate(termEc);
        if (termEc)
        {
            log_error("Unable to terminate process group of pid {}: {}", child.id(), termEc.message());
            child.terminate(termEc);
        }
        std::error_code reapEc;
        child.wait(reapEc);
        reader.join();
        if (termEc)
        {
            return std::unexpected(
                ProcessError { CHD_ST_CHILD_NOT_KILLED,
                               fmt::format("Unable to terminate '{}': {}", executable, termEc.message()),
                               std::move(collected) });
        }
        return std::unexpected(ProcessError { CHD_ST_TIMEOUT,
                                              fmt::format("Process did not finish within {} ms", timeout.count()),
                                              std::move(collected) });
    }

    if (waitEc)
    {
        log_error("Error while waiting for '{}': {}", executable, waitEc.message());
        std::error_code termEc;
        group.terminate(termEc);
        reader.join();
        return std::unexpected(ProcessError { CHD_ST_GENERIC_ERROR, waitEc.message(), std::move(collected) });
    }

    reader.join();

    ProcessOutput result;
    result.output   = std::move(collected);
    result.exitCode = child.exit_code();
    log_debug("Process '{}' exited with code {}", executable, result.exitCode);
    return result;
}

} // namespace ChdNs::Common::Subprocess

#pragma GCC diagnostic pop
