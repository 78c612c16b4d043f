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
#pragma once

#include <chd_structs.h>

#include <chrono>
#include <expected>
#include <string>
#include <sys/types.h>
#include <vector>


namespace ChdNs::Common::Subprocess
{

struct ProcessOutput
{
    std::string output; //!< Combined stdout and stderr of the process
    int exitCode = 0;
};

struct ProcessError
{
    chdReturn_t status; //!< CHD_ST_TIMEOUT, CHD_ST_CHILD_SPAWN_FAILED or CHD_ST_CHILD_NOT_KILLED
    std::string message;
    std::string partialOutput; //!< Whatever the process printed before it failed
};

/**
 * Runs an executable to completion and collects its output.
 * Mocked in tests.
 */
class ChildProcessRunnerBase
{
public:
    /**
     * Starts the executable and blocks until it exits or the timeout elapses.
     * On timeout the whole process group of the child is terminated before this call returns.
     *
     * @param[in] executable    Absolute path to the executable
     * @param[in] args          Arguments, not including argv[0]
     * @param[in] timeout       Maximum wall time for the process
     */
    virtual std::expected<ProcessOutput, ProcessError> Run(std::string const &executable,
                                                           std::vector<std::string> const &args,
                                                           std::chrono::milliseconds timeout)
        = 0;

    virtual ~ChildProcessRunnerBase() = default;
};

/**
 * Process group of the child currently run by ChildProcessRunner, or 0 when no child is running.
 */
pid_t ActiveProcessGroup() noexcept;

/**
 * Sends SIGTERM to the process group of the running child, if any.
 * Async-signal-safe. Meant to be called from signal handlers before the parent exits.
 */
void TerminateActiveProcessGroup() noexcept;

class ChildProcessRunner final : public ChildProcessRunnerBase
{
public:
    std::expected<ProcessOutput, ProcessError> Run(std::string const &executable,
                                                   std::vector<std::string> const &args,
                                                   std::chrono::milliseconds timeout) override;
};

} // namespace ChdNs::Common::Subprocess
