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
#include "CommandLineParser.h"

#include <ChdLogging.h>
#include <ChildProcess/ChildProcessRunner.hpp>
#include <chd_structs.h>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <unistd.h>


/*****************************************************************************/
void sig_handler(int signum)
{
    // A benchmark runs in its own process group and does not see the terminal's signals
    ChdNs::Common::Subprocess::TerminateActiveProcessGroup();
    _exit(128 + signum); // Exit with UNIX fatal error signal code for the received signal
}

/*****************************************************************************
 * This method provides mechanism to register Sighandler callbacks for
 * SIGHUP, SIGINT, SIGQUIT, and SIGTERM
 *****************************************************************************/
int InstallCtrlHandler()
{
    if (signal(SIGHUP, sig_handler) == SIG_ERR)
    {
        return -1;
    }
    if (signal(SIGINT, sig_handler) == SIG_ERR)
    {
        return -1;
    }
    if (signal(SIGQUIT, sig_handler) == SIG_ERR)
    {
        return -1;
    }
    if (signal(SIGTERM, sig_handler) == SIG_ERR)
    {
        return -1;
    }

    return 0;
}


int main(int argc, char *argv[])
{
    int result = CHD_EXIT_OK;

    // Install the signal handler
    if (InstallCtrlHandler() != 0)
    {
        std::cerr << "Warning: unable to install signal handlers" << std::endl;
    }

    try
    {
        result = CommandLineParser::ProcessCommandLine(argc, argv);
    }
    catch (std::exception &e)
    {
        log_error("Unhandled exception: {}", e.what());
        std::cerr << e.what() << std::endl;
        result = CHD_EXIT_INTERNAL_ERROR;
    }

    return result;
}
