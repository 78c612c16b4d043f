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
/*
 * File:   Command.h
 */

#ifndef COMMAND_H
#define COMMAND_H

#include <chd_structs.h>

#include <iostream>
#include <string>

/**
 * Logging overrides shared by every subcommand. Empty values fall back to the environment.
 */
struct LoggingParams
{
    std::string logFile;
    std::string logLevel;
};

class Command
{
public:
    Command() = default;

    virtual ~Command() = default;

    /*****************************************************************************
     * Run the command and translate its outcome into a process exit status
     * (CHD_EXIT_*). A ChdException escaping the command is reported on stderr.
     *****************************************************************************/
    int Execute();

    /*****************************************************************************
     * Redirect human readable output. Used by the tests.
     *****************************************************************************/
    void SetOutputStream(std::ostream &out)
    {
        m_out = &out;
    }

    /*****************************************************************************
     * Map a status code to the process exit status reported for it
     *****************************************************************************/
    static int ExitStatusFromReturn(chdReturn_t result);

protected:
    /**
     * Virtual function and should be implemented by the derived class.
     * @return CHD_EXIT_* status
     */
    virtual int DoExecute() = 0;

    std::ostream &Out()
    {
        return *m_out;
    }

    bool m_json {};

private:
    std::ostream *m_out = &std::cout;
};


#endif /* COMMAND_H */
