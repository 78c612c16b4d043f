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
#ifndef CHDIAG_TCLAP_H
#define CHDIAG_TCLAP_H

#include <tclap/CmdLine.h>

#include <string>
#include <vector>

/*
 * Command line for a single subcommand. The subcommand name (argv[1]) is folded into the program name
 * so that TCLAP does not try to parse it but still shows it in the usage statement.
 */
class ChdiagSubsystemCmdLine : public TCLAP::CmdLine
{
public:
    ChdiagSubsystemCmdLine(std::string name, std::string const &message, std::string const &version)
        : CmdLine(message, ' ', version, true)
        , m_name(std::move(name))
    {
        // Parse errors are thrown to CommandLineParser
        setExceptionHandling(false);
    }

    void parse(int argc, char const *const *argv)
    {
        std::vector<std::string> args;
        for (int i = 0; i < argc; i++)
        {
            if (i == 1)
            {
                args[0] = args[0] + " " + m_name;
            }
            else
            {
                args.emplace_back(argv[i]);
            }
        }
        CmdLine::parse(args);
    }

private:
    std::string m_name;
};

#endif // CHDIAG_TCLAP_H
