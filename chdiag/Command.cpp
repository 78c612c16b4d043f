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
 * File:   Command.cpp
 */

#include "Command.h"

#include <ChdException.hpp>
#include <ChdLogging.h>

#include <iostream>

/*****************************************************************************/
int Command::ExitStatusFromReturn(chdReturn_t result)
{
    switch (result)
    {
        case CHD_ST_OK:
            return CHD_EXIT_OK;
        case CHD_ST_BADPARAM:
        case CHD_ST_FILE_IO_ERROR:
            return CHD_EXIT_CONFIG_ERROR;
        default:
            return CHD_EXIT_INTERNAL_ERROR;
    }
}

/*****************************************************************************/
int Command::Execute()
{
    try
    {
        return DoExecute();
    }
    catch (ChdNs::ChdException const &e)
    {
        log_error("Command failed: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return ExitStatusFromReturn(e.GetErrorCode());
    }
}
