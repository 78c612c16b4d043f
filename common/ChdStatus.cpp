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
#include "chd_structs.h"

extern "C" const char *errorString(chdReturn_t result)
{
    switch (result)
    {
        case CHD_ST_OK:
            return "Success";
        case CHD_ST_BADPARAM:
            return "Bad parameter passed to function";
        case CHD_ST_GENERIC_ERROR:
            return "Generic unspecified error";
        case CHD_ST_TIMEOUT:
            return "Timeout";
        case CHD_ST_FILE_IO_ERROR:
            return "Error reading or writing a file";
        case CHD_ST_CHILD_SPAWN_FAILED:
            return "Failed to launch a child process";
        case CHD_ST_CHILD_NOT_KILLED:
            return "Failed to stop a child process after its timeout";
        default:
            // Wrong error codes should be handled by the caller
            return "Unknown error";
    }
}
