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
#ifndef CHD_STRUCTS_H
#define CHD_STRUCTS_H

/***************************************************************************************************/
/** @defgroup chdEnums Enums and Macros
 *  @{
 */
/***************************************************************************************************/

/**
 * Return values for chdiag API calls.
 */
typedef enum chdReturn_enum
{
    CHD_ST_OK                 = 0,   //!< Success
    CHD_ST_BADPARAM           = -1,  //!< A bad parameter was passed to a function
    CHD_ST_GENERIC_ERROR      = -3,  //!< A generic, unspecified error
    CHD_ST_TIMEOUT            = -15, //!< The requested operation timed out
    CHD_ST_FILE_IO_ERROR      = -34, //!< Error reading from or writing to a file
    CHD_ST_CHILD_SPAWN_FAILED = -44, //!< Could not launch a child process
    CHD_ST_CHILD_NOT_KILLED   = -52, //!< Child process was not stopped after the timeout elapsed
} chdReturn_t;

/**
 * Process exit codes returned by the chdiag tool.
 */
#define CHD_EXIT_OK              0 //!< No node was condemned
#define CHD_EXIT_NODES_CONDEMNED 1 //!< At least one node was condemned
#define CHD_EXIT_CONFIG_ERROR    2 //!< Invalid configuration or missing input file
#define CHD_EXIT_INTERNAL_ERROR  3 //!< Any other error

/**
 * Logging severities. Values line up with plog::Severity.
 */
typedef enum
{
    ChdLoggingSeverityUnspecified = -1, //!< Don't care/inherit from the environment
    ChdLoggingSeverityNone        = 0,  //!< NONE
    ChdLoggingSeverityFatal       = 1,  //!< FATAL
    ChdLoggingSeverityError       = 2,  //!< ERROR
    ChdLoggingSeverityWarning     = 3,  //!< WARN
    ChdLoggingSeverityInfo        = 4,  //!< INFO
    ChdLoggingSeverityDebug       = 5,  //!< DEBUG
    ChdLoggingSeverityVerbose     = 6   //!< VERB
} ChdLoggingSeverity_t;

/** @} */

#ifdef __cplusplus
extern "C" {
#endif

/**
 * Returns a human readable description for a chdReturn_t value.
 *
 * @param result    IN: Return code
 * @return Null terminated string. Never nullptr.
 */
const char *errorString(chdReturn_t result);

#ifdef __cplusplus
}
#endif

#endif /* CHD_STRUCTS_H */
