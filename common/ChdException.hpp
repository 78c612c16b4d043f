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
#include <stdexcept>
#include <string>


namespace ChdNs
{
/**
 * Exception carrying a chdReturn_t. An optional detail message is appended to the error string.
 */
class ChdException : public std::runtime_error
{
public:
    explicit ChdException(chdReturn_t errorCode)
        : runtime_error(errorString(errorCode))
        , m_errorCode(errorCode)
    {}

    ChdException(chdReturn_t errorCode, std::string const &detail)
        : runtime_error(std::string(errorString(errorCode)) + ": " + detail)
        , m_errorCode(errorCode)
    {}

    chdReturn_t GetErrorCode() const
    {
        return m_errorCode;
    }

private:
    chdReturn_t m_errorCode;
};
} // namespace ChdNs
