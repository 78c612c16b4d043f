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

#include "nodediag_structs.hpp"

#include <chd_structs.h>

#include <expected>
#include <istream>
#include <string>


namespace ChdNs::NodeDiag
{

/**
 * @brief Read node names from an MPI style hostfile
 *
 * The first whitespace separated token of every line is the node name, so `node01 slots=8` works.
 * Blank lines and lines starting with '#' are skipped. Repeated names are dropped with a warning,
 * keeping the first occurrence.
 */
Roster ParseRoster(std::istream &input);

/**
 * @brief Open and parse a hostfile
 *
 * @return CHD_ST_FILE_IO_ERROR when the file does not exist or cannot be read
 */
std::expected<Roster, chdReturn_t> LoadRoster(std::string const &path);

} // namespace ChdNs::NodeDiag
