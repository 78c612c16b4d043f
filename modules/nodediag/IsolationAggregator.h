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
#include <json/json.h>
#include <optional>
#include <span>
#include <string>


namespace ChdNs::NodeDiag::IsolationAggregator
{

/**
 * @brief Set union of the condemned sets of every method that ran
 */
CondemnedSet Union(std::span<CondemnedSet const> methodResults);

/**
 * @brief Set union of the bisection and pairwise outputs. Either may be absent
 */
CondemnedSet Union(std::optional<CondemnedSet> const &bisection, std::optional<CondemnedSet> const &pairwise);

/**
 * @brief Extract condemned nodes from a persisted report
 *
 * Recognized fields are `condemned_nodes`, `bad_nodes`, `bisection.bad_nodes`,
 * `analysis.problematic_nodes[].node` and `pairwise.analysis.problematic_nodes[].node`.
 * Missing or malformed fields contribute nothing.
 */
CondemnedSet FromReport(Json::Value const &report);

/**
 * @brief Parse a report file and extract its condemned nodes
 *
 * @return CHD_ST_FILE_IO_ERROR when the file cannot be opened, CHD_ST_BADPARAM when it is not valid JSON
 */
std::expected<CondemnedSet, chdReturn_t> FromReportFile(std::string const &path);

/**
 * @brief Process exit status for a final condemned set
 *
 * @return CHD_EXIT_NODES_CONDEMNED when the set is not empty, CHD_EXIT_OK otherwise
 */
int ExitStatus(CondemnedSet const &condemned);

} // namespace ChdNs::NodeDiag::IsolationAggregator
