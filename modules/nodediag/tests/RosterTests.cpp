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

#include <Roster.h>
#include <catch2/catch_all.hpp>

#include "TestTempDir.h"

#include <sstream>

using namespace ChdNs::NodeDiag;

TEST_CASE("ParseRoster")
{
    SECTION("Hostfile with slots, comments and blank lines")
    {
        std::istringstream input("# GPU nodes\n"
                                 "node01 slots=8\n"
                                 "\n"
                                 "   node02\tslots=8\n"
                                 "  # node03 slots=8\n"
                                 "node04\n");
        CHECK(ParseRoster(input) == Roster { "node01", "node02", "node04" });
    }

    SECTION("Duplicates keep the first occurrence")
    {
        std::istringstream input("node02\nnode01 slots=4\nnode02 slots=8\nnode03\nnode01\n");
        CHECK(ParseRoster(input) == Roster { "node02", "node01", "node03" });
    }

    SECTION("Empty input")
    {
        std::istringstream input("\n# nothing here\n\n");
        CHECK(ParseRoster(input).empty());
    }

    SECTION("Windows line endings")
    {
        std::istringstream input("node01 slots=8\r\nnode02\r\n");
        CHECK(ParseRoster(input) == Roster { "node01", "node02" });
    }
}

TEST_CASE("LoadRoster")
{
    TestTempDir dir;

    SECTION("Existing file")
    {
        auto const path = dir.WriteFile("hostfile", "node01 slots=8\nnode02 slots=8\n");
        auto roster     = LoadRoster(path);
        REQUIRE(roster.has_value());
        CHECK(*roster == Roster { "node01", "node02" });
    }

    SECTION("Missing file")
    {
        auto roster = LoadRoster((dir.Path() / "does_not_exist").string());
        REQUIRE_FALSE(roster.has_value());
        CHECK(roster.error() == CHD_ST_FILE_IO_ERROR);
    }
}
