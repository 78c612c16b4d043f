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
#include <catch2/catch_all.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include <ChdStringHelpers.h>

TEST_CASE("String Split_Join")
{
    using namespace ChdNs;
    REQUIRE(Join(Split("a,b,c,d", ','), "::") == "a::b::c::d");
    REQUIRE(Join(Split("a", ','), "::") == "a");
    REQUIRE(Join(Split("", '\0'), ",").empty());
    REQUIRE(Join(Split("", '\0'), "").empty());
    REQUIRE(Split("a,,b", ',') == std::vector<std::string_view> { "a", "", "b" });

    std::vector<std::string> v1 = { "a", "b", "c", "d" };
    REQUIRE(Join(begin(v1), end(v1), ",") == "a,b,c,d");

    std::vector<std::string_view> v2 = { "a", "b", "c", "d" };
    REQUIRE(Join(begin(v2), end(v2), "::") == "a::b::c::d");
}

TEST_CASE("SplitWhitespace")
{
    using namespace ChdNs;
    REQUIRE(SplitWhitespace("").empty());
    REQUIRE(SplitWhitespace(" \t ").empty());
    REQUIRE(SplitWhitespace("node01 slots=8") == std::vector<std::string_view> { "node01", "slots=8" });
    REQUIRE(SplitWhitespace("  1024\t 256   float ") == std::vector<std::string_view> { "1024", "256", "float" });
}

TEST_CASE("Trim")
{
    using namespace ChdNs;
    REQUIRE(Trim("").empty());
    REQUIRE(Trim(" \t\r\n").empty());
    REQUIRE(Trim("  node01 slots=8\r\n") == "node01 slots=8");
    REQUIRE(Trim("node01") == "node01");
}

TEST_CASE("StripAnsiCodes")
{
    using namespace ChdNs;
    REQUIRE(StripAnsiCodes("plain") == "plain");
    REQUIRE(StripAnsiCodes("\x1b[31mred\x1b[0m text") == "red text");
    REQUIRE(StripAnsiCodes("\x1b[1;32mbold green\x1b[0m") == "bold green");
    REQUIRE(StripAnsiCodes("broken \x1b[31") == "broken ");
}

TEST_CASE("chdTokenizeString")
{
    REQUIRE(chdTokenizeString("a,b,c", ",") == std::vector<std::string> { "a", "b", "c" });
    REQUIRE(chdTokenizeString("node01", ",") == std::vector<std::string> { "node01" });

    std::vector<std::string> tokens;
    chdTokenizeString("x::y", "::", tokens);
    REQUIRE(tokens == std::vector<std::string> { "x", "y" });
}

TEST_CASE("chdStrToLower")
{
    REQUIRE(chdStrToLower("BisEction") == "bisection");
    REQUIRE(chdStrToLower("") == "");
}

TEST_CASE("strictStrToInt")
{
    REQUIRE(ChdNs::strictStrToInt("42") == 42);
    REQUIRE(ChdNs::strictStrToInt("-7") == -7);
    REQUIRE_THROWS_AS(ChdNs::strictStrToInt("42abc"), std::invalid_argument);
    REQUIRE_THROWS_AS(ChdNs::strictStrToInt("abc"), std::invalid_argument);
    REQUIRE_THROWS_AS(ChdNs::strictStrToInt("99999999999999"), std::out_of_range);
}

TEST_CASE("strictStrToDouble")
{
    REQUIRE(ChdNs::strictStrToDouble("0.8") == Catch::Approx(0.8));
    REQUIRE(ChdNs::strictStrToDouble("250") == Catch::Approx(250.0));
    REQUIRE_THROWS_AS(ChdNs::strictStrToDouble("1.5GB"), std::invalid_argument);
    REQUIRE_THROWS_AS(ChdNs::strictStrToDouble(""), std::invalid_argument);
}
