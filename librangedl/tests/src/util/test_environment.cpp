// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <string>
#include <vector>

#include <catch2/catch_all.hpp>

#include "rangedl/util/environment.hpp"

#include "rangedltests.hpp"

using namespace rangedl::util;

namespace
{
    TEST_CASE("get_env", "[rangedl::util]")
    {
        REQUIRE_FALSE(get_env("RANGEDL_VAR_THAT_DOES_NOT_EXIST_XYZ").has_value());
        REQUIRE(get_env("PATH").has_value());
    }

    TEST_CASE("set_env", "[rangedl::util]")
    {
        const auto restore = rangedltests::EnvironmentCleaner(
            std::vector<std::string>{ "RANGEDL_TEST_VAR" }
        );

        set_env("RANGEDL_TEST_VAR", "VALUE");
        REQUIRE(get_env("RANGEDL_TEST_VAR") == "VALUE");
        set_env("RANGEDL_TEST_VAR", "VALUE_NEW");
        REQUIRE(get_env("RANGEDL_TEST_VAR") == "VALUE_NEW");
    }

    TEST_CASE("unset_env", "[rangedl::util]")
    {
        const auto restore = rangedltests::EnvironmentCleaner(
            std::vector<std::string>{ "RANGEDL_TEST_VAR" }
        );

        unset_env("RANGEDL_TEST_VAR");
        REQUIRE_FALSE(get_env("RANGEDL_TEST_VAR").has_value());
        set_env("RANGEDL_TEST_VAR", "VALUE");
        unset_env("RANGEDL_TEST_VAR");
        REQUIRE_FALSE(get_env("RANGEDL_TEST_VAR").has_value());
    }

    TEST_CASE("env_flag", "[rangedl::util]")
    {
        const auto restore = rangedltests::EnvironmentCleaner(
            std::vector<std::string>{ "RANGEDL_TEST_FLAG" }
        );

        unset_env("RANGEDL_TEST_FLAG");
        REQUIRE_FALSE(env_flag("RANGEDL_TEST_FLAG"));
        set_env("RANGEDL_TEST_FLAG", "0");
        REQUIRE_FALSE(env_flag("RANGEDL_TEST_FLAG"));
        set_env("RANGEDL_TEST_FLAG", "1");
        REQUIRE(env_flag("RANGEDL_TEST_FLAG"));
        set_env("RANGEDL_TEST_FLAG", "yes");
        REQUIRE(env_flag("RANGEDL_TEST_FLAG"));
    }
}
