// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef RANGEDL_UTIL_ENVIRONMENT_HPP
#define RANGEDL_UTIL_ENVIRONMENT_HPP

#include <optional>
#include <string>

namespace rangedl::util
{
    /**
     * Get an environment variable.
     */
    [[nodiscard]] auto get_env(const std::string& key) -> std::optional<std::string>;

    /**
     * Set an environment variable.
     */
    void set_env(const std::string& key, const std::string& value);

    /**
     * Unset an environment variable.
     */
    void unset_env(const std::string& key);

    /**
     * Return true when the variable is set to a value different from "0".
     */
    [[nodiscard]] auto env_flag(const std::string& key) -> bool;
}
#endif
