// Copyright (c) 2023, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <stdexcept>

#include <fmt/format.h>

#include "rangedl/util/environment.hpp"

namespace rangedl::util
{
    namespace
    {
        // getenv and setenv are not guaranteed to be thread-safe together.
        std::mutex env_mutex = {};
    }

    auto get_env(const std::string& key) -> std::optional<std::string>
    {
        std::scoped_lock lock{ env_mutex };
        if (const char* val = std::getenv(key.c_str()))
        {
            return { val };
        }
        return {};
    }

    void set_env(const std::string& key, const std::string& value)
    {
        std::scoped_lock lock{ env_mutex };
        if (::setenv(key.c_str(), value.c_str(), 1) != 0)
        {
            throw std::runtime_error(fmt::format(
                R"(Could not set environment variable "{}" : {})",
                key,
                std::strerror(errno)
            ));
        }
    }

    void unset_env(const std::string& key)
    {
        std::scoped_lock lock{ env_mutex };
        if (::unsetenv(key.c_str()) != 0)
        {
            throw std::runtime_error(fmt::format(
                R"(Could not unset environment variable "{}" : {})",
                key,
                std::strerror(errno)
            ));
        }
    }

    auto env_flag(const std::string& key) -> bool
    {
        return get_env(key).value_or("0") != "0";
    }
}
