#pragma once

#include <cstdlib>
#include <string_view>

namespace utils
{
    inline bool is_env_flag_set(const char* name)
    {
        using namespace std::literals;

        const auto* env = getenv(name);
        return env && (env == "1"sv || env == "true"sv);
    }
}
