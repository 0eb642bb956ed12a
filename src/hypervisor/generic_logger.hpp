#pragma once

#include <string_view>

#if defined(__clang__) || defined(__GNUC__)
#define HVKIT_FORMAT_ATTRIBUTE(fmt_pos, var_pos) __attribute__((format(printf, fmt_pos, var_pos)))
#else
#define HVKIT_FORMAT_ATTRIBUTE(fmt_pos, var_pos)
#endif

namespace hvkit
{
    enum class color
    {
        black,
        red,
        green,
        yellow,
        blue,
        cyan,
        pink,
        white,
        gray,
        dark_gray,
    };

    struct generic_logger
    {
        virtual ~generic_logger() = default;

        virtual void print(color c, std::string_view message) = 0;
        virtual void print(color c, const char* message, ...) HVKIT_FORMAT_ATTRIBUTE(3, 4) = 0;
    };
}
