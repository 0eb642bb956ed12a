#pragma once

#include <cstdint>
#include <string>

namespace hvkit
{
    // Bit values match the native memory flags (read = 1, write = 2, exec = 4)
    enum class memory_permission : uint8_t
    {
        none = 0,
        read = 1 << 0,
        write = 1 << 1,
        exec = 1 << 2,
        read_write = read | write,
        read_exec = read | exec,
        write_exec = write | exec,
        all = read | write | exec
    };

    /*****************************************************************************
     *
     ****************************************************************************/

    constexpr memory_permission operator&(const memory_permission x, const memory_permission y)
    {
        return static_cast<memory_permission>(static_cast<uint8_t>(x) & static_cast<uint8_t>(y));
    }

    constexpr memory_permission operator|(const memory_permission x, const memory_permission y)
    {
        return static_cast<memory_permission>(static_cast<uint8_t>(x) | static_cast<uint8_t>(y));
    }

    constexpr memory_permission operator^(const memory_permission x, const memory_permission y)
    {
        return static_cast<memory_permission>(static_cast<uint8_t>(x) ^ static_cast<uint8_t>(y));
    }

    constexpr memory_permission operator~(const memory_permission x)
    {
        return static_cast<memory_permission>(~static_cast<uint8_t>(x) & static_cast<uint8_t>(memory_permission::all));
    }

    inline memory_permission& operator&=(memory_permission& x, const memory_permission y)
    {
        x = x & y;
        return x;
    }

    inline memory_permission& operator|=(memory_permission& x, const memory_permission y)
    {
        x = x | y;
        return x;
    }

    /*****************************************************************************
     *
     ****************************************************************************/

    constexpr bool is_readable(const memory_permission permission)
    {
        return (permission & memory_permission::read) != memory_permission::none;
    }

    constexpr bool is_writable(const memory_permission permission)
    {
        return (permission & memory_permission::write) != memory_permission::none;
    }

    constexpr bool is_executable(const memory_permission permission)
    {
        return (permission & memory_permission::exec) != memory_permission::none;
    }

    constexpr memory_permission make_memory_permission(const bool read, const bool write, const bool execute)
    {
        auto permission = memory_permission::none;

        if (read)
        {
            permission = permission | memory_permission::read;
        }

        if (write)
        {
            permission = permission | memory_permission::write;
        }

        if (execute)
        {
            permission = permission | memory_permission::exec;
        }

        return permission;
    }

    constexpr uint64_t to_native_flags(const memory_permission permission)
    {
        return static_cast<uint64_t>(permission & memory_permission::all);
    }

    inline std::string get_permission_string(const memory_permission permission)
    {
        std::string res = {};
        res.reserve(3);

        res.push_back(is_readable(permission) ? 'r' : '-');
        res.push_back(is_writable(permission) ? 'w' : '-');
        res.push_back(is_executable(permission) ? 'x' : '-');

        return res;
    }
}
