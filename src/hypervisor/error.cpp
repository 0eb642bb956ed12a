#include "error.hpp"
#include "logger.hpp"

#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace hvkit
{
    namespace
    {
        std::string get_status_string(const native_status value)
        {
            char buffer[32]{};
            (void)snprintf(buffer, sizeof(buffer), "0x%08" PRIX32, static_cast<uint32_t>(value));
            return buffer;
        }

        std::string get_error_message(const error_code code, const native_status value)
        {
            std::string message = to_string(code);

            if (code == error_code::unknown)
            {
                message += " (" + get_status_string(value) + ")";
            }

            return message;
        }
    }

    const char* to_string(const error_code code)
    {
        switch (code)
        {
        case error_code::error:
            return "error";
        case error_code::busy:
            return "busy";
        case error_code::bad_argument:
            return "bad argument";
        case error_code::illegal_guest_state:
            return "illegal guest state";
        case error_code::no_resources:
            return "no resources";
        case error_code::no_device:
            return "no device";
        case error_code::denied:
            return "denied";
        case error_code::unsupported:
            return "unsupported";
        case error_code::invalid_handle:
            return "invalid handle";
        case error_code::allocation_still_mapped:
            return "allocation still mapped";
        case error_code::misaligned_address:
            return "misaligned address";
        case error_code::unknown:
        default:
            return "unknown";
        }
    }

    error_code to_error_code(const native_status value)
    {
        switch (value)
        {
        case status::success:
            fatal_error("Success status reached the error conversion path, this is a bug!");
        case status::error:
            return error_code::error;
        case status::busy:
            return error_code::busy;
        case status::bad_argument:
            return error_code::bad_argument;
        case status::illegal_guest_state:
            return error_code::illegal_guest_state;
        case status::no_resources:
            return error_code::no_resources;
        case status::no_device:
            return error_code::no_device;
        case status::denied:
            return error_code::denied;
        case status::unsupported:
            return error_code::unsupported;
        default:
            return error_code::unknown;
        }
    }

    hypervisor_error::hypervisor_error(const error_code code)
        : std::runtime_error(to_string(code)),
          code_(code)
    {
    }

    hypervisor_error::hypervisor_error(const native_status native)
        : hypervisor_error(to_error_code(native), native)
    {
    }

    hypervisor_error::hypervisor_error(const error_code code, const native_status native)
        : std::runtime_error(get_error_message(code, native)),
          code_(code),
          native_status_(native)
    {
    }

    void fatal_error(const std::string_view message)
    {
        const logger log{};
        log.error("%.*s\n", static_cast<int>(message.size()), message.data());
        std::abort();
    }

    void fatal_error(const std::string_view message, const native_status value)
    {
        const auto code = to_error_code(value);
        fatal_error(std::string(message) + ": " + get_error_message(code, value));
    }
}
