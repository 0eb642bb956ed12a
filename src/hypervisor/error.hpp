#pragma once

#include <optional>
#include <stdexcept>
#include <string_view>

#include "native_hypervisor.hpp"

namespace hvkit
{
    enum class error_code
    {
        error,
        busy,
        bad_argument,
        illegal_guest_state,
        no_resources,
        no_device,
        denied,
        unsupported,

        // Raised by the trackers, never by the native layer
        invalid_handle,
        allocation_still_mapped,
        misaligned_address,

        unknown,
    };

    const char* to_string(error_code code);

    // A success status is not an error. Passing one here terminates the process.
    error_code to_error_code(native_status value);

    class hypervisor_error : public std::runtime_error
    {
      public:
        explicit hypervisor_error(error_code code);
        explicit hypervisor_error(native_status native);

        error_code code() const
        {
            return this->code_;
        }

        // Only set for failures reported by the native layer
        std::optional<native_status> get_native_status() const
        {
            return this->native_status_;
        }

      private:
        hypervisor_error(error_code code, native_status native);

        error_code code_{};
        std::optional<native_status> native_status_{};
    };

    inline void hve(const native_status res)
    {
        if (res != status::success)
        {
            throw hypervisor_error(res);
        }
    }

    [[noreturn]] void fatal_error(std::string_view message);
    [[noreturn]] void fatal_error(std::string_view message, native_status value);
}
