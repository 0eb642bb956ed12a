#pragma once

#include <variant>

#include "native_hypervisor.hpp"

namespace hvkit
{
    namespace vcpu_exit
    {
        // Asynchronous exit requested through exit() or exit_vcpus()
        struct cancelled
        {
        };

        struct exception
        {
            exit_exception exception{};
        };

        // The virtual timer entered the pending state
        struct vtimer_activated
        {
        };

        struct unknown
        {
        };
    }

    using vcpu_exit_reason = std::variant<vcpu_exit::cancelled, vcpu_exit::exception, vcpu_exit::vtimer_activated, vcpu_exit::unknown>;

    vcpu_exit_reason decode_exit_record(const native_exit_record& record);

    const char* get_exit_reason_name(const vcpu_exit_reason& reason);
}
