#include "vcpu_exit.hpp"

namespace hvkit
{
    vcpu_exit_reason decode_exit_record(const native_exit_record& record)
    {
        switch (static_cast<native_exit_reason>(record.reason))
        {
        case native_exit_reason::canceled:
            return vcpu_exit::cancelled{};
        case native_exit_reason::exception:
            return vcpu_exit::exception{record.exception};
        case native_exit_reason::vtimer_activated:
            return vcpu_exit::vtimer_activated{};
        case native_exit_reason::unknown:
        default:
            return vcpu_exit::unknown{};
        }
    }

    const char* get_exit_reason_name(const vcpu_exit_reason& reason)
    {
        struct visitor
        {
            const char* operator()(const vcpu_exit::cancelled&) const
            {
                return "cancelled";
            }

            const char* operator()(const vcpu_exit::exception&) const
            {
                return "exception";
            }

            const char* operator()(const vcpu_exit::vtimer_activated&) const
            {
                return "vtimer activated";
            }

            const char* operator()(const vcpu_exit::unknown&) const
            {
                return "unknown";
            }
        };

        return std::visit(visitor{}, reason);
    }
}
