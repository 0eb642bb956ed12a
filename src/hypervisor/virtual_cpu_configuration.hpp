#pragma once

#include <cstdint>

#include <utils/moved_marker.hpp>

#include "native_hypervisor.hpp"

namespace hvkit
{
    // Read-only native vCPU configuration. Independent of any VM memory state.
    class virtual_cpu_configuration
    {
      public:
        explicit virtual_cpu_configuration(native_hypervisor& native);
        ~virtual_cpu_configuration();

        virtual_cpu_configuration(virtual_cpu_configuration&&) noexcept = default;
        virtual_cpu_configuration& operator=(virtual_cpu_configuration&&) = delete;

        virtual_cpu_configuration(const virtual_cpu_configuration&) = delete;
        virtual_cpu_configuration& operator=(const virtual_cpu_configuration&) = delete;

        uint64_t get_feature_register(arm64_feature_register reg) const;

        // CCSIDR_EL1 for each of the 8 cache levels
        ccsidr_values get_ccsidr_el1_sys_register_values(cache_type type) const;

        native_vcpu_config* get_handle() const
        {
            return this->handle_;
        }

      private:
        utils::moved_marker marker_{};
        native_hypervisor* native_{};
        native_vcpu_config* handle_{};
    };
}
