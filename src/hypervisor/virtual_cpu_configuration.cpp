#include "virtual_cpu_configuration.hpp"
#include "error.hpp"

namespace hvkit
{
    virtual_cpu_configuration::virtual_cpu_configuration(native_hypervisor& native)
        : native_(&native),
          handle_(native.vcpu_config_create())
    {
        if (!this->handle_)
        {
            throw hypervisor_error(error_code::no_resources);
        }
    }

    virtual_cpu_configuration::~virtual_cpu_configuration()
    {
        if (this->marker_.was_moved())
        {
            return;
        }

        this->native_->vcpu_config_release(this->handle_);
    }

    uint64_t virtual_cpu_configuration::get_feature_register(const arm64_feature_register reg) const
    {
        uint64_t value{};
        hve(this->native_->vcpu_config_get_feature_reg(this->handle_, reg, value));
        return value;
    }

    ccsidr_values virtual_cpu_configuration::get_ccsidr_el1_sys_register_values(const cache_type type) const
    {
        ccsidr_values values{};
        hve(this->native_->vcpu_config_get_ccsidr_el1_sys_reg_values(this->handle_, type, values));
        return values;
    }
}
