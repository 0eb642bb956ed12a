#include "backend_selection.hpp"

#include <stdexcept>

#include <utils/env.hpp>

#if HVKIT_ENABLE_UNICORN
#include <unicorn_arm64_hypervisor.hpp>
#endif

#if HVKIT_ENABLE_HVF
#include <hvf_arm64_hypervisor.hpp>
#endif

namespace hvkit
{
    std::unique_ptr<native_hypervisor> create_arm64_hypervisor()
    {
#if HVKIT_ENABLE_HVF
#if HVKIT_ENABLE_UNICORN
        if (utils::is_env_flag_set("HYPERVISOR_UNICORN"))
        {
            return unicorn::create_arm64_hypervisor();
        }
#endif

        return hvf::create_arm64_hypervisor();
#elif HVKIT_ENABLE_UNICORN
        return unicorn::create_arm64_hypervisor();
#else
        throw std::runtime_error("No hypervisor backend available");
#endif
    }
}
