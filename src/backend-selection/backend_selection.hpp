#pragma once

#include <memory>
#include <native_hypervisor.hpp>

namespace hvkit
{
    // Hypervisor.framework where it was built, unless HYPERVISOR_UNICORN is set
    std::unique_ptr<native_hypervisor> create_arm64_hypervisor();
}
