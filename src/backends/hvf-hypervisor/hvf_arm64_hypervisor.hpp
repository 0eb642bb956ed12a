#pragma once

#include <memory>

#include <native_hypervisor.hpp>

namespace hvkit::hvf
{
    // Pass-through to Hypervisor.framework. Only available on Apple arm64 hosts.
    std::unique_ptr<native_hypervisor> create_arm64_hypervisor();
}
