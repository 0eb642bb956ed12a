#pragma once

#include <memory>

#include <native_hypervisor.hpp>

namespace hvkit::unicorn
{
    // Software implementation of the native call surface.
    // Guest exceptions and memory faults are reported as exception exits with a synthesized syndrome.
    std::unique_ptr<native_hypervisor> create_arm64_hypervisor();
}
