#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include "allocation_tracker.hpp"
#include "mapping_tracker.hpp"
#include "native_hypervisor.hpp"
#include "virtual_cpu.hpp"
#include "virtual_cpu_configuration.hpp"
#include "logger.hpp"

namespace hvkit
{
    // The platform does not expose any VM configuration yet
    struct virtual_machine_configuration
    {
        native_vm_config* get_handle() const
        {
            return nullptr;
        }
    };

    struct virtual_machine_settings
    {
        bool disable_logging{false};
        // Unset falls back to HYPERVISOR_VERBOSE
        std::optional<bool> verbose_calls{};
    };

    // Owner of the native VM resource and of all guest memory.
    //
    // The native VM is a process-wide singleton: only one virtual_machine may exist at a time.
    // This is not checked. Allocation and mapping calls are not synchronized and must be serialized
    // by the caller.
    class virtual_machine
    {
      public:
        virtual_machine(std::unique_ptr<native_hypervisor> native, std::optional<virtual_machine_configuration> config = std::nullopt,
                        const virtual_machine_settings& settings = {});
        ~virtual_machine();

        virtual_machine(virtual_machine&&) = delete;
        virtual_machine(const virtual_machine&) = delete;
        virtual_machine& operator=(virtual_machine&&) = delete;
        virtual_machine& operator=(const virtual_machine&) = delete;

        allocation_handle allocate(size_t size);
        allocation_handle allocate_from(std::span<const std::byte> source);

        // All mappings of the allocation must be removed first
        void deallocate(allocation_handle handle);

        std::span<const std::byte> get_allocation_slice(allocation_handle handle) const;

        // Do not write through this view while a vCPU may run against the mapped allocation
        std::span<std::byte> get_allocation_slice_mut(allocation_handle handle);

        allocation_info get_allocation_info(allocation_handle handle) const;
        std::vector<allocation_info> get_all_allocation_infos() const;

        mapping_handle map(allocation_handle allocation, uint64_t guest_address, memory_permission permission);
        void unmap(mapping_handle handle);
        void reprotect(mapping_handle handle, memory_permission permission);

        mapping_info get_mapping_info(mapping_handle handle) const;
        std::vector<mapping_info> get_all_mapping_infos() const;

        virtual_cpu_configuration create_vcpu_configuration();

        // Call this from the thread that will run the vCPU
        virtual_cpu create_vcpu(const virtual_cpu_configuration* config = nullptr);

        // Callable from any thread
        void exit_vcpus(std::span<const vcpu_id> vcpus);

        native_hypervisor& native()
        {
            return *this->native_;
        }

        logger log{};

      private:
        std::unique_ptr<native_hypervisor> native_{};
        bool verbose_calls_{false};
        allocation_tracker allocations_{};
        mapping_tracker mappings_;

        static native_hypervisor& validate(const std::unique_ptr<native_hypervisor>& native);
    };
}
