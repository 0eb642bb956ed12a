#include "virtual_machine.hpp"
#include "error.hpp"

#include <cinttypes>
#include <string>

#include <utils/env.hpp>

namespace hvkit
{
    native_hypervisor& virtual_machine::validate(const std::unique_ptr<native_hypervisor>& native)
    {
        if (!native)
        {
            throw hypervisor_error(error_code::bad_argument);
        }

        return *native;
    }

    virtual_machine::virtual_machine(std::unique_ptr<native_hypervisor> native, const std::optional<virtual_machine_configuration> config,
                                     const virtual_machine_settings& settings)
        : native_(std::move(native)),
          verbose_calls_(settings.verbose_calls.value_or(utils::is_env_flag_set("HYPERVISOR_VERBOSE"))),
          mappings_(validate(this->native_), this->allocations_)
    {
        this->log.disable_output(settings.disable_logging);

        hve(this->native_->vm_create(config ? config->get_handle() : nullptr));

        if (this->verbose_calls_)
        {
            this->log.info("Created virtual machine (%s)\n", this->native_->get_name().c_str());
        }
    }

    virtual_machine::~virtual_machine()
    {
        for (const auto& mapping : this->mappings_.get_all_infos())
        {
            try
            {
                this->mappings_.unmap(mapping.handle);
            }
            catch (const hypervisor_error& e)
            {
                fatal_error(std::string("Cannot unmap memory on VM destruction: ") + e.what());
            }
        }

        const auto res = this->native_->vm_destroy();
        if (res != status::success)
        {
            fatal_error("Cannot destroy VM on destruction", res);
        }

        if (this->verbose_calls_)
        {
            this->log.info("Destroyed virtual machine\n");
        }
    }

    allocation_handle virtual_machine::allocate(const size_t size)
    {
        const auto handle = this->allocations_.allocate(size);

        if (this->verbose_calls_)
        {
            this->log.print(color::dark_gray, "--> Allocated %" PRIu64 " (0x%zX bytes)\n", handle.value, page_align_up(size));
        }

        return handle;
    }

    allocation_handle virtual_machine::allocate_from(const std::span<const std::byte> source)
    {
        const auto handle = this->allocations_.allocate_from(source);

        if (this->verbose_calls_)
        {
            this->log.print(color::dark_gray, "--> Allocated %" PRIu64 " from 0x%zX bytes\n", handle.value, source.size());
        }

        return handle;
    }

    void virtual_machine::deallocate(const allocation_handle handle)
    {
        if (!this->allocations_.contains(handle))
        {
            throw hypervisor_error(error_code::invalid_handle);
        }

        if (this->mappings_.is_allocation_mapped(handle))
        {
            throw hypervisor_error(error_code::allocation_still_mapped);
        }

        this->allocations_.release(handle);

        if (this->verbose_calls_)
        {
            this->log.print(color::dark_gray, "--> Deallocated %" PRIu64 "\n", handle.value);
        }
    }

    std::span<const std::byte> virtual_machine::get_allocation_slice(const allocation_handle handle) const
    {
        return this->allocations_.get_buffer(handle);
    }

    std::span<std::byte> virtual_machine::get_allocation_slice_mut(const allocation_handle handle)
    {
        return this->allocations_.get_buffer(handle);
    }

    allocation_info virtual_machine::get_allocation_info(const allocation_handle handle) const
    {
        return this->allocations_.get_info(handle);
    }

    std::vector<allocation_info> virtual_machine::get_all_allocation_infos() const
    {
        return this->allocations_.get_all_infos();
    }

    mapping_handle virtual_machine::map(const allocation_handle allocation, const uint64_t guest_address,
                                        const memory_permission permission)
    {
        const auto handle = this->mappings_.map(allocation, guest_address, permission);

        if (this->verbose_calls_)
        {
            const auto info = this->mappings_.get_info(handle);
            this->log.print(color::dark_gray, "--> Mapped %" PRIu64 " at 0x%016" PRIx64 " - 0x%016" PRIx64 " (%s)\n", allocation.value,
                            info.address, info.address + info.size, get_permission_string(permission).c_str());
        }

        return handle;
    }

    void virtual_machine::unmap(const mapping_handle handle)
    {
        this->mappings_.unmap(handle);

        if (this->verbose_calls_)
        {
            this->log.print(color::dark_gray, "--> Unmapped %" PRIu64 "\n", handle.value);
        }
    }

    void virtual_machine::reprotect(const mapping_handle handle, const memory_permission permission)
    {
        this->mappings_.reprotect(handle, permission);

        if (this->verbose_calls_)
        {
            this->log.print(color::dark_gray, "--> Reprotected %" PRIu64 " (%s)\n", handle.value,
                            get_permission_string(permission).c_str());
        }
    }

    mapping_info virtual_machine::get_mapping_info(const mapping_handle handle) const
    {
        return this->mappings_.get_info(handle);
    }

    std::vector<mapping_info> virtual_machine::get_all_mapping_infos() const
    {
        return this->mappings_.get_all_infos();
    }

    virtual_cpu_configuration virtual_machine::create_vcpu_configuration()
    {
        return virtual_cpu_configuration{*this->native_};
    }

    virtual_cpu virtual_machine::create_vcpu(const virtual_cpu_configuration* config)
    {
        vcpu_id id{};
        const native_exit_record* exit{};

        hve(this->native_->vcpu_create(id, exit, config ? config->get_handle() : nullptr));

        if (this->verbose_calls_)
        {
            this->log.info("Created vCPU %" PRIu64 "\n", id);
        }

        return virtual_cpu{*this->native_, this->log, id, exit};
    }

    void virtual_machine::exit_vcpus(const std::span<const vcpu_id> vcpus)
    {
        hve(this->native_->vcpus_exit(vcpus));
    }
}
