#include "mapping_tracker.hpp"
#include "allocation_tracker.hpp"
#include "native_hypervisor.hpp"
#include "error.hpp"

#include <algorithm>
#include <ranges>

namespace hvkit
{
    mapping_tracker::mapping_tracker(native_hypervisor& native, allocation_tracker& allocations)
        : native_(&native),
          allocations_(&allocations)
    {
    }

    mapping_handle mapping_tracker::map(const allocation_handle allocation, const uint64_t guest_address,
                                        const memory_permission permission)
    {
        const auto buffer = this->allocations_->get_buffer(allocation);

        if (!is_page_aligned(guest_address))
        {
            throw hypervisor_error(error_code::misaligned_address);
        }

        hve(this->native_->vm_map(buffer.data(), guest_address, buffer.size(), to_native_flags(permission)));

        const auto handle = this->counter_.get_next_handle();

        this->mappings_[handle] = mapping_info{
            .allocation = allocation,
            .handle = handle,
            .address = guest_address,
            .size = buffer.size(),
            .permission = permission,
        };

        return handle;
    }

    void mapping_tracker::unmap(const mapping_handle handle)
    {
        const auto entry = this->mappings_.find(handle);
        if (entry == this->mappings_.end())
        {
            throw hypervisor_error(error_code::invalid_handle);
        }

        hve(this->native_->vm_unmap(entry->second.address, entry->second.size));

        this->mappings_.erase(entry);
    }

    void mapping_tracker::reprotect(const mapping_handle handle, const memory_permission permission)
    {
        const auto entry = this->mappings_.find(handle);
        if (entry == this->mappings_.end())
        {
            throw hypervisor_error(error_code::invalid_handle);
        }

        hve(this->native_->vm_protect(entry->second.address, entry->second.size, to_native_flags(permission)));

        const auto mapping = this->mappings_.find(handle);
        if (mapping == this->mappings_.end())
        {
            fatal_error("Mapping disappeared while being reprotected");
        }

        mapping->second.permission = permission;
    }

    bool mapping_tracker::is_allocation_mapped(const allocation_handle allocation) const
    {
        return std::ranges::any_of(this->mappings_ | std::views::values,
                                   [&](const mapping_info& mapping) { return mapping.allocation == allocation; });
    }

    mapping_info mapping_tracker::get_info(const mapping_handle handle) const
    {
        const auto entry = this->mappings_.find(handle);
        if (entry == this->mappings_.end())
        {
            throw hypervisor_error(error_code::invalid_handle);
        }

        return entry->second;
    }

    std::vector<mapping_info> mapping_tracker::get_all_infos() const
    {
        std::vector<mapping_info> infos{};
        infos.reserve(this->mappings_.size());

        for (const auto& mapping : this->mappings_ | std::views::values)
        {
            infos.push_back(mapping);
        }

        return infos;
    }
}
