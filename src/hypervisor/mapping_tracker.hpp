#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

#include "handles.hpp"
#include "memory_permission.hpp"

namespace hvkit
{
    class native_hypervisor;
    class allocation_tracker;

    struct mapping_info
    {
        allocation_handle allocation{};
        mapping_handle handle{};
        uint64_t address{};
        size_t size{};
        memory_permission permission{};
    };

    // Records the allocations that are bound into the guest physical address space.
    // A record only exists while the native mapping exists.
    class mapping_tracker
    {
      public:
        mapping_tracker(native_hypervisor& native, allocation_tracker& allocations);

        mapping_handle map(allocation_handle allocation, uint64_t guest_address, memory_permission permission);
        void unmap(mapping_handle handle);
        void reprotect(mapping_handle handle, memory_permission permission);

        bool is_allocation_mapped(allocation_handle allocation) const;

        mapping_info get_info(mapping_handle handle) const;
        std::vector<mapping_info> get_all_infos() const;

        size_t size() const
        {
            return this->mappings_.size();
        }

      private:
        native_hypervisor* native_{};
        allocation_tracker* allocations_{};

        handle_counter<mapping_handle> counter_{};
        std::map<mapping_handle, mapping_info> mappings_{};
    };
}
