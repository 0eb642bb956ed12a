#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <span>
#include <vector>

#include "handles.hpp"

namespace hvkit
{
    inline constexpr size_t page_size = 0x10000;

    constexpr bool is_page_aligned(const uint64_t value)
    {
        return (value % page_size) == 0;
    }

    constexpr size_t page_align_up(const size_t value)
    {
        return (value + (page_size - 1)) & ~(page_size - 1);
    }

    struct allocation_info
    {
        allocation_handle handle{};
        size_t size{};
    };

    // Owns the host buffers backing guest memory. Buffers are page aligned, zero filled and sized to
    // a whole number of pages. Mapping state is not known here, callers check it before releasing.
    class allocation_tracker
    {
      public:
        allocation_handle allocate(size_t size);
        allocation_handle allocate_from(std::span<const std::byte> source);

        void release(allocation_handle handle);

        bool contains(allocation_handle handle) const;

        std::span<const std::byte> get_buffer(allocation_handle handle) const;
        std::span<std::byte> get_buffer(allocation_handle handle);

        allocation_info get_info(allocation_handle handle) const;
        std::vector<allocation_info> get_all_infos() const;

        size_t size() const
        {
            return this->allocations_.size();
        }

      private:
        struct page_deleter
        {
            void operator()(std::byte* buffer) const;
        };

        using page_buffer = std::unique_ptr<std::byte[], page_deleter>;

        struct allocation
        {
            page_buffer buffer{};
            size_t size{};
        };

        handle_counter<allocation_handle> counter_{};
        std::map<allocation_handle, allocation> allocations_{};

        const allocation& find(allocation_handle handle) const;
    };
}
