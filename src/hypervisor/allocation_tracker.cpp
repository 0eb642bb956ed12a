#include "allocation_tracker.hpp"
#include "error.hpp"

#include <algorithm>
#include <limits>
#include <new>

namespace hvkit
{
    namespace
    {
        std::byte* allocate_pages(const size_t size)
        {
            try
            {
                auto* buffer = static_cast<std::byte*>(::operator new(size, std::align_val_t{page_size}));
                std::fill_n(buffer, size, std::byte{0});
                return buffer;
            }
            catch (const std::bad_alloc&)
            {
                throw hypervisor_error(error_code::no_resources);
            }
        }
    }

    void allocation_tracker::page_deleter::operator()(std::byte* buffer) const
    {
        ::operator delete(buffer, std::align_val_t{page_size});
    }

    allocation_handle allocation_tracker::allocate(const size_t size)
    {
        if (size == 0)
        {
            throw hypervisor_error(error_code::bad_argument);
        }

        if (size > std::numeric_limits<size_t>::max() - (page_size - 1))
        {
            throw hypervisor_error(error_code::no_resources);
        }

        const auto aligned_size = page_align_up(size);

        allocation entry{};
        entry.buffer = page_buffer(allocate_pages(aligned_size));
        entry.size = aligned_size;

        const auto handle = this->counter_.get_next_handle();
        this->allocations_.emplace(handle, std::move(entry));

        return handle;
    }

    allocation_handle allocation_tracker::allocate_from(const std::span<const std::byte> source)
    {
        const auto handle = this->allocate(source.size());

        const auto entry = this->allocations_.find(handle);
        if (entry == this->allocations_.end())
        {
            throw hypervisor_error(error_code::no_resources);
        }

        std::ranges::copy(source, entry->second.buffer.get());

        return handle;
    }

    void allocation_tracker::release(const allocation_handle handle)
    {
        const auto entry = this->allocations_.find(handle);
        if (entry == this->allocations_.end())
        {
            throw hypervisor_error(error_code::invalid_handle);
        }

        this->allocations_.erase(entry);
    }

    bool allocation_tracker::contains(const allocation_handle handle) const
    {
        return this->allocations_.contains(handle);
    }

    const allocation_tracker::allocation& allocation_tracker::find(const allocation_handle handle) const
    {
        const auto entry = this->allocations_.find(handle);
        if (entry == this->allocations_.end())
        {
            throw hypervisor_error(error_code::invalid_handle);
        }

        return entry->second;
    }

    std::span<const std::byte> allocation_tracker::get_buffer(const allocation_handle handle) const
    {
        const auto& entry = this->find(handle);
        return {entry.buffer.get(), entry.size};
    }

    std::span<std::byte> allocation_tracker::get_buffer(const allocation_handle handle)
    {
        const auto& entry = this->find(handle);
        return {entry.buffer.get(), entry.size};
    }

    allocation_info allocation_tracker::get_info(const allocation_handle handle) const
    {
        const auto& entry = this->find(handle);

        return {
            .handle = handle,
            .size = entry.size,
        };
    }

    std::vector<allocation_info> allocation_tracker::get_all_infos() const
    {
        std::vector<allocation_info> infos{};
        infos.reserve(this->allocations_.size());

        for (const auto& [handle, entry] : this->allocations_)
        {
            infos.push_back({
                .handle = handle,
                .size = entry.size,
            });
        }

        return infos;
    }
}
