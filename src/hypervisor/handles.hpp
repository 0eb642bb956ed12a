#pragma once

#include <compare>
#include <cstdint>

namespace hvkit
{
    struct allocation_handle
    {
        uint64_t value{};

        auto operator<=>(const allocation_handle&) const = default;
    };

    struct mapping_handle
    {
        uint64_t value{};

        auto operator<=>(const mapping_handle&) const = default;
    };

    // Handles start at 1 and are never reused
    template <typename Handle>
    class handle_counter
    {
      public:
        Handle get_next_handle()
        {
            return Handle{++this->value_};
        }

      private:
        uint64_t value_{0};
    };
}
