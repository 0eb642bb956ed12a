#include "hypervisor_test_utils.hpp"

#include <array>
#include <cstring>

namespace test
{
    using hvkit::error_code;
    using hvkit::page_size;

    TEST(AllocationTest, SizeIsRoundedUpToWholePages)
    {
        auto machine = create_test_machine();
        auto& vm = *machine.vm;

        const std::array sizes{size_t{1}, page_size - 1, page_size, page_size + 1, (3 * page_size) + 5};

        for (const auto size : sizes)
        {
            const auto handle = vm.allocate(size);
            const auto slice = vm.get_allocation_slice(handle);

            const auto expected = ((size + page_size - 1) / page_size) * page_size;

            EXPECT_EQ(slice.size(), expected) << "size " << size;
            EXPECT_EQ(vm.get_allocation_info(handle).size, expected);
            EXPECT_TRUE(is_zero_filled(slice));
            EXPECT_EQ(reinterpret_cast<uintptr_t>(slice.data()) % page_size, 0u);
        }
    }

    TEST(AllocationTest, ZeroSizeIsRejected)
    {
        auto machine = create_test_machine();

        ASSERT_HYPERVISOR_ERROR(machine.vm->allocate(0), error_code::bad_argument);
        EXPECT_TRUE(machine.vm->get_all_allocation_infos().empty());
    }

    TEST(AllocationTest, AllocateFromCopiesData)
    {
        auto machine = create_test_machine();
        auto& vm = *machine.vm;

        const std::array data{std::byte{0xDE}, std::byte{0xAD}, std::byte{0xBE}, std::byte{0xEF}};

        const auto handle = vm.allocate_from(data);
        const auto slice = vm.get_allocation_slice(handle);

        ASSERT_EQ(slice.size(), page_size);
        EXPECT_EQ(memcmp(slice.data(), data.data(), data.size()), 0);
        EXPECT_TRUE(is_zero_filled(slice.subspan(data.size())));
    }

    TEST(AllocationTest, MutableSliceWritesAreVisible)
    {
        auto machine = create_test_machine();
        auto& vm = *machine.vm;

        const auto handle = vm.allocate(0x100);

        auto slice = vm.get_allocation_slice_mut(handle);
        slice[0x10] = std::byte{0x42};

        EXPECT_EQ(vm.get_allocation_slice(handle)[0x10], std::byte{0x42});
    }

    TEST(AllocationTest, HandlesIncreaseAndAreNeverReused)
    {
        auto machine = create_test_machine();
        auto& vm = *machine.vm;

        const auto first = vm.allocate(1);
        const auto second = vm.allocate(1);

        EXPECT_EQ(first.value, 1u);
        EXPECT_EQ(second.value, 2u);

        vm.deallocate(second);

        const auto third = vm.allocate(1);
        EXPECT_EQ(third.value, 3u);

        const auto infos = vm.get_all_allocation_infos();
        ASSERT_EQ(infos.size(), 2u);
        EXPECT_EQ(infos[0].handle, first);
        EXPECT_EQ(infos[1].handle, third);
    }

    TEST(AllocationTest, DeallocatedHandleIsInvalid)
    {
        auto machine = create_test_machine();
        auto& vm = *machine.vm;

        const auto handle = vm.allocate(page_size);
        vm.deallocate(handle);

        ASSERT_HYPERVISOR_ERROR(vm.get_allocation_slice(handle), error_code::invalid_handle);
        ASSERT_HYPERVISOR_ERROR(vm.get_allocation_slice_mut(handle), error_code::invalid_handle);
        ASSERT_HYPERVISOR_ERROR(vm.get_allocation_info(handle), error_code::invalid_handle);
        ASSERT_HYPERVISOR_ERROR(vm.deallocate(handle), error_code::invalid_handle);
    }

    TEST(AllocationTest, MappedAllocationCannotBeDeallocated)
    {
        auto machine = create_test_machine();
        auto& vm = *machine.vm;

        const auto handle = vm.allocate(page_size);
        (void)vm.map(handle, 0, hvkit::memory_permission::read);

        ASSERT_HYPERVISOR_ERROR(vm.deallocate(handle), error_code::allocation_still_mapped);

        EXPECT_EQ(vm.get_allocation_slice(handle).size(), page_size);
        EXPECT_EQ(vm.get_all_allocation_infos().size(), 1u);
    }

    TEST(AllocationTest, UnknownHandleIsInvalid)
    {
        auto machine = create_test_machine();

        ASSERT_HYPERVISOR_ERROR(machine.vm->deallocate(hvkit::allocation_handle{42}), error_code::invalid_handle);
        ASSERT_HYPERVISOR_ERROR(machine.vm->get_allocation_slice(hvkit::allocation_handle{42}), error_code::invalid_handle);
    }
}
