#include "hypervisor_test_utils.hpp"

#include <array>

namespace test
{
    using hvkit::error_code;
    using hvkit::memory_permission;
    using hvkit::page_size;

    constexpr std::array all_permissions{
        memory_permission::none,      memory_permission::read,      memory_permission::write,      memory_permission::exec,
        memory_permission::read_write, memory_permission::read_exec, memory_permission::write_exec, memory_permission::all,
    };

    TEST(MappingTest, MapBindsTheWholeAllocation)
    {
        auto machine = create_test_machine();
        auto& vm = *machine.vm;

        const auto allocation = vm.allocate(page_size + 1);
        const auto mapping = vm.map(allocation, 4 * page_size, memory_permission::read_exec);

        const auto info = vm.get_mapping_info(mapping);
        EXPECT_EQ(info.allocation, allocation);
        EXPECT_EQ(info.handle, mapping);
        EXPECT_EQ(info.address, 4 * page_size);
        EXPECT_EQ(info.size, 2 * page_size);
        EXPECT_EQ(info.permission, memory_permission::read_exec);

        const auto calls = machine.native->get_map_calls();
        ASSERT_EQ(calls.size(), 1u);
        EXPECT_EQ(calls[0].host_address, vm.get_allocation_slice(allocation).data());
        EXPECT_EQ(calls[0].guest_address, 4 * page_size);
        EXPECT_EQ(calls[0].size, 2 * page_size);
        EXPECT_EQ(calls[0].flags, 5u);
    }

    TEST(MappingTest, MisalignedAddressIsRejectedForEveryPermission)
    {
        auto machine = create_test_machine();
        auto& vm = *machine.vm;

        const auto allocation = vm.allocate(page_size);
        const std::array addresses{uint64_t{1}, uint64_t{0x1000}, uint64_t{page_size - 1}, uint64_t{page_size + 0x8000}};

        for (const auto permission : all_permissions)
        {
            for (const auto address : addresses)
            {
                ASSERT_HYPERVISOR_ERROR(vm.map(allocation, address, permission), error_code::misaligned_address);
            }
        }

        EXPECT_TRUE(vm.get_all_mapping_infos().empty());
        EXPECT_EQ(machine.calls->count("vm_map"), 0u);

        vm.deallocate(allocation);
    }

    TEST(MappingTest, UnknownAllocationIsCheckedFirst)
    {
        auto machine = create_test_machine();

        ASSERT_HYPERVISOR_ERROR(machine.vm->map(hvkit::allocation_handle{7}, 1, memory_permission::read), error_code::invalid_handle);
        EXPECT_EQ(machine.calls->count("vm_map"), 0u);
    }

    TEST(MappingTest, NativeMapFailureLeavesNoRecord)
    {
        auto machine = create_test_machine();
        auto& vm = *machine.vm;

        const auto allocation = vm.allocate(page_size);
        machine.native->fail("vm_map", hvkit::status::no_resources);

        try
        {
            (void)vm.map(allocation, 0, memory_permission::read);
            FAIL() << "Expected map to fail";
        }
        catch (const hvkit::hypervisor_error& e)
        {
            EXPECT_EQ(e.code(), error_code::no_resources);
            EXPECT_EQ(e.get_native_status(), hvkit::status::no_resources);
        }

        EXPECT_TRUE(vm.get_all_mapping_infos().empty());

        machine.native->clear_failure("vm_map");

        const auto mapping = vm.map(allocation, 0, memory_permission::read);
        EXPECT_EQ(mapping.value, 1u);
    }

    TEST(MappingTest, UnmapRemovesTheMapping)
    {
        auto machine = create_test_machine();
        auto& vm = *machine.vm;

        const auto allocation = vm.allocate(page_size);
        const auto mapping = vm.map(allocation, 0, memory_permission::read_write);

        vm.unmap(mapping);

        EXPECT_TRUE(vm.get_all_mapping_infos().empty());
        ASSERT_HYPERVISOR_ERROR(vm.unmap(mapping), error_code::invalid_handle);
        ASSERT_HYPERVISOR_ERROR(vm.get_mapping_info(mapping), error_code::invalid_handle);

        const auto calls = machine.native->get_unmap_calls();
        ASSERT_EQ(calls.size(), 1u);
        EXPECT_EQ(calls[0].guest_address, 0u);
        EXPECT_EQ(calls[0].size, page_size);
    }

    TEST(MappingTest, FailedUnmapKeepsTheMapping)
    {
        auto machine = create_test_machine();
        auto& vm = *machine.vm;

        const auto allocation = vm.allocate(page_size);
        const auto mapping = vm.map(allocation, 0, memory_permission::read);

        machine.native->fail("vm_unmap", hvkit::status::busy);
        ASSERT_HYPERVISOR_ERROR(vm.unmap(mapping), error_code::busy);

        EXPECT_EQ(vm.get_all_mapping_infos().size(), 1u);

        machine.native->clear_failure("vm_unmap");
    }

    TEST(MappingTest, ReprotectOnlyChangesThePermission)
    {
        auto machine = create_test_machine();
        auto& vm = *machine.vm;

        const auto allocation = vm.allocate(2 * page_size);
        const auto mapping = vm.map(allocation, 8 * page_size, memory_permission::read_write);

        const auto before = vm.get_mapping_info(mapping);
        vm.reprotect(mapping, memory_permission::read_exec);
        const auto after = vm.get_mapping_info(mapping);

        EXPECT_EQ(after.permission, memory_permission::read_exec);
        EXPECT_EQ(after.allocation, before.allocation);
        EXPECT_EQ(after.address, before.address);
        EXPECT_EQ(after.size, before.size);

        const auto calls = machine.native->get_protect_calls();
        ASSERT_EQ(calls.size(), 1u);
        EXPECT_EQ(calls[0].guest_address, 8 * page_size);
        EXPECT_EQ(calls[0].size, 2 * page_size);
        EXPECT_EQ(calls[0].flags, 5u);
    }

    TEST(MappingTest, ReprotectOfUnknownMappingMakesNoNativeCall)
    {
        auto machine = create_test_machine();

        ASSERT_HYPERVISOR_ERROR(machine.vm->reprotect(hvkit::mapping_handle{3}, memory_permission::read), error_code::invalid_handle);
        EXPECT_EQ(machine.calls->count("vm_protect"), 0u);
    }

    TEST(MappingTest, FailedReprotectKeepsThePermission)
    {
        auto machine = create_test_machine();
        auto& vm = *machine.vm;

        const auto allocation = vm.allocate(page_size);
        const auto mapping = vm.map(allocation, 0, memory_permission::read);

        machine.native->fail("vm_protect", hvkit::status::denied);
        ASSERT_HYPERVISOR_ERROR(vm.reprotect(mapping, memory_permission::all), error_code::denied);

        EXPECT_EQ(vm.get_mapping_info(mapping).permission, memory_permission::read);
    }

    TEST(MappingTest, SinglePageLifecycle)
    {
        auto machine = create_test_machine();
        auto& vm = *machine.vm;

        const auto allocation = vm.allocate(1);
        EXPECT_EQ(vm.get_allocation_slice(allocation).size(), page_size);

        const auto mapping = vm.map(allocation, 0, memory_permission::read_write);
        EXPECT_EQ(vm.get_mapping_info(mapping).size, page_size);

        vm.reprotect(mapping, memory_permission::exec);
        EXPECT_EQ(vm.get_mapping_info(mapping).permission, memory_permission::exec);

        vm.unmap(mapping);
        EXPECT_TRUE(vm.get_all_mapping_infos().empty());

        vm.deallocate(allocation);
        EXPECT_TRUE(vm.get_all_allocation_infos().empty());
    }

    TEST(MappingTest, AllocationCanBeReleasedOnceUnmapped)
    {
        auto machine = create_test_machine();
        auto& vm = *machine.vm;

        const auto first = vm.allocate(page_size);
        const auto second = vm.allocate(page_size);

        const auto first_mapping = vm.map(first, 0, memory_permission::read);
        const auto second_mapping = vm.map(second, 2 * page_size, memory_permission::read_write);

        ASSERT_HYPERVISOR_ERROR(vm.deallocate(first), error_code::allocation_still_mapped);

        vm.unmap(first_mapping);
        vm.deallocate(first);

        const auto allocations = vm.get_all_allocation_infos();
        ASSERT_EQ(allocations.size(), 1u);
        EXPECT_EQ(allocations[0].handle, second);

        const auto mappings = vm.get_all_mapping_infos();
        ASSERT_EQ(mappings.size(), 1u);
        EXPECT_EQ(mappings[0].handle, second_mapping);
    }

    TEST(MappingTest, AllocationCanBeMappedTwice)
    {
        auto machine = create_test_machine();
        auto& vm = *machine.vm;

        const auto allocation = vm.allocate(page_size);

        const auto low = vm.map(allocation, 0, memory_permission::read);
        const auto high = vm.map(allocation, 16 * page_size, memory_permission::read);

        EXPECT_EQ(low.value, 1u);
        EXPECT_EQ(high.value, 2u);

        vm.unmap(low);
        ASSERT_HYPERVISOR_ERROR(vm.deallocate(allocation), error_code::allocation_still_mapped);

        vm.unmap(high);
        vm.deallocate(allocation);
    }
}
