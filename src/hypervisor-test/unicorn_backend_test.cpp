#include "hypervisor_test_utils.hpp"

#include <chrono>
#include <cstring>
#include <initializer_list>
#include <thread>

#include <exception_syndrome.hpp>
#include <unicorn_arm64_hypervisor.hpp>

namespace test
{
    using hvkit::arm64_register;
    using hvkit::exception_class;
    using hvkit::memory_permission;
    using hvkit::page_size;

    namespace
    {
        constexpr uint64_t code_address = page_size;
        constexpr uint64_t data_address = 4 * page_size;
        constexpr uint64_t unmapped_address = 16 * page_size;

        constexpr uint32_t brk_0 = 0xD4200000;
        constexpr uint32_t brk_0x42 = 0xD4200840;
        constexpr uint32_t mov_x0_5 = 0xD28000A0;
        constexpr uint32_t add_x0_x0_3 = 0x91000C00;
        constexpr uint32_t ldr_x0_x1 = 0xF9400020;
        constexpr uint32_t str_x0_x1 = 0xF9000020;
        constexpr uint32_t branch_to_self = 0x14000000;

        std::vector<std::byte> assemble(const std::initializer_list<uint32_t> instructions)
        {
            std::vector<std::byte> code(instructions.size() * sizeof(uint32_t));
            size_t offset = 0;

            for (const auto instruction : instructions)
            {
                memcpy(code.data() + offset, &instruction, sizeof(instruction));
                offset += sizeof(instruction);
            }

            return code;
        }

        std::unique_ptr<hvkit::virtual_machine> create_unicorn_machine()
        {
            hvkit::virtual_machine_settings settings{};
            settings.disable_logging = true;

            return std::make_unique<hvkit::virtual_machine>(hvkit::unicorn::create_arm64_hypervisor(), std::nullopt, settings);
        }

        void load_code(hvkit::virtual_machine& vm, const std::initializer_list<uint32_t> instructions)
        {
            const auto code = vm.allocate_from(assemble(instructions));
            (void)vm.map(code, code_address, memory_permission::read_exec);
        }

        hvkit::exit_exception expect_exception(const hvkit::vcpu_exit_reason& reason)
        {
            EXPECT_TRUE(std::holds_alternative<hvkit::vcpu_exit::exception>(reason)) << hvkit::get_exit_reason_name(reason);

            if (const auto* exception = std::get_if<hvkit::vcpu_exit::exception>(&reason))
            {
                return exception->exception;
            }

            return {};
        }
    }

    TEST(UnicornBackendTest, BreakpointExitsWithImmediate)
    {
        auto vm = create_unicorn_machine();
        load_code(*vm, {brk_0x42});

        auto vcpu = vm->create_vcpu();
        vcpu.set_register(arm64_register::pc, code_address);

        const auto exception = expect_exception(vcpu.run());

        EXPECT_EQ(hvkit::get_exception_class(exception.syndrome), exception_class::brk64);
        EXPECT_EQ(hvkit::get_exception_immediate(exception.syndrome), 0x42);
    }

    TEST(UnicornBackendTest, GuestCodeUpdatesRegisters)
    {
        auto vm = create_unicorn_machine();
        load_code(*vm, {mov_x0_5, add_x0_x0_3, brk_0});

        auto vcpu = vm->create_vcpu();
        vcpu.set_register(arm64_register::pc, code_address);

        const auto exception = expect_exception(vcpu.run());

        EXPECT_EQ(hvkit::get_exception_class(exception.syndrome), exception_class::brk64);
        EXPECT_EQ(vcpu.get_register(arm64_register::x0), 8u);
    }

    TEST(UnicornBackendTest, UnmappedReadIsDataAbort)
    {
        auto vm = create_unicorn_machine();
        load_code(*vm, {ldr_x0_x1, brk_0});

        auto vcpu = vm->create_vcpu();
        vcpu.set_register(arm64_register::pc, code_address);
        vcpu.set_register(arm64_register::x1, unmapped_address);

        const auto exception = expect_exception(vcpu.run());

        EXPECT_EQ(hvkit::get_exception_class(exception.syndrome), exception_class::data_abort_lower);
        EXPECT_FALSE(hvkit::is_data_abort_write(exception.syndrome));
        EXPECT_EQ(hvkit::get_instruction_specific_syndrome(exception.syndrome) & 0x3F, hvkit::fault_status_translation_level3);
        EXPECT_EQ(exception.virtual_address, unmapped_address);
        EXPECT_EQ(exception.physical_address, unmapped_address);
    }

    TEST(UnicornBackendTest, WriteToReadOnlyMemoryIsPermissionFault)
    {
        auto vm = create_unicorn_machine();
        load_code(*vm, {str_x0_x1, brk_0});

        const auto data = vm->allocate(page_size);
        (void)vm->map(data, data_address, memory_permission::read);

        auto vcpu = vm->create_vcpu();
        vcpu.set_register(arm64_register::pc, code_address);
        vcpu.set_register(arm64_register::x1, data_address);

        const auto exception = expect_exception(vcpu.run());

        EXPECT_EQ(hvkit::get_exception_class(exception.syndrome), exception_class::data_abort_lower);
        EXPECT_TRUE(hvkit::is_data_abort_write(exception.syndrome));
        EXPECT_EQ(hvkit::get_instruction_specific_syndrome(exception.syndrome) & 0x3F, hvkit::fault_status_permission_level3);
    }

    TEST(UnicornBackendTest, GuestWritesReachHostMemory)
    {
        auto vm = create_unicorn_machine();
        load_code(*vm, {str_x0_x1, brk_0});

        const auto data = vm->allocate(page_size);
        const auto mapping = vm->map(data, data_address, memory_permission::read_write);

        auto vcpu = vm->create_vcpu();
        vcpu.set_register(arm64_register::pc, code_address);
        vcpu.set_register(arm64_register::x0, 0x1122334455667788);
        vcpu.set_register(arm64_register::x1, data_address + 0x20);

        (void)expect_exception(vcpu.run());

        uint64_t value{};
        memcpy(&value, vm->get_allocation_slice(data).data() + 0x20, sizeof(value));
        EXPECT_EQ(value, 0x1122334455667788u);

        vm->unmap(mapping);
    }

    TEST(UnicornBackendTest, ReprotectTakesEffect)
    {
        auto vm = create_unicorn_machine();
        load_code(*vm, {str_x0_x1, brk_0});

        const auto data = vm->allocate(page_size);
        const auto mapping = vm->map(data, data_address, memory_permission::read_write);
        vm->reprotect(mapping, memory_permission::read);

        auto vcpu = vm->create_vcpu();
        vcpu.set_register(arm64_register::pc, code_address);
        vcpu.set_register(arm64_register::x1, data_address);

        const auto exception = expect_exception(vcpu.run());
        EXPECT_EQ(hvkit::get_exception_class(exception.syndrome), exception_class::data_abort_lower);
    }

    TEST(UnicornBackendTest, MemoryMappedAfterVcpuCreationIsVisible)
    {
        auto vm = create_unicorn_machine();

        auto vcpu = vm->create_vcpu();
        load_code(*vm, {brk_0x42});

        vcpu.set_register(arm64_register::pc, code_address);

        const auto exception = expect_exception(vcpu.run());
        EXPECT_EQ(hvkit::get_exception_immediate(exception.syndrome), 0x42);
    }

    TEST(UnicornBackendTest, OverlappingMappingIsRejected)
    {
        auto vm = create_unicorn_machine();

        const auto first = vm->allocate(2 * page_size);
        const auto second = vm->allocate(page_size);

        (void)vm->map(first, data_address, memory_permission::read);

        ASSERT_HYPERVISOR_ERROR(vm->map(second, data_address + page_size, memory_permission::read), hvkit::error_code::bad_argument);
        EXPECT_EQ(vm->get_all_mapping_infos().size(), 1u);
    }

    TEST(UnicornBackendTest, SecondVmIsBusy)
    {
        auto native = hvkit::unicorn::create_arm64_hypervisor();

        EXPECT_EQ(native->vm_create(nullptr), hvkit::status::success);
        EXPECT_EQ(native->vm_create(nullptr), hvkit::status::busy);
        EXPECT_EQ(native->vm_destroy(), hvkit::status::success);
    }

    TEST(UnicornBackendTest, ExitCancelsRunningGuest)
    {
        auto vm = create_unicorn_machine();

        const auto code = vm->allocate_from(assemble({branch_to_self, brk_0x42}));
        (void)vm->map(code, code_address, memory_permission::read_exec);

        auto vcpu = vm->create_vcpu();
        vcpu.set_register(arm64_register::pc, code_address);

        std::thread exit_thread([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            vcpu.exit();
        });

        const auto reason = vcpu.run();
        exit_thread.join();

        EXPECT_TRUE(std::holds_alternative<hvkit::vcpu_exit::cancelled>(reason)) << hvkit::get_exit_reason_name(reason);

        vcpu.set_register(arm64_register::pc, code_address + 4);

        const auto exception = expect_exception(vcpu.run());
        EXPECT_EQ(hvkit::get_exception_immediate(exception.syndrome), 0x42);
    }

    TEST(UnicornBackendTest, ConfigurationReportsCacheType)
    {
        auto vm = create_unicorn_machine();

        const auto config = vm->create_vcpu_configuration();
        EXPECT_NE(config.get_feature_register(hvkit::arm64_feature_register::ctr_el0), 0u);

        auto vcpu = vm->create_vcpu(&config);
        EXPECT_EQ(vcpu.get_handle(), 0u);
    }

    TEST(UnicornBackendTest, ExecTimeAdvances)
    {
        auto vm = create_unicorn_machine();
        load_code(*vm, {mov_x0_5, brk_0});

        auto vcpu = vm->create_vcpu();
        vcpu.set_register(arm64_register::pc, code_address);

        (void)vcpu.run();

        EXPECT_GT(vcpu.get_exec_time(), 0u);
    }

    TEST(UnicornBackendTest, FailedUnmapKeepsMemoryInEveryVcpu)
    {
        auto vm = create_unicorn_machine();
        load_code(*vm, {brk_0x42});

        auto first = vm->create_vcpu();
        auto second = vm->create_vcpu();

        EXPECT_EQ(vm->native().vm_unmap(code_address, 0x1000), hvkit::status::bad_argument);

        for (auto* vcpu : {&first, &second})
        {
            vcpu->set_register(arm64_register::pc, code_address);

            const auto exception = expect_exception(vcpu->run());
            EXPECT_EQ(hvkit::get_exception_immediate(exception.syndrome), 0x42);
        }
    }

    TEST(UnicornBackendTest, PendingInterruptsAreUnsupported)
    {
        auto vm = create_unicorn_machine();
        auto vcpu = vm->create_vcpu();

        ASSERT_HYPERVISOR_ERROR(vcpu.set_pending_interrupt(hvkit::interrupt_type::irq, true), hvkit::error_code::unsupported);
        ASSERT_HYPERVISOR_ERROR(vcpu.set_pending_interrupt(hvkit::interrupt_type::fiq, true), hvkit::error_code::unsupported);

        vcpu.set_pending_interrupt(hvkit::interrupt_type::irq, false);

        EXPECT_FALSE(vcpu.get_pending_interrupt(hvkit::interrupt_type::irq));
        EXPECT_FALSE(vcpu.get_pending_interrupt(hvkit::interrupt_type::fiq));
    }

    TEST(UnicornBackendTest, BreakpointsAlwaysTrapToTheHost)
    {
        auto vm = create_unicorn_machine();
        auto vcpu = vm->create_vcpu();

        EXPECT_TRUE(vcpu.get_trap_debug_exceptions());
        vcpu.set_trap_debug_exceptions(true);

        ASSERT_HYPERVISOR_ERROR(vcpu.set_trap_debug_exceptions(false), hvkit::error_code::unsupported);
        EXPECT_TRUE(vcpu.get_trap_debug_exceptions());
    }

    TEST(UnicornBackendTest, DebugRegisterAccessesNeverTrap)
    {
        auto vm = create_unicorn_machine();
        auto vcpu = vm->create_vcpu();

        EXPECT_FALSE(vcpu.get_trap_debug_reg_accesses());
        vcpu.set_trap_debug_reg_accesses(false);

        ASSERT_HYPERVISOR_ERROR(vcpu.set_trap_debug_reg_accesses(true), hvkit::error_code::unsupported);
        EXPECT_FALSE(vcpu.get_trap_debug_reg_accesses());
    }

    TEST(UnicornBackendTest, VirtualTimerStaysMasked)
    {
        auto vm = create_unicorn_machine();
        auto vcpu = vm->create_vcpu();

        EXPECT_TRUE(vcpu.get_vtimer_mask());
        EXPECT_EQ(vcpu.get_vtimer_offset(), 0u);

        vcpu.set_vtimer_mask(true);
        vcpu.set_vtimer_offset(0);

        ASSERT_HYPERVISOR_ERROR(vcpu.set_vtimer_mask(false), hvkit::error_code::unsupported);
        ASSERT_HYPERVISOR_ERROR(vcpu.set_vtimer_offset(0x1000), hvkit::error_code::unsupported);

        EXPECT_TRUE(vcpu.get_vtimer_mask());
        EXPECT_EQ(vcpu.get_vtimer_offset(), 0u);
    }
}
