#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

#include "arm64_register.hpp"

namespace hvkit
{
    using native_status = int32_t;

    // Values follow the Hypervisor.framework return codes
    namespace status
    {
        inline constexpr native_status success = 0;
        inline constexpr native_status error = static_cast<native_status>(0xFAE94001);
        inline constexpr native_status busy = static_cast<native_status>(0xFAE94002);
        inline constexpr native_status bad_argument = static_cast<native_status>(0xFAE94003);
        inline constexpr native_status illegal_guest_state = static_cast<native_status>(0xFAE94004);
        inline constexpr native_status no_resources = static_cast<native_status>(0xFAE94005);
        inline constexpr native_status no_device = static_cast<native_status>(0xFAE94006);
        inline constexpr native_status denied = static_cast<native_status>(0xFAE94007);
        inline constexpr native_status unsupported = static_cast<native_status>(0xFAE9400F);
    }

    using vcpu_id = uint64_t;

    struct native_vm_config;
    struct native_vcpu_config;

    enum class interrupt_type : uint32_t
    {
        irq = 0,
        fiq = 1,
    };

    enum class cache_type : uint32_t
    {
        data = 0,
        instruction = 1,
    };

    enum class native_exit_reason : uint32_t
    {
        canceled = 0,
        exception = 1,
        vtimer_activated = 2,
        unknown = 3,
    };

    struct exit_exception
    {
        uint64_t syndrome{};
        uint64_t virtual_address{};
        uint64_t physical_address{};
    };

    // Written by the native layer on every successful run, stable for the lifetime of the vCPU.
    // The reason is kept raw so that codes newer than this header still pass through.
    struct native_exit_record
    {
        uint32_t reason{};
        exit_exception exception{};
    };

    inline constexpr size_t ccsidr_value_count = 8;
    using ccsidr_values = std::array<uint64_t, ccsidr_value_count>;

    // The raw platform call surface. Every entry point reports a native status; nothing throws.
    class native_hypervisor
    {
      public:
        virtual ~native_hypervisor() = default;

        virtual native_status vm_create(native_vm_config* config) = 0;
        virtual native_status vm_destroy() = 0;

        virtual native_status vm_map(void* host_address, uint64_t guest_address, size_t size, uint64_t flags) = 0;
        virtual native_status vm_unmap(uint64_t guest_address, size_t size) = 0;
        virtual native_status vm_protect(uint64_t guest_address, size_t size, uint64_t flags) = 0;

        virtual native_vcpu_config* vcpu_config_create() = 0;
        virtual void vcpu_config_release(native_vcpu_config* config) = 0;
        virtual native_status vcpu_config_get_feature_reg(native_vcpu_config* config, arm64_feature_register reg, uint64_t& value) = 0;
        virtual native_status vcpu_config_get_ccsidr_el1_sys_reg_values(native_vcpu_config* config, cache_type type,
                                                                        ccsidr_values& values) = 0;

        virtual native_status vcpu_create(vcpu_id& vcpu, const native_exit_record*& exit, native_vcpu_config* config) = 0;
        virtual native_status vcpu_destroy(vcpu_id vcpu) = 0;
        virtual native_status vcpu_run(vcpu_id vcpu) = 0;
        virtual native_status vcpus_exit(std::span<const vcpu_id> vcpus) = 0;

        virtual native_status vcpu_get_reg(vcpu_id vcpu, arm64_register reg, uint64_t& value) = 0;
        virtual native_status vcpu_set_reg(vcpu_id vcpu, arm64_register reg, uint64_t value) = 0;
        virtual native_status vcpu_get_sys_reg(vcpu_id vcpu, arm64_system_register reg, uint64_t& value) = 0;
        virtual native_status vcpu_set_sys_reg(vcpu_id vcpu, arm64_system_register reg, uint64_t value) = 0;

        virtual native_status vcpu_get_pending_interrupt(vcpu_id vcpu, interrupt_type type, bool& pending) = 0;
        virtual native_status vcpu_set_pending_interrupt(vcpu_id vcpu, interrupt_type type, bool pending) = 0;

        virtual native_status vcpu_get_trap_debug_exceptions(vcpu_id vcpu, bool& value) = 0;
        virtual native_status vcpu_set_trap_debug_exceptions(vcpu_id vcpu, bool value) = 0;
        virtual native_status vcpu_get_trap_debug_reg_accesses(vcpu_id vcpu, bool& value) = 0;
        virtual native_status vcpu_set_trap_debug_reg_accesses(vcpu_id vcpu, bool value) = 0;

        virtual native_status vcpu_get_exec_time(vcpu_id vcpu, uint64_t& time) = 0;

        virtual native_status vcpu_get_vtimer_mask(vcpu_id vcpu, bool& masked) = 0;
        virtual native_status vcpu_set_vtimer_mask(vcpu_id vcpu, bool masked) = 0;
        virtual native_status vcpu_get_vtimer_offset(vcpu_id vcpu, uint64_t& offset) = 0;
        virtual native_status vcpu_set_vtimer_offset(vcpu_id vcpu, uint64_t offset) = 0;

        virtual std::string get_name() const = 0;
    };
}
