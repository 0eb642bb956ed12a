#include "hvf_arm64_hypervisor.hpp"

#include <map>
#include <mutex>
#include <vector>

#include <Hypervisor/Hypervisor.h>
#include <os/object.h>

namespace hvkit::hvf
{
    namespace
    {
        static_assert(status::success == HV_SUCCESS);
        static_assert(status::error == static_cast<native_status>(HV_ERROR));
        static_assert(status::busy == static_cast<native_status>(HV_BUSY));
        static_assert(status::bad_argument == static_cast<native_status>(HV_BAD_ARGUMENT));
        static_assert(status::illegal_guest_state == static_cast<native_status>(HV_ILLEGAL_GUEST_STATE));
        static_assert(status::no_resources == static_cast<native_status>(HV_NO_RESOURCES));
        static_assert(status::no_device == static_cast<native_status>(HV_NO_DEVICE));
        static_assert(status::denied == static_cast<native_status>(HV_DENIED));
        static_assert(status::unsupported == static_cast<native_status>(HV_UNSUPPORTED));

        static_assert(HV_MEMORY_READ == 1);
        static_assert(HV_MEMORY_WRITE == 2);
        static_assert(HV_MEMORY_EXEC == 4);

        static_assert(static_cast<uint32_t>(arm64_register::x0) == HV_REG_X0);
        static_assert(static_cast<uint32_t>(arm64_register::x30) == HV_REG_X30);
        static_assert(static_cast<uint32_t>(arm64_register::pc) == HV_REG_PC);
        static_assert(static_cast<uint32_t>(arm64_register::fpcr) == HV_REG_FPCR);
        static_assert(static_cast<uint32_t>(arm64_register::fpsr) == HV_REG_FPSR);
        static_assert(static_cast<uint32_t>(arm64_register::cpsr) == HV_REG_CPSR);

        static_assert(static_cast<uint32_t>(arm64_feature_register::id_aa64dfr0_el1) == HV_FEATURE_REG_ID_AA64DFR0_EL1);
        static_assert(static_cast<uint32_t>(arm64_feature_register::dczid_el0) == HV_FEATURE_REG_DCZID_EL0);

        static_assert(static_cast<uint16_t>(arm64_system_register::dbgbvr0_el1) == HV_SYS_REG_DBGBVR0_EL1);
        static_assert(static_cast<uint16_t>(arm64_system_register::mdscr_el1) == HV_SYS_REG_MDSCR_EL1);
        static_assert(static_cast<uint16_t>(arm64_system_register::sctlr_el1) == HV_SYS_REG_SCTLR_EL1);
        static_assert(static_cast<uint16_t>(arm64_system_register::tcr_el1) == HV_SYS_REG_TCR_EL1);
        static_assert(static_cast<uint16_t>(arm64_system_register::esr_el1) == HV_SYS_REG_ESR_EL1);
        static_assert(static_cast<uint16_t>(arm64_system_register::vbar_el1) == HV_SYS_REG_VBAR_EL1);
        static_assert(static_cast<uint16_t>(arm64_system_register::cntv_cval_el0) == HV_SYS_REG_CNTV_CVAL_EL0);
        static_assert(static_cast<uint16_t>(arm64_system_register::sp_el1) == HV_SYS_REG_SP_EL1);

        static_assert(static_cast<uint32_t>(native_exit_reason::canceled) == HV_EXIT_REASON_CANCELED);
        static_assert(static_cast<uint32_t>(native_exit_reason::exception) == HV_EXIT_REASON_EXCEPTION);
        static_assert(static_cast<uint32_t>(native_exit_reason::vtimer_activated) == HV_EXIT_REASON_VTIMER_ACTIVATED);
        static_assert(static_cast<uint32_t>(native_exit_reason::unknown) == HV_EXIT_REASON_UNKNOWN);

        static_assert(static_cast<uint32_t>(interrupt_type::irq) == HV_INTERRUPT_TYPE_IRQ);
        static_assert(static_cast<uint32_t>(interrupt_type::fiq) == HV_INTERRUPT_TYPE_FIQ);
        static_assert(static_cast<uint32_t>(cache_type::data) == HV_CACHE_TYPE_DATA);
        static_assert(static_cast<uint32_t>(cache_type::instruction) == HV_CACHE_TYPE_INSTRUCTION);

        hv_vcpu_config_t to_hv_config(native_vcpu_config* config)
        {
            return reinterpret_cast<hv_vcpu_config_t>(config);
        }

        // The framework writes its exit structure during hv_vcpu_run.
        // The copy handed out to callers is refreshed after every run.
        struct hvf_vcpu
        {
            hv_vcpu_exit_t* hv_exit{};
            native_exit_record exit{};

            void update_exit()
            {
                this->exit.reason = static_cast<uint32_t>(this->hv_exit->reason);
                this->exit.exception.syndrome = this->hv_exit->exception.syndrome;
                this->exit.exception.virtual_address = this->hv_exit->exception.virtual_address;
                this->exit.exception.physical_address = this->hv_exit->exception.physical_address;
            }
        };

        class hvf_arm64_hypervisor : public native_hypervisor
        {
          public:
            native_status vm_create(native_vm_config*) override
            {
                return hv_vm_create(nullptr);
            }

            native_status vm_destroy() override
            {
                return hv_vm_destroy();
            }

            native_status vm_map(void* host_address, const uint64_t guest_address, const size_t size, const uint64_t flags) override
            {
                return hv_vm_map(host_address, guest_address, size, flags);
            }

            native_status vm_unmap(const uint64_t guest_address, const size_t size) override
            {
                return hv_vm_unmap(guest_address, size);
            }

            native_status vm_protect(const uint64_t guest_address, const size_t size, const uint64_t flags) override
            {
                return hv_vm_protect(guest_address, size, flags);
            }

            native_vcpu_config* vcpu_config_create() override
            {
                return reinterpret_cast<native_vcpu_config*>(hv_vcpu_config_create());
            }

            void vcpu_config_release(native_vcpu_config* config) override
            {
                os_release(to_hv_config(config));
            }

            native_status vcpu_config_get_feature_reg(native_vcpu_config* config, const arm64_feature_register reg,
                                                      uint64_t& value) override
            {
                return hv_vcpu_config_get_feature_reg(to_hv_config(config), static_cast<hv_feature_reg_t>(reg), &value);
            }

            native_status vcpu_config_get_ccsidr_el1_sys_reg_values(native_vcpu_config* config, const cache_type type,
                                                                    ccsidr_values& values) override
            {
                return hv_vcpu_config_get_ccsidr_el1_sys_reg_values(to_hv_config(config), static_cast<hv_cache_type_t>(type),
                                                                    values.data());
            }

            native_status vcpu_create(vcpu_id& vcpu, const native_exit_record*& exit, native_vcpu_config* config) override
            {
                auto entry = std::make_unique<hvf_vcpu>();

                hv_vcpu_t id{};
                const auto res = hv_vcpu_create(&id, &entry->hv_exit, to_hv_config(config));
                if (res != HV_SUCCESS)
                {
                    return res;
                }

                entry->update_exit();

                vcpu = id;
                exit = &entry->exit;

                std::lock_guard _{this->mutex_};
                this->vcpus_[id] = std::move(entry);

                return HV_SUCCESS;
            }

            native_status vcpu_destroy(const vcpu_id vcpu) override
            {
                const auto res = hv_vcpu_destroy(vcpu);
                if (res == HV_SUCCESS)
                {
                    std::lock_guard _{this->mutex_};
                    this->vcpus_.erase(vcpu);
                }

                return res;
            }

            native_status vcpu_run(const vcpu_id vcpu) override
            {
                hvf_vcpu* entry{};

                {
                    std::lock_guard _{this->mutex_};

                    const auto it = this->vcpus_.find(vcpu);
                    if (it == this->vcpus_.end())
                    {
                        return HV_BAD_ARGUMENT;
                    }

                    entry = it->second.get();
                }

                const auto res = hv_vcpu_run(vcpu);
                if (res == HV_SUCCESS)
                {
                    entry->update_exit();
                }

                return res;
            }

            native_status vcpus_exit(const std::span<const vcpu_id> vcpus) override
            {
                std::vector<hv_vcpu_t> ids(vcpus.begin(), vcpus.end());
                return hv_vcpus_exit(ids.data(), static_cast<uint32_t>(ids.size()));
            }

            native_status vcpu_get_reg(const vcpu_id vcpu, const arm64_register reg, uint64_t& value) override
            {
                return hv_vcpu_get_reg(vcpu, static_cast<hv_reg_t>(reg), &value);
            }

            native_status vcpu_set_reg(const vcpu_id vcpu, const arm64_register reg, const uint64_t value) override
            {
                return hv_vcpu_set_reg(vcpu, static_cast<hv_reg_t>(reg), value);
            }

            native_status vcpu_get_sys_reg(const vcpu_id vcpu, const arm64_system_register reg, uint64_t& value) override
            {
                return hv_vcpu_get_sys_reg(vcpu, static_cast<hv_sys_reg_t>(reg), &value);
            }

            native_status vcpu_set_sys_reg(const vcpu_id vcpu, const arm64_system_register reg, const uint64_t value) override
            {
                return hv_vcpu_set_sys_reg(vcpu, static_cast<hv_sys_reg_t>(reg), value);
            }

            native_status vcpu_get_pending_interrupt(const vcpu_id vcpu, const interrupt_type type, bool& pending) override
            {
                return hv_vcpu_get_pending_interrupt(vcpu, static_cast<hv_interrupt_type_t>(type), &pending);
            }

            native_status vcpu_set_pending_interrupt(const vcpu_id vcpu, const interrupt_type type, const bool pending) override
            {
                return hv_vcpu_set_pending_interrupt(vcpu, static_cast<hv_interrupt_type_t>(type), pending);
            }

            native_status vcpu_get_trap_debug_exceptions(const vcpu_id vcpu, bool& value) override
            {
                return hv_vcpu_get_trap_debug_exceptions(vcpu, &value);
            }

            native_status vcpu_set_trap_debug_exceptions(const vcpu_id vcpu, const bool value) override
            {
                return hv_vcpu_set_trap_debug_exceptions(vcpu, value);
            }

            native_status vcpu_get_trap_debug_reg_accesses(const vcpu_id vcpu, bool& value) override
            {
                return hv_vcpu_get_trap_debug_reg_accesses(vcpu, &value);
            }

            native_status vcpu_set_trap_debug_reg_accesses(const vcpu_id vcpu, const bool value) override
            {
                return hv_vcpu_set_trap_debug_reg_accesses(vcpu, value);
            }

            native_status vcpu_get_exec_time(const vcpu_id vcpu, uint64_t& time) override
            {
                return hv_vcpu_get_exec_time(vcpu, &time);
            }

            native_status vcpu_get_vtimer_mask(const vcpu_id vcpu, bool& masked) override
            {
                return hv_vcpu_get_vtimer_mask(vcpu, &masked);
            }

            native_status vcpu_set_vtimer_mask(const vcpu_id vcpu, const bool masked) override
            {
                return hv_vcpu_set_vtimer_mask(vcpu, masked);
            }

            native_status vcpu_get_vtimer_offset(const vcpu_id vcpu, uint64_t& offset) override
            {
                return hv_vcpu_get_vtimer_offset(vcpu, &offset);
            }

            native_status vcpu_set_vtimer_offset(const vcpu_id vcpu, const uint64_t offset) override
            {
                return hv_vcpu_set_vtimer_offset(vcpu, offset);
            }

            std::string get_name() const override
            {
                return "Hypervisor.framework";
            }

          private:
            std::mutex mutex_{};
            std::map<vcpu_id, std::unique_ptr<hvf_vcpu>> vcpus_{};
        };
    }

    std::unique_ptr<native_hypervisor> create_arm64_hypervisor()
    {
        return std::make_unique<hvf_arm64_hypervisor>();
    }
}
