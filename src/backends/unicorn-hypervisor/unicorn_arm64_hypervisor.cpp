#include "unicorn_arm64_hypervisor.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <limits>
#include <map>
#include <mutex>
#include <optional>
#include <ranges>
#include <vector>

#include <exception_syndrome.hpp>

#include "function_wrapper.hpp"
#include "unicorn_hook.hpp"

namespace hvkit::unicorn
{
    namespace
    {
        static_assert(UC_PROT_READ == 1);
        static_assert(UC_PROT_WRITE == 2);
        static_assert(UC_PROT_EXEC == 4);

        // Unicorn maps with 4 KiB granularity
        constexpr uint64_t unicorn_page_mask = 0xFFF;

        constexpr uint64_t supported_memory_flags = UC_PROT_READ | UC_PROT_WRITE | UC_PROT_EXEC;

        // QEMU exception numbers delivered through UC_HOOK_INTR
        constexpr uint32_t excp_udef = 1;
        constexpr uint32_t excp_swi = 2;
        constexpr uint32_t excp_bkpt = 7;
        constexpr uint32_t excp_hvc = 11;
        constexpr uint32_t excp_smc = 13;

        constexpr uint32_t exception_instruction_mask = 0xFFE0001F;
        constexpr uint32_t brk_instruction = 0xD4200000;
        constexpr uint32_t svc_instruction = 0xD4000001;
        constexpr uint32_t hvc_instruction = 0xD4000002;
        constexpr uint32_t smc_instruction = 0xD4000003;

        native_status map_uc_error(const uc_err error)
        {
            switch (error)
            {
            case UC_ERR_OK:
                return status::success;
            case UC_ERR_NOMEM:
            case UC_ERR_RESOURCE:
                return status::no_resources;
            case UC_ERR_ARCH:
            case UC_ERR_MODE:
                return status::unsupported;
            case UC_ERR_HANDLE:
            case UC_ERR_ARG:
            case UC_ERR_MAP:
                return status::bad_argument;
            case UC_ERR_EXCEPTION:
            case UC_ERR_INSN_INVALID:
                return status::illegal_guest_state;
            default:
                return status::error;
            }
        }

        std::optional<int> map_general_register(const arm64_register reg)
        {
            const auto index = static_cast<uint32_t>(reg);

            if (reg <= arm64_register::x28)
            {
                return static_cast<int>(UC_ARM64_REG_X0 + index);
            }

            switch (reg)
            {
            case arm64_register::x29:
                return UC_ARM64_REG_X29;
            case arm64_register::x30:
                return UC_ARM64_REG_X30;
            case arm64_register::pc:
                return UC_ARM64_REG_PC;
            case arm64_register::fpcr:
                return UC_ARM64_REG_FPCR;
            case arm64_register::fpsr:
                return UC_ARM64_REG_FPSR;
            case arm64_register::cpsr:
                return UC_ARM64_REG_PSTATE;
            default:
                return std::nullopt;
            }
        }

        // The banked stack pointers are not plain coprocessor registers in unicorn
        std::optional<int> map_direct_system_register(const arm64_system_register reg)
        {
            switch (reg)
            {
            case arm64_system_register::sp_el0:
                return UC_ARM64_REG_SP_EL0;
            case arm64_system_register::sp_el1:
                return UC_ARM64_REG_SP_EL1;
            default:
                return std::nullopt;
            }
        }

        uc_arm64_cp_reg make_cp_reg(const uint16_t encoding, const uint64_t value = 0)
        {
            const auto operands = decode_system_register(encoding);

            uc_arm64_cp_reg cp_reg{};
            cp_reg.crn = operands.crn;
            cp_reg.crm = operands.crm;
            cp_reg.op0 = operands.op0;
            cp_reg.op1 = operands.op1;
            cp_reg.op2 = operands.op2;
            cp_reg.val = value;

            return cp_reg;
        }

        constexpr std::array<uint16_t, static_cast<size_t>(arm64_feature_register::end)> feature_register_encodings{
            encode_system_register(3, 0, 0, 5, 0), // ID_AA64DFR0_EL1
            encode_system_register(3, 0, 0, 5, 1), // ID_AA64DFR1_EL1
            encode_system_register(3, 0, 0, 6, 0), // ID_AA64ISAR0_EL1
            encode_system_register(3, 0, 0, 6, 1), // ID_AA64ISAR1_EL1
            encode_system_register(3, 0, 0, 7, 0), // ID_AA64MMFR0_EL1
            encode_system_register(3, 0, 0, 7, 1), // ID_AA64MMFR1_EL1
            encode_system_register(3, 0, 0, 7, 2), // ID_AA64MMFR2_EL1
            encode_system_register(3, 0, 0, 4, 0), // ID_AA64PFR0_EL1
            encode_system_register(3, 0, 0, 4, 1), // ID_AA64PFR1_EL1
            encode_system_register(3, 3, 0, 0, 1), // CTR_EL0
            encode_system_register(3, 1, 0, 0, 1), // CLIDR_EL1
            encode_system_register(3, 3, 0, 0, 7), // DCZID_EL0
        };

        constexpr auto csselr_el1 = encode_system_register(3, 2, 0, 0, 0);
        constexpr auto ccsidr_el1 = encode_system_register(3, 1, 0, 0, 0);

        struct memory_region
        {
            void* host_address{};
            size_t size{};
            uint64_t flags{};
        };

        struct unicorn_vcpu_config
        {
            std::array<uint64_t, static_cast<size_t>(arm64_feature_register::end)> feature_registers{};
            ccsidr_values data_caches{};
            ccsidr_values instruction_caches{};
        };

        class unicorn_engine
        {
          public:
            unicorn_engine() = default;

            ~unicorn_engine()
            {
                if (this->uc_)
                {
                    (void)uc_close(this->uc_);
                }
            }

            unicorn_engine(unicorn_engine&&) = delete;
            unicorn_engine(const unicorn_engine&) = delete;
            unicorn_engine& operator=(unicorn_engine&&) = delete;
            unicorn_engine& operator=(const unicorn_engine&) = delete;

            native_status open()
            {
                auto res = uc_open(UC_ARCH_ARM64, UC_MODE_ARM, &this->uc_);
                if (res != UC_ERR_OK)
                {
                    this->uc_ = nullptr;
                    return map_uc_error(res);
                }

#if defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wconversion"
#endif
                res = uc_ctl_set_cpu_model(this->uc_, UC_CPU_ARM64_MAX);
#if defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

                return map_uc_error(res);
            }

            native_status read_system_register(const uint16_t encoding, uint64_t& value) const
            {
                auto cp_reg = make_cp_reg(encoding);
                const auto res = uc_reg_read(this->uc_, UC_ARM64_REG_CP_REG, &cp_reg);
                if (res != UC_ERR_OK)
                {
                    return map_uc_error(res);
                }

                value = cp_reg.val;
                return status::success;
            }

            native_status write_system_register(const uint16_t encoding, const uint64_t value) const
            {
                auto cp_reg = make_cp_reg(encoding, value);
                return map_uc_error(uc_reg_write(this->uc_, UC_ARM64_REG_CP_REG, &cp_reg));
            }

            operator uc_engine*() const
            {
                return this->uc_;
            }

          private:
            uc_engine* uc_{};
        };

        class unicorn_vcpu
        {
          public:
            unicorn_vcpu() = default;

            ~unicorn_vcpu()
            {
                this->hooks_.clear();
            }

            unicorn_vcpu(unicorn_vcpu&&) = delete;
            unicorn_vcpu(const unicorn_vcpu&) = delete;
            unicorn_vcpu& operator=(unicorn_vcpu&&) = delete;
            unicorn_vcpu& operator=(const unicorn_vcpu&) = delete;

            native_status initialize(const std::map<uint64_t, memory_region>& regions)
            {
                auto res = this->engine_.open();
                if (res != status::success)
                {
                    return res;
                }

                for (const auto& [address, region] : regions)
                {
                    res = this->map_memory(address, region);
                    if (res != status::success)
                    {
                        return res;
                    }
                }

                return this->install_hooks();
            }

            native_status map_memory(const uint64_t address, const memory_region& region) const
            {
                return map_uc_error(
                    uc_mem_map_ptr(this->engine_, address, region.size, static_cast<uint32_t>(region.flags), region.host_address));
            }

            native_status unmap_memory(const uint64_t address, const size_t size) const
            {
                return map_uc_error(uc_mem_unmap(this->engine_, address, size));
            }

            native_status protect_memory(const uint64_t address, const size_t size, const uint64_t flags) const
            {
                return map_uc_error(uc_mem_protect(this->engine_, address, size, static_cast<uint32_t>(flags)));
            }

            native_status run()
            {
                this->exit_ = {};
                this->exception_ = std::nullopt;

                if (this->exit_requested_.exchange(false))
                {
                    this->exit_.reason = static_cast<uint32_t>(native_exit_reason::canceled);
                    return status::success;
                }

                uint64_t pc{};
                auto res = uc_reg_read(this->engine_, UC_ARM64_REG_PC, &pc);
                if (res != UC_ERR_OK)
                {
                    return map_uc_error(res);
                }

                this->running_ = true;
                const auto start = std::chrono::steady_clock::now();

                res = uc_emu_start(this->engine_, pc, std::numeric_limits<uint64_t>::max(), 0, 0);

                const auto duration = std::chrono::steady_clock::now() - start;
                this->running_ = false;

                this->exec_time_ += static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(duration).count());

                if (this->exception_)
                {
                    this->exit_.reason = static_cast<uint32_t>(native_exit_reason::exception);
                    this->exit_.exception = *this->exception_;
                    return status::success;
                }

                if (this->exit_requested_.exchange(false))
                {
                    this->exit_.reason = static_cast<uint32_t>(native_exit_reason::canceled);
                    return status::success;
                }

                if (res != UC_ERR_OK)
                {
                    return map_uc_error(res);
                }

                this->exit_.reason = static_cast<uint32_t>(native_exit_reason::unknown);
                return status::success;
            }

            // Callable from any thread
            native_status request_exit()
            {
                this->exit_requested_ = true;
                return map_uc_error(uc_emu_stop(this->engine_));
            }

            bool is_running() const
            {
                return this->running_;
            }

            native_status read_register(const arm64_register reg, uint64_t& value) const
            {
                const auto id = map_general_register(reg);
                if (!id)
                {
                    return status::bad_argument;
                }

                uint64_t result{};
                const auto res = uc_reg_read(this->engine_, *id, &result);
                if (res != UC_ERR_OK)
                {
                    return map_uc_error(res);
                }

                value = result;
                return status::success;
            }

            native_status write_register(const arm64_register reg, const uint64_t value) const
            {
                const auto id = map_general_register(reg);
                if (!id)
                {
                    return status::bad_argument;
                }

                return map_uc_error(uc_reg_write(this->engine_, *id, &value));
            }

            native_status read_system_register(const arm64_system_register reg, uint64_t& value) const
            {
                if (const auto id = map_direct_system_register(reg))
                {
                    uint64_t result{};
                    const auto res = uc_reg_read(this->engine_, *id, &result);
                    if (res != UC_ERR_OK)
                    {
                        return map_uc_error(res);
                    }

                    value = result;
                    return status::success;
                }

                return this->engine_.read_system_register(static_cast<uint16_t>(reg), value);
            }

            native_status write_system_register(const arm64_system_register reg, const uint64_t value) const
            {
                if (const auto id = map_direct_system_register(reg))
                {
                    return map_uc_error(uc_reg_write(this->engine_, *id, &value));
                }

                return this->engine_.write_system_register(static_cast<uint16_t>(reg), value);
            }

            const native_exit_record* get_exit_record() const
            {
                return &this->exit_;
            }

            // The engine has no interrupt injection and no virtual timer exits.
            // BRK always leaves to the host and debug register accesses never do.
            // Only the settings matching that fixed behavior are accepted.
            static native_status set_pending_interrupt(const bool pending)
            {
                return pending ? status::unsupported : status::success;
            }

            static native_status set_trap_debug_exceptions(const bool value)
            {
                return value ? status::success : status::unsupported;
            }

            static native_status set_trap_debug_reg_accesses(const bool value)
            {
                return value ? status::unsupported : status::success;
            }

            static native_status set_vtimer_mask(const bool masked)
            {
                return masked ? status::success : status::unsupported;
            }

            static native_status set_vtimer_offset(const uint64_t offset)
            {
                return offset == 0 ? status::success : status::unsupported;
            }

            uint64_t get_exec_time() const
            {
                return this->exec_time_;
            }

          private:
            unicorn_engine engine_{};
            native_exit_record exit_{};
            std::optional<exit_exception> exception_{};
            std::atomic_bool exit_requested_{false};
            std::atomic_bool running_{false};
            uint64_t exec_time_{0};

            function_wrapper<void, uc_engine*, uint64_t, uint32_t> block_wrapper_{};
            function_wrapper<void, uc_engine*, uint32_t> interrupt_wrapper_{};
            function_wrapper<bool, uc_engine*, uc_mem_type, uint64_t, int, int64_t> memory_wrapper_{};
            std::vector<unicorn_hook> hooks_{};

            template <typename Wrapper>
            native_status add_hook(const int type, const Wrapper& wrapper)
            {
                unicorn_hook hook{this->engine_};

                const auto res = uc_hook_add(this->engine_, hook.make_reference(), type, wrapper.get_function(), wrapper.get_user_data(),
                                             0, std::numeric_limits<uint64_t>::max());
                if (res != UC_ERR_OK)
                {
                    return map_uc_error(res);
                }

                this->hooks_.push_back(std::move(hook));
                return status::success;
            }

            native_status install_hooks()
            {
                this->block_wrapper_ = decltype(this->block_wrapper_)([this](uc_engine* uc, uint64_t, uint32_t) {
                    if (this->exit_requested_)
                    {
                        (void)uc_emu_stop(uc);
                    }
                });

                this->interrupt_wrapper_ = decltype(this->interrupt_wrapper_)([this](uc_engine* uc, const uint32_t interrupt) {
                    this->handle_interrupt(interrupt);
                    (void)uc_emu_stop(uc);
                });

                this->memory_wrapper_ = decltype(this->memory_wrapper_)(
                    [this](uc_engine*, const uc_mem_type type, const uint64_t address, int, int64_t) {
                        this->handle_memory_fault(type, address);
                        return false;
                    });

                auto res = this->add_hook(UC_HOOK_BLOCK, this->block_wrapper_);
                if (res == status::success)
                {
                    res = this->add_hook(UC_HOOK_INTR, this->interrupt_wrapper_);
                }

                if (res == status::success)
                {
                    res = this->add_hook(UC_HOOK_MEM_INVALID, this->memory_wrapper_);
                }

                return res;
            }

            std::optional<uint32_t> read_instruction(const uint64_t address) const
            {
                uint32_t instruction{};
                if (uc_mem_read(this->engine_, address, &instruction, sizeof(instruction)) != UC_ERR_OK)
                {
                    return std::nullopt;
                }

                return instruction;
            }

            // SVC, HVC and SMC leave the pc after the instruction, BRK leaves it on the instruction
            uint16_t find_exception_immediate(const uint32_t pattern, const bool pc_on_instruction) const
            {
                uint64_t pc{};
                if (uc_reg_read(this->engine_, UC_ARM64_REG_PC, &pc) != UC_ERR_OK)
                {
                    return 0;
                }

                const std::array candidates{
                    pc_on_instruction ? pc : pc - 4,
                    pc_on_instruction ? pc - 4 : pc,
                };

                for (const auto address : candidates)
                {
                    const auto instruction = this->read_instruction(address);
                    if (instruction && (*instruction & exception_instruction_mask) == pattern)
                    {
                        return static_cast<uint16_t>((*instruction >> 5) & 0xFFFF);
                    }
                }

                return 0;
            }

            void handle_interrupt(const uint32_t interrupt)
            {
                exit_exception exception{};

                switch (interrupt)
                {
                case excp_swi:
                    exception.syndrome = make_syndrome(exception_class::svc64, this->find_exception_immediate(svc_instruction, false));
                    break;
                case excp_hvc:
                    exception.syndrome = make_syndrome(exception_class::hvc64, this->find_exception_immediate(hvc_instruction, false));
                    break;
                case excp_smc:
                    exception.syndrome = make_syndrome(exception_class::smc64, this->find_exception_immediate(smc_instruction, false));
                    break;
                case excp_bkpt:
                    exception.syndrome = make_syndrome(exception_class::brk64, this->find_exception_immediate(brk_instruction, true));
                    break;
                case excp_udef:
                default:
                    exception.syndrome = make_syndrome(exception_class::unknown, 0);
                    break;
                }

                this->exception_ = exception;
            }

            void handle_memory_fault(const uc_mem_type type, const uint64_t address)
            {
                const auto is_fetch = type == UC_MEM_FETCH_UNMAPPED || type == UC_MEM_FETCH_PROT;
                const auto is_write = type == UC_MEM_WRITE_UNMAPPED || type == UC_MEM_WRITE_PROT;
                const auto is_protection = type == UC_MEM_READ_PROT || type == UC_MEM_WRITE_PROT || type == UC_MEM_FETCH_PROT;

                uint64_t iss = is_protection ? fault_status_permission_level3 : fault_status_translation_level3;
                if (is_write)
                {
                    iss |= data_abort_wnr_bit;
                }

                const auto ec = is_fetch ? exception_class::instruction_abort_lower : exception_class::data_abort_lower;

                this->exception_ = exit_exception{
                    .syndrome = make_syndrome(ec, iss),
                    .virtual_address = address,
                    .physical_address = address,
                };
            }
        };

        class unicorn_arm64_hypervisor : public native_hypervisor
        {
          public:
            native_status vm_create(native_vm_config*) override
            {
                std::lock_guard _{this->mutex_};

                if (this->created_)
                {
                    return status::busy;
                }

                this->created_ = true;
                return status::success;
            }

            native_status vm_destroy() override
            {
                std::lock_guard _{this->mutex_};

                if (!this->created_)
                {
                    return status::bad_argument;
                }

                if (!this->vcpus_.empty())
                {
                    return status::busy;
                }

                this->regions_.clear();
                this->created_ = false;
                return status::success;
            }

            native_status vm_map(void* host_address, const uint64_t guest_address, const size_t size, const uint64_t flags) override
            {
                std::lock_guard _{this->mutex_};

                if (!this->created_)
                {
                    return status::error;
                }

                if (!host_address || !is_valid_range(guest_address, size) || (flags & ~supported_memory_flags) != 0)
                {
                    return status::bad_argument;
                }

                if (this->is_any_vcpu_running())
                {
                    return status::busy;
                }

                if (this->overlaps_region(guest_address, size))
                {
                    return status::bad_argument;
                }

                const memory_region region{
                    .host_address = host_address,
                    .size = size,
                    .flags = flags,
                };

                std::vector<unicorn_vcpu*> mapped{};

                for (const auto& vcpu : this->vcpus_ | std::views::values)
                {
                    const auto res = vcpu->map_memory(guest_address, region);
                    if (res != status::success)
                    {
                        for (const auto* entry : mapped)
                        {
                            (void)entry->unmap_memory(guest_address, size);
                        }

                        return res;
                    }

                    mapped.push_back(vcpu.get());
                }

                this->regions_[guest_address] = region;
                return status::success;
            }

            native_status vm_unmap(const uint64_t guest_address, const size_t size) override
            {
                std::lock_guard _{this->mutex_};

                const auto entry = this->find_region(guest_address, size);
                if (entry == this->regions_.end())
                {
                    return status::bad_argument;
                }

                if (this->is_any_vcpu_running())
                {
                    return status::busy;
                }

                std::vector<unicorn_vcpu*> unmapped{};

                for (const auto& vcpu : this->vcpus_ | std::views::values)
                {
                    const auto res = vcpu->unmap_memory(guest_address, size);
                    if (res != status::success)
                    {
                        for (const auto* restored : unmapped)
                        {
                            (void)restored->map_memory(guest_address, entry->second);
                        }

                        return res;
                    }

                    unmapped.push_back(vcpu.get());
                }

                this->regions_.erase(entry);
                return status::success;
            }

            native_status vm_protect(const uint64_t guest_address, const size_t size, const uint64_t flags) override
            {
                std::lock_guard _{this->mutex_};

                if ((flags & ~supported_memory_flags) != 0)
                {
                    return status::bad_argument;
                }

                const auto entry = this->find_region(guest_address, size);
                if (entry == this->regions_.end())
                {
                    return status::bad_argument;
                }

                if (this->is_any_vcpu_running())
                {
                    return status::busy;
                }

                const auto previous_flags = entry->second.flags;
                std::vector<unicorn_vcpu*> protected_vcpus{};

                for (const auto& vcpu : this->vcpus_ | std::views::values)
                {
                    const auto res = vcpu->protect_memory(guest_address, size, flags);
                    if (res != status::success)
                    {
                        for (const auto* restored : protected_vcpus)
                        {
                            (void)restored->protect_memory(guest_address, size, previous_flags);
                        }

                        return res;
                    }

                    protected_vcpus.push_back(vcpu.get());
                }

                entry->second.flags = flags;
                return status::success;
            }

            native_vcpu_config* vcpu_config_create() override
            {
                unicorn_engine engine{};
                if (engine.open() != status::success)
                {
                    return nullptr;
                }

                auto config = std::make_unique<unicorn_vcpu_config>();

                for (size_t i = 0; i < feature_register_encodings.size(); ++i)
                {
                    if (engine.read_system_register(feature_register_encodings[i], config->feature_registers[i]) != status::success)
                    {
                        return nullptr;
                    }
                }

                if (!read_cache_ids(engine, cache_type::data, config->data_caches) ||
                    !read_cache_ids(engine, cache_type::instruction, config->instruction_caches))
                {
                    return nullptr;
                }

                std::lock_guard _{this->mutex_};

                auto* handle = reinterpret_cast<native_vcpu_config*>(config.get());
                this->configs_.push_back(std::move(config));

                return handle;
            }

            void vcpu_config_release(native_vcpu_config* config) override
            {
                std::lock_guard _{this->mutex_};

                std::erase_if(this->configs_, [config](const std::unique_ptr<unicorn_vcpu_config>& entry) {
                    return reinterpret_cast<native_vcpu_config*>(entry.get()) == config;
                });
            }

            native_status vcpu_config_get_feature_reg(native_vcpu_config* config, const arm64_feature_register reg,
                                                      uint64_t& value) override
            {
                std::lock_guard _{this->mutex_};

                const auto* entry = this->find_config(config);
                if (!entry || reg >= arm64_feature_register::end)
                {
                    return status::bad_argument;
                }

                value = entry->feature_registers[static_cast<size_t>(reg)];
                return status::success;
            }

            native_status vcpu_config_get_ccsidr_el1_sys_reg_values(native_vcpu_config* config, const cache_type type,
                                                                    ccsidr_values& values) override
            {
                std::lock_guard _{this->mutex_};

                const auto* entry = this->find_config(config);
                if (!entry)
                {
                    return status::bad_argument;
                }

                values = type == cache_type::instruction ? entry->instruction_caches : entry->data_caches;
                return status::success;
            }

            native_status vcpu_create(vcpu_id& vcpu, const native_exit_record*& exit, native_vcpu_config* config) override
            {
                std::lock_guard _{this->mutex_};

                if (!this->created_)
                {
                    return status::error;
                }

                if (config && !this->find_config(config))
                {
                    return status::bad_argument;
                }

                auto entry = std::make_unique<unicorn_vcpu>();
                const auto res = entry->initialize(this->regions_);
                if (res != status::success)
                {
                    return res;
                }

                const auto id = this->next_vcpu_id_++;

                exit = entry->get_exit_record();
                vcpu = id;

                this->vcpus_[id] = std::move(entry);
                return status::success;
            }

            native_status vcpu_destroy(const vcpu_id vcpu) override
            {
                std::lock_guard _{this->mutex_};

                const auto entry = this->vcpus_.find(vcpu);
                if (entry == this->vcpus_.end())
                {
                    return status::bad_argument;
                }

                if (entry->second->is_running())
                {
                    return status::busy;
                }

                this->vcpus_.erase(entry);
                return status::success;
            }

            native_status vcpu_run(const vcpu_id vcpu) override
            {
                unicorn_vcpu* entry{};

                {
                    std::lock_guard _{this->mutex_};

                    entry = this->find_vcpu(vcpu);
                    if (!entry)
                    {
                        return status::bad_argument;
                    }

                    ++this->running_vcpus_;
                }

                const auto res = entry->run();

                std::lock_guard _{this->mutex_};
                --this->running_vcpus_;

                return res;
            }

            native_status vcpus_exit(const std::span<const vcpu_id> vcpus) override
            {
                std::lock_guard _{this->mutex_};

                for (const auto id : vcpus)
                {
                    if (!this->find_vcpu(id))
                    {
                        return status::bad_argument;
                    }
                }

                for (const auto id : vcpus)
                {
                    const auto res = this->find_vcpu(id)->request_exit();
                    if (res != status::success)
                    {
                        return res;
                    }
                }

                return status::success;
            }

            native_status vcpu_get_reg(const vcpu_id vcpu, const arm64_register reg, uint64_t& value) override
            {
                return this->access_vcpu(vcpu, [&](const unicorn_vcpu& entry) { return entry.read_register(reg, value); });
            }

            native_status vcpu_set_reg(const vcpu_id vcpu, const arm64_register reg, const uint64_t value) override
            {
                return this->access_vcpu(vcpu, [&](const unicorn_vcpu& entry) { return entry.write_register(reg, value); });
            }

            native_status vcpu_get_sys_reg(const vcpu_id vcpu, const arm64_system_register reg, uint64_t& value) override
            {
                return this->access_vcpu(vcpu, [&](const unicorn_vcpu& entry) { return entry.read_system_register(reg, value); });
            }

            native_status vcpu_set_sys_reg(const vcpu_id vcpu, const arm64_system_register reg, const uint64_t value) override
            {
                return this->access_vcpu(vcpu, [&](const unicorn_vcpu& entry) { return entry.write_system_register(reg, value); });
            }

            native_status vcpu_get_pending_interrupt(const vcpu_id vcpu, interrupt_type, bool& pending) override
            {
                return this->access_vcpu(vcpu, [&](const unicorn_vcpu&) {
                    pending = false;
                    return status::success;
                });
            }

            native_status vcpu_set_pending_interrupt(const vcpu_id vcpu, interrupt_type, const bool pending) override
            {
                return this->access_vcpu(vcpu, [&](const unicorn_vcpu&) { return unicorn_vcpu::set_pending_interrupt(pending); });
            }

            native_status vcpu_get_trap_debug_exceptions(const vcpu_id vcpu, bool& value) override
            {
                return this->access_vcpu(vcpu, [&](const unicorn_vcpu&) {
                    value = true;
                    return status::success;
                });
            }

            native_status vcpu_set_trap_debug_exceptions(const vcpu_id vcpu, const bool value) override
            {
                return this->access_vcpu(vcpu, [&](const unicorn_vcpu&) { return unicorn_vcpu::set_trap_debug_exceptions(value); });
            }

            native_status vcpu_get_trap_debug_reg_accesses(const vcpu_id vcpu, bool& value) override
            {
                return this->access_vcpu(vcpu, [&](const unicorn_vcpu&) {
                    value = false;
                    return status::success;
                });
            }

            native_status vcpu_set_trap_debug_reg_accesses(const vcpu_id vcpu, const bool value) override
            {
                return this->access_vcpu(vcpu, [&](const unicorn_vcpu&) { return unicorn_vcpu::set_trap_debug_reg_accesses(value); });
            }

            native_status vcpu_get_exec_time(const vcpu_id vcpu, uint64_t& time) override
            {
                return this->access_vcpu(vcpu, [&](const unicorn_vcpu& entry) {
                    time = entry.get_exec_time();
                    return status::success;
                });
            }

            native_status vcpu_get_vtimer_mask(const vcpu_id vcpu, bool& masked) override
            {
                return this->access_vcpu(vcpu, [&](const unicorn_vcpu&) {
                    masked = true;
                    return status::success;
                });
            }

            native_status vcpu_set_vtimer_mask(const vcpu_id vcpu, const bool masked) override
            {
                return this->access_vcpu(vcpu, [&](const unicorn_vcpu&) { return unicorn_vcpu::set_vtimer_mask(masked); });
            }

            native_status vcpu_get_vtimer_offset(const vcpu_id vcpu, uint64_t& offset) override
            {
                return this->access_vcpu(vcpu, [&](const unicorn_vcpu&) {
                    offset = 0;
                    return status::success;
                });
            }

            native_status vcpu_set_vtimer_offset(const vcpu_id vcpu, const uint64_t offset) override
            {
                return this->access_vcpu(vcpu, [&](const unicorn_vcpu&) { return unicorn_vcpu::set_vtimer_offset(offset); });
            }

            std::string get_name() const override
            {
                return "Unicorn Engine";
            }

          private:
            mutable std::mutex mutex_{};
            bool created_{false};
            size_t running_vcpus_{0};
            vcpu_id next_vcpu_id_{0};
            std::map<uint64_t, memory_region> regions_{};
            std::map<vcpu_id, std::unique_ptr<unicorn_vcpu>> vcpus_{};
            std::vector<std::unique_ptr<unicorn_vcpu_config>> configs_{};

            static bool is_valid_range(const uint64_t address, const size_t size)
            {
                if (size == 0 || ((address | size) & unicorn_page_mask) != 0)
                {
                    return false;
                }

                return address <= std::numeric_limits<uint64_t>::max() - (size - 1);
            }

            static bool read_cache_ids(const unicorn_engine& engine, const cache_type type, ccsidr_values& values)
            {
                for (size_t level = 0; level < values.size(); ++level)
                {
                    const auto selector = (level << 1) | (type == cache_type::instruction ? 1 : 0);

                    if (engine.write_system_register(csselr_el1, selector) != status::success ||
                        engine.read_system_register(ccsidr_el1, values[level]) != status::success)
                    {
                        return false;
                    }
                }

                return true;
            }

            bool is_any_vcpu_running() const
            {
                return this->running_vcpus_ != 0;
            }

            bool overlaps_region(const uint64_t address, const size_t size) const
            {
                const auto end = address + (size - 1);

                return std::ranges::any_of(this->regions_, [&](const std::pair<const uint64_t, memory_region>& entry) {
                    const auto region_end = entry.first + (entry.second.size - 1);
                    return entry.first <= end && address <= region_end;
                });
            }

            // Only whole regions can be unmapped or reprotected
            std::map<uint64_t, memory_region>::iterator find_region(const uint64_t address, const size_t size)
            {
                const auto entry = this->regions_.find(address);
                if (entry == this->regions_.end() || entry->second.size != size)
                {
                    return this->regions_.end();
                }

                return entry;
            }

            unicorn_vcpu_config* find_config(native_vcpu_config* config) const
            {
                const auto entry = std::ranges::find_if(this->configs_, [config](const std::unique_ptr<unicorn_vcpu_config>& e) {
                    return reinterpret_cast<native_vcpu_config*>(e.get()) == config;
                });

                return entry == this->configs_.end() ? nullptr : entry->get();
            }

            unicorn_vcpu* find_vcpu(const vcpu_id vcpu) const
            {
                const auto entry = this->vcpus_.find(vcpu);
                return entry == this->vcpus_.end() ? nullptr : entry->second.get();
            }

            template <typename F>
            native_status access_vcpu(const vcpu_id vcpu, const F& accessor)
            {
                unicorn_vcpu* entry{};

                {
                    std::lock_guard _{this->mutex_};
                    entry = this->find_vcpu(vcpu);
                }

                if (!entry)
                {
                    return status::bad_argument;
                }

                return accessor(*entry);
            }
        };
    }

    std::unique_ptr<native_hypervisor> create_arm64_hypervisor()
    {
        return std::make_unique<unicorn_arm64_hypervisor>();
    }
}
