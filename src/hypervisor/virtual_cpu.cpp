#include "virtual_cpu.hpp"
#include "error.hpp"
#include "logger.hpp"

#include <cassert>
#include <cinttypes>

namespace hvkit
{
    virtual_cpu::virtual_cpu(native_hypervisor& native, const logger& log, const vcpu_id id, const native_exit_record* exit)
        : native_(&native),
          log_(&log),
          id_(id),
          exit_(exit)
    {
    }

    virtual_cpu::~virtual_cpu()
    {
        if (this->marker_.was_moved())
        {
            return;
        }

        this->release();
    }

    void virtual_cpu::release() const
    {
        const vcpu_id vcpus[] = {this->id_};

        auto res = this->native_->vcpus_exit(vcpus);
        if (res != status::success)
        {
            fatal_error("Cannot exit vCPU on destruction", res);
        }

        res = this->native_->vcpu_destroy(this->id_);
        if (res != status::success)
        {
            fatal_error("Cannot destroy vCPU on destruction", res);
        }
    }

    void virtual_cpu::check_owner_thread()
    {
        const auto current = std::this_thread::get_id();

        if (this->owner_thread_ == std::thread::id{})
        {
            this->owner_thread_ = current;
        }

        assert(this->owner_thread_ == current && "vCPU used outside of its owning thread");
    }

    uint64_t virtual_cpu::get_register(const arm64_register reg)
    {
        this->check_owner_thread();

        uint64_t value{};
        hve(this->native_->vcpu_get_reg(this->id_, reg, value));
        return value;
    }

    void virtual_cpu::set_register(const arm64_register reg, const uint64_t value)
    {
        this->check_owner_thread();
        hve(this->native_->vcpu_set_reg(this->id_, reg, value));
    }

    uint64_t virtual_cpu::get_system_register(const arm64_system_register reg)
    {
        this->check_owner_thread();

        uint64_t value{};
        hve(this->native_->vcpu_get_sys_reg(this->id_, reg, value));
        return value;
    }

    void virtual_cpu::set_system_register(const arm64_system_register reg, const uint64_t value)
    {
        this->check_owner_thread();
        hve(this->native_->vcpu_set_sys_reg(this->id_, reg, value));
    }

    bool virtual_cpu::get_pending_interrupt(const interrupt_type type)
    {
        this->check_owner_thread();

        bool pending{};
        hve(this->native_->vcpu_get_pending_interrupt(this->id_, type, pending));
        return pending;
    }

    void virtual_cpu::set_pending_interrupt(const interrupt_type type, const bool pending)
    {
        this->check_owner_thread();
        hve(this->native_->vcpu_set_pending_interrupt(this->id_, type, pending));
    }

    bool virtual_cpu::get_trap_debug_exceptions()
    {
        this->check_owner_thread();

        bool value{};
        hve(this->native_->vcpu_get_trap_debug_exceptions(this->id_, value));
        return value;
    }

    void virtual_cpu::set_trap_debug_exceptions(const bool value)
    {
        this->check_owner_thread();
        hve(this->native_->vcpu_set_trap_debug_exceptions(this->id_, value));
    }

    bool virtual_cpu::get_trap_debug_reg_accesses()
    {
        this->check_owner_thread();

        bool value{};
        hve(this->native_->vcpu_get_trap_debug_reg_accesses(this->id_, value));
        return value;
    }

    void virtual_cpu::set_trap_debug_reg_accesses(const bool value)
    {
        this->check_owner_thread();
        hve(this->native_->vcpu_set_trap_debug_reg_accesses(this->id_, value));
    }

    vcpu_exit_reason virtual_cpu::run()
    {
        this->check_owner_thread();
        hve(this->native_->vcpu_run(this->id_));

        const auto& record = *this->exit_;
        if (record.reason > static_cast<uint32_t>(native_exit_reason::unknown))
        {
            this->log_->warn("vCPU %" PRIu64 " exited with unrecognized reason %" PRIu32 "\n", this->id_, record.reason);
        }

        return decode_exit_record(record);
    }

    void virtual_cpu::exit() const
    {
        const vcpu_id vcpus[] = {this->id_};
        hve(this->native_->vcpus_exit(vcpus));
    }

    uint64_t virtual_cpu::get_exec_time()
    {
        this->check_owner_thread();

        uint64_t time{};
        hve(this->native_->vcpu_get_exec_time(this->id_, time));
        return time;
    }

    bool virtual_cpu::get_vtimer_mask()
    {
        this->check_owner_thread();

        bool masked{};
        hve(this->native_->vcpu_get_vtimer_mask(this->id_, masked));
        return masked;
    }

    void virtual_cpu::set_vtimer_mask(const bool masked)
    {
        this->check_owner_thread();
        hve(this->native_->vcpu_set_vtimer_mask(this->id_, masked));
    }

    uint64_t virtual_cpu::get_vtimer_offset()
    {
        this->check_owner_thread();

        uint64_t offset{};
        hve(this->native_->vcpu_get_vtimer_offset(this->id_, offset));
        return offset;
    }

    void virtual_cpu::set_vtimer_offset(const uint64_t offset)
    {
        this->check_owner_thread();
        hve(this->native_->vcpu_set_vtimer_offset(this->id_, offset));
    }
}
