#pragma once

#include <cstdint>
#include <thread>

#include <utils/moved_marker.hpp>

#include "native_hypervisor.hpp"
#include "vcpu_exit.hpp"

namespace hvkit
{
    class logger;

    // One native execution context of a virtual machine.
    //
    // The context is resident in the thread that first operates on it. Every operation except exit()
    // must be issued from that thread. Debug builds assert this, release builds do not check it.
    // A virtual_cpu must be destroyed before the virtual_machine that created it.
    class virtual_cpu
    {
      public:
        virtual_cpu(native_hypervisor& native, const logger& log, vcpu_id id, const native_exit_record* exit);
        ~virtual_cpu();

        virtual_cpu(virtual_cpu&&) noexcept = default;
        virtual_cpu& operator=(virtual_cpu&&) = delete;

        virtual_cpu(const virtual_cpu&) = delete;
        virtual_cpu& operator=(const virtual_cpu&) = delete;

        vcpu_id get_handle() const
        {
            return this->id_;
        }

        uint64_t get_register(arm64_register reg);
        void set_register(arm64_register reg, uint64_t value);

        uint64_t get_system_register(arm64_system_register reg);
        void set_system_register(arm64_system_register reg, uint64_t value);

        bool get_pending_interrupt(interrupt_type type);

        // Pending interrupts are cleared by every run and must be set again before the next one
        void set_pending_interrupt(interrupt_type type, bool pending);

        bool get_trap_debug_exceptions();
        void set_trap_debug_exceptions(bool value);

        bool get_trap_debug_reg_accesses();
        void set_trap_debug_reg_accesses(bool value);

        // Blocks until the guest exits
        vcpu_exit_reason run();

        // Callable from any thread
        void exit() const;

        // Cumulative execution time in backend ticks
        uint64_t get_exec_time();

        bool get_vtimer_mask();
        void set_vtimer_mask(bool masked);

        // CNTVOFF_EL2
        uint64_t get_vtimer_offset();
        void set_vtimer_offset(uint64_t offset);

        const native_exit_record& get_last_exit() const
        {
            return *this->exit_;
        }

      private:
        utils::moved_marker marker_{};
        native_hypervisor* native_{};
        const logger* log_{};
        vcpu_id id_{};
        const native_exit_record* exit_{};
        std::thread::id owner_thread_{};

        void check_owner_thread();
        void release() const;
    };
}
