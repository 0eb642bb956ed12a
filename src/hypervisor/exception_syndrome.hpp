#pragma once

#include <cstdint>

namespace hvkit
{
    // ESR_ELx.EC values relevant to guest exits
    enum class exception_class : uint8_t
    {
        unknown = 0x00,
        wf_instruction = 0x01,
        svc64 = 0x15,
        hvc64 = 0x16,
        smc64 = 0x17,
        system_register_trap = 0x18,
        instruction_abort_lower = 0x20,
        instruction_abort_same = 0x21,
        pc_alignment = 0x22,
        data_abort_lower = 0x24,
        data_abort_same = 0x25,
        sp_alignment = 0x26,
        breakpoint_lower = 0x30,
        software_step_lower = 0x32,
        watchpoint_lower = 0x34,
        brk64 = 0x3C,
    };

    constexpr uint64_t syndrome_il_bit = 1ULL << 25;
    constexpr uint64_t syndrome_iss_mask = (1ULL << 25) - 1;

    // Data abort ISS bits
    constexpr uint64_t data_abort_wnr_bit = 1ULL << 6;
    constexpr uint64_t fault_status_translation_level3 = 0x07;
    constexpr uint64_t fault_status_permission_level3 = 0x0F;

    constexpr exception_class get_exception_class(const uint64_t syndrome)
    {
        return static_cast<exception_class>((syndrome >> 26) & 0x3F);
    }

    constexpr uint64_t get_instruction_specific_syndrome(const uint64_t syndrome)
    {
        return syndrome & syndrome_iss_mask;
    }

    constexpr uint64_t make_syndrome(const exception_class ec, const uint64_t iss)
    {
        return (static_cast<uint64_t>(ec) << 26) | syndrome_il_bit | (iss & syndrome_iss_mask);
    }

    constexpr bool is_data_abort_write(const uint64_t syndrome)
    {
        return (syndrome & data_abort_wnr_bit) != 0;
    }

    // Immediate of SVC, HVC, SMC and BRK
    constexpr uint16_t get_exception_immediate(const uint64_t syndrome)
    {
        return static_cast<uint16_t>(syndrome & 0xFFFF);
    }
}
