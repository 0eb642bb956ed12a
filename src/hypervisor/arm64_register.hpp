#pragma once

#include <cstdint>

namespace hvkit
{
    enum class arm64_register : uint32_t
    {
        x0 = 0,
        x1,
        x2,
        x3,
        x4,
        x5,
        x6,
        x7,
        x8,
        x9,
        x10,
        x11,
        x12,
        x13,
        x14,
        x15,
        x16,
        x17,
        x18,
        x19,
        x20,
        x21,
        x22,
        x23,
        x24,
        x25,
        x26,
        x27,
        x28,
        x29,
        x30,
        pc,
        fpcr,
        fpsr,
        cpsr,
        end,

        fp = x29,
        lr = x30,
    };

    enum class arm64_feature_register : uint32_t
    {
        id_aa64dfr0_el1 = 0,
        id_aa64dfr1_el1,
        id_aa64isar0_el1,
        id_aa64isar1_el1,
        id_aa64mmfr0_el1,
        id_aa64mmfr1_el1,
        id_aa64mmfr2_el1,
        id_aa64pfr0_el1,
        id_aa64pfr1_el1,
        ctr_el0,
        clidr_el1,
        dczid_el0,
        end,
    };

    // MRS/MSR operand encoding: op0[15:14] op1[13:11] CRn[10:7] CRm[6:3] op2[2:0]
    constexpr uint16_t encode_system_register(const uint32_t op0, const uint32_t op1, const uint32_t crn, const uint32_t crm,
                                              const uint32_t op2)
    {
        return static_cast<uint16_t>(((op0 & 0x3) << 14) | ((op1 & 0x7) << 11) | ((crn & 0xF) << 7) | ((crm & 0xF) << 3) | (op2 & 0x7));
    }

    struct system_register_operands
    {
        uint32_t op0{};
        uint32_t op1{};
        uint32_t crn{};
        uint32_t crm{};
        uint32_t op2{};
    };

    constexpr system_register_operands decode_system_register(const uint16_t encoding)
    {
        return {
            .op0 = static_cast<uint32_t>(encoding >> 14) & 0x3,
            .op1 = static_cast<uint32_t>(encoding >> 11) & 0x7,
            .crn = static_cast<uint32_t>(encoding >> 7) & 0xF,
            .crm = static_cast<uint32_t>(encoding >> 3) & 0xF,
            .op2 = static_cast<uint32_t>(encoding) & 0x7,
        };
    }

    enum class arm64_system_register : uint16_t
    {
        dbgbvr0_el1 = encode_system_register(2, 0, 0, 0, 4),
        dbgbcr0_el1 = encode_system_register(2, 0, 0, 0, 5),
        dbgwvr0_el1 = encode_system_register(2, 0, 0, 0, 6),
        dbgwcr0_el1 = encode_system_register(2, 0, 0, 0, 7),
        dbgbvr1_el1 = encode_system_register(2, 0, 0, 1, 4),
        dbgbcr1_el1 = encode_system_register(2, 0, 0, 1, 5),
        dbgwvr1_el1 = encode_system_register(2, 0, 0, 1, 6),
        dbgwcr1_el1 = encode_system_register(2, 0, 0, 1, 7),
        mdccint_el1 = encode_system_register(2, 0, 0, 2, 0),
        mdscr_el1 = encode_system_register(2, 0, 0, 2, 2),
        dbgbvr2_el1 = encode_system_register(2, 0, 0, 2, 4),
        dbgbcr2_el1 = encode_system_register(2, 0, 0, 2, 5),
        dbgwvr2_el1 = encode_system_register(2, 0, 0, 2, 6),
        dbgwcr2_el1 = encode_system_register(2, 0, 0, 2, 7),
        dbgbvr3_el1 = encode_system_register(2, 0, 0, 3, 4),
        dbgbcr3_el1 = encode_system_register(2, 0, 0, 3, 5),
        dbgwvr3_el1 = encode_system_register(2, 0, 0, 3, 6),
        dbgwcr3_el1 = encode_system_register(2, 0, 0, 3, 7),
        dbgbvr4_el1 = encode_system_register(2, 0, 0, 4, 4),
        dbgbcr4_el1 = encode_system_register(2, 0, 0, 4, 5),
        dbgwvr4_el1 = encode_system_register(2, 0, 0, 4, 6),
        dbgwcr4_el1 = encode_system_register(2, 0, 0, 4, 7),
        dbgbvr5_el1 = encode_system_register(2, 0, 0, 5, 4),
        dbgbcr5_el1 = encode_system_register(2, 0, 0, 5, 5),
        dbgwvr5_el1 = encode_system_register(2, 0, 0, 5, 6),
        dbgwcr5_el1 = encode_system_register(2, 0, 0, 5, 7),
        dbgbvr6_el1 = encode_system_register(2, 0, 0, 6, 4),
        dbgbcr6_el1 = encode_system_register(2, 0, 0, 6, 5),
        dbgwvr6_el1 = encode_system_register(2, 0, 0, 6, 6),
        dbgwcr6_el1 = encode_system_register(2, 0, 0, 6, 7),
        dbgbvr7_el1 = encode_system_register(2, 0, 0, 7, 4),
        dbgbcr7_el1 = encode_system_register(2, 0, 0, 7, 5),
        dbgwvr7_el1 = encode_system_register(2, 0, 0, 7, 6),
        dbgwcr7_el1 = encode_system_register(2, 0, 0, 7, 7),
        dbgbvr8_el1 = encode_system_register(2, 0, 0, 8, 4),
        dbgbcr8_el1 = encode_system_register(2, 0, 0, 8, 5),
        dbgwvr8_el1 = encode_system_register(2, 0, 0, 8, 6),
        dbgwcr8_el1 = encode_system_register(2, 0, 0, 8, 7),
        dbgbvr9_el1 = encode_system_register(2, 0, 0, 9, 4),
        dbgbcr9_el1 = encode_system_register(2, 0, 0, 9, 5),
        dbgwvr9_el1 = encode_system_register(2, 0, 0, 9, 6),
        dbgwcr9_el1 = encode_system_register(2, 0, 0, 9, 7),
        dbgbvr10_el1 = encode_system_register(2, 0, 0, 10, 4),
        dbgbcr10_el1 = encode_system_register(2, 0, 0, 10, 5),
        dbgwvr10_el1 = encode_system_register(2, 0, 0, 10, 6),
        dbgwcr10_el1 = encode_system_register(2, 0, 0, 10, 7),
        dbgbvr11_el1 = encode_system_register(2, 0, 0, 11, 4),
        dbgbcr11_el1 = encode_system_register(2, 0, 0, 11, 5),
        dbgwvr11_el1 = encode_system_register(2, 0, 0, 11, 6),
        dbgwcr11_el1 = encode_system_register(2, 0, 0, 11, 7),
        dbgbvr12_el1 = encode_system_register(2, 0, 0, 12, 4),
        dbgbcr12_el1 = encode_system_register(2, 0, 0, 12, 5),
        dbgwvr12_el1 = encode_system_register(2, 0, 0, 12, 6),
        dbgwcr12_el1 = encode_system_register(2, 0, 0, 12, 7),
        dbgbvr13_el1 = encode_system_register(2, 0, 0, 13, 4),
        dbgbcr13_el1 = encode_system_register(2, 0, 0, 13, 5),
        dbgwvr13_el1 = encode_system_register(2, 0, 0, 13, 6),
        dbgwcr13_el1 = encode_system_register(2, 0, 0, 13, 7),
        dbgbvr14_el1 = encode_system_register(2, 0, 0, 14, 4),
        dbgbcr14_el1 = encode_system_register(2, 0, 0, 14, 5),
        dbgwvr14_el1 = encode_system_register(2, 0, 0, 14, 6),
        dbgwcr14_el1 = encode_system_register(2, 0, 0, 14, 7),
        dbgbvr15_el1 = encode_system_register(2, 0, 0, 15, 4),
        dbgbcr15_el1 = encode_system_register(2, 0, 0, 15, 5),
        dbgwvr15_el1 = encode_system_register(2, 0, 0, 15, 6),
        dbgwcr15_el1 = encode_system_register(2, 0, 0, 15, 7),
        midr_el1 = encode_system_register(3, 0, 0, 0, 0),
        mpidr_el1 = encode_system_register(3, 0, 0, 0, 5),
        id_aa64pfr0_el1 = encode_system_register(3, 0, 0, 4, 0),
        id_aa64pfr1_el1 = encode_system_register(3, 0, 0, 4, 1),
        id_aa64dfr0_el1 = encode_system_register(3, 0, 0, 5, 0),
        id_aa64dfr1_el1 = encode_system_register(3, 0, 0, 5, 1),
        id_aa64isar0_el1 = encode_system_register(3, 0, 0, 6, 0),
        id_aa64isar1_el1 = encode_system_register(3, 0, 0, 6, 1),
        id_aa64mmfr0_el1 = encode_system_register(3, 0, 0, 7, 0),
        id_aa64mmfr1_el1 = encode_system_register(3, 0, 0, 7, 1),
        id_aa64mmfr2_el1 = encode_system_register(3, 0, 0, 7, 2),
        sctlr_el1 = encode_system_register(3, 0, 1, 0, 0),
        cpacr_el1 = encode_system_register(3, 0, 1, 0, 2),
        ttbr0_el1 = encode_system_register(3, 0, 2, 0, 0),
        ttbr1_el1 = encode_system_register(3, 0, 2, 0, 1),
        tcr_el1 = encode_system_register(3, 0, 2, 0, 2),
        apiakeylo_el1 = encode_system_register(3, 0, 2, 1, 0),
        apiakeyhi_el1 = encode_system_register(3, 0, 2, 1, 1),
        apibkeylo_el1 = encode_system_register(3, 0, 2, 1, 2),
        apibkeyhi_el1 = encode_system_register(3, 0, 2, 1, 3),
        apdakeylo_el1 = encode_system_register(3, 0, 2, 2, 0),
        apdakeyhi_el1 = encode_system_register(3, 0, 2, 2, 1),
        apdbkeylo_el1 = encode_system_register(3, 0, 2, 2, 2),
        apdbkeyhi_el1 = encode_system_register(3, 0, 2, 2, 3),
        apgakeylo_el1 = encode_system_register(3, 0, 2, 3, 0),
        apgakeyhi_el1 = encode_system_register(3, 0, 2, 3, 1),
        spsr_el1 = encode_system_register(3, 0, 4, 0, 0),
        elr_el1 = encode_system_register(3, 0, 4, 0, 1),
        sp_el0 = encode_system_register(3, 0, 4, 1, 0),
        afsr0_el1 = encode_system_register(3, 0, 5, 1, 0),
        afsr1_el1 = encode_system_register(3, 0, 5, 1, 1),
        esr_el1 = encode_system_register(3, 0, 5, 2, 0),
        far_el1 = encode_system_register(3, 0, 6, 0, 0),
        par_el1 = encode_system_register(3, 0, 7, 4, 0),
        mair_el1 = encode_system_register(3, 0, 10, 2, 0),
        amair_el1 = encode_system_register(3, 0, 10, 3, 0),
        vbar_el1 = encode_system_register(3, 0, 12, 0, 0),
        contextidr_el1 = encode_system_register(3, 0, 13, 0, 1),
        tpidr_el1 = encode_system_register(3, 0, 13, 0, 4),
        cntkctl_el1 = encode_system_register(3, 0, 14, 1, 0),
        csselr_el1 = encode_system_register(3, 2, 0, 0, 0),
        tpidr_el0 = encode_system_register(3, 3, 13, 0, 2),
        tpidrro_el0 = encode_system_register(3, 3, 13, 0, 3),
        cntv_ctl_el0 = encode_system_register(3, 3, 14, 3, 1),
        cntv_cval_el0 = encode_system_register(3, 3, 14, 3, 2),
        sp_el1 = encode_system_register(3, 4, 4, 1, 0),
    };
}
