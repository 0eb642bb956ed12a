#include "hypervisor_test_utils.hpp"

#include <exception_syndrome.hpp>
#include <memory_permission.hpp>

namespace test
{
    TEST(ErrorTest, NativeStatusesMapToTheirErrorCode)
    {
        using hvkit::error_code;

        EXPECT_EQ(hvkit::to_error_code(hvkit::status::error), error_code::error);
        EXPECT_EQ(hvkit::to_error_code(hvkit::status::busy), error_code::busy);
        EXPECT_EQ(hvkit::to_error_code(hvkit::status::bad_argument), error_code::bad_argument);
        EXPECT_EQ(hvkit::to_error_code(hvkit::status::illegal_guest_state), error_code::illegal_guest_state);
        EXPECT_EQ(hvkit::to_error_code(hvkit::status::no_resources), error_code::no_resources);
        EXPECT_EQ(hvkit::to_error_code(hvkit::status::no_device), error_code::no_device);
        EXPECT_EQ(hvkit::to_error_code(hvkit::status::denied), error_code::denied);
        EXPECT_EQ(hvkit::to_error_code(hvkit::status::unsupported), error_code::unsupported);
    }

    TEST(ErrorTest, UnrecognizedStatusKeepsItsCode)
    {
        constexpr auto raw = static_cast<hvkit::native_status>(0xFAE94042);

        const hvkit::hypervisor_error error(raw);

        EXPECT_EQ(error.code(), hvkit::error_code::unknown);
        ASSERT_TRUE(error.get_native_status().has_value());
        EXPECT_EQ(*error.get_native_status(), raw);
        EXPECT_NE(std::string(error.what()).find("0xFAE94042"), std::string::npos);
    }

    TEST(ErrorTest, LocalErrorsCarryNoNativeStatus)
    {
        const hvkit::hypervisor_error error(hvkit::error_code::misaligned_address);

        EXPECT_EQ(error.code(), hvkit::error_code::misaligned_address);
        EXPECT_FALSE(error.get_native_status().has_value());
        EXPECT_STREQ(error.what(), "misaligned address");
    }

    TEST(ErrorTest, SuccessDoesNotThrow)
    {
        EXPECT_NO_THROW(hvkit::hve(hvkit::status::success));
        ASSERT_HYPERVISOR_ERROR(hvkit::hve(hvkit::status::busy), hvkit::error_code::busy);
    }

    TEST(ErrorDeathTest, ConvertingSuccessIsFatal)
    {
        EXPECT_EXIT((void)hvkit::to_error_code(hvkit::status::success), testing::KilledBySignal(SIGABRT), "");
    }

    TEST(ErrorDeathTest, FatalErrorAborts)
    {
        EXPECT_EXIT(hvkit::fatal_error("Cannot continue"), testing::KilledBySignal(SIGABRT), "");
    }

    TEST(MemoryPermissionTest, NativeFlagsMatchPermissionBits)
    {
        using hvkit::memory_permission;

        EXPECT_EQ(hvkit::to_native_flags(memory_permission::none), 0u);
        EXPECT_EQ(hvkit::to_native_flags(memory_permission::read), 1u);
        EXPECT_EQ(hvkit::to_native_flags(memory_permission::write), 2u);
        EXPECT_EQ(hvkit::to_native_flags(memory_permission::exec), 4u);
        EXPECT_EQ(hvkit::to_native_flags(memory_permission::read_write), 3u);
        EXPECT_EQ(hvkit::to_native_flags(memory_permission::all), 7u);

        EXPECT_EQ(hvkit::get_permission_string(memory_permission::read_exec), "r-x");
        EXPECT_EQ(hvkit::make_memory_permission(true, true, false), memory_permission::read_write);
        EXPECT_EQ(~memory_permission::read, memory_permission::write_exec);
    }

    TEST(ExceptionSyndromeTest, FieldsAreExtracted)
    {
        constexpr auto syndrome = hvkit::make_syndrome(hvkit::exception_class::brk64, 0x1234);

        EXPECT_EQ(hvkit::get_exception_class(syndrome), hvkit::exception_class::brk64);
        EXPECT_EQ(hvkit::get_exception_immediate(syndrome), 0x1234);
        EXPECT_NE(syndrome & hvkit::syndrome_il_bit, 0u);

        constexpr auto abort = hvkit::make_syndrome(hvkit::exception_class::data_abort_lower,
                                                    hvkit::data_abort_wnr_bit | hvkit::fault_status_translation_level3);

        EXPECT_TRUE(hvkit::is_data_abort_write(abort));
        EXPECT_EQ(hvkit::get_instruction_specific_syndrome(abort) & 0x3F, hvkit::fault_status_translation_level3);
    }
}
