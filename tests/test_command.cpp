/**
 * @file test_command.cpp
 * @brief Unit tests for the command model and flag byte packing.
 */

#include <dcdgen/command.hpp>

#include <catch2/catch.hpp>

#include <string>

using namespace dcdgen;

TEST_CASE("Command defaults", "[command]") {
    Command command;
    REQUIRE(std::holds_alternative<Nop>(command));

    Write write;
    REQUIRE(write.width == Width::B4);
    REQUIRE(write.op == WriteOp::Write);

    Check check;
    REQUIRE(check.width == Width::B4);
    REQUIRE(check.cond == CheckCond::AllClear);
    REQUIRE_FALSE(check.count.has_value());
}

TEST_CASE("Flag byte packing", "[command]") {
    SECTION("width occupies bits 2..0") {
        REQUIRE(flags(Write{Width::B1, WriteOp::Write, 0, 0}) == 0x01);
        REQUIRE(flags(Write{Width::B2, WriteOp::Write, 0, 0}) == 0x02);
        REQUIRE(flags(Write{Width::B4, WriteOp::Write, 0, 0}) == 0x04);
    }

    SECTION("write op occupies bits 4..3") {
        REQUIRE(flags(Write{Width::B4, WriteOp::Clear, 0, 0}) == 0x0C);
        REQUIRE(flags(Write{Width::B4, WriteOp::Set, 0, 0}) == 0x1C);
        REQUIRE(flags(Write{Width::B1, WriteOp::Set, 0, 0}) == 0x19);
    }

    SECTION("check conditions") {
        REQUIRE(flags(Check{Width::B4, CheckCond::AllClear, 0, 0, {}}) == 0x04);
        REQUIRE(flags(Check{Width::B1, CheckCond::AnyClear, 0, 0, {}}) == 0x09);
        REQUIRE(flags(Check{Width::B4, CheckCond::AllSet, 0, 0, {}}) == 0x14);
        REQUIRE(flags(Check{Width::B2, CheckCond::AnySet, 0, 0, {}}) == 0x1A);
    }
}

TEST_CASE("Width conversions", "[command]") {
    Width width = Width::B4;

    REQUIRE(width_from_bytes(1, width) == Error::Ok);
    REQUIRE(width == Width::B1);
    REQUIRE(width_from_bytes(2, width) == Error::Ok);
    REQUIRE(width == Width::B2);
    REQUIRE(width_from_bytes(4, width) == Error::Ok);
    REQUIRE(width == Width::B4);
    REQUIRE(width_from_bytes(3, width) == Error::InvalidArg);
    REQUIRE(width_from_bytes(8, width) == Error::InvalidArg);

    REQUIRE(width_bytes(Width::B1) == 1);
    REQUIRE(width_bytes(Width::B2) == 2);
    REQUIRE(width_bytes(Width::B4) == 4);
}

TEST_CASE("Flag byte decoding", "[command]") {
    Width width;
    WriteOp op;
    CheckCond cond;

    SECTION("valid tags") {
        REQUIRE(width_from_flags(0x1A, width) == Error::Ok);
        REQUIRE(width == Width::B2);
        REQUIRE(write_op_from_flags(0x0C, op) == Error::Ok);
        REQUIRE(op == WriteOp::Clear);
        REQUIRE(check_cond_from_flags(0x14, cond) == Error::Ok);
        REQUIRE(cond == CheckCond::AllSet);
    }

    SECTION("width needs exactly one bit") {
        REQUIRE(width_from_flags(0x00, width) == Error::InvalidData);
        REQUIRE(width_from_flags(0x03, width) == Error::InvalidData);
        REQUIRE(width_from_flags(0x07, width) == Error::InvalidData);
    }

    SECTION("0b10 is not a write op") {
        REQUIRE(write_op_from_flags(0x14, op) == Error::InvalidData);
    }
}

TEST_CASE("Command builders", "[command]") {
    SECTION("field values are shifted and clipped") {
        // 2-bit field at offset 14
        REQUIRE(field_value(0b01, 14, 0b11U << 14) == 0x4000);
        REQUIRE(field_value(0b111, 14, 0b11U << 14) == 0xC000);
        REQUIRE(field_value(1, 32, 0xFFFFFFFF) == 0);
    }

    SECTION("writes") {
        std::uint32_t bypass = 1U << 16;
        std::uint32_t value = bypass | field_value(0b01, 14, 0b11U << 14);
        REQUIRE(write_reg(Width::B4, 0x400D8000, value) ==
                Command{Write{Width::B4, WriteOp::Write, 0x400D8000, 0x00014000}});
        REQUIRE(set_reg(Width::B4, 0x400D8000, 1U << 13) ==
                Command{Write{Width::B4, WriteOp::Set, 0x400D8000, 1U << 13}});
        REQUIRE(clear_reg(Width::B4, 0x400FC018, 0b11U << 12) ==
                Command{Write{Width::B4, WriteOp::Clear, 0x400FC018, 0b11U << 12}});
    }

    SECTION("checks poll indefinitely") {
        std::uint32_t busy = (1U << 3) | (1U << 5);
        REQUIRE(check_all_clear(Width::B4, 0x400FC048, busy) ==
                Command{Check{Width::B4, CheckCond::AllClear, 0x400FC048, busy, std::nullopt}});
        REQUIRE(check_any_clear(Width::B4, 0x400FC048, busy) ==
                Command{Check{Width::B4, CheckCond::AnyClear, 0x400FC048, busy, std::nullopt}});
        REQUIRE(check_all_set(Width::B4, 0x400D8000, 1U << 31) ==
                Command{Check{Width::B4, CheckCond::AllSet, 0x400D8000, 1U << 31, std::nullopt}});
        REQUIRE(check_any_set(Width::B4, 0x401F8338, 0b111U << 3) ==
                Command{Check{Width::B4, CheckCond::AnySet, 0x401F8338, 0b111U << 3, std::nullopt}});
    }
}

TEST_CASE("Enum names", "[command]") {
    REQUIRE(std::string(to_string(Width::B2)) == "2");
    REQUIRE(std::string(to_string(WriteOp::Clear)) == "clear");
    REQUIRE(std::string(to_string(CheckCond::AnySet)) == "any_set");
}
