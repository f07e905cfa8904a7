/**
 * @file test_script.cpp
 * @brief Unit tests for text command scripts.
 */

#include <dcdgen/script.hpp>

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using namespace dcdgen;

TEST_CASE("Parse every command form", "[script]") {
    const std::string text = "# PLL setup\n"
                             "\n"
                             "nop\n"
                             "write 4 0x01234567 0xdeadbeef\n"
                             "set   4 0x400D8000 8192   # ENABLE\n"
                             "clear 2 0x400FC018 0x3000\n"
                             "check any_set 2 0x89abcdef 0x55aa55aa 16\n"
                             "check all_clear 1 0x400FC048 0x28\n";

    std::vector<Command> commands;
    std::size_t error_line = 99;
    REQUIRE(parse_script(text, commands, error_line) == Error::Ok);
    REQUIRE(error_line == 0);
    REQUIRE(commands == std::vector<Command>{
                            Nop{},
                            Write{Width::B4, WriteOp::Write, 0x01234567, 0xDEADBEEF},
                            Write{Width::B4, WriteOp::Set, 0x400D8000, 0x2000},
                            Write{Width::B2, WriteOp::Clear, 0x400FC018, 0x3000},
                            Check{Width::B2, CheckCond::AnySet, 0x89ABCDEF, 0x55AA55AA, 16U},
                            Check{Width::B1, CheckCond::AllClear, 0x400FC048, 0x28, std::nullopt},
                        });
}

TEST_CASE("Parse empty script", "[script]") {
    std::vector<Command> commands{Nop{}};
    std::size_t error_line = 0;
    REQUIRE(parse_script("", commands, error_line) == Error::Ok);
    REQUIRE(commands.empty());
    REQUIRE(parse_script("# nothing\n\n   \n", commands, error_line) == Error::Ok);
    REQUIRE(commands.empty());
}

TEST_CASE("Parse reports the offending line", "[script]") {
    std::vector<Command> commands;
    std::size_t error_line = 0;

    SECTION("unknown keyword") {
        REQUIRE(parse_script("nop\npoke 4 0 0\n", commands, error_line) == Error::InvalidData);
        REQUIRE(error_line == 2);
        REQUIRE(commands.empty());
    }

    SECTION("bad width") {
        REQUIRE(parse_script("write 3 0 0", commands, error_line) == Error::InvalidData);
        REQUIRE(error_line == 1);
    }

    SECTION("value wider than 32 bits") {
        REQUIRE(parse_script("nop\nnop\nset 4 0 0x100000000", commands, error_line) ==
                Error::InvalidData);
        REQUIRE(error_line == 3);
    }

    SECTION("negative number") {
        REQUIRE(parse_script("write 4 -1 0", commands, error_line) == Error::InvalidData);
    }

    SECTION("trailing garbage in number") {
        REQUIRE(parse_script("write 4 0x10zz 0", commands, error_line) == Error::InvalidData);
    }

    SECTION("missing operand") {
        REQUIRE(parse_script("check all_set 4 0x10", commands, error_line) == Error::InvalidData);
    }

    SECTION("extra operand") {
        REQUIRE(parse_script("nop 1", commands, error_line) == Error::InvalidData);
        REQUIRE(parse_script("check all_set 4 1 2 3 4", commands, error_line) ==
                Error::InvalidData);
    }

    SECTION("unknown condition") {
        REQUIRE(parse_script("check none_set 4 1 2", commands, error_line) == Error::InvalidData);
    }
}

TEST_CASE("Format commands", "[script]") {
    REQUIRE(format_command(Nop{}) == "nop");
    REQUIRE(format_command(Write{Width::B4, WriteOp::Write, 0x01234567, 0xDEADBEEF}) ==
            "write 4 0x01234567 0xDEADBEEF");
    REQUIRE(format_command(Write{Width::B2, WriteOp::Set, 0x10, 0x1}) ==
            "set   2 0x00000010 0x00000001");
    REQUIRE(format_command(Check{Width::B2, CheckCond::AnySet, 0x89ABCDEF, 0x55AA55AA, 16U}) ==
            "check any_set 2 0x89ABCDEF 0x55AA55AA 16");
    REQUIRE(format_command(Check{Width::B1, CheckCond::AnyClear, 0x1, 0x2, std::nullopt}) ==
            "check any_clear 1 0x00000001 0x00000002");
}

TEST_CASE("Formatted lines parse back", "[script]") {
    Command check = Check{Width::B4, CheckCond::AllSet, 0x400D8000, 0x80000000, 0U};

    std::vector<Command> commands;
    std::size_t error_line = 0;
    REQUIRE(parse_script(format_command(check), commands, error_line) == Error::Ok);
    REQUIRE(commands == std::vector<Command>{check});
}
