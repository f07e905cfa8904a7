/**
 * @file test_run.cpp
 * @brief Unit tests for run partitioning.
 */

#include <dcdgen/run.hpp>

#include <catch2/catch.hpp>

#include <vector>

using namespace dcdgen;

namespace {

Command w4(std::uint32_t address) {
    return write_reg(Width::B4, address, 0);
}

std::vector<Run> partition(const std::vector<Command>& commands) {
    std::vector<Run> runs;
    partition_runs(commands.data(), commands.size(), runs);
    return runs;
}

} // namespace

TEST_CASE("Group keys", "[run]") {
    SECTION("writes with equal width and op share a key") {
        REQUIRE(group_key(0, w4(1)) == group_key(7, w4(2)));
    }

    SECTION("width or op difference changes the key") {
        REQUIRE_FALSE(group_key(0, w4(1)) == group_key(1, write_reg(Width::B2, 1, 0)));
        REQUIRE_FALSE(group_key(0, w4(1)) == group_key(1, set_reg(Width::B4, 1, 0)));
    }

    SECTION("non-writes never match a neighbour") {
        REQUIRE_FALSE(group_key(0, Nop{}) == group_key(1, Nop{}));
        Command check = check_all_set(Width::B4, 0, 1);
        REQUIRE_FALSE(group_key(2, check) == group_key(3, check));
        // A Nop key at any position differs from a write key
        REQUIRE_FALSE(group_key(0, Nop{}) == group_key(0, w4(0)));
    }
}

TEST_CASE("Partition empty list", "[run]") {
    std::vector<Run> runs{Run{}};
    partition_runs(nullptr, 0, runs);
    REQUIRE(runs.empty());
}

TEST_CASE("Partition merges adjacent compatible writes", "[run]") {
    auto runs = partition({w4(1), w4(2), w4(3)});
    REQUIRE(runs.size() == 1);
    REQUIRE(runs[0] == Run{RunKind::Write, 0, 3, 28});
}

TEST_CASE("Partition splits at any other command", "[run]") {
    auto runs = partition({w4(1), w4(2), Nop{}, w4(3), check_any_set(Width::B4, 0, 1), w4(4)});
    REQUIRE(runs.size() == 5);
    REQUIRE(runs[0] == Run{RunKind::Write, 0, 2, 20});
    REQUIRE(runs[1] == Run{RunKind::Nop, 2, 1, 4});
    REQUIRE(runs[2] == Run{RunKind::Write, 3, 1, 12});
    REQUIRE(runs[3] == Run{RunKind::Check, 4, 1, 12});
    REQUIRE(runs[4] == Run{RunKind::Write, 5, 1, 12});
}

TEST_CASE("Partition splits on width or op change", "[run]") {
    auto runs = partition({w4(1), write_reg(Width::B2, 2, 0), w4(3), set_reg(Width::B4, 4, 0),
                           set_reg(Width::B4, 5, 0)});
    REQUIRE(runs.size() == 4);
    REQUIRE(runs[0].size == 1);
    REQUIRE(runs[1].size == 1);
    REQUIRE(runs[2].size == 1);
    REQUIRE(runs[3] == Run{RunKind::Write, 3, 2, 20});
}

TEST_CASE("Partition keeps consecutive non-writes apart", "[run]") {
    Command check = Check{Width::B4, CheckCond::AllSet, 0x10, 0x1, 5U};
    auto runs = partition({Nop{}, Nop{}, check, check});
    REQUIRE(runs.size() == 4);
    REQUIRE(runs[0].length == 4);
    REQUIRE(runs[1].length == 4);
    REQUIRE(runs[2].length == 16);
    REQUIRE(runs[3].length == 16);
}

TEST_CASE("Record length", "[run]") {
    REQUIRE(record_length(Nop{}, 1) == 4);
    REQUIRE(record_length(w4(0), 5) == 44);
    REQUIRE(record_length(check_all_clear(Width::B1, 0, 1), 1) == 12);
}
