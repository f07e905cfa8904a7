/**
 * @file run.cpp
 * @brief Run partitioning.
 */

#include <dcdgen/record.hpp>
#include <dcdgen/run.hpp>

#include <limits>

namespace dcdgen {

namespace {

constexpr std::size_t WRITE_POSITION = std::numeric_limits<std::size_t>::max();

RunKind run_kind(const Command& command) noexcept {
    if (std::holds_alternative<Write>(command)) {
        return RunKind::Write;
    }
    if (std::holds_alternative<Check>(command)) {
        return RunKind::Check;
    }
    return RunKind::Nop;
}

} // namespace

GroupKey group_key(std::size_t index, const Command& command) noexcept {
    if (const auto* write = std::get_if<Write>(&command)) {
        return GroupKey{WRITE_POSITION, write->width, write->op};
    }
    return GroupKey{index, Width::B4, WriteOp::Write};
}

std::size_t record_length(const Command& head, std::size_t size) noexcept {
    if (std::holds_alternative<Write>(head)) {
        return write_record_length(size);
    }
    if (const auto* check = std::get_if<Check>(&head)) {
        return check_record_length(*check);
    }
    return HEADER_SIZE;
}

void partition_runs(const Command* commands, std::size_t count, std::vector<Run>& runs) {
    runs.clear();

    std::size_t start = 0;
    while (start < count) {
        GroupKey key = group_key(start, commands[start]);

        // Extend while the next command shares the key
        std::size_t end = start + 1;
        while (end < count && group_key(end, commands[end]) == key) {
            ++end;
        }

        std::size_t size = end - start;
        runs.push_back(Run{run_kind(commands[start]), start, size,
                           record_length(commands[start], size)});
        start = end;
    }
}

} // namespace dcdgen
