/**
 * @file run.hpp
 * @brief Partitioning of a command list into records.
 *
 * Consecutive writes sharing width and op form one run and are merged
 * into a single Write record. Nop and Check commands always form runs of
 * their own. Boundaries depend only on adjacent keys, so any other
 * command between two compatible writes splits them.
 */

#ifndef DCDGEN_RUN_HPP
#define DCDGEN_RUN_HPP

#include "command.hpp"
#include "config.hpp"

#include <vector>

namespace dcdgen {

/**
 * @brief Record type produced by a run.
 */
enum class RunKind : std::uint8_t { Nop, Write, Check };

/**
 * @brief A maximal contiguous group of commands encoded as one record.
 */
struct Run {
    RunKind kind = RunKind::Nop;
    std::size_t first = 0;  ///< Index of the first command
    std::size_t size = 0;   ///< Number of commands
    std::size_t length = 0; ///< Record length in bytes, header included

    bool operator==(const Run&) const = default;
};

/**
 * @brief Grouping key: adjacent commands with equal keys share a run.
 *
 * Writes use a shared position marker so only (width, op) matters.
 * Other commands use their own index, which no neighbour can match.
 */
struct GroupKey {
    std::size_t position = 0;
    Width width = Width::B4;
    WriteOp op = WriteOp::Write;

    bool operator==(const GroupKey&) const = default;
};

/**
 * @brief Grouping key of the command at `index`.
 */
[[nodiscard]] GroupKey group_key(std::size_t index, const Command& command) noexcept;

/**
 * @brief Record length of a run of `size` commands starting with `head`.
 */
[[nodiscard]] std::size_t record_length(const Command& head, std::size_t size) noexcept;

/**
 * @brief Split commands into maximal runs.
 *
 * Single forward pass with one command of lookahead. `runs` is cleared
 * first, then filled in command order.
 *
 * @param commands Command list (may be null when count is 0)
 * @param count Number of commands
 * @param[out] runs Runs covering every command exactly once
 */
void partition_runs(const Command* commands, std::size_t count, std::vector<Run>& runs);

} // namespace dcdgen

#endif // DCDGEN_RUN_HPP
