/**
 * @file dcdgen.hpp
 * @brief dcdgen public API.
 *
 * Builds Device Configuration Data blocks: lists of register writes and
 * polls executed by the i.MX RT boot ROM before the firmware starts.
 *
 * @code
 * std::vector<dcdgen::Command> commands = {
 *     dcdgen::set_reg(dcdgen::Width::B4, 0x400D8000, 1U << 13),
 *     dcdgen::check_all_set(dcdgen::Width::B4, 0x400D8000, 1U << 31),
 * };
 * std::ofstream file("dcd.bin", std::ios::binary);
 * dcdgen::StreamSink sink(file);
 * std::size_t written = 0;
 * dcdgen::Error result = dcdgen::encode(sink, commands, written);
 * @endcode
 */

#ifndef DCDGEN_HPP
#define DCDGEN_HPP

#include "command.hpp"
#include "config.hpp"
#include "decoder.hpp"
#include "encoder.hpp"
#include "error.hpp"
#include "record.hpp"
#include "run.hpp"
#include "script.hpp"
#include "sink.hpp"

namespace dcdgen {

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.1.0";
}

} // namespace dcdgen

#endif // DCDGEN_HPP
