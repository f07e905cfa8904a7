/**
 * @file script.hpp
 * @brief Text command scripts.
 *
 * One command per line, `#` starts a comment:
 *
 * @code
 * nop
 * write <width> <address> <value>
 * set   <width> <address> <value>
 * clear <width> <address> <value>
 * check <all_clear|any_clear|all_set|any_set> <width> <address> <mask> [count]
 * @endcode
 *
 * Width is 1, 2 or 4 bytes. Numbers are decimal, 0x-prefixed hex or
 * 0-prefixed octal and must fit in 32 bits.
 */

#ifndef DCDGEN_SCRIPT_HPP
#define DCDGEN_SCRIPT_HPP

#include "command.hpp"
#include "config.hpp"
#include "error.hpp"

#include <string>
#include <vector>

namespace dcdgen {

/**
 * @brief Parse a command script.
 *
 * @param text Script text
 * @param[out] commands Parsed commands in order (cleared first)
 * @param[out] error_line 1-based line of the first error, 0 on success
 * @return Error::Ok on success, Error::InvalidData on a malformed line
 */
Error parse_script(const std::string& text, std::vector<Command>& commands,
                   std::size_t& error_line);

/**
 * @brief Format a command as one script line (no newline).
 */
std::string format_command(const Command& command);

} // namespace dcdgen

#endif // DCDGEN_SCRIPT_HPP
