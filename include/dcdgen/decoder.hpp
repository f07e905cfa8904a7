/**
 * @file decoder.hpp
 * @brief DCD block parser.
 *
 * Turns an encoded block back into its command list for inspection.
 * Merged Write records expand to one Write per address/value pair, so
 * re-encoding the commands of a block made by encode() reproduces it byte
 * for byte.
 */

#ifndef DCDGEN_DECODER_HPP
#define DCDGEN_DECODER_HPP

#include "command.hpp"
#include "config.hpp"
#include "error.hpp"

#include <vector>

namespace dcdgen {

/**
 * @brief Parse a complete DCD block.
 *
 * An empty input yields an empty command list. The header length must
 * match `size` exactly.
 *
 * @param data Block bytes (may be null when size is 0)
 * @param size Block size in bytes
 * @param[out] commands Decoded commands (cleared first)
 * @return Error::Ok on success, Error::InvalidData for malformed blocks
 */
Error decode(const std::uint8_t* data, std::size_t size, std::vector<Command>& commands);

/**
 * @brief Parse a complete DCD block held in a vector.
 */
inline Error decode(const std::vector<std::uint8_t>& block, std::vector<Command>& commands) {
    return decode(block.data(), block.size(), commands);
}

} // namespace dcdgen

#endif // DCDGEN_DECODER_HPP
