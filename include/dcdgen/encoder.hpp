/**
 * @file encoder.hpp
 * @brief DCD block encoder.
 *
 * Serializes commands as one complete DCD block: a 4-byte block header
 * stating the total length, then one record per run (see run.hpp).
 * Consecutive writes with the same width and op are merged into a single
 * Write record.
 *
 * Encoding is a pure function of the command list. No state is kept
 * between calls, so independent sinks may be used from different threads.
 */

#ifndef DCDGEN_ENCODER_HPP
#define DCDGEN_ENCODER_HPP

#include "command.hpp"
#include "config.hpp"
#include "error.hpp"
#include "run.hpp"
#include "sink.hpp"

#include <vector>

namespace dcdgen {

/**
 * @brief Compute the encoded block length.
 *
 * @param commands Command list (may be null when count is 0)
 * @param count Number of commands
 * @param[out] length Total bytes including the block header; 0 for an
 *             empty list. Set even when the block is oversized.
 * @return Error::Ok, or Error::OversizedBlock above MAX_BLOCK_LENGTH
 */
Error block_length(const Command* commands, std::size_t count, std::size_t& length);

/**
 * @brief Encode commands as a DCD block into a sink.
 *
 * An empty list writes nothing. Otherwise the length is checked before
 * the first byte is written, so an oversized block leaves the sink
 * untouched.
 *
 * @param sink Output sink
 * @param commands Command list (may be null when count is 0)
 * @param count Number of commands
 * @param[out] written Bytes written: the block length on success, 0 when
 *             oversized, bytes accepted before a sink failure otherwise
 * @return Error::Ok, Error::OversizedBlock, Error::InvalidArg, or the
 *         error returned by the sink
 */
Error encode(Sink& sink, const Command* commands, std::size_t count, std::size_t& written);

/**
 * @brief Encode a command vector into a sink.
 */
inline Error encode(Sink& sink, const std::vector<Command>& commands, std::size_t& written) {
    return encode(sink, commands.data(), commands.size(), written);
}

#if !DCDGEN_NO_EXCEPTIONS

/**
 * @brief Encode a command vector into a new byte vector.
 *
 * @throws OversizedBlockException if the block exceeds MAX_BLOCK_LENGTH
 */
std::vector<std::uint8_t> encode(const std::vector<Command>& commands);

#endif // !DCDGEN_NO_EXCEPTIONS

} // namespace dcdgen

#endif // DCDGEN_ENCODER_HPP
