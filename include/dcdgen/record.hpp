/**
 * @file record.hpp
 * @brief DCD block and record byte layout.
 *
 * All multi-byte fields are big-endian:
 *
 * @code
 * Block:   [0xD2][len_hi][len_lo][0x41]  <record>*
 * Nop:     [0xC0][0x00][0x04][0x00]
 * Check:   [0xCF][len_hi][len_lo][width|cond] [addr:4][mask:4] [count:4]?
 * Write:   [0xCC][len_hi][len_lo][width|op]  ([addr:4][value:4])+
 * @endcode
 *
 * Lengths include the 4-byte header they belong to.
 */

#ifndef DCDGEN_RECORD_HPP
#define DCDGEN_RECORD_HPP

#include "command.hpp"
#include "config.hpp"

#include <array>

namespace dcdgen {

/// Block or record header
using Header = std::array<std::uint8_t, HEADER_SIZE>;

/// One address/value pair of a Write record
using WriteEntry = std::array<std::uint8_t, WRITE_ENTRY_SIZE>;

/**
 * @brief Check record payload.
 *
 * Holds address, mask and optional count; only the first `size` bytes
 * are emitted.
 */
struct CheckPayload {
    std::array<std::uint8_t, CHECK_PAYLOAD_SIZE + CHECK_COUNT_SIZE> bytes{};
    std::size_t size = 0;
};

/**
 * @defgroup byteorder Big-Endian Helpers
 * @{
 */
constexpr void store_be16(std::uint8_t* out, std::uint16_t value) noexcept {
    out[0] = static_cast<std::uint8_t>(value >> 8);
    out[1] = static_cast<std::uint8_t>(value);
}

constexpr void store_be32(std::uint8_t* out, std::uint32_t value) noexcept {
    out[0] = static_cast<std::uint8_t>(value >> 24);
    out[1] = static_cast<std::uint8_t>(value >> 16);
    out[2] = static_cast<std::uint8_t>(value >> 8);
    out[3] = static_cast<std::uint8_t>(value);
}

[[nodiscard]] constexpr std::uint16_t load_be16(const std::uint8_t* in) noexcept {
    return static_cast<std::uint16_t>((static_cast<std::uint16_t>(in[0]) << 8) | in[1]);
}

[[nodiscard]] constexpr std::uint32_t load_be32(const std::uint8_t* in) noexcept {
    return (static_cast<std::uint32_t>(in[0]) << 24) | (static_cast<std::uint32_t>(in[1]) << 16) |
           (static_cast<std::uint32_t>(in[2]) << 8) | static_cast<std::uint32_t>(in[3]);
}
/** @} */

namespace detail {
constexpr Header make_header(std::uint8_t tag, std::uint16_t length,
                             std::uint8_t last) noexcept {
    Header header{tag, 0x00U, 0x00U, last};
    store_be16(&header[1], length);
    return header;
}
} // namespace detail

/**
 * @brief Block header for a block of `byte_len` bytes (header included).
 */
[[nodiscard]] constexpr Header block_header(std::uint16_t byte_len) noexcept {
    return detail::make_header(BLOCK_TAG, byte_len, BLOCK_VERSION);
}

/**
 * @brief The fixed Nop record.
 */
[[nodiscard]] constexpr Header nop_record() noexcept {
    return Header{NOP_TAG, 0x00U, 0x04U, 0x00U};
}

/**
 * @brief Length of a Write record merging `group_size` writes.
 *
 * Not clipped to 16 bits; callers check against MAX_BLOCK_LENGTH.
 */
[[nodiscard]] constexpr std::size_t write_record_length(std::size_t group_size) noexcept {
    return HEADER_SIZE + (group_size * WRITE_ENTRY_SIZE);
}

/**
 * @brief Header of a Write record.
 *
 * @param first First write of the run (supplies width and op)
 * @param group_size Number of writes in the run
 */
[[nodiscard]] constexpr Header write_record_header(const Write& first,
                                                   std::size_t group_size) noexcept {
    return detail::make_header(WRITE_TAG, static_cast<std::uint16_t>(write_record_length(group_size)),
                               flags(first));
}

/**
 * @brief Address/value pair of one write.
 */
[[nodiscard]] constexpr WriteEntry write_entry(const Write& write) noexcept {
    WriteEntry entry{};
    store_be32(&entry[0], write.address);
    store_be32(&entry[4], write.value);
    return entry;
}

/**
 * @brief Length of a Check record: 16 with a poll count, 12 without.
 */
[[nodiscard]] constexpr std::size_t check_record_length(const Check& check) noexcept {
    return HEADER_SIZE + CHECK_PAYLOAD_SIZE + (check.count.has_value() ? CHECK_COUNT_SIZE : 0U);
}

/**
 * @brief Header of a Check record.
 */
[[nodiscard]] constexpr Header check_record_header(const Check& check) noexcept {
    return detail::make_header(CHECK_TAG, static_cast<std::uint16_t>(check_record_length(check)),
                               flags(check));
}

/**
 * @brief Payload of a Check record.
 */
[[nodiscard]] constexpr CheckPayload check_payload(const Check& check) noexcept {
    CheckPayload payload;
    store_be32(&payload.bytes[0], check.address);
    store_be32(&payload.bytes[4], check.mask);
    payload.size = CHECK_PAYLOAD_SIZE;
    if (check.count.has_value()) {
        store_be32(&payload.bytes[8], *check.count);
        payload.size += CHECK_COUNT_SIZE;
    }
    return payload;
}

} // namespace dcdgen

#endif // DCDGEN_RECORD_HPP
