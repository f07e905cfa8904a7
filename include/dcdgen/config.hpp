/**
 * @file config.hpp
 * @brief dcdgen compile-time configuration.
 *
 * Device Configuration Data (DCD) block generator for the i.MX RT boot ROM.
 *
 * @see i.MX RT1060 Processor Reference Manual, Section 9.7.2 "Device
 *      Configuration Data (DCD)"
 */

#ifndef DCDGEN_CONFIG_HPP
#define DCDGEN_CONFIG_HPP

#include <cstdint>
#include <cstddef>

namespace dcdgen {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 1;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Largest accepted block in bytes (header length field is 16 bits)
#ifndef DCDGEN_MAX_BLOCK_LENGTH
#define DCDGEN_MAX_BLOCK_LENGTH 65535U
#endif

inline constexpr std::size_t MAX_BLOCK_LENGTH = DCDGEN_MAX_BLOCK_LENGTH;
static_assert(MAX_BLOCK_LENGTH <= 0xFFFFU, "DCDGEN_MAX_BLOCK_LENGTH must fit in 16 bits");
static_assert(MAX_BLOCK_LENGTH >= 4U, "DCDGEN_MAX_BLOCK_LENGTH must hold the block header");

/** @} */

/**
 * @defgroup wire Wire Format Constants
 * @{
 */
inline constexpr std::uint8_t BLOCK_TAG = 0xD2U;
inline constexpr std::uint8_t BLOCK_VERSION = 0x41U;
inline constexpr std::uint8_t NOP_TAG = 0xC0U;
inline constexpr std::uint8_t WRITE_TAG = 0xCCU;
inline constexpr std::uint8_t CHECK_TAG = 0xCFU;

inline constexpr std::size_t HEADER_SIZE = 4U;       ///< Block and record headers
inline constexpr std::size_t WRITE_ENTRY_SIZE = 8U;  ///< address + value
inline constexpr std::size_t CHECK_PAYLOAD_SIZE = 8U; ///< address + mask
inline constexpr std::size_t CHECK_COUNT_SIZE = 4U;

/// Flag byte: bits [2:0] width tag, bits [4:3] op/cond tag
inline constexpr std::uint8_t WIDTH_FLAG_MASK = 0b00'111U;
inline constexpr std::uint8_t OP_FLAG_MASK = 0b11'000U;
/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define DCDGEN_NO_EXCEPTIONS=1 to disable exceptions for embedded use.
 * @{
 */
#ifndef DCDGEN_NO_EXCEPTIONS
#define DCDGEN_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace dcdgen

#endif // DCDGEN_CONFIG_HPP
