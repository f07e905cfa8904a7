/**
 * @file command.hpp
 * @brief DCD command data model.
 *
 * A DCD is an ordered list of commands interpreted by the boot ROM before
 * any firmware runs:
 * - Nop: does nothing (may behave as a small delay)
 * - Write: writes a value to a memory-mapped address
 * - Check: polls an address until a bitmask condition holds
 *
 * Commands are plain values. The encoder never interprets them.
 *
 * @par Flag Byte
 * Every Write and Check record carries a flag byte built by OR-ing two
 * disjoint tags:
 * - bits [2:0]: Width (0b001, 0b010, 0b100)
 * - bits [4:3]: WriteOp or CheckCond
 */

#ifndef DCDGEN_COMMAND_HPP
#define DCDGEN_COMMAND_HPP

#include "config.hpp"
#include "error.hpp"

#include <optional>
#include <variant>

namespace dcdgen {

/**
 * @brief Byte width of the bus read/write.
 */
enum class Width : std::uint8_t {
    B1 = 0b001U, ///< 1 byte / 8 bit
    B2 = 0b010U, ///< 2 bytes / 16 bit
    B4 = 0b100U  ///< 4 bytes / 32 bit
};

/**
 * @brief Write operation variant.
 */
enum class WriteOp : std::uint8_t {
    Write = 0b00'000U, ///< `*address = value`
    Clear = 0b01'000U, ///< `*address &= ~value` (read-modify-write)
    Set = 0b11'000U    ///< `*address |= value` (read-modify-write)
};

/**
 * @brief Check condition variant.
 */
enum class CheckCond : std::uint8_t {
    AllClear = 0b00'000U, ///< `(*address & mask) == 0`
    AnyClear = 0b01'000U, ///< `(*address & mask) != mask`
    AllSet = 0b10'000U,   ///< `(*address & mask) == mask`
    AnySet = 0b11'000U    ///< `(*address & mask) != 0`
};

/**
 * @brief Dummy command.
 */
struct Nop {
    bool operator==(const Nop&) const = default;
};

/**
 * @brief Write a value to an address.
 *
 * The ROM may enforce valid address ranges; nothing is checked here.
 */
struct Write {
    Width width = Width::B4;
    WriteOp op = WriteOp::Write;
    std::uint32_t address = 0;
    std::uint32_t value = 0;

    bool operator==(const Write&) const = default;
};

/**
 * @brief Poll an address until the value matches a bitmask condition.
 *
 * Poll count:
 * - empty: poll indefinitely
 * - 0: equivalent to Nop, but still encoded as a full Check record
 * - n > 0: poll at most n times; on timeout the ROM abandons the rest
 *   of the DCD
 */
struct Check {
    Width width = Width::B4;
    CheckCond cond = CheckCond::AllClear;
    std::uint32_t address = 0;
    std::uint32_t mask = 0;
    std::optional<std::uint32_t> count;

    bool operator==(const Check&) const = default;
};

/// A DCD command. Default-constructed commands are Nop.
using Command = std::variant<Nop, Write, Check>;

/**
 * @brief Flag byte of a Write record.
 */
[[nodiscard]] constexpr std::uint8_t flags(const Write& write) noexcept {
    return static_cast<std::uint8_t>(static_cast<std::uint8_t>(write.width) |
                                     static_cast<std::uint8_t>(write.op));
}

/**
 * @brief Flag byte of a Check record.
 */
[[nodiscard]] constexpr std::uint8_t flags(const Check& check) noexcept {
    return static_cast<std::uint8_t>(static_cast<std::uint8_t>(check.width) |
                                     static_cast<std::uint8_t>(check.cond));
}

/**
 * @brief Number of bytes accessed for a width.
 */
[[nodiscard]] constexpr std::size_t width_bytes(Width width) noexcept {
    return static_cast<std::size_t>(width);
}

/**
 * @brief Width for a byte count.
 *
 * @param bytes 1, 2 or 4
 * @param[out] width Resulting width
 * @return Error::Ok on success, Error::InvalidArg otherwise
 */
Error width_from_bytes(std::size_t bytes, Width& width) noexcept;

/**
 * @defgroup flag_decode Flag Byte Decoding
 *
 * Validating inverses of flags(). Each returns Error::InvalidData when
 * the relevant bits hold no valid tag.
 * @{
 */
Error width_from_flags(std::uint8_t flag_byte, Width& width) noexcept;
Error write_op_from_flags(std::uint8_t flag_byte, WriteOp& op) noexcept;
Error check_cond_from_flags(std::uint8_t flag_byte, CheckCond& cond) noexcept;
/** @} */

const char* to_string(Width width) noexcept;
const char* to_string(WriteOp op) noexcept;
const char* to_string(CheckCond cond) noexcept;

/**
 * @defgroup builders Command Builders
 *
 * Build commands from resolved register values. A register value is
 * assembled by OR-ing field_value() terms or whole-field masks.
 * @{
 */

/**
 * @brief Place a raw field value at its offset, clipped to the field.
 *
 * @param raw Field value (right-justified)
 * @param offset Bit offset of the field within the register
 * @param mask Field mask, already shifted to the field position
 */
[[nodiscard]] constexpr std::uint32_t field_value(std::uint32_t raw, unsigned offset,
                                                  std::uint32_t mask) noexcept {
    return offset < 32U ? ((raw << offset) & mask) : 0U;
}

/// `register = value`
[[nodiscard]] constexpr Command write_reg(Width width, std::uint32_t address,
                                          std::uint32_t value) noexcept {
    return Write{width, WriteOp::Write, address, value};
}

/// `register |= value`
[[nodiscard]] constexpr Command set_reg(Width width, std::uint32_t address,
                                        std::uint32_t value) noexcept {
    return Write{width, WriteOp::Set, address, value};
}

/// `register &= ~value`
[[nodiscard]] constexpr Command clear_reg(Width width, std::uint32_t address,
                                          std::uint32_t value) noexcept {
    return Write{width, WriteOp::Clear, address, value};
}

/// Poll indefinitely until `(register & mask) == 0`
[[nodiscard]] constexpr Command check_all_clear(Width width, std::uint32_t address,
                                                std::uint32_t mask) noexcept {
    return Check{width, CheckCond::AllClear, address, mask, std::nullopt};
}

/// Poll indefinitely until `(register & mask) != mask`
[[nodiscard]] constexpr Command check_any_clear(Width width, std::uint32_t address,
                                                std::uint32_t mask) noexcept {
    return Check{width, CheckCond::AnyClear, address, mask, std::nullopt};
}

/// Poll indefinitely until `(register & mask) == mask`
[[nodiscard]] constexpr Command check_all_set(Width width, std::uint32_t address,
                                              std::uint32_t mask) noexcept {
    return Check{width, CheckCond::AllSet, address, mask, std::nullopt};
}

/// Poll indefinitely until `(register & mask) != 0`
[[nodiscard]] constexpr Command check_any_set(Width width, std::uint32_t address,
                                              std::uint32_t mask) noexcept {
    return Check{width, CheckCond::AnySet, address, mask, std::nullopt};
}

/** @} */

} // namespace dcdgen

#endif // DCDGEN_COMMAND_HPP
