/**
 * @file command.cpp
 * @brief Width/op/condition conversions.
 */

#include <dcdgen/command.hpp>

namespace dcdgen {

Error width_from_bytes(std::size_t bytes, Width& width) noexcept {
    switch (bytes) {
    case 1:
        width = Width::B1;
        return Error::Ok;
    case 2:
        width = Width::B2;
        return Error::Ok;
    case 4:
        width = Width::B4;
        return Error::Ok;
    default:
        return Error::InvalidArg;
    }
}

Error width_from_flags(std::uint8_t flag_byte, Width& width) noexcept {
    // Exactly one width bit must be set
    switch (flag_byte & WIDTH_FLAG_MASK) {
    case 0b001U:
        width = Width::B1;
        return Error::Ok;
    case 0b010U:
        width = Width::B2;
        return Error::Ok;
    case 0b100U:
        width = Width::B4;
        return Error::Ok;
    default:
        return Error::InvalidData;
    }
}

Error write_op_from_flags(std::uint8_t flag_byte, WriteOp& op) noexcept {
    switch (flag_byte & OP_FLAG_MASK) {
    case 0b00'000U:
        op = WriteOp::Write;
        return Error::Ok;
    case 0b01'000U:
        op = WriteOp::Clear;
        return Error::Ok;
    case 0b11'000U:
        op = WriteOp::Set;
        return Error::Ok;
    default:
        // 0b10 has no write operation
        return Error::InvalidData;
    }
}

Error check_cond_from_flags(std::uint8_t flag_byte, CheckCond& cond) noexcept {
    // All four 2-bit values are conditions
    cond = static_cast<CheckCond>(flag_byte & OP_FLAG_MASK);
    return Error::Ok;
}

const char* to_string(Width width) noexcept {
    switch (width) {
    case Width::B1:
        return "1";
    case Width::B2:
        return "2";
    case Width::B4:
        return "4";
    default:
        return "?";
    }
}

const char* to_string(WriteOp op) noexcept {
    switch (op) {
    case WriteOp::Write:
        return "write";
    case WriteOp::Clear:
        return "clear";
    case WriteOp::Set:
        return "set";
    default:
        return "?";
    }
}

const char* to_string(CheckCond cond) noexcept {
    switch (cond) {
    case CheckCond::AllClear:
        return "all_clear";
    case CheckCond::AnyClear:
        return "any_clear";
    case CheckCond::AllSet:
        return "all_set";
    case CheckCond::AnySet:
        return "any_set";
    default:
        return "?";
    }
}

} // namespace dcdgen
