/**
 * @file decoder.cpp
 * @brief DCD block parser.
 */

#include <dcdgen/decoder.hpp>
#include <dcdgen/record.hpp>

namespace dcdgen {

namespace {

/// Bits above the op/cond tag are reserved
constexpr std::uint8_t RESERVED_FLAG_MASK = 0b1110'0000U;

Error decode_nop(const std::uint8_t* record, std::size_t length,
                 std::vector<Command>& commands) {
    if (length != HEADER_SIZE || record[3] != 0x00U) {
        return Error::InvalidData;
    }
    commands.emplace_back(Nop{});
    return Error::Ok;
}

Error decode_write(const std::uint8_t* record, std::size_t length,
                   std::vector<Command>& commands) {
    if (length < write_record_length(1) || ((length - HEADER_SIZE) % WRITE_ENTRY_SIZE) != 0) {
        return Error::InvalidData;
    }
    std::uint8_t flag_byte = record[3];
    if ((flag_byte & RESERVED_FLAG_MASK) != 0) {
        return Error::InvalidData;
    }

    Write write;
    auto result = width_from_flags(flag_byte, write.width);
    if (result != Error::Ok) {
        return result;
    }
    result = write_op_from_flags(flag_byte, write.op);
    if (result != Error::Ok) {
        return result;
    }

    for (std::size_t pos = HEADER_SIZE; pos < length; pos += WRITE_ENTRY_SIZE) {
        write.address = load_be32(&record[pos]);
        write.value = load_be32(&record[pos + 4]);
        commands.emplace_back(write);
    }
    return Error::Ok;
}

Error decode_check(const std::uint8_t* record, std::size_t length,
                   std::vector<Command>& commands) {
    constexpr std::size_t without_count = HEADER_SIZE + CHECK_PAYLOAD_SIZE;
    constexpr std::size_t with_count = without_count + CHECK_COUNT_SIZE;
    if (length != without_count && length != with_count) {
        return Error::InvalidData;
    }
    std::uint8_t flag_byte = record[3];
    if ((flag_byte & RESERVED_FLAG_MASK) != 0) {
        return Error::InvalidData;
    }

    Check check;
    auto result = width_from_flags(flag_byte, check.width);
    if (result != Error::Ok) {
        return result;
    }
    result = check_cond_from_flags(flag_byte, check.cond);
    if (result != Error::Ok) {
        return result;
    }

    check.address = load_be32(&record[4]);
    check.mask = load_be32(&record[8]);
    if (length == with_count) {
        check.count = load_be32(&record[12]);
    }
    commands.emplace_back(check);
    return Error::Ok;
}

} // namespace

Error decode(const std::uint8_t* data, std::size_t size, std::vector<Command>& commands) {
    commands.clear();
    if (size == 0) {
        return Error::Ok;
    }
    if (data == nullptr) {
        return Error::InvalidArg;
    }

    // Block header
    if (size < HEADER_SIZE || data[0] != BLOCK_TAG || data[3] != BLOCK_VERSION) {
        return Error::InvalidData;
    }
    if (load_be16(&data[1]) != size) {
        return Error::InvalidData;
    }

    std::size_t pos = HEADER_SIZE;
    while (pos < size) {
        if (size - pos < HEADER_SIZE) {
            return Error::InvalidData;
        }
        const std::uint8_t* record = &data[pos];
        std::size_t length = load_be16(&record[1]);
        if (length < HEADER_SIZE || length > size - pos) {
            return Error::InvalidData;
        }

        Error result;
        switch (record[0]) {
        case NOP_TAG:
            result = decode_nop(record, length, commands);
            break;
        case WRITE_TAG:
            result = decode_write(record, length, commands);
            break;
        case CHECK_TAG:
            result = decode_check(record, length, commands);
            break;
        default:
            result = Error::InvalidData;
            break;
        }
        if (result != Error::Ok) {
            commands.clear();
            return result;
        }

        pos += length;
    }

    return Error::Ok;
}

} // namespace dcdgen
