/**
 * @file script.cpp
 * @brief Text command script parsing and formatting.
 */

#include <dcdgen/script.hpp>

#include <cerrno>
#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace dcdgen {

namespace {

constexpr std::size_t MAX_TOKENS = 6;

/**
 * @brief Split a line into whitespace-separated tokens, dropping comments.
 *
 * @return Number of tokens, or MAX_TOKENS + 1 if there are too many
 */
std::size_t tokenize(const std::string& line, std::string (&tokens)[MAX_TOKENS]) {
    std::size_t end = line.find('#');
    if (end == std::string::npos) {
        end = line.size();
    }

    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < end) {
        pos = line.find_first_not_of(" \t\r", pos);
        if (pos == std::string::npos || pos >= end) {
            break;
        }
        std::size_t stop = line.find_first_of(" \t\r#", pos);
        if (stop == std::string::npos || stop > end) {
            stop = end;
        }
        if (count == MAX_TOKENS) {
            return MAX_TOKENS + 1;
        }
        tokens[count++] = line.substr(pos, stop - pos);
        pos = stop;
    }
    return count;
}

bool parse_u32(const std::string& token, std::uint32_t& value) {
    if (token.empty() || token[0] == '-' || token[0] == '+') {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long parsed = std::strtoull(token.c_str(), &end, 0);
    if (errno != 0 || end == nullptr || *end != '\0' || parsed > 0xFFFFFFFFULL) {
        return false;
    }
    value = static_cast<std::uint32_t>(parsed);
    return true;
}

bool parse_width(const std::string& token, Width& width) {
    std::uint32_t bytes = 0;
    return parse_u32(token, bytes) && width_from_bytes(bytes, width) == Error::Ok;
}

bool parse_cond(const std::string& token, CheckCond& cond) {
    for (CheckCond candidate : {CheckCond::AllClear, CheckCond::AnyClear, CheckCond::AllSet,
                                CheckCond::AnySet}) {
        if (token == to_string(candidate)) {
            cond = candidate;
            return true;
        }
    }
    return false;
}

bool parse_op(const std::string& token, WriteOp& op) {
    for (WriteOp candidate : {WriteOp::Write, WriteOp::Clear, WriteOp::Set}) {
        if (token == to_string(candidate)) {
            op = candidate;
            return true;
        }
    }
    return false;
}

bool parse_line(const std::string (&tokens)[MAX_TOKENS], std::size_t count, Command& command) {
    const std::string& keyword = tokens[0];

    if (keyword == "nop") {
        command = Nop{};
        return count == 1;
    }

    WriteOp op = WriteOp::Write;
    if (parse_op(keyword, op)) {
        Write write;
        write.op = op;
        if (count != 4 || !parse_width(tokens[1], write.width) ||
            !parse_u32(tokens[2], write.address) || !parse_u32(tokens[3], write.value)) {
            return false;
        }
        command = write;
        return true;
    }

    if (keyword == "check") {
        Check check;
        if ((count != 5 && count != 6) || !parse_cond(tokens[1], check.cond) ||
            !parse_width(tokens[2], check.width) || !parse_u32(tokens[3], check.address) ||
            !parse_u32(tokens[4], check.mask)) {
            return false;
        }
        if (count == 6) {
            std::uint32_t poll_count = 0;
            if (!parse_u32(tokens[5], poll_count)) {
                return false;
            }
            check.count = poll_count;
        }
        command = check;
        return true;
    }

    return false;
}

} // namespace

Error parse_script(const std::string& text, std::vector<Command>& commands,
                   std::size_t& error_line) {
    commands.clear();
    error_line = 0;

    std::size_t line_number = 0;
    std::size_t pos = 0;
    while (pos <= text.size()) {
        std::size_t newline = text.find('\n', pos);
        if (newline == std::string::npos) {
            newline = text.size();
        }
        ++line_number;

        std::string tokens[MAX_TOKENS];
        std::size_t count = tokenize(text.substr(pos, newline - pos), tokens);
        if (count > 0) {
            Command command;
            if (count > MAX_TOKENS || !parse_line(tokens, count, command)) {
                commands.clear();
                error_line = line_number;
                return Error::InvalidData;
            }
            commands.push_back(command);
        }

        pos = newline + 1;
    }

    return Error::Ok;
}

std::string format_command(const Command& command) {
    char line[96];

    if (const auto* write = std::get_if<Write>(&command)) {
        std::snprintf(line, sizeof(line), "%-5s %s 0x%08" PRIX32 " 0x%08" PRIX32,
                      to_string(write->op), to_string(write->width), write->address,
                      write->value);
    } else if (const auto* check = std::get_if<Check>(&command)) {
        int n = std::snprintf(line, sizeof(line), "check %s %s 0x%08" PRIX32 " 0x%08" PRIX32,
                              to_string(check->cond), to_string(check->width), check->address,
                              check->mask);
        if (check->count.has_value() && n > 0) {
            std::snprintf(line + n, sizeof(line) - static_cast<std::size_t>(n), " %" PRIu32,
                          *check->count);
        }
    } else {
        std::strcpy(line, "nop");
    }

    return line;
}

} // namespace dcdgen
