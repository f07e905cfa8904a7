/**
 * @file encoder.cpp
 * @brief DCD block encoder.
 */

#include <dcdgen/encoder.hpp>
#include <dcdgen/record.hpp>

namespace dcdgen {

namespace {

std::size_t runs_length(const std::vector<Run>& runs) noexcept {
    std::size_t length = HEADER_SIZE;
    for (const auto& run : runs) {
        length += run.length;
    }
    return length;
}

/**
 * @brief Sink front end that tallies accepted bytes.
 */
class CountingWriter {
public:
    CountingWriter(Sink& sink, std::size_t& written) noexcept : sink_(sink), written_(written) {}

    template <std::size_t N>
    Error put(const std::array<std::uint8_t, N>& bytes, std::size_t size = N) noexcept {
        auto result = sink_.write(bytes.data(), size);
        if (result == Error::Ok) {
            written_ += size;
        }
        return result;
    }

private:
    Sink& sink_;
    std::size_t& written_;
};

Error emit_write_run(CountingWriter& out, const Command* commands, const Run& run) noexcept {
    const auto& first = std::get<Write>(commands[run.first]);
    auto result = out.put(write_record_header(first, run.size));
    if (result != Error::Ok) {
        return result;
    }

    for (std::size_t i = run.first; i < run.first + run.size; ++i) {
        result = out.put(write_entry(std::get<Write>(commands[i])));
        if (result != Error::Ok) {
            return result;
        }
    }
    return Error::Ok;
}

Error emit_check(CountingWriter& out, const Check& check) noexcept {
    auto result = out.put(check_record_header(check));
    if (result != Error::Ok) {
        return result;
    }
    CheckPayload payload = check_payload(check);
    return out.put(payload.bytes, payload.size);
}

} // namespace

Error block_length(const Command* commands, std::size_t count, std::size_t& length) {
    length = 0;
    if (count == 0) {
        return Error::Ok;
    }
    if (commands == nullptr) {
        return Error::InvalidArg;
    }

    std::vector<Run> runs;
    partition_runs(commands, count, runs);
    length = runs_length(runs);

    return (length > MAX_BLOCK_LENGTH) ? Error::OversizedBlock : Error::Ok;
}

Error encode(Sink& sink, const Command* commands, std::size_t count, std::size_t& written) {
    written = 0;
    if (count == 0) {
        return Error::Ok;
    }
    if (commands == nullptr) {
        return Error::InvalidArg;
    }

    // Runs are computed once and reused for sizing and emission
    std::vector<Run> runs;
    partition_runs(commands, count, runs);

    std::size_t length = runs_length(runs);
    if (length > MAX_BLOCK_LENGTH) {
        return Error::OversizedBlock;
    }

    CountingWriter out(sink, written);
    auto result = out.put(block_header(static_cast<std::uint16_t>(length)));
    if (result != Error::Ok) {
        return result;
    }

    for (const auto& run : runs) {
        switch (run.kind) {
        case RunKind::Nop:
            result = out.put(nop_record());
            break;
        case RunKind::Check:
            result = emit_check(out, std::get<Check>(commands[run.first]));
            break;
        case RunKind::Write:
            result = emit_write_run(out, commands, run);
            break;
        }
        if (result != Error::Ok) {
            return result;
        }
    }

    return Error::Ok;
}

#if !DCDGEN_NO_EXCEPTIONS

std::vector<std::uint8_t> encode(const std::vector<Command>& commands) {
    VectorSink sink;
    std::size_t written = 0;
    throw_if_error(encode(sink, commands, written), "DCD encoding failed");
    return sink.take();
}

#endif // !DCDGEN_NO_EXCEPTIONS

} // namespace dcdgen
