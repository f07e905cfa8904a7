/**
 * @file sink.hpp
 * @brief Byte sinks for encoded blocks.
 *
 * The encoder writes sequentially to a Sink and stops at the first
 * failed write, returning the sink's error unchanged. A failure can
 * therefore leave a partial block behind; write to a VectorSink or
 * BufferSink first when the destination must be updated atomically.
 */

#ifndef DCDGEN_SINK_HPP
#define DCDGEN_SINK_HPP

#include "config.hpp"
#include "error.hpp"

#include <array>
#include <cstring>
#include <iosfwd>
#include <vector>

namespace dcdgen {

/**
 * @brief Sequential byte output.
 */
class Sink {
public:
    virtual ~Sink() = default;

    /**
     * @brief Write all `size` bytes.
     *
     * @param data Source bytes (may be null when size is 0)
     * @param size Number of bytes
     * @return Error::Ok on success, any other code aborts encoding
     */
    virtual Error write(const std::uint8_t* data, std::size_t size) noexcept = 0;
};

/**
 * @brief Sink appending to an owned byte vector.
 */
class VectorSink : public Sink {
public:
    Error write(const std::uint8_t* data, std::size_t size) noexcept override;

    [[nodiscard]] const std::vector<std::uint8_t>& bytes() const noexcept { return bytes_; }

    /**
     * @brief Move the collected bytes out, leaving the sink empty.
     */
    std::vector<std::uint8_t> take() noexcept {
        std::vector<std::uint8_t> out;
        out.swap(bytes_);
        return out;
    }

private:
    std::vector<std::uint8_t> bytes_;
};

/**
 * @brief Sink with static allocation.
 *
 * @tparam MaxBytes Capacity in bytes
 *
 * A write that does not fit is rejected whole with Error::SinkFailure.
 * Suitable for embedded builds without heap.
 */
template <std::size_t MaxBytes>
class BufferSink : public Sink {
public:
    constexpr BufferSink() noexcept : data_{}, size_(0) {}

    Error write(const std::uint8_t* data, std::size_t size) noexcept override {
        if (size == 0) {
            return Error::Ok;
        }
        if (data == nullptr) {
            return Error::InvalidArg;
        }
        if (size > MaxBytes - size_) {
            return Error::SinkFailure;
        }
        std::memcpy(&data_[size_], data, size);
        size_ += size;
        return Error::Ok;
    }

    void clear() noexcept { size_ = 0; }

    [[nodiscard]] const std::uint8_t* data() const noexcept { return data_.data(); }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] static constexpr std::size_t capacity() noexcept { return MaxBytes; }

private:
    std::array<std::uint8_t, MaxBytes> data_;
    std::size_t size_;
};

/**
 * @brief Sink forwarding to a std::ostream (e.g. std::ofstream).
 *
 * Reports Error::SinkFailure once the stream enters a failed state.
 */
class StreamSink : public Sink {
public:
    explicit StreamSink(std::ostream& stream) noexcept : stream_(stream) {}

    Error write(const std::uint8_t* data, std::size_t size) noexcept override;

private:
    std::ostream& stream_;
};

} // namespace dcdgen

#endif // DCDGEN_SINK_HPP
