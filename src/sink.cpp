/**
 * @file sink.cpp
 * @brief Heap and stream sinks.
 */

#include <dcdgen/sink.hpp>

#include <new>
#include <ostream>

namespace dcdgen {

Error VectorSink::write(const std::uint8_t* data, std::size_t size) noexcept {
    if (size == 0) {
        return Error::Ok;
    }
    if (data == nullptr) {
        return Error::InvalidArg;
    }
#if !DCDGEN_NO_EXCEPTIONS
    try {
        bytes_.insert(bytes_.end(), data, data + size);
    } catch (const std::bad_alloc&) {
        return Error::SinkFailure;
    }
#else
    bytes_.insert(bytes_.end(), data, data + size);
#endif
    return Error::Ok;
}

Error StreamSink::write(const std::uint8_t* data, std::size_t size) noexcept {
    if (size == 0) {
        return Error::Ok;
    }
    if (data == nullptr) {
        return Error::InvalidArg;
    }
#if !DCDGEN_NO_EXCEPTIONS
    try {
        stream_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    } catch (const std::ios_base::failure&) {
        return Error::SinkFailure;
    }
#else
    stream_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
#endif
    return stream_.good() ? Error::Ok : Error::SinkFailure;
}

} // namespace dcdgen
