/**
 * @file bytebuffer.hpp
 * @brief Fixed-capacity byte buffer for DUID encoding.
 */

#ifndef DUIDKIT_BYTEBUFFER_HPP
#define DUIDKIT_BYTEBUFFER_HPP

#include "config.hpp"
#include "error.hpp"
#include <array>
#include <cstring>

namespace duidkit {

/**
 * @brief Append-only byte buffer with static allocation.
 *
 * @tparam MaxBytes Maximum output size in bytes
 *
 * Multi-byte integers are appended in network byte order. An append
 * that does not fit leaves the buffer unchanged.
 */
template <std::size_t MaxBytes = MAX_DUID_BYTES>
class ByteBuffer {
public:
    /**
     * @brief Default constructor - initializes to empty state.
     */
    constexpr ByteBuffer() noexcept : data_{}, size_(0) {}

    /**
     * @brief Get number of bytes in buffer.
     */
    [[nodiscard]] std::size_t size() const noexcept { return size_; }

    /**
     * @brief Append a 16-bit value, most significant byte first.
     *
     * @param value Value to append
     * @return Error::Ok on success, Error::Overflow if it does not fit
     */
    Error append_u16(std::uint16_t value) noexcept {
        if (size_ + 2 > MaxBytes) {
            return Error::Overflow;
        }
        data_[size_++] = static_cast<std::uint8_t>(value >> 8);
        data_[size_++] = static_cast<std::uint8_t>(value);
        return Error::Ok;
    }

    /**
     * @brief Append a 32-bit value, most significant byte first.
     *
     * @param value Value to append
     * @return Error::Ok on success, Error::Overflow if it does not fit
     */
    Error append_u32(std::uint32_t value) noexcept {
        if (size_ + 4 > MaxBytes) {
            return Error::Overflow;
        }
        for (int shift = 24; shift >= 0; shift -= 8) {
            data_[size_++] = static_cast<std::uint8_t>(value >> shift);
        }
        return Error::Ok;
    }

    /**
     * @brief Append raw bytes.
     *
     * @param bytes Source bytes
     * @param count Number of bytes to append
     * @return Error::Ok on success, Error::Overflow if they do not fit
     */
    Error append_bytes(const std::uint8_t* bytes, std::size_t count) noexcept {
        if (count > MaxBytes - size_) {
            return Error::Overflow;
        }
        if (count > 0) {
            std::memcpy(&data_[size_], bytes, count);
        }
        size_ += count;
        return Error::Ok;
    }

    /**
     * @brief Copy buffer contents to a byte array.
     *
     * @param bytes Destination byte array
     * @param max_bytes Maximum bytes to write
     * @return Number of bytes written
     */
    std::size_t to_bytes(std::uint8_t* bytes, std::size_t max_bytes) const noexcept {
        std::size_t num_bytes = (size_ > max_bytes) ? max_bytes : size_;
        if (num_bytes > 0) {
            std::memcpy(bytes, data_.data(), num_bytes);
        }
        return num_bytes;
    }

private:
    std::array<std::uint8_t, MaxBytes> data_;
    std::size_t size_;
};

} // namespace duidkit

#endif // DUIDKIT_BYTEBUFFER_HPP
