/**
 * @file bytereader.hpp
 * @brief Sequential big-endian field reading from DUID bytes.
 *
 * The byte reader provides stateful, bounds-checked access to wire
 * data. Multi-byte integers are read in network byte order.
 */

#ifndef DUIDKIT_BYTEREADER_HPP
#define DUIDKIT_BYTEREADER_HPP

#include "config.hpp"
#include "error.hpp"

#include <cstring>

namespace duidkit {

/**
 * @brief Sequential reader over a byte buffer.
 *
 * Tracks position within the buffer. Reads past the end leave the
 * position untouched and report Error::Underflow.
 */
class ByteReader {
public:
    /**
     * @brief Construct a byte reader.
     *
     * @param data Pointer to source data buffer
     * @param size Number of valid bytes in buffer
     */
    ByteReader(const std::uint8_t* data, std::size_t size) noexcept
        : data_(data), size_(size), pos_(0) {}

    /**
     * @brief Read a 16-bit unsigned integer (big-endian).
     *
     * @param[out] value Value read
     * @return Error::Ok on success, Error::Underflow if fewer than 2 bytes remain
     */
    Error read_u16(std::uint16_t& value) noexcept {
        if (remaining() < 2) [[unlikely]] {
            return Error::Underflow;
        }
        value = static_cast<std::uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
        pos_ += 2;
        return Error::Ok;
    }

    /**
     * @brief Read a 32-bit unsigned integer (big-endian).
     *
     * @param[out] value Value read
     * @return Error::Ok on success, Error::Underflow if fewer than 4 bytes remain
     */
    Error read_u32(std::uint32_t& value) noexcept {
        if (remaining() < 4) [[unlikely]] {
            return Error::Underflow;
        }
        std::uint32_t result = 0;
        for (std::size_t i = 0; i < 4; ++i) {
            result = (result << 8) | data_[pos_ + i];
        }
        value = result;
        pos_ += 4;
        return Error::Ok;
    }

    /**
     * @brief Copy raw bytes out of the buffer.
     *
     * @param dest Destination (must hold count bytes)
     * @param count Number of bytes to copy
     * @return Error::Ok on success, Error::Underflow if not enough data
     */
    Error read_bytes(std::uint8_t* dest, std::size_t count) noexcept {
        if (remaining() < count) [[unlikely]] {
            return Error::Underflow;
        }
        if (count > 0) {
            std::memcpy(dest, &data_[pos_], count);
        }
        pos_ += count;
        return Error::Ok;
    }

    /**
     * @brief Pointer to the next unread byte.
     */
    [[nodiscard]] const std::uint8_t* current() const noexcept {
        return data_ + pos_;
    }

    /**
     * @brief Get remaining bytes.
     *
     * @return Number of bytes remaining to read
     */
    [[nodiscard]] std::size_t remaining() const noexcept {
        return (pos_ < size_) ? (size_ - pos_) : 0;
    }

private:
    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_;
};

} // namespace duidkit

#endif // DUIDKIT_BYTEREADER_HPP
