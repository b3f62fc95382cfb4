/**
 * @file hex.cpp
 * @brief Hex codec implementation.
 */

#include <duidkit/hex.hpp>

#include <utility>

namespace duidkit {

namespace {

int hex_nibble(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // namespace

Error hex_decode(std::string_view text, std::vector<std::uint8_t>& out) {
    std::vector<std::uint8_t> bytes;
    bytes.reserve(text.size() / 2);

    int high = -1;
    for (char c : text) {
        if (c == ':') {
            continue;
        }
        int nibble = hex_nibble(c);
        if (nibble < 0) {
            return Error::InvalidHexEncoding;
        }
        if (high < 0) {
            high = nibble;
        } else {
            bytes.push_back(static_cast<std::uint8_t>((high << 4) | nibble));
            high = -1;
        }
    }

    // Dangling nibble: odd digit count
    if (high >= 0) {
        return Error::InvalidHexEncoding;
    }

    out = std::move(bytes);
    return Error::Ok;
}

#if !DUIDKIT_NO_EXCEPTIONS
std::vector<std::uint8_t> hex_decode(std::string_view text) {
    std::vector<std::uint8_t> bytes;
    if (hex_decode(text, bytes) != Error::Ok) {
        throw InvalidHexException("Invalid hex string format provided: '" + std::string(text) +
                                  "'");
    }
    return bytes;
}
#endif

std::string hex_encode(const std::uint8_t* data, std::size_t size, char separator) {
    static constexpr char digits[] = "0123456789abcdef";

    std::string out;
    out.reserve(size * 3);
    for (std::size_t i = 0; i < size; ++i) {
        if (i > 0 && separator != '\0') {
            out.push_back(separator);
        }
        out.push_back(digits[(data[i] >> 4) & 0x0F]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

} // namespace duidkit
