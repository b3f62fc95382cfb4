/**
 * @file hex.hpp
 * @brief Hex text to bytes and back.
 */

#ifndef DUIDKIT_HEX_HPP
#define DUIDKIT_HEX_HPP

#include "config.hpp"
#include "error.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace duidkit {

/**
 * @brief Decode a hex string into bytes.
 *
 * Every ':' is stripped before decoding, wherever it appears. The
 * remaining text must have an even number of [0-9a-fA-F] characters.
 * An empty string decodes to zero bytes.
 *
 * @param text Hex text, e.g. "00:01:ab" or "0001ab"
 * @param[out] out Decoded bytes (replaced, untouched on error)
 * @return Error::Ok on success, Error::InvalidHexEncoding otherwise
 */
Error hex_decode(std::string_view text, std::vector<std::uint8_t>& out);

#if !DUIDKIT_NO_EXCEPTIONS
/**
 * @brief Decode a hex string into bytes.
 * @throws InvalidHexException on bad input
 */
std::vector<std::uint8_t> hex_decode(std::string_view text);
#endif

/**
 * @brief Encode bytes as lowercase hex.
 *
 * @param data Source bytes
 * @param size Number of bytes
 * @param separator Character placed between bytes, '\0' for none
 * @return Hex text
 */
std::string hex_encode(const std::uint8_t* data, std::size_t size, char separator = '\0');

inline std::string hex_encode(const std::vector<std::uint8_t>& bytes, char separator = '\0') {
    return hex_encode(bytes.data(), bytes.size(), separator);
}

} // namespace duidkit

#endif // DUIDKIT_HEX_HPP
