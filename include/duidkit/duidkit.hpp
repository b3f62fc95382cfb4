/**
 * @file duidkit.hpp
 * @brief High-level duidkit API.
 *
 * Provides decode_hex() for turning user-supplied hex text straight
 * into a DUID, suitable for command-line tools.
 */

#ifndef DUIDKIT_HPP
#define DUIDKIT_HPP

#include <string_view>
#include <vector>

#include "bytebuffer.hpp"
#include "bytereader.hpp"
#include "config.hpp"
#include "duid.hpp"
#include "error.hpp"
#include "hex.hpp"
#include "hwtype.hpp"

namespace duidkit {

/**
 * @brief Decode hex text as a DUID.
 *
 * @param text Hex string, colons allowed anywhere
 * @param[out] out Decoded DUID
 * @return Error::Ok, Error::InvalidHexEncoding or Error::MalformedDuid
 */
inline Error decode_hex(std::string_view text, Duid& out) {
    std::vector<std::uint8_t> bytes;
    auto result = hex_decode(text, bytes);
    if (result != Error::Ok) {
        return result;
    }
    return parse_duid(bytes.data(), bytes.size(), out);
}

#if !DUIDKIT_NO_EXCEPTIONS
/**
 * @brief Decode hex text as a DUID.
 * @throws InvalidHexException or MalformedDuidException
 */
inline Duid decode_hex(std::string_view text) {
    return parse_duid(hex_decode(text));
}
#endif

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace duidkit

#endif // DUIDKIT_HPP
