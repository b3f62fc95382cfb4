/**
 * @file duid.hpp
 * @brief DHCP Unique Identifier types, decoding and encoding.
 *
 * Implements RFC 8415 Section 11:
 * - DUID-LLT  (type 1) - Section 11.2, link-layer address plus time
 * - DUID-EN   (type 2) - Section 11.3, enterprise number
 * - DUID-LL   (type 3) - Section 11.4, link-layer address
 * - DUID-UUID (type 4) - Section 11.5, RFC 6355 UUID
 *
 * Any other type code is kept verbatim as DuidUnknown.
 *
 * @see https://www.rfc-editor.org/rfc/rfc8415#section-11 RFC 8415 Section 11
 */

#ifndef DUIDKIT_DUID_HPP
#define DUIDKIT_DUID_HPP

#include "config.hpp"
#include "error.hpp"

#include <array>
#include <string>
#include <variant>
#include <vector>

namespace duidkit {

/**
 * @brief Registered DUID type codes.
 */
enum class DuidType : std::uint16_t {
    LLT = 1,
    EN = 2,
    LL = 3,
    UUID = 4
};

/**
 * @brief DUID-LLT: hardware type, time and link-layer address.
 */
struct DuidLlt {
    std::uint16_t hw_type = 0;
    std::uint32_t time = 0; ///< Seconds since 2000-01-01T00:00:00Z
    std::vector<std::uint8_t> link_layer_address;

    bool operator==(const DuidLlt&) const = default;
};

/**
 * @brief DUID-EN: IANA enterprise number and vendor identifier.
 */
struct DuidEn {
    std::uint32_t enterprise_number = 0;
    std::vector<std::uint8_t> identifier;

    bool operator==(const DuidEn&) const = default;
};

/**
 * @brief DUID-LL: hardware type and link-layer address.
 */
struct DuidLl {
    std::uint16_t hw_type = 0;
    std::vector<std::uint8_t> link_layer_address;

    bool operator==(const DuidLl&) const = default;
};

/**
 * @brief DUID-UUID: 128-bit UUID in wire order.
 */
struct DuidUuid {
    std::array<std::uint8_t, UUID_BYTES> uuid{};

    bool operator==(const DuidUuid&) const = default;
};

/**
 * @brief DUID with an unregistered type code; payload kept verbatim.
 */
struct DuidUnknown {
    std::uint16_t type = 0;
    std::vector<std::uint8_t> data; ///< Bytes following the type field

    bool operator==(const DuidUnknown&) const = default;
};

using Duid = std::variant<DuidLlt, DuidEn, DuidLl, DuidUuid, DuidUnknown>;

/**
 * @brief Decode a DUID from wire bytes.
 *
 * The first two bytes select the variant. Fails when the input is
 * empty, longer than MAX_DUID_BYTES, shorter than the type field, or
 * shorter than the fixed fields of its declared type. A DUID-UUID must
 * be exactly DUID_UUID_BYTES long. Unknown types accept any payload
 * length within the overall bound.
 *
 * @param data Input bytes
 * @param size Input size in bytes
 * @param[out] out Decoded DUID (untouched on error)
 * @return Error::Ok on success, Error::MalformedDuid otherwise
 */
Error parse_duid(const std::uint8_t* data, std::size_t size, Duid& out);

/**
 * @brief Decode a DUID, also naming the defect on failure.
 *
 * @param[out] reason Static description of the defect, e.g.
 *             "DUID-UUID must be exactly 18 bytes long"
 */
Error parse_duid(const std::uint8_t* data, std::size_t size, Duid& out, const char*& reason);

#if !DUIDKIT_NO_EXCEPTIONS
/**
 * @brief Decode a DUID from wire bytes.
 * @throws MalformedDuidException with a description of the defect
 */
Duid parse_duid(const std::vector<std::uint8_t>& bytes);
#endif

/**
 * @brief Encode a DUID to wire bytes.
 *
 * @param duid DUID to encode
 * @param[out] out Encoded bytes (replaced, untouched on error)
 * @return Error::Ok on success, Error::Overflow if longer than MAX_DUID_BYTES
 */
Error encode_duid(const Duid& duid, std::vector<std::uint8_t>& out);

/**
 * @brief Type discriminator carried by a DUID.
 */
std::uint16_t duid_type_code(const Duid& duid) noexcept;

/**
 * @brief Short type name: "DUID-LLT", "DUID-EN", "DUID-LL", "DUID-UUID" or "Unknown".
 */
const char* duid_type_name(std::uint16_t type) noexcept;

/**
 * @brief Long type name as worded in RFC 8415, "Unknown" if unregistered.
 */
const char* duid_type_description(std::uint16_t type) noexcept;

/**
 * @brief Canonical one-line form of a DUID.
 *
 * e.g. "DUID-LLT{HWType=Ethernet HWAddr=aa:bb:cc:dd:ee:ff Time=742215263}"
 */
std::string to_string(const Duid& duid);

/**
 * @brief Multi-line, field-by-field explanation of a DUID.
 *
 * Each line ends with '\n'.
 */
std::string describe(const Duid& duid);

/**
 * @brief ISO-8601 UTC form of a DUID-LLT time value.
 *
 * @param seconds Seconds since 2000-01-01T00:00:00Z
 * @return e.g. "2023-07-09T10:54:23+00:00", or an empty string when the
 *         date does not fit in std::time_t
 */
std::string format_duid_time(std::uint32_t seconds);

/**
 * @brief 8-4-4-4-12 lowercase form of a UUID.
 */
std::string format_uuid(const std::array<std::uint8_t, UUID_BYTES>& uuid);

} // namespace duidkit

#endif // DUIDKIT_DUID_HPP
