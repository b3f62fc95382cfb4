/**
 * @file config.hpp
 * @brief duidkit compile-time configuration.
 *
 * Protocol constants for DHCPv6 DUIDs (RFC 8415, Section 11) and
 * build-time switches.
 *
 * @see https://www.rfc-editor.org/rfc/rfc8415#section-11 RFC 8415 Section 11
 */

#ifndef DUIDKIT_CONFIG_HPP
#define DUIDKIT_CONFIG_HPP

#include <cstdint>
#include <cstddef>

namespace duidkit {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Maximum DUID length in bytes, type field included (RFC 8415: 2 + 128)
#ifndef DUIDKIT_MAX_DUID_BYTES
#define DUIDKIT_MAX_DUID_BYTES 130U
#endif

inline constexpr std::size_t MAX_DUID_BYTES = DUIDKIT_MAX_DUID_BYTES;

/// Size of the DUID type discriminator
inline constexpr std::size_t DUID_TYPE_BYTES = 2U;

/// Minimum total lengths per declared type
inline constexpr std::size_t DUID_LLT_MIN_BYTES = 8U; ///< type + hw type + time
inline constexpr std::size_t DUID_EN_MIN_BYTES = 6U;  ///< type + enterprise number
inline constexpr std::size_t DUID_LL_MIN_BYTES = 4U;  ///< type + hw type

inline constexpr std::size_t UUID_BYTES = 16U;
inline constexpr std::size_t DUID_UUID_BYTES = DUID_TYPE_BYTES + UUID_BYTES;

/// DUID-LLT time epoch (2000-01-01T00:00:00Z) as seconds after the Unix epoch
inline constexpr std::int64_t DUID_TIME_EPOCH = 946684800;

/// Hardware type that gets MAC-style address formatting
inline constexpr std::uint16_t HW_TYPE_ETHERNET = 1U;
inline constexpr std::size_t ETHERNET_ADDRESS_BYTES = 6U;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define DUIDKIT_NO_EXCEPTIONS=1 to build without exceptions.
 * @{
 */
#ifndef DUIDKIT_NO_EXCEPTIONS
#define DUIDKIT_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace duidkit

#endif // DUIDKIT_CONFIG_HPP
