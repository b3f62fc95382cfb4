/**
 * @file hwtype.hpp
 * @brief IANA ARP hardware type names.
 *
 * @see https://www.iana.org/assignments/arp-parameters IANA Hardware Types
 */

#ifndef DUIDKIT_HWTYPE_HPP
#define DUIDKIT_HWTYPE_HPP

#include "config.hpp"

namespace duidkit {

/**
 * @brief Name of an IANA hardware type.
 *
 * @param hw_type Hardware type code as carried in DUID-LLT and DUID-LL
 * @return Registered name, or "Unknown" for unassigned codes
 */
const char* hardware_type_name(std::uint16_t hw_type) noexcept;

} // namespace duidkit

#endif // DUIDKIT_HWTYPE_HPP
