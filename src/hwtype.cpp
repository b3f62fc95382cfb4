/**
 * @file hwtype.cpp
 * @brief IANA hardware type table.
 */

#include <duidkit/hwtype.hpp>

#include <cstddef>

namespace duidkit {

namespace {

// Indexed by hardware type code, 0 is reserved
constexpr const char* HARDWARE_TYPE_NAMES[] = {
    "Unknown",
    "Ethernet",
    "Experimental Ethernet",
    "Amateur Radio AX.25",
    "Proteon ProNET Token Ring",
    "Chaos",
    "IEEE 802 Networks",
    "ARCNET",
    "Hyperchannel",
    "Lanstar",
    "Autonet Short Address",
    "LocalTalk",
    "LocalNet",
    "Ultra link",
    "SMDS",
    "Frame Relay",
    "Asynchronous Transmission Mode (ATM)",
    "HDLC",
    "Fibre Channel",
    "Asynchronous Transmission Mode (ATM)",
    "Serial Line",
    "Asynchronous Transmission Mode (ATM)",
    "MIL-STD-188-220",
    "Metricom",
    "IEEE 1394.1995",
    "MAPOS",
    "Twinaxial",
    "EUI-64",
    "HIPARP",
    "IP and ARP over ISO 7816-3",
    "ARPSec",
    "IPsec tunnel",
    "InfiniBand",
    "TIA-102 Project 25 Common Air Interface",
    "Wiegand Interface",
    "Pure IP",
    "HW_EXP1",
    "HFI",
    "Unified Bus",
};

constexpr std::size_t HARDWARE_TYPE_COUNT =
    sizeof(HARDWARE_TYPE_NAMES) / sizeof(HARDWARE_TYPE_NAMES[0]);

} // namespace

const char* hardware_type_name(std::uint16_t hw_type) noexcept {
    if (hw_type < HARDWARE_TYPE_COUNT) {
        return HARDWARE_TYPE_NAMES[hw_type];
    }
    switch (hw_type) {
    case 256:
        return "HW_EXP2";
    case 257:
        return "AEthernet";
    default:
        return "Unknown";
    }
}

} // namespace duidkit
