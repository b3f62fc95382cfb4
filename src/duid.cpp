/**
 * @file duid.cpp
 * @brief DUID decoding, encoding and formatting.
 */

#include <duidkit/duid.hpp>

#include <duidkit/bytebuffer.hpp>
#include <duidkit/bytereader.hpp>
#include <duidkit/hex.hpp>
#include <duidkit/hwtype.hpp>

#include <cstdio>
#include <ctime>
#include <limits>
#include <utility>

namespace duidkit {

namespace {

/**
 * @brief Decode into out, reporting the first structural defect.
 *
 * @param[out] reason Static description of the defect on failure
 */
Error parse_fields(const std::uint8_t* data, std::size_t size, Duid& out, const char*& reason) {
    if (size == 0) {
        reason = "DUID is empty";
        return Error::MalformedDuid;
    }
    if (size > MAX_DUID_BYTES) {
        reason = "DUID exceeds the maximum length";
        return Error::MalformedDuid;
    }
    if (size < DUID_TYPE_BYTES) {
        reason = "DUID is too short for the type field";
        return Error::MalformedDuid;
    }

    ByteReader reader(data, size);
    std::uint16_t type = 0;
    if (reader.read_u16(type) != Error::Ok) {
        reason = "DUID is too short for the type field";
        return Error::MalformedDuid;
    }

    switch (type) {
    case static_cast<std::uint16_t>(DuidType::LLT): {
        DuidLlt llt;
        if (size < DUID_LLT_MIN_BYTES || reader.read_u16(llt.hw_type) != Error::Ok ||
            reader.read_u32(llt.time) != Error::Ok) {
            reason = "DUID-LLT is too short for fixed fields";
            return Error::MalformedDuid;
        }
        llt.link_layer_address.assign(reader.current(), reader.current() + reader.remaining());
        out = std::move(llt);
        return Error::Ok;
    }
    case static_cast<std::uint16_t>(DuidType::EN): {
        DuidEn en;
        if (size < DUID_EN_MIN_BYTES || reader.read_u32(en.enterprise_number) != Error::Ok) {
            reason = "DUID-EN is too short for fixed fields";
            return Error::MalformedDuid;
        }
        en.identifier.assign(reader.current(), reader.current() + reader.remaining());
        out = std::move(en);
        return Error::Ok;
    }
    case static_cast<std::uint16_t>(DuidType::LL): {
        DuidLl ll;
        if (size < DUID_LL_MIN_BYTES || reader.read_u16(ll.hw_type) != Error::Ok) {
            reason = "DUID-LL is too short for fixed fields";
            return Error::MalformedDuid;
        }
        ll.link_layer_address.assign(reader.current(), reader.current() + reader.remaining());
        out = std::move(ll);
        return Error::Ok;
    }
    case static_cast<std::uint16_t>(DuidType::UUID): {
        DuidUuid uuid;
        if (size != DUID_UUID_BYTES ||
            reader.read_bytes(uuid.uuid.data(), uuid.uuid.size()) != Error::Ok) {
            reason = "DUID-UUID must be exactly 18 bytes long";
            return Error::MalformedDuid;
        }
        out = uuid;
        return Error::Ok;
    }
    default: {
        DuidUnknown unknown;
        unknown.type = type;
        unknown.data.assign(reader.current(), reader.current() + reader.remaining());
        out = std::move(unknown);
        return Error::Ok;
    }
    }
}

struct TypeCodeVisitor {
    std::uint16_t operator()(const DuidLlt&) const noexcept {
        return static_cast<std::uint16_t>(DuidType::LLT);
    }
    std::uint16_t operator()(const DuidEn&) const noexcept {
        return static_cast<std::uint16_t>(DuidType::EN);
    }
    std::uint16_t operator()(const DuidLl&) const noexcept {
        return static_cast<std::uint16_t>(DuidType::LL);
    }
    std::uint16_t operator()(const DuidUuid&) const noexcept {
        return static_cast<std::uint16_t>(DuidType::UUID);
    }
    std::uint16_t operator()(const DuidUnknown& d) const noexcept {
        return d.type;
    }
};

struct EncodeVisitor {
    ByteBuffer<MAX_DUID_BYTES>& buf;

    Error operator()(const DuidLlt& d) const {
        auto result = buf.append_u16(static_cast<std::uint16_t>(DuidType::LLT));
        if (result == Error::Ok) {
            result = buf.append_u16(d.hw_type);
        }
        if (result == Error::Ok) {
            result = buf.append_u32(d.time);
        }
        if (result == Error::Ok) {
            result = buf.append_bytes(d.link_layer_address.data(), d.link_layer_address.size());
        }
        return result;
    }

    Error operator()(const DuidEn& d) const {
        auto result = buf.append_u16(static_cast<std::uint16_t>(DuidType::EN));
        if (result == Error::Ok) {
            result = buf.append_u32(d.enterprise_number);
        }
        if (result == Error::Ok) {
            result = buf.append_bytes(d.identifier.data(), d.identifier.size());
        }
        return result;
    }

    Error operator()(const DuidLl& d) const {
        auto result = buf.append_u16(static_cast<std::uint16_t>(DuidType::LL));
        if (result == Error::Ok) {
            result = buf.append_u16(d.hw_type);
        }
        if (result == Error::Ok) {
            result = buf.append_bytes(d.link_layer_address.data(), d.link_layer_address.size());
        }
        return result;
    }

    Error operator()(const DuidUuid& d) const {
        auto result = buf.append_u16(static_cast<std::uint16_t>(DuidType::UUID));
        if (result == Error::Ok) {
            result = buf.append_bytes(d.uuid.data(), d.uuid.size());
        }
        return result;
    }

    Error operator()(const DuidUnknown& d) const {
        auto result = buf.append_u16(d.type);
        if (result == Error::Ok) {
            result = buf.append_bytes(d.data.data(), d.data.size());
        }
        return result;
    }
};

struct StringVisitor {
    std::string operator()(const DuidLlt& d) const {
        return "DUID-LLT{HWType=" + std::string(hardware_type_name(d.hw_type)) +
               " HWAddr=" + hex_encode(d.link_layer_address, ':') +
               " Time=" + std::to_string(d.time) + "}";
    }
    std::string operator()(const DuidEn& d) const {
        return "DUID-EN{EnterpriseNumber=" + std::to_string(d.enterprise_number) +
               " EnterpriseIdentifier=" + hex_encode(d.identifier, ':') + "}";
    }
    std::string operator()(const DuidLl& d) const {
        return "DUID-LL{HWType=" + std::string(hardware_type_name(d.hw_type)) +
               " HWAddr=" + hex_encode(d.link_layer_address, ':') + "}";
    }
    std::string operator()(const DuidUuid& d) const {
        return "DUID-UUID{UUID=" + format_uuid(d.uuid) + "}";
    }
    std::string operator()(const DuidUnknown& d) const {
        return "DUID-Unknown{Type=" + std::to_string(d.type) +
               " Data=" + hex_encode(d.data, ':') + "}";
    }
};

std::string hardware_type_line(std::uint16_t hw_type) {
    return "Hardware Type: " + std::to_string(hw_type) + " [" + hardware_type_name(hw_type) +
           "]\n";
}

// Ethernet MACs print bare, anything else is flagged as raw hex
std::string link_layer_line(std::uint16_t hw_type, const std::vector<std::uint8_t>& address) {
    std::string line = "Link-layer Address: " + hex_encode(address, ':');
    if (hw_type != HW_TYPE_ETHERNET || address.size() != ETHERNET_ADDRESS_BYTES) {
        line += " (Hex)";
    }
    return line + "\n";
}

struct DescribeVisitor {
    std::string operator()(const DuidLlt& d) const {
        std::string text = hardware_type_line(d.hw_type);
        text += "Seconds since midnight (UTC), January 1, 2000: " + std::to_string(d.time) + "\n";
        std::string timestamp = format_duid_time(d.time);
        // Empty only where time_t is 32 bits or gmtime_r fails
        if (timestamp.empty()) {
            text += "Warning: Could not calculate datetime from time value\n";
        } else {
            text += "Calculated Timestamp (UTC): " + timestamp + "\n";
        }
        return text + link_layer_line(d.hw_type, d.link_layer_address);
    }
    std::string operator()(const DuidEn& d) const {
        return "Enterprise Number: " + std::to_string(d.enterprise_number) + "\n" +
               "Identifier: 0x" + hex_encode(d.identifier) + "\n";
    }
    std::string operator()(const DuidLl& d) const {
        return hardware_type_line(d.hw_type) + link_layer_line(d.hw_type, d.link_layer_address);
    }
    std::string operator()(const DuidUuid& d) const {
        return "UUID: " + format_uuid(d.uuid) + "\n";
    }
    std::string operator()(const DuidUnknown& d) const {
        std::string text = "Unknown DUID Type. Unable to decode further.\n";
        if (!d.data.empty()) {
            text += "Remaining undecoded data: 0x" + hex_encode(d.data) + "\n";
        }
        return text;
    }
};

} // namespace

Error parse_duid(const std::uint8_t* data, std::size_t size, Duid& out) {
    const char* reason = nullptr;
    return parse_fields(data, size, out, reason);
}

Error parse_duid(const std::uint8_t* data, std::size_t size, Duid& out, const char*& reason) {
    reason = error_string(Error::Ok);
    return parse_fields(data, size, out, reason);
}

#if !DUIDKIT_NO_EXCEPTIONS
Duid parse_duid(const std::vector<std::uint8_t>& bytes) {
    Duid duid;
    const char* reason = nullptr;
    if (parse_fields(bytes.data(), bytes.size(), duid, reason) != Error::Ok) {
        throw MalformedDuidException(std::string(reason) + " (" + std::to_string(bytes.size()) +
                                     " bytes)");
    }
    return duid;
}
#endif

Error encode_duid(const Duid& duid, std::vector<std::uint8_t>& out) {
    ByteBuffer<MAX_DUID_BYTES> buf;
    auto result = std::visit(EncodeVisitor{buf}, duid);
    if (result != Error::Ok) {
        return result;
    }
    std::vector<std::uint8_t> bytes(buf.size());
    buf.to_bytes(bytes.data(), bytes.size());
    out = std::move(bytes);
    return Error::Ok;
}

std::uint16_t duid_type_code(const Duid& duid) noexcept {
    return std::visit(TypeCodeVisitor{}, duid);
}

const char* duid_type_name(std::uint16_t type) noexcept {
    switch (type) {
    case static_cast<std::uint16_t>(DuidType::LLT):
        return "DUID-LLT";
    case static_cast<std::uint16_t>(DuidType::EN):
        return "DUID-EN";
    case static_cast<std::uint16_t>(DuidType::LL):
        return "DUID-LL";
    case static_cast<std::uint16_t>(DuidType::UUID):
        return "DUID-UUID";
    default:
        return "Unknown";
    }
}

const char* duid_type_description(std::uint16_t type) noexcept {
    switch (type) {
    case static_cast<std::uint16_t>(DuidType::LLT):
        return "DUID-LLT - Link-layer address plus time";
    case static_cast<std::uint16_t>(DuidType::EN):
        return "DUID-EN - Vendor-assigned unique ID based on Enterprise Number";
    case static_cast<std::uint16_t>(DuidType::LL):
        return "DUID-LL - Link-layer address";
    case static_cast<std::uint16_t>(DuidType::UUID):
        return "DUID-UUID - Universally Unique IDentifier";
    default:
        return "Unknown";
    }
}

std::string to_string(const Duid& duid) {
    return std::visit(StringVisitor{}, duid);
}

std::string describe(const Duid& duid) {
    std::uint16_t type = duid_type_code(duid);
    std::string text = "DUID Type: " + std::to_string(type) + " [" +
                       duid_type_description(type) + "]\n";
    return text + std::visit(DescribeVisitor{}, duid);
}

std::string format_duid_time(std::uint32_t seconds) {
    std::int64_t unix_seconds = DUID_TIME_EPOCH + static_cast<std::int64_t>(seconds);
    if (unix_seconds > static_cast<std::int64_t>(std::numeric_limits<std::time_t>::max())) {
        return {};
    }
    std::time_t t = static_cast<std::time_t>(unix_seconds);
    struct tm utc;
    if (gmtime_r(&t, &utc) == nullptr) {
        return {};
    }

    char buf[32];
    std::size_t len = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc);
    if (len == 0) {
        return {};
    }
    return std::string(buf, len) + "+00:00";
}

std::string format_uuid(const std::array<std::uint8_t, UUID_BYTES>& uuid) {
    // 8-4-4-4-12 hex digit groups
    static constexpr std::size_t group_bytes[] = {4, 2, 2, 2, 6};

    std::string out;
    out.reserve(36);
    std::size_t offset = 0;
    for (std::size_t g = 0; g < 5; ++g) {
        if (g > 0) {
            out.push_back('-');
        }
        out += hex_encode(&uuid[offset], group_bytes[g]);
        offset += group_bytes[g];
    }
    return out;
}

} // namespace duidkit
