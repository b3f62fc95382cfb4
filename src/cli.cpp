/**
 * @file cli.cpp
 * @brief duidkit command line interface.
 *
 * Decodes a DHCPv6 DUID given as hex text and prints it.
 */

#include <duidkit/duidkit.hpp>

#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

using namespace duidkit;

static void print_version() {
    std::printf("duidkit %s (C++)\n", version());
}

static void print_usage(std::FILE* out, const char* prog_name) {
    std::fprintf(out, "Usage: %s [-e] <DUID_hex_string>\n", prog_name);
    std::fprintf(out, "Example: %s 00:01:00:01:2c:3d:4e:5f:aa:bb:cc:dd:ee:ff\n", prog_name);
}

static void print_help(const char* prog_name) {
    std::printf("DHCPv6 DUID decoder (v%s C++)\n", version());
    std::printf("================================\n\n");
    std::printf("References:\n");
    std::printf("  RFC 8415 Section 11: https://www.rfc-editor.org/rfc/rfc8415#section-11\n\n");
    print_usage(stdout, prog_name);
    std::printf("\nOptions:\n");
    std::printf("  -e, --explain  Print a field-by-field report\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Arguments:\n");
    std::printf("  DUID_hex_string  Hex digits, colons allowed (e.g. 00:03:00:01:aa:bb:cc:dd:ee:ff)\n\n");
}

static int do_decode(const char* hex_text, bool explain) {
    std::vector<std::uint8_t> bytes;
    if (hex_decode(hex_text, bytes) != Error::Ok) {
        std::fprintf(stderr, "Error: Invalid hex string format provided: '%s'\n", hex_text);
        std::fprintf(stderr, "Ensure the string contains only hex characters (0-9, a-f, A-F) "
                             "and optional colons.\n");
        return 1;
    }

    Duid duid;
    const char* reason = nullptr;
    if (parse_duid(bytes.data(), bytes.size(), duid, reason) != Error::Ok) {
        std::fprintf(stderr, "Error: %s (%zu bytes) decoding as DUID\n", reason, bytes.size());
        return 1;
    }

    if (explain) {
        std::printf("Input DUID Hex: %s\n", hex_text);
        std::printf("Total DUID Length: %zu bytes\n", bytes.size());
        std::printf("%s", describe(duid).c_str());
    } else {
        std::printf("%s\n", to_string(duid).c_str());
    }

    return 0;
}

int main(int argc, char** argv) {
    bool explain = false;
    int arg_offset = 1;

    if (argc >= 2) {
        // Check for help flag
        if (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
            print_help(argv[0]);
            return 0;
        }

        // Check for version flag
        if (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0) {
            print_version();
            return 0;
        }

        if (std::strcmp(argv[1], "-e") == 0 || std::strcmp(argv[1], "--explain") == 0) {
            explain = true;
            arg_offset = 2;
        }
    }

    if (argc != arg_offset + 1) {
        print_usage(stderr, argv[0]);
        std::fprintf(stderr,
                     "DUID hex string is missing or extra arguments provided. Please try again.\n");
        return 1;
    }

    return do_decode(argv[arg_offset], explain);
}
