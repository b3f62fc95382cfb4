/**
 * @file bench.cpp
 * @brief Performance benchmarks for duidkit decoding.
 *
 * Measures parse and format throughput for regression testing during
 * development. Use for relative comparisons only.
 *
 * Usage:
 *   ./build/duidkit_bench              # Run with default 100000 iterations
 *   ./build/duidkit_bench 1000000      # Run with custom iteration count
 */

#include <duidkit/duidkit.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <vector>

using namespace duidkit;

static constexpr int DEFAULT_ITERATIONS = 100000;

static void bench_parse(const char* name, const char* hex_text, int iterations) {
    std::vector<std::uint8_t> bytes;
    if (hex_decode(hex_text, bytes) != Error::Ok) {
        std::printf("%-20s SKIP (invalid hex)\n", name);
        return;
    }

    Duid duid;
    std::size_t checksum = 0;

    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; ++i) {
        if (parse_duid(bytes.data(), bytes.size(), duid) != Error::Ok) {
            std::printf("%-20s FAIL (decode error)\n", name);
            return;
        }
        checksum += duid_type_code(duid);
    }
    auto end = std::chrono::high_resolution_clock::now();

    double total_ns =
        static_cast<double>(std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count());
    double per_op = total_ns / iterations;
    double mb_per_s = (static_cast<double>(bytes.size()) * iterations) / (total_ns / 1e9) / 1e6;

    std::printf("%-20s %8.1f ns/op  %8.2f MB/s  (%3zu bytes, checksum %zu)\n", name, per_op,
                mb_per_s, bytes.size(), checksum);
}

static void bench_format(const char* name, const char* hex_text, int iterations) {
    Duid duid;
    if (decode_hex(hex_text, duid) != Error::Ok) {
        std::printf("%-20s SKIP (decode error)\n", name);
        return;
    }

    std::size_t total_chars = 0;
    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < iterations; ++i) {
        total_chars += to_string(duid).size();
    }
    auto end = std::chrono::high_resolution_clock::now();

    double total_ns =
        static_cast<double>(std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count());
    std::printf("%-20s %8.1f ns/op  (%zu chars)\n", name, total_ns / iterations, total_chars);
}

int main(int argc, char** argv) {
    int iterations = DEFAULT_ITERATIONS;
    if (argc > 1) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            std::fprintf(stderr, "Error: iteration count must be positive\n");
            return 1;
        }
    }

    std::printf("duidkit %s benchmark (%d iterations)\n\n", version(), iterations);

    std::printf("Parse:\n");
    bench_parse("DUID-LLT", "00:01:00:01:2c:3d:4e:5f:aa:bb:cc:dd:ee:ff", iterations);
    bench_parse("DUID-EN", "00:02:00:00:00:09:01:02:03", iterations);
    bench_parse("DUID-LL", "00:03:00:01:00:11:22:33:44:55", iterations);
    bench_parse("DUID-UUID", "00:04:00:01:02:03:04:05:06:07:08:09:0a:0b:0c:0d:0e:0f",
                iterations);

    std::printf("\nFormat:\n");
    bench_format("DUID-LLT", "00:01:00:01:2c:3d:4e:5f:aa:bb:cc:dd:ee:ff", iterations);
    bench_format("DUID-UUID", "00:04:00:01:02:03:04:05:06:07:08:09:0a:0b:0c:0d:0e:0f",
                 iterations);

    return 0;
}
