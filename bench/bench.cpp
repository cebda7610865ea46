/**
 * @file bench.cpp
 * @brief Performance benchmarks for yEnc encoding and decoding.
 *
 * Measures throughput on synthetic payloads for regression testing
 * during development. Use for relative comparisons only.
 *
 * Usage:
 *   ./build/yenc_bench              # Run with default 50 iterations
 *   ./build/yenc_bench 500          # Run with custom iteration count
 */

#include <yenc/yenc.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

using namespace yenc;

static constexpr int DEFAULT_ITERATIONS = 50;
static constexpr std::size_t PAYLOAD_BYTES = 1U << 20;

/**
 * @brief Deterministic pseudo-random payload (LCG).
 */
static std::vector<std::uint8_t> make_random(std::size_t size) {
    std::vector<std::uint8_t> data(size);
    std::uint32_t state = 0x12345678U;
    for (auto& byte : data) {
        state = state * 1664525U + 1013904223U;
        byte = static_cast<std::uint8_t>(state >> 24);
    }
    return data;
}

/**
 * @brief Payload made only of bytes that encode to escaped characters.
 */
static std::vector<std::uint8_t> make_critical(std::size_t size) {
    static constexpr std::uint8_t critical[] = {214, 224, 227, 19};
    std::vector<std::uint8_t> data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = critical[i % sizeof(critical)];
    }
    return data;
}

static void report(const char* name, double total_us, int iterations, std::size_t bytes) {
    double per_iter_us = total_us / static_cast<double>(iterations);
    double throughput_mbps = static_cast<double>(bytes) / per_iter_us;

    std::printf("%-20s %10.1f µs/iter  %8.1f MB/s  (%zu bytes)\n", name, per_iter_us,
                throughput_mbps, bytes);
}

static void bench_encode(const char* name, const std::vector<std::uint8_t>& input,
                         int iterations) {
    std::string output;

    // Warmup run
    if (encode(input.data(), input.size(), "bench.bin", output) != Error::Ok) {
        std::printf("%-20s SKIP (encode failed)\n", name);
        return;
    }

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        output.clear();
        if (encode(input.data(), input.size(), "bench.bin", output) != Error::Ok) {
            std::printf("%-20s FAIL (iteration %d)\n", name, i);
            return;
        }
    }

    auto end = std::chrono::high_resolution_clock::now();

    report(name, std::chrono::duration<double, std::micro>(end - start).count(), iterations,
           input.size());
}

static void bench_decode(const char* name, const std::vector<std::uint8_t>& input,
                         int iterations) {
    std::string encoded;
    if (encode(input.data(), input.size(), "bench.bin", encoded) != Error::Ok) {
        std::printf("%-20s SKIP (encode failed)\n", name);
        return;
    }

    Part part;
    std::string message;

    // Warmup run
    std::istringstream warmup(encoded, std::ios::in | std::ios::binary);
    if (decode(warmup, part, &message) != Error::Ok) {
        std::printf("%-20s FAIL (%s)\n", name, message.c_str());
        return;
    }

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        std::istringstream stream(encoded, std::ios::in | std::ios::binary);
        if (decode(stream, part) != Error::Ok) {
            std::printf("%-20s FAIL (iteration %d)\n", name, i);
            return;
        }
    }

    auto end = std::chrono::high_resolution_clock::now();

    report(name, std::chrono::duration<double, std::micro>(end - start).count(), iterations,
           input.size());
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("yEnc Benchmarks (C++ Implementation)\n");
    std::printf("====================================\n");
    std::printf("Iterations: %d\n", iterations);
    std::printf("Payload:    %zu bytes\n\n", PAYLOAD_BYTES);

    auto random = make_random(PAYLOAD_BYTES);
    auto critical = make_critical(PAYLOAD_BYTES);

    std::printf("\nEncode:\n");
    bench_encode("random", random, iterations);
    bench_encode("critical", critical, iterations);

    std::printf("\nDecode:\n");
    bench_decode("random", random, iterations);
    bench_decode("critical", critical, iterations);

    return 0;
}
