/**
 * @file bench.cpp
 * @brief Performance benchmarks for fracpack encode and decode.
 *
 * Measures per-call latency for regression testing during development.
 * Use for relative comparisons only.
 *
 * Usage:
 *   ./build/fracpack_bench            # Run with default 100000 iterations
 *   ./build/fracpack_bench 1000000    # Run with custom iteration count
 */

#include <fracpack/fracpack.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>

using namespace fracpack;

static constexpr int DEFAULT_ITERATIONS = 100000;

static bool bench_encode(const char* name, const char* input, int iterations) {
    PackedValue value;

    // Warmup run
    if (encode_decimal(input, value) != Error::Ok) {
        std::fprintf(stderr, "Error: Cannot encode %s (\"%s\")\n", name, input);
        return false;
    }

    word_t sink = 0;
    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        if (encode_decimal(input, value) != Error::Ok) {
            return false;
        }
        sink ^= value.bits();
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_ns = std::chrono::duration<double, std::nano>(end - start).count();
    double per_op_ns = total_ns / static_cast<double>(iterations);

    std::printf("%-20s %10.1f ns/op  exp=%-3u  (sink %08x)\n", name, per_op_ns,
                value.exponent(), sink);
    return true;
}

static bool bench_decode(const char* name, const char* input, int iterations) {
    PackedValue value;
    if (encode_decimal(input, value) != Error::Ok) {
        std::fprintf(stderr, "Error: Cannot encode %s (\"%s\")\n", name, input);
        return false;
    }

    char buffer[MAX_DECIMAL_LENGTH + 1];
    std::size_t length = 0;

    // Warmup run
    auto result = decode(value, buffer, sizeof(buffer), length);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: Cannot decode %s: %s\n", name, error_string(result));
        return false;
    }

    std::size_t sink = 0;
    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        if (decode(value, buffer, sizeof(buffer), length) != Error::Ok) {
            return false;
        }
        sink += length;
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_ns = std::chrono::duration<double, std::nano>(end - start).count();
    double per_op_ns = total_ns / static_cast<double>(iterations);

    std::printf("%-20s %10.1f ns/op  %s  (sink %zu)\n", name, per_op_ns, buffer, sink);
    return true;
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("fracpack Benchmarks (v%s)\n", version());
    std::printf("=========================\n");
    std::printf("Iterations: %d\n", iterations);

    struct Input {
        const char* name;
        const char* text;
    };
    const Input inputs[] = {
        {"half", "0.5"},
        {"three-bit", "0.625"},
        {"nine-bit", "0.001953125"},
        {"truncated 0.1", "0.1"},
        {"truncated 9-digit", "0.123456789"},
    };

    bool ok = true;

    std::printf("\nEncode:\n");
    for (const auto& in : inputs) {
        ok = bench_encode(in.name, in.text, iterations) && ok;
    }

    std::printf("\nDecode:\n");
    for (const auto& in : inputs) {
        ok = bench_decode(in.name, in.text, iterations) && ok;
    }

    std::printf("\nUse these results for relative comparisons only.\n");

    return ok ? 0 : 1;
}
