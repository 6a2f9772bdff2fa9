/**
 * @file bench.cpp
 * @brief Performance benchmarks for flower bit arrays.
 *
 * Measures point access, population count and chunked transfer throughput
 * for regression testing during development. Use for relative comparisons
 * only.
 *
 * Usage:
 *   ./build/flower_bench           # Run with default 100 iterations
 *   ./build/flower_bench 1000      # Run with custom iteration count
 */

#include <flower/flower.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <vector>

using namespace flower;

static constexpr int DEFAULT_ITERATIONS = 100;
static constexpr std::size_t ARRAY_BITS = std::size_t{1} << 24;  // 2 MiB of words
static constexpr std::size_t POINT_OPS = 100000;

// Keeps results observable so the optimizer cannot drop the work
static volatile std::size_t sink = 0;

template <typename Fn>
static void bench(const char* name, int iterations, double bytes_per_iter, Fn&& fn) {
    // Warmup run
    fn();

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        fn();
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double throughput_mbps = bytes_per_iter / per_iter_us;

    std::printf("%-22s %10.2f µs/iter  %10.1f MB/s\n", name, per_iter_us, throughput_mbps);
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    BitArray::Handle array;
    if (BitArray::create(ARRAY_BITS, array) != Error::Ok) {
        std::printf("Could not allocate %zu-bit array\n", ARRAY_BITS);
        return 1;
    }

    BitArray::Handle target;
    if (BitArray::create(ARRAY_BITS, target) != Error::Ok) {
        std::printf("Could not allocate %zu-bit array\n", ARRAY_BITS);
        return 1;
    }

    // Sparse pattern so counts and merges have work to do
    for (std::size_t i = 0; i < ARRAY_BITS; i += 7) {
        array->put_unchecked(i, true);
    }

    const double array_bytes = static_cast<double>(array->byte_length());
    const double point_bytes = static_cast<double>(POINT_OPS) / 8.0;

    std::printf("flower Benchmarks (C++ Implementation)\n");
    std::printf("======================================\n");
    std::printf("Iterations: %d\n", iterations);
    std::printf("Array size: %zu bits (%zu bytes, %zu chunks)\n\n", array->bit_length(),
                array->byte_length(), (array->num_words() + CHUNK_WORDS - 1) / CHUNK_WORDS);

    std::printf("%-22s %16s  %15s\n", "Test", "Time", "Throughput");
    std::printf("%-22s %16s  %15s\n", "----", "----", "----------");

    std::printf("\nPoint access:\n");
    bench("put", iterations, point_bytes, [&] {
        for (std::size_t i = 0; i < POINT_OPS; ++i) {
            sink = (array->put((i * 131U) % ARRAY_BITS, (i & 1U) != 0U) == Error::Ok) ? 1U : 0U;
        }
    });
    bench("get", iterations, point_bytes, [&] {
        bool value = false;
        for (std::size_t i = 0; i < POINT_OPS; ++i) {
            sink = (array->get((i * 131U) % ARRAY_BITS, value) == Error::Ok) ? 1U : 0U;
        }
        sink = value ? 1U : 0U;
    });

    std::printf("\nPopulation count:\n");
    bench("count_ones", iterations, array_bytes, [&] { sink = array->count_ones(); });
    bench("count_ones_chunked", iterations, array_bytes, [&] {
        std::size_t total = 0;
        if (count_ones_chunked(*array, total) == Error::Ok) {
            sink = total;
        }
    });

    std::printf("\nChunked transfer:\n");
    bench("serialize_chunk", iterations, array_bytes, [&] {
        ChunkReader reader(*array);
        std::vector<std::uint8_t> chunk;
        while (!reader.done()) {
            if (reader.read_next(chunk) != Error::Ok) {
                break;
            }
            sink = chunk.size();
        }
    });

    std::vector<std::uint8_t> payload;
    if (to_bytes(*array, payload) != Error::Ok) {
        std::printf("Could not serialize array\n");
        return 1;
    }
    bench("merge_chunk", iterations, array_bytes, [&] {
        ChunkWriter writer(*target);
        for (std::size_t pos = 0; pos < payload.size(); pos += CHUNK_BYTES) {
            const std::size_t piece =
                (payload.size() - pos < CHUNK_BYTES) ? (payload.size() - pos) : CHUNK_BYTES;
            if (writer.write(payload.data() + pos, piece) != Error::Ok) {
                break;
            }
        }
        sink = writer.offset();
    });

    std::printf("\nNote: Use these results for relative comparisons only.\n");

    return 0;
}
