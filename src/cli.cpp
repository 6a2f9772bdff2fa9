/**
 * @file cli.cpp
 * @brief flower command line interface.
 *
 * Creates, fills, queries and merges Bloom filter files. Filter files are
 * streamed chunk by chunk in both directions.
 */

#include <flower/flower.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

using namespace flower;

static void print_version() {
    std::printf("flower %s (C++)\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("\nflower Bloom filter tool (v%s)\n", version());
    std::printf("==============================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s new <file> <bit_addr_len> <expected>\n", prog_name);
    std::printf("  %s insert <file> <element>...\n", prog_name);
    std::printf("  %s has <file> <element>...\n", prog_name);
    std::printf("  %s info <file>\n", prog_name);
    std::printf("  %s merge <dst> <src>\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Arguments:\n");
    std::printf("  bit_addr_len   Filter holds 2^bit_addr_len bits (%u-%u)\n", MIN_BIT_ADDR_LEN,
                MAX_BIT_ADDR_LEN);
    std::printf("  expected       Expected number of elements\n\n");
    std::printf("Examples:\n");
    std::printf("  %s new users.bloom 20 10000\n", prog_name);
    std::printf("  %s insert users.bloom alice bob\n", prog_name);
    std::printf("  %s has users.bloom alice carol\n\n", prog_name);
}

static BloomFilter load_filter(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw InvalidArgumentException("Cannot read filter file: " + path);
    }

    BloomFilter::Header header{};
    file.read(reinterpret_cast<char*>(header.data()), static_cast<std::streamsize>(header.size()));
    if (file.gcount() != static_cast<std::streamsize>(header.size())) {
        throw InvalidDataException("Truncated filter header: " + path);
    }

    BloomFilter filter;
    throw_if_error(BloomFilter::from_header(header.data(), header.size(), filter), path);

    ChunkWriter writer(*filter.bits());
    std::vector<std::uint8_t> block(CHUNK_BYTES);
    while (file) {
        file.read(reinterpret_cast<char*>(block.data()), static_cast<std::streamsize>(block.size()));
        const auto got = static_cast<std::size_t>(file.gcount());
        if (got == 0) {
            break;
        }
        throw_if_error(writer.write(block.data(), got), path);
    }

    if (writer.offset() != filter.bits()->byte_length()) {
        throw InvalidDataException("Truncated filter payload: " + path);
    }
    return filter;
}

static void save_filter(const std::string& path, const BloomFilter& filter) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw InvalidArgumentException("Cannot write filter file: " + path);
    }

    const BloomFilter::Header header = filter.header();
    file.write(reinterpret_cast<const char*>(header.data()),
               static_cast<std::streamsize>(header.size()));

    ChunkReader reader(*filter.bits());
    std::vector<std::uint8_t> chunk;
    while (!reader.done()) {
        throw_if_error(reader.read_next(chunk), path);
        file.write(reinterpret_cast<const char*>(chunk.data()),
                   static_cast<std::streamsize>(chunk.size()));
    }

    if (!file.good()) {
        throw InvalidArgumentException("Write failed: " + path);
    }
}

static void print_info(const char* label, const BloomFilter& filter) {
    const BitArray& bits = *filter.bits();
    std::size_t ones = 0;
    throw_if_error(count_ones_chunked(bits, ones), label);

    std::printf("File:        %s\n", label);
    std::printf("Bits:        %zu (%zu bytes)\n", bits.bit_length(), bits.byte_length());
    std::printf("Set bits:    %zu\n", ones);
    std::printf("Hashes:      %u\n", filter.num_hashes());
    std::printf("FP prob:     %.6f\n", filter.false_positive_probability());
    std::printf("Estimated:   %llu elements\n",
                static_cast<unsigned long long>(filter.estimate_count()));
}

static int do_new(const char* path, int bit_addr_len, long long expected) {
    BloomFilter filter;
    throw_if_error(BloomFilter::create(static_cast<unsigned>(bit_addr_len),
                                       static_cast<std::uint64_t>(expected), filter),
                   "create");
    if (filter.undersized()) {
        std::fprintf(stderr,
                     "Warning: Bloom filter is too small for the expected number of elements\n");
    }

    save_filter(path, filter);
    std::printf("Created:     %s (2^%d bits, %u hashes)\n", path, bit_addr_len,
                filter.num_hashes());
    return 0;
}

static int do_insert(const char* path, int count, char** elements) {
    BloomFilter filter = load_filter(path);
    for (int i = 0; i < count; ++i) {
        throw_if_error(filter.insert(elements[i]), "insert");
    }
    save_filter(path, filter);
    std::printf("Inserted:    %d element(s) into %s\n", count, path);
    return 0;
}

static int do_has(const char* path, int count, char** elements) {
    const BloomFilter filter = load_filter(path);
    int found = 0;
    for (int i = 0; i < count; ++i) {
        bool present = false;
        throw_if_error(filter.has(reinterpret_cast<const std::uint8_t*>(elements[i]),
                                  std::strlen(elements[i]), present),
                       "has");
        std::printf("%-12s %s\n", present ? "maybe" : "no", elements[i]);
        found += present ? 1 : 0;
    }
    // Exit status 0 only if every element may be present
    return (found == count) ? 0 : 2;
}

static int do_info(const char* path) {
    const BloomFilter filter = load_filter(path);
    print_info(path, filter);
    return 0;
}

static int do_merge(const char* dst_path, const char* src_path) {
    BloomFilter dst = load_filter(dst_path);
    const BloomFilter src = load_filter(src_path);
    throw_if_error(dst.merge(src), "merge (filters must share size and hash count)");
    save_filter(dst_path, dst);
    std::printf("Merged:      %s into %s\n", src_path, dst_path);
    return 0;
}

static int run(int argc, char** argv) {
    const char* command = argv[1];

    if (std::strcmp(command, "new") == 0) {
        if (argc != 5) {
            std::fprintf(stderr, "Usage: %s new <file> <bit_addr_len> <expected>\n", argv[0]);
            return 1;
        }
        int bit_addr_len = std::atoi(argv[3]);
        long long expected = std::atoll(argv[4]);

        // Validate parameters
        if (bit_addr_len < static_cast<int>(MIN_BIT_ADDR_LEN) ||
            bit_addr_len > static_cast<int>(MAX_BIT_ADDR_LEN)) {
            std::fprintf(stderr, "Error: bit_addr_len must be %u-%u\n", MIN_BIT_ADDR_LEN,
                         MAX_BIT_ADDR_LEN);
            return 1;
        }
        if (expected <= 0) {
            std::fprintf(stderr, "Error: expected must be positive\n");
            return 1;
        }
        return do_new(argv[2], bit_addr_len, expected);
    }

    if (std::strcmp(command, "insert") == 0 || std::strcmp(command, "has") == 0) {
        if (argc < 4) {
            std::fprintf(stderr, "Usage: %s %s <file> <element>...\n", argv[0], command);
            return 1;
        }
        if (command[0] == 'i') {
            return do_insert(argv[2], argc - 3, &argv[3]);
        }
        return do_has(argv[2], argc - 3, &argv[3]);
    }

    if (std::strcmp(command, "info") == 0) {
        if (argc != 3) {
            std::fprintf(stderr, "Usage: %s info <file>\n", argv[0]);
            return 1;
        }
        return do_info(argv[2]);
    }

    if (std::strcmp(command, "merge") == 0) {
        if (argc != 4) {
            std::fprintf(stderr, "Usage: %s merge <dst> <src>\n", argv[0]);
            return 1;
        }
        return do_merge(argv[2], argv[3]);
    }

    std::fprintf(stderr, "Error: Unknown command: %s\n", command);
    print_help(argv[0]);
    return 1;
}

int main(int argc, char** argv) {
    // Check for help flag
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_help(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    // Check for version flag
    if (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0) {
        print_version();
        return 0;
    }

    try {
        return run(argc, argv);
    } catch (const FlowerException& e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
}
