#include <catch2/catch_test_macros.hpp>
#include <linkbench/util/crc32.hpp>
#include <linkbench/util/types.hpp>
#include <algorithm>
#include <random>

using namespace linkbench;

TEST_CASE("CRC-32 known values", "[unit][util][crc32]") {
    REQUIRE(util::crc32("") == 0u);
    REQUIRE(util::crc32("123456789") == 0xCBF43926u);
    REQUIRE(util::crc32("The quick brown fox jumps over the lazy dog") == 0x414FA339u);
}

TEST_CASE("CRC-32 fold chaining", "[unit][util][crc32]") {
    byte_buffer data(10000);
    std::mt19937 engine(42);
    for (auto& byte : data) {
        byte = static_cast<uint8_t>(engine() & 0xFF);
    }
    const uint32_t whole = util::crc32(data.data(), data.size());

    SECTION("Folding an empty chunk keeps the previous value") {
        REQUIRE(util::crc32_fold(whole, data.data(), 0) == whole);
    }

    SECTION("Fixed size chunks") {
        for (size_t chunk : {1u, 7u, 100u, 4096u, 9999u}) {
            uint32_t crc = 0;
            for (size_t offset = 0; offset < data.size(); offset += chunk) {
                size_t size = std::min(chunk, data.size() - offset);
                crc = util::crc32_fold(crc, data.data() + offset, size);
            }
            INFO("chunk size " << chunk);
            REQUIRE(crc == whole);
        }
    }

    SECTION("Random partitions") {
        std::uniform_int_distribution<size_t> sizes(0, 700);
        for (int round = 0; round < 20; ++round) {
            uint32_t crc = 0;
            size_t offset = 0;
            while (offset < data.size()) {
                size_t size = std::min(sizes(engine), data.size() - offset);
                crc = util::crc32_fold(crc, data.data() + offset, size);
                offset += size;
            }
            REQUIRE(crc == whole);
        }
    }

    SECTION("String chunks") {
        REQUIRE(util::crc32_fold(util::crc32("12345"), "6789") == util::crc32("123456789"));
    }
}
