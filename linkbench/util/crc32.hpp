#ifndef LINKBENCH_UTIL_CRC32_HPP
#define LINKBENCH_UTIL_CRC32_HPP

#include <cstdint>
#include <cstddef>
#include <limits>
#include <string_view>
#include <zlib.h>

namespace linkbench::util {

// Streaming CRC-32 (IEEE 802.3, zlib convention). Folding every chunk of a
// stream in order gives the checksum of the whole stream, starting from 0.
inline uint32_t crc32_fold(uint32_t previous, const uint8_t* data, size_t size) {
    uLong crc = previous;
    // zlib takes uInt lengths, feed very large buffers in slices
    constexpr size_t max_slice = std::numeric_limits<uInt>::max();
    while (size > 0) {
        auto slice = static_cast<uInt>(size < max_slice ? size : max_slice);
        crc = ::crc32(crc, reinterpret_cast<const Bytef*>(data), slice);
        data += slice;
        size -= slice;
    }
    return static_cast<uint32_t>(crc);
}

inline uint32_t crc32_fold(uint32_t previous, std::string_view data) {
    return crc32_fold(previous, reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

inline uint32_t crc32(const uint8_t* data, size_t size) {
    return crc32_fold(0, data, size);
}

inline uint32_t crc32(std::string_view data) {
    return crc32_fold(0, data);
}

} // namespace linkbench::util

#endif // LINKBENCH_UTIL_CRC32_HPP
