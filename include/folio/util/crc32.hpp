#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace folio {

/**
 * CRC32 (IEEE 802.3, reflected 0xEDB88320) checksums for the file header
 * and page frames.
 */
class CRC32 {
public:
    static uint32_t compute(const uint8_t* data, size_t len);
    static uint32_t compute(const char* data, size_t len);
    static uint32_t compute(const std::string& data);

    /**
     * Continue a running CRC32 with more data.
     * update(compute(a), b) == compute(a + b).
     */
    static uint32_t update(uint32_t crc, const uint8_t* data, size_t len);
};

}  // namespace folio
