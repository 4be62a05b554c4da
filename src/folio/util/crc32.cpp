#include <folio/util/crc32.hpp>

#include <array>

namespace folio {

namespace {

constexpr uint32_t CRC32_POLYNOMIAL = 0xEDB88320;

constexpr std::array<uint32_t, 256> make_table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            crc = (crc >> 1) ^ ((crc & 1) ? CRC32_POLYNOMIAL : 0);
        }
        table[i] = crc;
    }
    return table;
}

constexpr std::array<uint32_t, 256> CRC32_TABLE = make_table();

}  // namespace

uint32_t CRC32::compute(const uint8_t* data, size_t len) {
    return update(0, data, len);
}

uint32_t CRC32::compute(const char* data, size_t len) {
    return compute(reinterpret_cast<const uint8_t*>(data), len);
}

uint32_t CRC32::compute(const std::string& data) {
    return compute(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

uint32_t CRC32::update(uint32_t crc, const uint8_t* data, size_t len) {
    crc = ~crc;
    for (size_t i = 0; i < len; ++i) {
        crc = CRC32_TABLE[(crc ^ data[i]) & 0xFF] ^ (crc >> 8);
    }
    return ~crc;
}

}  // namespace folio
