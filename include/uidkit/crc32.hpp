#pragma once

#include <uidkit/result.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace uidkit {

// Two CRC-32 flavours share the 0x04C11DB7 polynomial but differ in bit
// order and in how the final value is rendered as hex.
//
//   Legacy ("crc32")  MSB-first (bzip2 table), digest bytes little-endian.
//                     "123456789" -> 181989fc
//   Ieee   ("crc32b") reflected (zlib/PNG), digest bytes big-endian.
//                     "123456789" -> cbf43926
enum class Crc32Kind { Legacy, Ieee };

const char* crc32_kind_name(Crc32Kind kind);
Result<Crc32Kind> parse_crc32_kind(const std::string& name);

class CRC32 {
public:
    explicit CRC32(Crc32Kind kind = Crc32Kind::Legacy);

    void update(const uint8_t* data, size_t len);
    void update(const std::string& s);

    // Finalized checksum value (before byte-order rendering).
    uint32_t value() const;

    // 8 lowercase hex characters in the byte order of the selected kind.
    std::string hex() const;

    void reset();

    static uint32_t compute(const std::string& data, Crc32Kind kind = Crc32Kind::Legacy);
    static std::string hash_hex(const std::string& data, Crc32Kind kind = Crc32Kind::Legacy);

private:
    Crc32Kind kind_;
    uint32_t crc_;
};

} // namespace uidkit
