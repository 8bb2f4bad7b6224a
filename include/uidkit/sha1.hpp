#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>

namespace uidkit {

// FIPS 180-4 SHA-1. Used for name-based (version 5) UUIDs only; not
// suitable as a general-purpose secure hash.
class SHA1 {
public:
    SHA1();

    void update(const uint8_t* data, size_t len);
    void update(const std::string& s);

    // Finalize and return the 20-byte digest. Object should not be
    // reused after this call.
    std::array<uint8_t, 20> finalize();

    static std::string hash_hex(const std::string& input);
    static std::string bytes_to_hex(const std::array<uint8_t, 20>& bytes);

private:
    void process_block(const uint8_t block[64]);

    std::array<uint32_t, 5> state_;   // H0..H4
    uint64_t total_bytes_;
    uint8_t  buffer_[64];
    size_t   buffer_len_;
};

} // namespace uidkit
