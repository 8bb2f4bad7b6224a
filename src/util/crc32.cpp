#include <uidkit/crc32.hpp>

namespace uidkit {

static constexpr uint32_t POLYNOMIAL = 0x04C11DB7;
static constexpr uint32_t POLYNOMIAL_REFLECTED = 0xEDB88320;

static std::array<uint32_t, 256> generate_msb_table() {
    std::array<uint32_t, 256> t{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i << 24;
        for (int j = 0; j < 8; ++j) {
            crc = (crc & 0x80000000u) ? (crc << 1) ^ POLYNOMIAL : crc << 1;
        }
        t[i] = crc;
    }
    return t;
}

static std::array<uint32_t, 256> generate_lsb_table() {
    std::array<uint32_t, 256> t{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            crc = (crc & 1u) ? (crc >> 1) ^ POLYNOMIAL_REFLECTED : crc >> 1;
        }
        t[i] = crc;
    }
    return t;
}

static const std::array<uint32_t, 256>& msb_table() {
    static const std::array<uint32_t, 256> t = generate_msb_table();
    return t;
}

static const std::array<uint32_t, 256>& lsb_table() {
    static const std::array<uint32_t, 256> t = generate_lsb_table();
    return t;
}

const char* crc32_kind_name(Crc32Kind kind) {
    switch (kind) {
        case Crc32Kind::Legacy: return "crc32";
        case Crc32Kind::Ieee:   return "crc32b";
    }
    return "unknown";
}

Result<Crc32Kind> parse_crc32_kind(const std::string& name) {
    if (name == "crc32") return Result<Crc32Kind>::ok(Crc32Kind::Legacy);
    if (name == "crc32b") return Result<Crc32Kind>::ok(Crc32Kind::Ieee);
    return UidError{UidError::Config,
        "unknown checksum kind: '" + name + "'",
        "expected \"crc32\" or \"crc32b\""};
}

CRC32::CRC32(Crc32Kind kind) : kind_(kind), crc_(0xFFFFFFFFu) {}

void CRC32::update(const uint8_t* data, size_t len) {
    if (kind_ == Crc32Kind::Legacy) {
        const auto& t = msb_table();
        for (size_t i = 0; i < len; ++i) {
            crc_ = (crc_ << 8) ^ t[(crc_ >> 24) ^ data[i]];
        }
    } else {
        const auto& t = lsb_table();
        for (size_t i = 0; i < len; ++i) {
            crc_ = (crc_ >> 8) ^ t[(crc_ ^ data[i]) & 0xFF];
        }
    }
}

void CRC32::update(const std::string& s) {
    update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

uint32_t CRC32::value() const {
    return crc_ ^ 0xFFFFFFFFu;
}

std::string CRC32::hex() const {
    static const char hex_chars[] = "0123456789abcdef";
    uint32_t v = value();

    uint8_t bytes[4];
    if (kind_ == Crc32Kind::Legacy) {
        bytes[0] = uint8_t(v);
        bytes[1] = uint8_t(v >> 8);
        bytes[2] = uint8_t(v >> 16);
        bytes[3] = uint8_t(v >> 24);
    } else {
        bytes[0] = uint8_t(v >> 24);
        bytes[1] = uint8_t(v >> 16);
        bytes[2] = uint8_t(v >> 8);
        bytes[3] = uint8_t(v);
    }

    std::string out;
    out.reserve(8);
    for (uint8_t b : bytes) {
        out += hex_chars[b >> 4];
        out += hex_chars[b & 0x0f];
    }
    return out;
}

void CRC32::reset() {
    crc_ = 0xFFFFFFFFu;
}

uint32_t CRC32::compute(const std::string& data, Crc32Kind kind) {
    CRC32 crc(kind);
    crc.update(data);
    return crc.value();
}

std::string CRC32::hash_hex(const std::string& data, Crc32Kind kind) {
    CRC32 crc(kind);
    crc.update(data);
    return crc.hex();
}

} // namespace uidkit
