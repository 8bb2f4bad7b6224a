#include <uidkit/uuid.hpp>
#include <uidkit/md5.hpp>
#include <uidkit/sha1.hpp>
#include <algorithm>
#include <cctype>

namespace uidkit {

// ---- Hex helpers ----

static const char hex_chars[] = "0123456789abcdef";

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Version nibble in byte 6, variant 10xx in byte 8.
static void stamp_version(Uuid& u, uint8_t version) {
    u.bytes[6] = static_cast<uint8_t>((u.bytes[6] & 0x0F) | (version << 4));
    u.bytes[8] = static_cast<uint8_t>((u.bytes[8] & 0x3F) | 0x80);
}

// ---- Validation / parsing ----

bool Uuid::is_valid(const std::string& s) {
    static const int group_len[5] = {8, 4, 4, 4, 12};

    size_t i = 0;
    if (i < s.size() && s[i] == '{') ++i;

    for (int g = 0; g < 5; ++g) {
        if (g > 0 && i < s.size() && s[i] == '-') ++i;
        for (int k = 0; k < group_len[g]; ++k, ++i) {
            if (i >= s.size() || hex_val(s[i]) < 0) return false;
        }
    }

    if (i < s.size() && s[i] == '}') ++i;
    return i == s.size();
}

Result<Uuid> Uuid::from_string(const std::string& s) {
    if (!is_valid(s)) {
        return UidError(UidError::Parse,
            "not a UUID: '" + s + "'",
            "Expected format: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx, braces and dashes optional");
    }

    Uuid u;
    int byte_idx = 0;
    int hi = -1;
    for (char c : s) {
        if (c == '-' || c == '{' || c == '}') continue;
        int v = hex_val(c);
        if (hi < 0) {
            hi = v;
        } else {
            u.bytes[byte_idx++] = static_cast<uint8_t>((hi << 4) | v);
            hi = -1;
        }
    }
    return Result<Uuid>::ok(u);
}

static Result<Uuid> decode_namespace(const std::string& ns) {
    if (!Uuid::is_valid(ns)) {
        return UidError(UidError::InvalidNamespace,
            "invalid namespace UUID: '" + ns + "'",
            "use a UUID such as 6ba7b810-9dad-11d1-80b4-00c04fd430c8 or an alias (dns, url, oid, x500)");
    }
    return Uuid::from_string(ns);
}

// ---- Name-based UUIDs ----

Result<Uuid> Uuid::v3(const std::string& ns, const std::string& name) {
    auto ns_uuid = decode_namespace(ns);
    UIDKIT_TRY(ns_uuid);

    MD5 ctx;
    ctx.update(ns_uuid.value().bytes.data(), ns_uuid.value().bytes.size());
    ctx.update(name);
    auto digest = ctx.finalize();

    Uuid u;
    std::copy(digest.begin(), digest.end(), u.bytes.begin());
    stamp_version(u, 3);
    return Result<Uuid>::ok(u);
}

Result<Uuid> Uuid::v5(const std::string& ns, const std::string& name) {
    auto ns_uuid = decode_namespace(ns);
    UIDKIT_TRY(ns_uuid);

    SHA1 ctx;
    ctx.update(ns_uuid.value().bytes.data(), ns_uuid.value().bytes.size());
    ctx.update(name);
    auto digest = ctx.finalize();

    // SHA-1 yields 20 bytes; only the first 16 are used.
    Uuid u;
    std::copy_n(digest.begin(), u.bytes.size(), u.bytes.begin());
    stamp_version(u, 5);
    return Result<Uuid>::ok(u);
}

// ---- Random UUID ----

Uuid Uuid::v4(std::mt19937& engine) {
    std::uniform_int_distribution<uint32_t> dist(0, 0xFFFF);

    // time_low(2) time_mid(1) time_hi_and_version(1) clock_seq(1) node(3)
    Uuid u;
    for (size_t i = 0; i < u.bytes.size(); i += 2) {
        uint32_t draw = dist(engine);
        u.bytes[i] = static_cast<uint8_t>(draw >> 8);
        u.bytes[i + 1] = static_cast<uint8_t>(draw & 0xFF);
    }
    stamp_version(u, 4);
    return u;
}

// ---- to_string: xxxxxxxx-xxxx-Vxxx-Yxxx-xxxxxxxxxxxx ----

std::string Uuid::to_string() const {
    std::string out;
    out.reserve(36);
    for (int i = 0; i < 16; ++i) {
        out += hex_chars[bytes[i] >> 4];
        out += hex_chars[bytes[i] & 0x0F];
        if (i == 3 || i == 5 || i == 7 || i == 9) {
            out += '-';
        }
    }
    return out;
}

int Uuid::version() const {
    return bytes[6] >> 4;
}

bool Uuid::operator==(const Uuid& other) const {
    return bytes == other.bytes;
}

bool Uuid::operator!=(const Uuid& other) const {
    return bytes != other.bytes;
}

std::optional<std::string> well_known_namespace(const std::string& alias) {
    std::string lower;
    for (char c : alias) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "dns")  return std::string(namespaces::DNS);
    if (lower == "url")  return std::string(namespaces::URL);
    if (lower == "oid")  return std::string(namespaces::OID);
    if (lower == "x500") return std::string(namespaces::X500);
    return std::nullopt;
}

} // namespace uidkit
