#include <uidkit/object_id.hpp>

namespace uidkit {

static const char hex_chars[] = "0123456789abcdef";

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Append the low `digits` nibbles of `v`, most significant first.
static void append_hex(std::string& out, uint32_t v, int digits) {
    for (int shift = (digits - 1) * 4; shift >= 0; shift -= 4) {
        out += hex_chars[(v >> shift) & 0x0F];
    }
}

static uint32_t read_hex(const std::string& s, size_t pos, int digits) {
    uint32_t v = 0;
    for (int i = 0; i < digits; ++i) {
        v = (v << 4) | static_cast<uint32_t>(hex_val(s[pos + i]));
    }
    return v;
}

std::string ObjectId::to_string() const {
    std::string out;
    out.reserve(hex_length);
    append_hex(out, timestamp, 8);
    append_hex(out, machine_id & max_24bit, 6);
    append_hex(out, process_id, 4);
    append_hex(out, counter & max_24bit, 6);
    return out;
}

bool ObjectId::is_valid(const std::string& s) {
    if (s.size() != hex_length) return false;
    for (char c : s) {
        if (hex_val(c) < 0) return false;
    }
    return true;
}

Result<ObjectId> ObjectId::from_string(const std::string& s) {
    if (s.size() != hex_length) {
        return UidError(UidError::Parse,
            "object id must be 24 hex characters",
            "Got " + std::to_string(s.size()) + " characters");
    }
    for (size_t i = 0; i < s.size(); ++i) {
        if (hex_val(s[i]) < 0) {
            return UidError(UidError::Parse,
                "object id contains invalid hex character",
                std::string("Invalid char '") + s[i] + "' at position " + std::to_string(i));
        }
    }

    ObjectId oid;
    oid.timestamp = read_hex(s, 0, 8);
    oid.machine_id = read_hex(s, 8, 6);
    oid.process_id = static_cast<uint16_t>(read_hex(s, 14, 4));
    oid.counter = read_hex(s, 18, 6);
    return Result<ObjectId>::ok(oid);
}

bool ObjectId::operator==(const ObjectId& other) const {
    return timestamp == other.timestamp
        && machine_id == other.machine_id
        && process_id == other.process_id
        && counter == other.counter;
}

bool ObjectId::operator!=(const ObjectId& other) const {
    return !(*this == other);
}

} // namespace uidkit
