#pragma once

#include <uidkit/result.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <random>
#include <string>

namespace uidkit {

// RFC 4122 predefined namespaces for name-based UUIDs.
namespace namespaces {
inline constexpr const char* DNS  = "6ba7b810-9dad-11d1-80b4-00c04fd430c8";
inline constexpr const char* URL  = "6ba7b811-9dad-11d1-80b4-00c04fd430c8";
inline constexpr const char* OID  = "6ba7b812-9dad-11d1-80b4-00c04fd430c8";
inline constexpr const char* X500 = "6ba7b814-9dad-11d1-80b4-00c04fd430c8";
} // namespace namespaces

struct Uuid {
    std::array<uint8_t, 16> bytes;

    // Name-based: MD5 (v3) or SHA-1 (v5) over namespace bytes + name.
    // Fails with InvalidNamespace when `ns` is not UUID-shaped.
    static Result<Uuid> v3(const std::string& ns, const std::string& name);
    static Result<Uuid> v5(const std::string& ns, const std::string& name);

    // Random, from eight 16-bit draws of a non-cryptographic engine.
    static Uuid v4(std::mt19937& engine);

    // Shape check only: {? 8 -? 4 -? 4 -? 4 -? 12 }?, any hex case.
    // Version and variant bits are not inspected.
    static bool is_valid(const std::string& s);

    // Accepts everything is_valid() accepts.
    static Result<Uuid> from_string(const std::string& s);

    // Lowercase xxxxxxxx-xxxx-Vxxx-Yxxx-xxxxxxxxxxxx
    std::string to_string() const;

    int version() const;

    bool operator==(const Uuid& other) const;
    bool operator!=(const Uuid& other) const;
};

// Maps "dns", "url", "oid" and "x500" (any case) to their namespace UUID.
std::optional<std::string> well_known_namespace(const std::string& alias);

} // namespace uidkit
