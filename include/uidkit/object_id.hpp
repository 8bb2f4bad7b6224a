#pragma once

#include <uidkit/result.hpp>
#include <cstdint>
#include <string>

namespace uidkit {

// Document-store style identifier: 12 bytes rendered as 24 hex chars.
//
//   offset  width  field
//   0       8      timestamp   (Unix seconds, 32 bits)
//   8       6      machine id  (24 bits)
//   14      4      process id  (16 bits)
//   18      6      counter     (24 bits)
struct ObjectId {
    uint32_t timestamp = 0;
    uint32_t machine_id = 0;
    uint16_t process_id = 0;
    uint32_t counter = 0;

    static constexpr size_t hex_length = 24;
    static constexpr uint32_t max_24bit = 0xFFFFFF;

    // Fields wider than their slot are truncated to it.
    std::string to_string() const;

    static bool is_valid(const std::string& s);
    static Result<ObjectId> from_string(const std::string& s);

    bool operator==(const ObjectId& other) const;
    bool operator!=(const ObjectId& other) const;
};

} // namespace uidkit
