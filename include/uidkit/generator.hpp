#pragma once

#include <uidkit/crc32.hpp>
#include <uidkit/object_id.hpp>
#include <uidkit/result.hpp>
#include <uidkit/uuid.hpp>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string>

namespace uidkit {

// How the machine field of an object id is chosen.
//   PerProcess  drawn once when the generator is constructed
//   PerCall     re-drawn for every object id (legacy output parity)
//   Fixed       GeneratorOptions::machine_id
enum class MachineIdMode { PerProcess, PerCall, Fixed };

const char* machine_id_mode_name(MachineIdMode mode);

struct GeneratorOptions {
    // Seeds the non-cryptographic engine; random_device when unset.
    std::optional<uint32_t> seed;
    MachineIdMode machine_id_mode = MachineIdMode::PerProcess;
    uint32_t machine_id = 0;
    // Counter value before the first increment; random when unset.
    std::optional<uint32_t> counter_start;
    Crc32Kind prefix_checksum = Crc32Kind::Legacy;
};

// Owns all mutable generator state: the random engine, the process
// machine id and the object-id counter. Safe to share between threads.
class IdGenerator {
public:
    IdGenerator();
    explicit IdGenerator(GeneratorOptions options);

    IdGenerator(const IdGenerator&) = delete;
    IdGenerator& operator=(const IdGenerator&) = delete;

    Result<std::string> uuid_v3(const std::string& ns, const std::string& name);
    Result<std::string> uuid_v5(const std::string& ns, const std::string& name);
    std::string uuid_v4();

    static bool is_valid_uuid(const std::string& candidate);

    ObjectId next_object_id();
    std::string object_id();

    // <crc of ns>-<object id>
    std::string prefixed_id(const std::string& ns);

    const GeneratorOptions& options() const { return options_; }

private:
    uint32_t draw_24bit();
    uint32_t current_machine_id();
    uint32_t next_counter();

    GeneratorOptions options_;

    std::mutex engine_mutex_;
    std::mt19937 engine_;

    uint32_t process_machine_id_ = 0;

    std::once_flag counter_once_;
    std::atomic<uint32_t> counter_{0};
};

} // namespace uidkit
