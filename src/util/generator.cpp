#include <uidkit/generator.hpp>
#include <uidkit/log.hpp>
#include <ctime>

#ifdef _WIN32
#include <process.h>
#define getpid _getpid
#else
#include <unistd.h>
#endif

namespace uidkit {

const char* machine_id_mode_name(MachineIdMode mode) {
    switch (mode) {
        case MachineIdMode::PerProcess: return "per-process";
        case MachineIdMode::PerCall:    return "per-call";
        case MachineIdMode::Fixed:      return "fixed";
    }
    return "unknown";
}

static std::mt19937 make_engine(const std::optional<uint32_t>& seed) {
    if (seed.has_value()) {
        return std::mt19937(*seed);
    }
    std::random_device rd;
    return std::mt19937(rd());
}

IdGenerator::IdGenerator() : IdGenerator(GeneratorOptions{}) {}

IdGenerator::IdGenerator(GeneratorOptions options)
    : options_(std::move(options)), engine_(make_engine(options_.seed)) {
    switch (options_.machine_id_mode) {
        case MachineIdMode::PerProcess:
            process_machine_id_ = draw_24bit();
            break;
        case MachineIdMode::Fixed:
            process_machine_id_ = options_.machine_id & ObjectId::max_24bit;
            break;
        case MachineIdMode::PerCall:
            log::warn("machine id is re-drawn for every object id; "
                      "ids from one process will not share a machine field");
            break;
    }
    log::debug("generator ready (machine-id %s, prefix %s)",
               machine_id_mode_name(options_.machine_id_mode),
               crc32_kind_name(options_.prefix_checksum));
}

uint32_t IdGenerator::draw_24bit() {
    std::uniform_int_distribution<uint32_t> dist(0, ObjectId::max_24bit);
    std::lock_guard<std::mutex> lock(engine_mutex_);
    return dist(engine_);
}

uint32_t IdGenerator::current_machine_id() {
    if (options_.machine_id_mode == MachineIdMode::PerCall) {
        return draw_24bit();
    }
    return process_machine_id_;
}

uint32_t IdGenerator::next_counter() {
    std::call_once(counter_once_, [this] {
        uint32_t start = options_.counter_start.has_value()
            ? (*options_.counter_start & ObjectId::max_24bit)
            : draw_24bit();
        counter_.store(start);
        log::debug("object id counter starts at %06x", start);
    });
    // Pre-increment: the first id carries start + 1.
    return (counter_.fetch_add(1) + 1) & ObjectId::max_24bit;
}

// ---- UUIDs ----

Result<std::string> IdGenerator::uuid_v3(const std::string& ns, const std::string& name) {
    return Uuid::v3(ns, name).map([](Uuid& u) { return u.to_string(); });
}

Result<std::string> IdGenerator::uuid_v5(const std::string& ns, const std::string& name) {
    return Uuid::v5(ns, name).map([](Uuid& u) { return u.to_string(); });
}

std::string IdGenerator::uuid_v4() {
    std::lock_guard<std::mutex> lock(engine_mutex_);
    return Uuid::v4(engine_).to_string();
}

bool IdGenerator::is_valid_uuid(const std::string& candidate) {
    return Uuid::is_valid(candidate);
}

// ---- Object ids ----

ObjectId IdGenerator::next_object_id() {
    ObjectId oid;
    oid.timestamp = static_cast<uint32_t>(std::time(nullptr));
    oid.machine_id = current_machine_id();
    oid.process_id = static_cast<uint16_t>(getpid() & 0xFFFF);
    oid.counter = next_counter();
    return oid;
}

std::string IdGenerator::object_id() {
    auto id = next_object_id().to_string();
    log::trace("object id %s", id.c_str());
    return id;
}

std::string IdGenerator::prefixed_id(const std::string& ns) {
    return CRC32::hash_hex(ns, options_.prefix_checksum) + "-" + object_id();
}

} // namespace uidkit
