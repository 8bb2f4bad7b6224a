#include <uidkit/config.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace uidkit {

static UidError config_error(const std::string& key, const std::string& msg,
                             const std::string& hint) {
    return UidError{UidError::Config, "[generator] " + key + ": " + msg, hint};
}

// Accepts "per-process", "per-call", a hex string of up to 6 digits, or an
// integer in [0, 0xFFFFFF].
static Status parse_machine_id(const toml::node& node, GeneratorOptions& out) {
    const std::string hint =
        "expected \"per-process\", \"per-call\" or a 24-bit machine id such as \"0a1b2c\"";

    if (auto n = node.value<int64_t>()) {
        if (*n < 0 || *n > ObjectId::max_24bit) {
            return config_error("machine-id", "out of range", hint);
        }
        out.machine_id_mode = MachineIdMode::Fixed;
        out.machine_id = static_cast<uint32_t>(*n);
        return ok_status();
    }

    auto s = node.value<std::string>();
    if (!s) {
        return config_error("machine-id", "must be a string or integer", hint);
    }
    if (*s == "per-process") {
        out.machine_id_mode = MachineIdMode::PerProcess;
        return ok_status();
    }
    if (*s == "per-call") {
        out.machine_id_mode = MachineIdMode::PerCall;
        return ok_status();
    }

    if (s->empty() || s->size() > 6) {
        return config_error("machine-id", "unrecognised value '" + *s + "'", hint);
    }
    uint32_t v = 0;
    for (char c : *s) {
        int d;
        if (c >= '0' && c <= '9') d = c - '0';
        else if (c >= 'a' && c <= 'f') d = c - 'a' + 10;
        else if (c >= 'A' && c <= 'F') d = c - 'A' + 10;
        else return config_error("machine-id", "unrecognised value '" + *s + "'", hint);
        v = (v << 4) | static_cast<uint32_t>(d);
    }
    out.machine_id_mode = MachineIdMode::Fixed;
    out.machine_id = v;
    return ok_status();
}

static Result<uint32_t> parse_bounded(const toml::node& node, const std::string& key,
                                      int64_t max) {
    auto n = node.value<int64_t>();
    if (!n) {
        return config_error(key, "must be an integer", "");
    }
    if (*n < 0 || *n > max) {
        return config_error(key, "out of range",
            "expected a value between 0 and " + std::to_string(max));
    }
    return Result<uint32_t>::ok(static_cast<uint32_t>(*n));
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return UidError{UidError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto node = lg->get("level")) {
            auto v = node->value<std::string>();
            if (!v) {
                return UidError{UidError::Config, "[log] level: must be a string",
                    "expected one of trace, debug, info, warn, error"};
            }
            auto lvl = log::parse_level(*v);
            UIDKIT_TRY(lvl);
            cfg.log_level = lvl.value();
        }
        if (auto node = lg->get("color")) {
            auto v = node->value<bool>();
            if (!v) {
                return UidError{UidError::Config, "[log] color: must be true or false"};
            }
            cfg.log_color = *v;
        }
    }

    // [generator] section
    if (auto gen = doc["generator"].as_table()) {
        if (auto node = gen->get("machine-id")) {
            UIDKIT_TRY(parse_machine_id(*node, cfg.generator));
            cfg.machine_id_set = true;
        }
        if (auto node = gen->get("counter-start")) {
            auto v = parse_bounded(*node, "counter-start", ObjectId::max_24bit);
            UIDKIT_TRY(v);
            cfg.generator.counter_start = v.value();
        }
        if (auto node = gen->get("seed")) {
            auto v = parse_bounded(*node, "seed", 0xFFFFFFFFll);
            UIDKIT_TRY(v);
            cfg.generator.seed = v.value();
        }
        if (auto node = gen->get("prefix-checksum")) {
            auto v = node->value<std::string>();
            if (!v) {
                return config_error("prefix-checksum", "must be a string",
                    "expected \"crc32\" or \"crc32b\"");
            }
            auto kind = parse_crc32_kind(*v);
            UIDKIT_TRY(kind);
            cfg.generator.prefix_checksum = kind.value();
            cfg.prefix_checksum_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return UidError{UidError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        cfg.error().file = path;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.log_level.has_value()) log_level = other.log_level;
    if (other.log_color.has_value()) log_color = other.log_color;

    // Generator: other overrides only explicitly-set fields
    if (other.machine_id_set) {
        generator.machine_id_mode = other.generator.machine_id_mode;
        generator.machine_id = other.generator.machine_id;
        machine_id_set = true;
    }
    if (other.generator.counter_start.has_value()) {
        generator.counter_start = other.generator.counter_start;
    }
    if (other.generator.seed.has_value()) {
        generator.seed = other.generator.seed;
    }
    if (other.prefix_checksum_set) {
        generator.prefix_checksum = other.generator.prefix_checksum;
        prefix_checksum_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

void Config::apply_logging() const {
    if (log_level.has_value()) log::set_level(*log_level);
    if (log_color.has_value()) log::set_color_enabled(*log_color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.uidkit/config.toml";
}

} // namespace uidkit
