#pragma once

#include <uidkit/generator.hpp>
#include <uidkit/log.hpp>
#include <uidkit/result.hpp>
#include <optional>
#include <string>

namespace uidkit {

// Layered configuration: global > local
// Lower layers override higher layers (local wins over global)
struct Config {
    std::optional<log::Level> log_level;
    std::optional<bool> log_color;

    GeneratorOptions generator;
    // Track which generator fields were explicitly set (for merge)
    bool machine_id_set = false;
    bool prefix_checksum_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> local
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    // Push the [log] settings into the process logger
    void apply_logging() const;

    GeneratorOptions generator_options() const { return generator; }
};

// Discover the global config file path: ~/.uidkit/config.toml
std::string global_config_path();

} // namespace uidkit
