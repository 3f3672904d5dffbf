#pragma once

#include <treeish/log.hpp>
#include <treeish/result.hpp>
#include <treeish/walk.hpp>
#include <optional>
#include <string>

namespace treeish {

// Layered configuration: global > local > explicit file.
// Lower layers override higher layers, field by field.
//
//   [walk]
//   min-depth = 0
//   max-depth = 8
//   follow-links = false
//
//   [log]
//   level = "warn"
struct Config {
    WalkBehavior walk;
    log::Level log_level = log::Warn;

    // Track which fields were explicitly set (for merge)
    bool min_depth_set = false;
    bool max_depth_set = false;
    bool follow_links_set = false;
    bool log_level_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly-set values override this)
    void merge(const Config& other);

    // Check cross-field constraints after merging
    Status validate() const;

    // Build effective config from layers: global -> local -> explicit
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local,
                            const std::optional<Config>& explicit_file = std::nullopt);
};

// Discover the global config file path: ~/.treeish/config.toml
std::string global_config_path();

// Per-directory config file: ./.treeish.toml
std::string local_config_path();

} // namespace treeish
