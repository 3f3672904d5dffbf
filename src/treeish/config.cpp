#include <treeish/config.hpp>
#include <toml++/toml.hpp>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace treeish {

static Result<size_t> read_depth(const toml::table& walk, const char* key) {
    auto node = walk[key];
    auto v = node.value<int64_t>();
    if (!v) {
        return TreeishError{TreeishError::Config,
            std::string("walk.") + key + " must be an integer"};
    }
    if (*v < 0) {
        return TreeishError{TreeishError::Config,
            std::string("walk.") + key + " must not be negative",
            "got " + std::to_string(*v)};
    }
    return Result<size_t>::ok(static_cast<size_t>(*v));
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return TreeishError{TreeishError::Config,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "at line " + std::to_string(e.source().begin.line)};
    }

    Config cfg;

    // [walk] section
    if (auto walk = doc["walk"].as_table()) {
        if (walk->contains("min-depth")) {
            auto v = read_depth(*walk, "min-depth");
            if (v.is_err()) return std::move(v).error();
            cfg.walk.min_depth = v.value();
            cfg.min_depth_set = true;
        }
        if (walk->contains("max-depth")) {
            auto v = read_depth(*walk, "max-depth");
            if (v.is_err()) return std::move(v).error();
            cfg.walk.max_depth = v.value();
            cfg.max_depth_set = true;
        }
        if (walk->contains("follow-links")) {
            auto v = (*walk)["follow-links"].value<bool>();
            if (!v) {
                return TreeishError{TreeishError::Config,
                    "walk.follow-links must be a boolean"};
            }
            cfg.walk.follow_links = *v;
            cfg.follow_links_set = true;
        }
    }

    // [log] section
    if (auto log_tbl = doc["log"].as_table()) {
        if (auto v = (*log_tbl)["level"].value<std::string>()) {
            if (!log::parse_level(*v, cfg.log_level)) {
                return TreeishError{TreeishError::Config,
                    "unknown log level '" + *v + "'",
                    "expected one of trace, debug, info, warn, error"};
            }
            cfg.log_level_set = true;
        }
    }

    auto ok = cfg.validate();
    if (ok.is_err()) return std::move(ok).error();
    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return TreeishError{TreeishError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        auto& hint = cfg.error().hint;
        hint += (hint.empty() ? "in " : " in ") + path;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.min_depth_set) {
        walk.min_depth = other.walk.min_depth;
        min_depth_set = true;
    }
    if (other.max_depth_set) {
        walk.max_depth = other.walk.max_depth;
        max_depth_set = true;
    }
    if (other.follow_links_set) {
        walk.follow_links = other.walk.follow_links;
        follow_links_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
}

Status Config::validate() const {
    if (walk.min_depth > walk.max_depth) {
        return TreeishError{TreeishError::Config,
            "walk.min-depth is greater than walk.max-depth",
            std::to_string(walk.min_depth) + " > " + std::to_string(walk.max_depth)};
    }
    return ok_status();
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local,
                         const std::optional<Config>& explicit_file) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    if (explicit_file.has_value()) result.merge(explicit_file.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.treeish/config.toml";
}

std::string local_config_path() {
    return ".treeish.toml";
}

} // namespace treeish
