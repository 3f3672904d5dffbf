// findish: print every filesystem entry a treeish expression selects.
//
//     findish '/var/log::**/*.log'
//     findish --max-depth 2 '**/*.txt'
//     findish /etc/hosts
//
// Exit status is 0 once the expression builds, even if some directories
// could not be read, and 1 if the expression, arguments, or config are bad.

#include <treeish/config.hpp>
#include <treeish/log.hpp>
#include <treeish/result.hpp>
#include <treeish/treeish.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;
using namespace treeish;

namespace {

struct Options {
    std::string expression;
    std::optional<std::string> config_file;
    std::optional<size_t> min_depth;
    std::optional<size_t> max_depth;
    bool follow_links = false;
    bool verbose = false;
    bool help = false;
};

const char* USAGE =
    "usage: findish [options] <expression>\n"
    "\n"
    "  <expression>        a path, a glob, or <path>::<glob>\n"
    "\n"
    "options:\n"
    "  -c, --config FILE   read settings from FILE after the global and local config\n"
    "      --min-depth N   skip entries shallower than N (the root is depth 0)\n"
    "      --max-depth N   do not descend deeper than N\n"
    "  -L, --follow-links  descend into symlinked directories\n"
    "  -v, --verbose       log debug output and report unreadable entries\n"
    "  -h, --help          show this message\n";

Result<size_t> parse_depth(const std::string& flag, const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return TreeishError{TreeishError::InvalidArg,
            flag + " expects a non-negative integer, got '" + text + "'"};
    }
    try {
        return Result<size_t>::ok(static_cast<size_t>(std::stoull(text)));
    } catch (const std::out_of_range&) {
        return TreeishError{TreeishError::InvalidArg, flag + " value is too large: " + text};
    }
}

Result<Options> parse_args(int argc, char** argv) {
    Options opts;
    bool have_expression = false;
    bool only_positional = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto take_value = [&](const std::string& flag) -> Result<std::string> {
            if (i + 1 >= argc) {
                return TreeishError{TreeishError::InvalidArg,
                    flag + " requires a value", USAGE};
            }
            return Result<std::string>::ok(argv[++i]);
        };

        if (!only_positional && arg == "--") {
            only_positional = true;
        } else if (!only_positional && (arg == "-h" || arg == "--help")) {
            opts.help = true;
        } else if (!only_positional && (arg == "-v" || arg == "--verbose")) {
            opts.verbose = true;
        } else if (!only_positional && (arg == "-L" || arg == "--follow-links")) {
            opts.follow_links = true;
        } else if (!only_positional && (arg == "-c" || arg == "--config")) {
            auto v = take_value(arg);
            if (v.is_err()) return std::move(v).error();
            opts.config_file = std::move(v).value();
        } else if (!only_positional && (arg == "--min-depth" || arg == "--max-depth")) {
            auto v = take_value(arg);
            if (v.is_err()) return std::move(v).error();
            auto depth = parse_depth(arg, v.value());
            if (depth.is_err()) return std::move(depth).error();
            if (arg == "--min-depth") {
                opts.min_depth = depth.value();
            } else {
                opts.max_depth = depth.value();
            }
        } else if (!only_positional && arg.size() > 1 && arg[0] == '-') {
            return TreeishError{TreeishError::InvalidArg, "unknown option: " + arg, USAGE};
        } else if (have_expression) {
            return TreeishError{TreeishError::InvalidArg,
                "unexpected argument: " + arg,
                "quote the expression so the shell does not expand it"};
        } else {
            opts.expression = arg;
            have_expression = true;
        }
    }

    if (!have_expression && !opts.help) {
        return TreeishError{TreeishError::InvalidArg, "no expression given", USAGE};
    }
    return Result<Options>::ok(std::move(opts));
}

// Load an optional layer; a missing implicit file is not an error.
Result<std::optional<Config>> load_layer(const std::string& path, bool required) {
    std::error_code ec;
    if (path.empty() || (!required && !fs::exists(path, ec))) {
        return Result<std::optional<Config>>::ok(std::nullopt);
    }
    log::debug("loading config %s", path.c_str());
    auto cfg = Config::load(path);
    if (cfg.is_err()) return std::move(cfg).error();
    return Result<std::optional<Config>>::ok(std::move(cfg).value());
}

Result<Config> load_config(const Options& opts) {
    auto global = load_layer(global_config_path(), false);
    if (global.is_err()) return std::move(global).error();
    auto local = load_layer(local_config_path(), false);
    if (local.is_err()) return std::move(local).error();

    std::optional<Config> explicit_file;
    if (opts.config_file) {
        auto file = load_layer(*opts.config_file, true);
        if (file.is_err()) return std::move(file).error();
        explicit_file = std::move(file).value();
    }

    Config cfg = Config::effective(global.value(), local.value(), explicit_file);
    if (opts.min_depth) cfg.walk.min_depth = *opts.min_depth;
    if (opts.max_depth) cfg.walk.max_depth = *opts.max_depth;
    if (opts.follow_links) cfg.walk.follow_links = true;

    TREEISH_TRY(cfg.validate());
    return Result<Config>::ok(std::move(cfg));
}

int run(const Options& opts) {
    auto cfg = load_config(opts);
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return 1;
    }
    if (!opts.verbose && cfg.value().log_level_set && !std::getenv("TREEISH_LOG")) {
        log::set_level(cfg.value().log_level);
    }

    auto built = Treeish::parse(opts.expression);
    if (built.is_err()) {
        std::cerr << built.error().format() << "\n";
        return 1;
    }
    const Treeish& tree = built.value();
    log::debug("expression '%s' is a %s", tree.to_string().c_str(),
               Treeish::kind_name(tree.kind()));

    size_t found = 0;
    size_t failed = 0;
    auto walk = tree.walk(cfg.value().walk);
    while (auto item = walk.next()) {
        if (item->is_ok()) {
            std::cout << item->value().path.string() << "\n";
            ++found;
        } else {
            // Unreadable entries are skipped; they do not change the exit status
            ++failed;
            log::info("skipped: %s", item->error().message.c_str());
        }
    }
    log::debug("%zu entries, %zu errors", found, failed);
    return 0;
}

} // anonymous namespace

int main(int argc, char** argv) {
    log::init_from_env();

    auto opts = parse_args(argc, argv);
    if (opts.is_err()) {
        std::cerr << opts.error().format() << "\n";
        return 1;
    }
    if (opts.value().help) {
        std::cout << USAGE;
        return 0;
    }
    if (opts.value().verbose) {
        log::set_level(log::Debug);
    }

    return run(opts.value());
}
