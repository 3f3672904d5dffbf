#include <catch2/catch.hpp>
#include <treeish/config.hpp>

using namespace treeish;

// ===== Parsing =====

TEST_CASE("parse config with walk section", "[config]") {
    auto r = Config::parse(R"(
[walk]
min-depth = 1
max-depth = 4
follow-links = true
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().walk.min_depth == 1);
    REQUIRE(r.value().walk.max_depth == 4);
    REQUIRE(r.value().walk.follow_links == true);
    REQUIRE(r.value().max_depth_set);
}

TEST_CASE("parse config with log level", "[config]") {
    auto r = Config::parse(R"(
[log]
level = "debug"
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().log_level == log::Debug);
    REQUIRE(r.value().log_level_set);
}

TEST_CASE("parse empty config keeps defaults", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().walk.min_depth == 0);
    REQUIRE(r.value().walk.max_depth == WalkBehavior::unlimited);
    REQUIRE_FALSE(r.value().walk.follow_links);
    REQUIRE_FALSE(r.value().min_depth_set);
}

TEST_CASE("parse invalid TOML config", "[config]") {
    auto r = Config::parse("not valid [toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TreeishError::Config);
}

TEST_CASE("negative depth is rejected", "[config]") {
    auto r = Config::parse("[walk]\nmax-depth = -1\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TreeishError::Config);
}

TEST_CASE("wrongly typed values are rejected", "[config]") {
    REQUIRE(Config::parse("[walk]\nmax-depth = \"deep\"\n").is_err());
    REQUIRE(Config::parse("[walk]\nfollow-links = 1\n").is_err());
}

TEST_CASE("unknown log level is rejected", "[config]") {
    auto r = Config::parse("[log]\nlevel = \"loud\"\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("loud") != std::string::npos);
}

TEST_CASE("min-depth above max-depth is rejected", "[config]") {
    auto r = Config::parse("[walk]\nmin-depth = 5\nmax-depth = 2\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TreeishError::Config);
}

// ===== Merge =====

TEST_CASE("merge overrides only explicitly set fields", "[config]") {
    auto base = Config::parse(R"(
[walk]
max-depth = 3
follow-links = true
)").value();

    auto overlay = Config::parse(R"(
[walk]
max-depth = 6
)").value();

    base.merge(overlay);
    REQUIRE(base.walk.max_depth == 6);       // overridden
    REQUIRE(base.walk.follow_links == true); // preserved
}

TEST_CASE("effective layers global, local and explicit", "[config]") {
    auto global = Config::parse("[walk]\nmax-depth = 2\n[log]\nlevel = \"info\"\n").value();
    auto local = Config::parse("[walk]\nmax-depth = 5\n").value();
    auto file = Config::parse("[walk]\nfollow-links = true\n").value();

    auto cfg = Config::effective(global, local, file);
    REQUIRE(cfg.walk.max_depth == 5);
    REQUIRE(cfg.walk.follow_links);
    REQUIRE(cfg.log_level == log::Info);
}

TEST_CASE("effective with no layers is the default", "[config]") {
    auto cfg = Config::effective(std::nullopt, std::nullopt);
    REQUIRE(cfg.walk.max_depth == WalkBehavior::unlimited);
    REQUIRE(cfg.validate().is_ok());
}

TEST_CASE("validate catches bounds crossed by merging", "[config]") {
    auto cfg = Config::effective(Config::parse("[walk]\nmin-depth = 4\n").value(),
                                 Config::parse("[walk]\nmax-depth = 1\n").value());
    REQUIRE(cfg.validate().is_err());
}

TEST_CASE("load missing config file", "[config]") {
    auto r = Config::load("/nonexistent_dir_xyz_123/config.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TreeishError::IO);
}
