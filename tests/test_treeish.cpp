#include <catch2/catch.hpp>
#include <treeish/treeish.hpp>
#include <string>

using namespace treeish;

static Treeish build(std::string_view expr) {
    auto r = Treeish::parse(expr);
    REQUIRE(r.is_ok());
    return std::move(r).value();
}

// ===== Construction =====

TEST_CASE("glob in tree", "[treeish]") {
    auto t = build("/mnt/media::**/*.txt");
    REQUIRE(t.kind() == Treeish::Kind::GlobIn);
    auto parts = std::move(t).glob_in();
    REQUIRE(parts.has_value());
    REQUIRE(parts->first.view() == "/mnt/media");
    REQUIRE(parts->second.text() == "**/*.txt");
}

TEST_CASE("bare glob", "[treeish]") {
    auto t = build("**/*.txt");
    REQUIRE(t.kind() == Treeish::Kind::Glob);
    auto g = std::move(t).glob();
    REQUIRE(g.has_value());
    REQUIRE(g->text() == "**/*.txt");
}

TEST_CASE("bare path", "[treeish]") {
    auto t = build("/var/log/app.log");
    REQUIRE(t.kind() == Treeish::Kind::Path);
    auto p = std::move(t).path();
    REQUIRE(p.has_value());
    REQUIRE(p->view() == "/var/log/app.log");
}

TEST_CASE("empty expression", "[treeish]") {
    auto t = build("");
    REQUIRE(t.is_empty());
    REQUIRE_FALSE(t.has_path());
    REQUIRE_FALSE(t.has_glob());
    REQUIRE(t.to_string().empty());

    auto walk = t.walk();
    REQUIRE_FALSE(walk.next().has_value());
}

TEST_CASE("literal paths round-trip exactly", "[treeish]") {
    for (const char* expr : {"/var/log/app.log", "relative/dir/", "./a.txt", "a//b", "/"}) {
        auto t = build(expr);
        REQUIRE(t.kind() == Treeish::Kind::Path);
        auto p = std::move(t).path();
        REQUIRE(p.has_value());
        REQUIRE(p->view() == expr);
    }
}

TEST_CASE("malformed glob without separator is a path", "[treeish]") {
    auto t = build("report[2024");
    REQUIRE(t.kind() == Treeish::Kind::Path);
    REQUIRE(t.to_string() == "report[2024");
}

TEST_CASE("unclosed class ending in an escape is a path", "[treeish]") {
    auto t = build("foo[a\\");
    REQUIRE(t.kind() == Treeish::Kind::Path);
    REQUIRE(t.to_string() == "foo[a\\");
}

TEST_CASE("empty prefix before separator is dropped", "[treeish]") {
    auto t = build("::src/*.cpp");
    REQUIRE(t.kind() == Treeish::Kind::Glob);
    REQUIRE(t.to_string() == "src/*.cpp");
}

// ===== Rule violations =====

TEST_CASE("rooted glob under a tree is rejected", "[treeish]") {
    auto r = Treeish::parse("a/b::/x/*.txt");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TreeishError::Rule);
    REQUIRE(r.error().is_build_error());
    REQUIRE(r.error().expression == "a/b::/x/*.txt");
    REQUIRE(r.error().offset == 5);
}

TEST_CASE("rooted glob with empty tree is allowed", "[treeish]") {
    auto t = build("::/x/*.txt");
    REQUIRE(t.kind() == Treeish::Kind::Glob);
}

TEST_CASE("build errors carry the expression", "[treeish]") {
    auto r = Treeish::parse("root::[");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TreeishError::Glob);
    REQUIRE(r.error().expression == "root::[");
    REQUIRE(r.error().format().find("error[Glob]") == 0);
}

// ===== Alternate entry points =====

TEST_CASE("from_glob partitions the glob", "[treeish]") {
    auto g = Glob::compile("/mnt/*.txt");
    REQUIRE(g.is_ok());
    auto t = Treeish::from_glob(std::move(g).value());
    REQUIRE(t.is_ok());
    auto parts = std::move(t).value().glob_in();
    REQUIRE(parts.has_value());
    REQUIRE(parts->first.view() == "/mnt");
    REQUIRE(parts->second.text() == "*.txt");
}

TEST_CASE("from_glob of an empty glob is empty", "[treeish]") {
    auto t = Treeish::from_glob(Glob());
    REQUIRE(t.is_ok());
    REQUIRE(t.value().is_empty());
}

TEST_CASE("from_partitioned checks the rooted rule", "[treeish]") {
    auto g = Glob::compile("/etc/*").value();
    auto r = Treeish::from_partitioned(
        Partitioned::glob_in(MaybeOwned::borrowed("/srv"), std::move(g)));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TreeishError::Rule);
}

TEST_CASE("from_path", "[treeish]") {
    REQUIRE(Treeish::from_path("").is_empty());
    auto t = Treeish::from_path("/tmp/x*");
    REQUIRE(t.kind() == Treeish::Kind::Path);
    REQUIRE(t.to_string() == "/tmp/x*");
}

// ===== Predicates and accessors =====

TEST_CASE("has_path and has_glob", "[treeish]") {
    auto path = build("/etc/hosts");
    REQUIRE(path.has_path());
    REQUIRE_FALSE(path.has_glob());

    auto glob = build("*.md");
    REQUIRE_FALSE(glob.has_path());
    REQUIRE(glob.has_glob());

    auto glob_in = build("docs::*.md");
    REQUIRE(glob_in.has_path());
    REQUIRE(glob_in.has_glob());
}

TEST_CASE("accessors yield nothing for other kinds", "[treeish]") {
    REQUIRE_FALSE(build("/etc/hosts").glob().has_value());
    REQUIRE_FALSE(build("/etc/hosts").glob_in().has_value());
    REQUIRE_FALSE(build("*.md").path().has_value());
    REQUIRE_FALSE(build("*.md").glob_in().has_value());
    REQUIRE_FALSE(build("docs::*.md").path().has_value());
    REQUIRE_FALSE(build("docs::*.md").glob().has_value());
    REQUIRE_FALSE(build("").path().has_value());
}

TEST_CASE("to_string is canonical", "[treeish]") {
    REQUIRE(build("/mnt/media::**/*.txt").to_string() == "/mnt/media::**/*.txt");
    REQUIRE(build("/mnt/media/**/*.txt").to_string() == "/mnt/media::**/*.txt");
}

// ===== Ownership =====

TEST_CASE("parse borrows, into_owned detaches", "[treeish]") {
    std::string expr = "/srv/data::**/*.csv";
    auto t = build(expr);
    REQUIRE_FALSE(t.is_owned());

    auto owned = std::move(t).into_owned();
    REQUIRE(owned.is_owned());

    expr.assign(expr.size(), 'x');
    REQUIRE(owned.to_string() == "/srv/data::**/*.csv");
}

TEST_CASE("into_owned twice equals once", "[treeish]") {
    for (const char* expr : {"", "/etc/hosts", "*.md", "docs::**/*.md"}) {
        auto once = build(expr).into_owned();
        auto twice = once.into_owned();
        REQUIRE(once.kind() == twice.kind());
        REQUIRE(once.to_string() == twice.to_string());
        REQUIRE(twice.is_owned());
    }
}
