#include <catch2/catch.hpp>
#include <treeish/parse.hpp>
#include <string>

using namespace treeish;

static std::optional<Partitioned> split(std::string_view expr) {
    auto r = partition_expression(expr);
    REQUIRE(r.is_ok());
    return std::move(r).value();
}

// ===== Separator branch =====

TEST_CASE("separator with both parts", "[parse]") {
    auto p = split("/mnt/media::**/*.txt");
    REQUIRE(p.has_value());
    REQUIRE(p->kind() == Partitioned::Kind::GlobIn);
    REQUIRE(p->path_text().view() == "/mnt/media");
    REQUIRE(p->glob_ref().text() == "**/*.txt");
}

TEST_CASE("separator with empty prefix gives a glob", "[parse]") {
    auto p = split("::*.txt");
    REQUIRE(p.has_value());
    REQUIRE(p->kind() == Partitioned::Kind::Glob);
    REQUIRE(p->glob_ref().text() == "*.txt");
}

TEST_CASE("separator with empty suffix gives a path", "[parse]") {
    auto p = split("some/dir::");
    REQUIRE(p.has_value());
    REQUIRE(p->kind() == Partitioned::Kind::Path);
    REQUIRE(p->path_text().view() == "some/dir");
}

TEST_CASE("bare separator is empty", "[parse]") {
    REQUIRE_FALSE(split("::").has_value());
}

TEST_CASE("only the first separator splits", "[parse]") {
    auto p = split("a::b::c");
    REQUIRE(p.has_value());
    REQUIRE(p->kind() == Partitioned::Kind::GlobIn);
    REQUIRE(p->path_text().view() == "a");
    REQUIRE(p->glob_ref().text() == "b::c");
}

TEST_CASE("prefix is taken literally", "[parse]") {
    auto p = split("dir[1]::*.v");
    REQUIRE(p.has_value());
    REQUIRE(p->kind() == Partitioned::Kind::GlobIn);
    REQUIRE(p->path_text().view() == "dir[1]");
}

TEST_CASE("rooted suffix is left for the rule check", "[parse]") {
    auto p = split("a/b::/x/*.txt");
    REQUIRE(p.has_value());
    REQUIRE(p->kind() == Partitioned::Kind::GlobIn);
    REQUIRE(p->glob_ref().has_root());
}

TEST_CASE("malformed glob after separator fails", "[parse]") {
    auto r = partition_expression("src::foo[");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TreeishError::Glob);
    REQUIRE(r.error().expression == "src::foo[");
    REQUIRE(r.error().offset == 8);
}

// ===== Whole-expression branch =====

TEST_CASE("pure pattern", "[parse]") {
    auto p = split("**/*.txt");
    REQUIRE(p.has_value());
    REQUIRE(p->kind() == Partitioned::Kind::Glob);
    REQUIRE(p->glob_ref().text() == "**/*.txt");
}

TEST_CASE("literal path", "[parse]") {
    auto p = split("/var/log/app.log");
    REQUIRE(p.has_value());
    REQUIRE(p->kind() == Partitioned::Kind::Path);
    REQUIRE(p->path_text().view() == "/var/log/app.log");
}

TEST_CASE("pattern under a literal prefix", "[parse]") {
    auto p = split("/mnt/media/*.mp3");
    REQUIRE(p.has_value());
    REQUIRE(p->kind() == Partitioned::Kind::GlobIn);
    REQUIRE(p->path_text().view() == "/mnt/media");
    REQUIRE(p->glob_ref().text() == "*.mp3");
    REQUIRE_FALSE(p->glob_ref().has_root());
}

TEST_CASE("malformed glob falls back to a literal path", "[parse]") {
    auto p = split("foo[");
    REQUIRE(p.has_value());
    REQUIRE(p->kind() == Partitioned::Kind::Path);
    REQUIRE(p->path_text().view() == "foo[");
}

TEST_CASE("empty expression has no partition", "[parse]") {
    REQUIRE_FALSE(split("").has_value());
}

TEST_CASE("components borrow from the expression", "[parse]") {
    std::string expr = "/srv/data::**/*.csv";
    auto p = split(expr);
    REQUIRE(p.has_value());
    REQUIRE(p->path_text().is_borrowed());
    REQUIRE(p->path_text().view().data() == expr.data());
    REQUIRE(p->glob_ref().text().data() == expr.data() + 11);
}

TEST_CASE("NUL byte is a parse error", "[parse]") {
    std::string expr("abc\0def", 7);
    auto r = partition_expression(expr);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TreeishError::Parse);
    REQUIRE(r.error().offset == 3);
}
