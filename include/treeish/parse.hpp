#pragma once

#include <treeish/glob.hpp>
#include <treeish/maybe_owned.hpp>
#include <treeish/result.hpp>
#include <optional>
#include <string_view>

namespace treeish {

// Separates the tree path from the glob: "/mnt/media::**/*.txt".
// Only the first occurrence splits; there is no escape for it.
inline constexpr std::string_view SEPARATOR = "::";

// Intermediate result of splitting an expression, before the rooted-glob
// rule has been checked. Components are never empty.
class Partitioned {
public:
    enum class Kind { Path, Glob, GlobIn };

    static Partitioned path(MaybeOwned path);
    static Partitioned glob(treeish::Glob glob);
    static Partitioned glob_in(MaybeOwned path, treeish::Glob glob);

    Kind kind() const { return kind_; }
    const MaybeOwned& path_text() const { return path_; }
    const treeish::Glob& glob_ref() const { return glob_; }

    MaybeOwned take_path() && { return std::move(path_); }
    treeish::Glob take_glob() && { return std::move(glob_); }

    const char* kind_name() const;

private:
    Partitioned() = default;

    Kind kind_ = Kind::Path;
    MaybeOwned path_;
    treeish::Glob glob_;
};

// Recombine a literal prefix and remainder glob by which of them are present.
std::optional<Partitioned> recombine(MaybeOwned path, Glob glob);

// Split an expression into its path and glob parts.
//
// 1. "prefix::suffix": the suffix must compile as a glob. An empty prefix or
//    suffix is omitted.
// 2. No separator: compile the whole expression and partition it into a
//    literal prefix and a remainder glob.
// 3. The expression does not compile: it is a literal path.
//
// An empty expression yields std::nullopt. Components borrow from
// `expression` where possible.
Result<std::optional<Partitioned>> partition_expression(std::string_view expression);

} // namespace treeish
