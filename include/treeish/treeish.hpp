#pragma once

#include <treeish/glob.hpp>
#include <treeish/maybe_owned.hpp>
#include <treeish/parse.hpp>
#include <treeish/result.hpp>
#include <treeish/walk.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace treeish {

class Treeish;

// A literal filesystem path, never empty.
class TreeishPath {
public:
    explicit TreeishPath(MaybeOwned path) : path_(std::move(path)) {}

    std::string_view view() const { return path_.view(); }
    std::filesystem::path native() const { return std::filesystem::path(path_.str()); }
    bool is_owned() const { return path_.is_owned(); }

    TreeishPath into_owned() && { return TreeishPath(std::move(path_).into_owned()); }
    MaybeOwned take() && { return std::move(path_); }

private:
    MaybeOwned path_;
};

// A compiled glob, never empty.
class TreeishGlob {
public:
    explicit TreeishGlob(Glob glob) : glob_(std::move(glob)) {}

    const Glob& get() const { return glob_; }
    const Glob* operator->() const { return &glob_; }

    TreeishGlob into_owned() && { return TreeishGlob(std::move(glob_).into_owned()); }
    Glob take() && { return std::move(glob_); }

private:
    Glob glob_;
};

// A value known not to be rooted. Only Treeish can vouch for that.
template<typename T>
class Unrooted {
public:
    const T& get() const { return value_; }
    const T* operator->() const { return &value_; }

    Unrooted into_owned() && { return Unrooted(std::move(value_).into_owned()); }
    T take() && { return std::move(value_); }

private:
    friend class Treeish;
    explicit Unrooted(T value) : value_(std::move(value)) {}

    T value_;
};

// A normalized path, glob, or glob anchored at a path.
//
//   "/var/log/app.log"       -> Path
//   "**/*.txt"               -> Glob (walked from ".")
//   "/mnt/media::**/*.txt"   -> GlobIn { tree: "/mnt/media", glob: "**/*.txt" }
//   ""                       -> Empty (walks nothing)
//
// A Treeish built by parse() may borrow from the expression; keep the
// expression alive or call into_owned().
class Treeish {
public:
    enum class Kind { Empty, Path, Glob, GlobIn };

    static Result<Treeish> parse(std::string_view expression);

    // Apply the construction rules to an already-split expression.
    static Result<Treeish> from_partitioned(std::optional<Partitioned> partitioned);

    // Partition a compiled glob into its literal tree and pattern.
    static Result<Treeish> from_glob(treeish::Glob glob);

    // A literal path; an empty path gives Empty.
    static Treeish from_path(std::string_view path);

    static Treeish empty() { return Treeish(); }

    Kind kind() const;
    bool is_empty() const { return kind() == Kind::Empty; }
    bool has_path() const { return kind() == Kind::Path || kind() == Kind::GlobIn; }
    bool has_glob() const { return kind() == Kind::Glob || kind() == Kind::GlobIn; }

    // True when nothing is borrowed from the expression.
    bool is_owned() const;

    Treeish into_owned() &&;
    Treeish into_owned() const&;

    // Consuming accessors. Each yields its component(s) only for its kind.
    std::optional<MaybeOwned> path() &&;
    std::optional<treeish::Glob> glob() &&;
    std::optional<std::pair<MaybeOwned, treeish::Glob>> glob_in() &&;

    Walk walk(const WalkBehavior& behavior = WalkBehavior{}) const;

    // Canonical expression text, e.g. "/mnt/media::**/*.txt".
    std::string to_string() const;

    static const char* kind_name(Kind k);

private:
    struct PathForm {
        TreeishPath path;
    };
    struct GlobForm {
        TreeishGlob glob;
    };
    struct GlobInForm {
        TreeishPath tree;
        Unrooted<TreeishGlob> glob;
    };
    using Form = std::variant<std::monostate, PathForm, GlobForm, GlobInForm>;

    Treeish() = default;
    explicit Treeish(Form form) : form_(std::move(form)) {}

    Form form_;
};

} // namespace treeish
