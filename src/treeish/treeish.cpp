#include <treeish/treeish.hpp>
#include <treeish/log.hpp>

namespace treeish {

const char* Treeish::kind_name(Kind k) {
    switch (k) {
        case Kind::Empty:  return "empty";
        case Kind::Path:   return "path";
        case Kind::Glob:   return "glob";
        case Kind::GlobIn: return "glob-in";
    }
    return "unknown";
}

Treeish::Kind Treeish::kind() const {
    switch (form_.index()) {
        case 1: return Kind::Path;
        case 2: return Kind::Glob;
        case 3: return Kind::GlobIn;
        default: return Kind::Empty;
    }
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

Result<Treeish> Treeish::parse(std::string_view expression) {
    auto partitioned = partition_expression(expression);
    if (partitioned.is_err()) return std::move(partitioned).error();
    return from_partitioned(std::move(partitioned).value())
        .with_expression(std::string(expression));
}

// The only place a GlobIn is built: its glob must not carry a root of its
// own, since it could not be joined to the tree without discarding one.
Result<Treeish> Treeish::from_partitioned(std::optional<Partitioned> partitioned) {
    if (!partitioned) {
        return Result<Treeish>::ok(Treeish());
    }

    switch (partitioned->kind()) {
    case Partitioned::Kind::Path:
        return Result<Treeish>::ok(Treeish(PathForm{
            TreeishPath(std::move(*partitioned).take_path())}));

    case Partitioned::Kind::Glob:
        return Result<Treeish>::ok(Treeish(GlobForm{
            TreeishGlob(std::move(*partitioned).take_glob())}));

    case Partitioned::Kind::GlobIn: {
        if (partitioned->glob_ref().has_root()) {
            std::string tree(partitioned->path_text().view());
            std::string glob = partitioned->glob_ref().to_string();
            log::trace("rejecting rooted glob '%s' under '%s'", glob.c_str(), tree.c_str());
            return TreeishError{TreeishError::Rule,
                "rooted glob '" + glob + "' cannot be joined to tree '" + tree + "'",
                "remove the leading '/' after '::', or drop the path before '::'",
                tree + std::string(SEPARATOR) + glob,
                tree.size() + SEPARATOR.size()};
        }
        MaybeOwned tree = partitioned->path_text();
        Glob glob = std::move(*partitioned).take_glob();
        return Result<Treeish>::ok(Treeish(GlobInForm{
            TreeishPath(std::move(tree)),
            Unrooted<TreeishGlob>(TreeishGlob(std::move(glob)))}));
    }
    }
    return TreeishError{TreeishError::Parse, "unknown partition kind"};
}

Result<Treeish> Treeish::from_glob(treeish::Glob glob) {
    // Pieces of a borrowed glob borrow from the same buffer as the glob.
    auto [path, rest] = glob.partition();
    return from_partitioned(recombine(std::move(path), std::move(rest)));
}

Treeish Treeish::from_path(std::string_view path) {
    if (path.empty()) return Treeish();
    return Treeish(PathForm{TreeishPath(MaybeOwned::borrowed(path))});
}

// ---------------------------------------------------------------------------
// Ownership
// ---------------------------------------------------------------------------

bool Treeish::is_owned() const {
    switch (kind()) {
    case Kind::Empty:
        return true;
    case Kind::Path:
        return std::get<PathForm>(form_).path.is_owned();
    case Kind::Glob:
        return std::get<GlobForm>(form_).glob->is_owned();
    case Kind::GlobIn: {
        const auto& f = std::get<GlobInForm>(form_);
        return f.tree.is_owned() && f.glob->get().is_owned();
    }
    }
    return false;
}

Treeish Treeish::into_owned() && {
    switch (kind()) {
    case Kind::Empty:
        return Treeish();
    case Kind::Path:
        return Treeish(PathForm{std::get<PathForm>(std::move(form_)).path.into_owned()});
    case Kind::Glob:
        return Treeish(GlobForm{std::get<GlobForm>(std::move(form_)).glob.into_owned()});
    case Kind::GlobIn: {
        auto f = std::get<GlobInForm>(std::move(form_));
        return Treeish(GlobInForm{std::move(f.tree).into_owned(),
                                  std::move(f.glob).into_owned()});
    }
    }
    return Treeish();
}

Treeish Treeish::into_owned() const& {
    Treeish copy(form_);
    return std::move(copy).into_owned();
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------

std::optional<MaybeOwned> Treeish::path() && {
    if (auto* f = std::get_if<PathForm>(&form_)) {
        return std::move(f->path).take();
    }
    return std::nullopt;
}

std::optional<treeish::Glob> Treeish::glob() && {
    if (auto* f = std::get_if<GlobForm>(&form_)) {
        return std::move(f->glob).take();
    }
    return std::nullopt;
}

std::optional<std::pair<MaybeOwned, treeish::Glob>> Treeish::glob_in() && {
    if (auto* f = std::get_if<GlobInForm>(&form_)) {
        return std::make_pair(std::move(f->tree).take(),
                              std::move(f->glob).take().take());
    }
    return std::nullopt;
}

std::string Treeish::to_string() const {
    switch (kind()) {
    case Kind::Empty:
        return "";
    case Kind::Path:
        return std::string(std::get<PathForm>(form_).path.view());
    case Kind::Glob:
        return std::get<GlobForm>(form_).glob->to_string();
    case Kind::GlobIn: {
        const auto& f = std::get<GlobInForm>(form_);
        return std::string(f.tree.view()) + std::string(SEPARATOR) + f.glob->get().to_string();
    }
    }
    return "";
}

// ---------------------------------------------------------------------------
// Walk adapter
// ---------------------------------------------------------------------------

Walk Treeish::walk(const WalkBehavior& behavior) const {
    switch (kind()) {
    case Kind::Empty:
        return Walk();
    case Kind::Path:
        return Glob().walk(std::get<PathForm>(form_).path.native(), behavior);
    case Kind::Glob:
        // TODO: "." is the POSIX working directory; pick a default root per platform.
        return std::get<GlobForm>(form_).glob->walk(".", behavior);
    case Kind::GlobIn: {
        const auto& f = std::get<GlobInForm>(form_);
        return f.glob->get().walk(f.tree.native(), behavior);
    }
    }
    return Walk();
}

} // namespace treeish
