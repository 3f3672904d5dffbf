#include <treeish/parse.hpp>
#include <treeish/log.hpp>

namespace treeish {

// ---------------------------------------------------------------------------
// Partitioned
// ---------------------------------------------------------------------------

Partitioned Partitioned::path(MaybeOwned path) {
    Partitioned p;
    p.kind_ = Kind::Path;
    p.path_ = std::move(path);
    return p;
}

Partitioned Partitioned::glob(treeish::Glob glob) {
    Partitioned p;
    p.kind_ = Kind::Glob;
    p.glob_ = std::move(glob);
    return p;
}

Partitioned Partitioned::glob_in(MaybeOwned path, treeish::Glob glob) {
    Partitioned p;
    p.kind_ = Kind::GlobIn;
    p.path_ = std::move(path);
    p.glob_ = std::move(glob);
    return p;
}

const char* Partitioned::kind_name() const {
    switch (kind_) {
        case Kind::Path:   return "path";
        case Kind::Glob:   return "glob";
        case Kind::GlobIn: return "glob-in";
    }
    return "unknown";
}

std::optional<Partitioned> recombine(MaybeOwned path, Glob glob) {
    bool has_path = !path.empty();
    bool has_glob = !glob.is_empty();

    if (has_path && has_glob) return Partitioned::glob_in(std::move(path), std::move(glob));
    if (has_glob) return Partitioned::glob(std::move(glob));
    if (has_path) return Partitioned::path(std::move(path));
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Expression splitting
// ---------------------------------------------------------------------------

static Result<std::optional<Partitioned>> split_at_separator(std::string_view expression,
                                                             size_t at) {
    auto prefix = expression.substr(0, at);
    size_t suffix_begin = at + SEPARATOR.size();
    auto suffix = expression.substr(suffix_begin);

    auto compiled = Glob::compile(suffix);
    if (compiled.is_err()) {
        // No literal fallback once the separator has been written
        TreeishError err = std::move(compiled).error();
        if (err.offset != TreeishError::npos) err.offset += suffix_begin;
        err.expression = std::string(expression);
        return err;
    }

    return Result<std::optional<Partitioned>>::ok(
        recombine(MaybeOwned::borrowed(prefix), std::move(compiled).value()));
}

static Result<std::optional<Partitioned>> split_whole(std::string_view expression) {
    auto compiled = Glob::compile(expression);
    if (compiled.is_err()) {
        log::trace("'%.*s' is not a glob (%s), reading it as a path",
                   static_cast<int>(expression.size()), expression.data(),
                   compiled.error().message.c_str());
        std::optional<Partitioned> result;
        if (!expression.empty()) {
            result = Partitioned::path(MaybeOwned::borrowed(expression));
        }
        return Result<std::optional<Partitioned>>::ok(std::move(result));
    }

    // Prefer emitting native paths: a glob with no pattern tokens is a path.
    auto [path, rest] = compiled.value().partition();
    return Result<std::optional<Partitioned>>::ok(recombine(std::move(path), std::move(rest)));
}

Result<std::optional<Partitioned>> partition_expression(std::string_view expression) {
    size_t nul = expression.find('\0');
    if (nul != std::string_view::npos) {
        return TreeishError{TreeishError::Parse,
            "expression contains a NUL byte",
            "paths and globs cannot contain NUL characters",
            std::string(expression.substr(0, nul)), nul};
    }

    size_t at = expression.find(SEPARATOR);
    auto result = at != std::string_view::npos
        ? split_at_separator(expression, at)
        : split_whole(expression);

    if (result.is_ok() && log::enabled(log::Trace)) {
        const auto& p = result.value();
        log::trace("partitioned '%.*s' as %s",
                   static_cast<int>(expression.size()), expression.data(),
                   p ? p->kind_name() : "empty");
    }
    return result;
}

} // namespace treeish
