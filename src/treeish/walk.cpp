#include <treeish/walk.hpp>
#include <treeish/log.hpp>

namespace fs = std::filesystem;

namespace treeish {

Walk Glob::walk(const fs::path& root, const WalkBehavior& behavior) const {
    // Walk from the literal prefix so a rooted glob replaces `root`.
    auto [prefix, rest] = partition();
    fs::path start = root;
    if (!prefix.empty()) {
        start /= fs::path(prefix.str());
    }
    return Walk(std::move(start), std::move(rest).into_owned(), behavior);
}

Walk::Walk(fs::path root, Glob glob, WalkBehavior behavior)
    : root_(std::move(root)), glob_(std::move(glob)), behavior_(behavior),
      done_(false) {}

bool Walk::in_bounds(size_t depth) const {
    return depth >= behavior_.min_depth && depth <= behavior_.max_depth;
}

void Walk::push_error(const fs::path& path, const std::string& what,
                      const std::error_code& ec) {
    log::debug("walk: %s '%s': %s", what.c_str(), path.string().c_str(),
               ec.message().c_str());
    pending_.push_back(TreeishError{TreeishError::IO,
        what + " '" + path.string() + "': " + ec.message()});
}

void Walk::descend(const fs::path& dir, std::string relative, size_t depth) {
    Frame frame;
    std::error_code ec;

    if (behavior_.follow_links) {
        frame.canonical = fs::canonical(dir, ec);
        if (ec) {
            push_error(dir, "cannot resolve directory", ec);
            return;
        }
        for (const auto& ancestor : stack_) {
            if (ancestor.canonical == frame.canonical) {
                push_error(dir, "symlink cycle at",
                           std::make_error_code(std::errc::too_many_symbolic_link_levels));
                return;
            }
        }
    }

    frame.it = fs::directory_iterator(dir, ec);
    if (ec) {
        push_error(dir, "cannot read directory", ec);
        return;
    }
    frame.relative = std::move(relative);
    frame.depth = depth;
    stack_.push_back(std::move(frame));
}

void Walk::start() {
    started_ = true;

    std::error_code ec;
    auto st = fs::status(root_, ec);
    if (ec || !fs::exists(st)) {
        if (!ec) ec = std::make_error_code(std::errc::no_such_file_or_directory);
        push_error(root_, "cannot access", ec);
        done_ = true;
        return;
    }

    bool is_dir = fs::is_directory(st);
    if (in_bounds(0) && glob_.is_match("")) {
        pending_.push_back(Result<WalkEntry>::ok(WalkEntry{root_, "", 0, is_dir}));
    }
    if (is_dir && behavior_.max_depth > 0) {
        descend(root_, "", 0);
    }
}

std::optional<Result<WalkEntry>> Walk::next() {
    if (!started_ && !done_) start();

    while (true) {
        if (!pending_.empty()) {
            auto item = std::move(pending_.front());
            pending_.pop_front();
            return item;
        }
        if (stack_.empty()) {
            done_ = true;
            return std::nullopt;
        }

        Frame& top = stack_.back();
        if (top.it == fs::directory_iterator()) {
            stack_.pop_back();
            continue;
        }

        fs::directory_entry entry = *top.it;
        size_t depth = top.depth + 1;
        std::string name = entry.path().filename().string();
        std::string relative = top.relative.empty() ? name : top.relative + "/" + name;

        std::error_code ec;
        top.it.increment(ec);
        if (ec) {
            // The iterator is unusable after a failed increment
            fs::path dir = entry.path().parent_path();
            stack_.pop_back();
            push_error(dir, "error iterating directory", ec);
        }

        std::error_code type_ec;
        bool is_dir = entry.is_directory(type_ec);
        bool is_link = entry.is_symlink(type_ec);

        if (is_dir && (!is_link || behavior_.follow_links) && depth < behavior_.max_depth) {
            descend(entry.path(), relative, depth);
        }

        if (in_bounds(depth) && glob_.is_match(relative)) {
            auto found = Result<WalkEntry>::ok(
                WalkEntry{entry.path(), std::move(relative), depth, is_dir});
            if (pending_.empty()) return found;
            // Keep errors already queued for this step in order
            pending_.push_front(std::move(found));
        }
    }
}

} // namespace treeish
