#pragma once

#include <treeish/glob.hpp>
#include <treeish/result.hpp>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace treeish {

// Knobs passed through to the walk engine untouched by the Treeish layer.
struct WalkBehavior {
    static constexpr size_t unlimited = std::numeric_limits<size_t>::max();

    size_t min_depth = 0;         // the root is depth 0
    size_t max_depth = unlimited;
    bool follow_links = false;    // descend into symlinked directories
};

struct WalkEntry {
    std::filesystem::path path;   // root joined with `relative`
    std::string relative;         // '/'-separated, empty for the root itself
    size_t depth = 0;
    bool is_directory = false;
};

// A lazy, single-pass, depth-first walk over a directory tree.
//
// Each call to next() does just enough filesystem work to produce one
// matching entry, one error, or report exhaustion (std::nullopt). Errors for
// individual directories do not end the walk.
class Walk {
public:
    // A walk that yields nothing.
    Walk() = default;
    Walk(std::filesystem::path root, Glob glob, WalkBehavior behavior);

    Walk(Walk&&) = default;
    Walk& operator=(Walk&&) = default;
    Walk(const Walk&) = delete;
    Walk& operator=(const Walk&) = delete;

    std::optional<Result<WalkEntry>> next();

    bool done() const { return done_ && pending_.empty(); }
    const std::filesystem::path& root() const { return root_; }

private:
    struct Frame {
        std::filesystem::directory_iterator it;
        std::string relative;
        size_t depth = 0;
        std::filesystem::path canonical;   // only tracked when following links
    };

    void start();
    void descend(const std::filesystem::path& dir, std::string relative, size_t depth);
    bool in_bounds(size_t depth) const;
    void push_error(const std::filesystem::path& path, const std::string& what,
                    const std::error_code& ec);

    std::filesystem::path root_;
    Glob glob_;
    WalkBehavior behavior_;
    bool started_ = false;
    bool done_ = true;
    std::vector<Frame> stack_;
    std::deque<Result<WalkEntry>> pending_;
};

} // namespace treeish
