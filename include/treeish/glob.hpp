#pragma once

#include <treeish/maybe_owned.hpp>
#include <treeish/result.hpp>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace treeish {

class Walk;
struct WalkBehavior;

// A compiled glob pattern. Segments are separated by '/'.
// Supports: * (any chars except /), ? (single code point except /),
//           ** (zero or more path segments, must be a whole segment),
//           [abc], [a-z], [!0-9], and '\' to escape the next character.
//
// The source text may be borrowed from the caller (see MaybeOwned); the
// compiled tokens are always owned.
class Glob {
public:
    // The empty glob. It matches every path.
    Glob() = default;

    // Compile borrowed text. `text` must outlive the Glob unless into_owned() is called.
    static Result<Glob> compile(std::string_view text);
    static Result<Glob> compile_owned(std::string text);

    bool is_empty() const { return text_.empty(); }

    // True if the glob begins with a separator and so names its own root.
    bool has_root() const { return rooted_; }

    // Split off the leading fully-literal segments as a native path. The
    // remainder is never rooted. Either part may be empty.
    std::pair<MaybeOwned, Glob> partition() const;

    // Match a '/'-separated path relative to the walk root.
    bool is_match(std::string_view relative) const;

    std::string_view text() const { return text_.view(); }
    std::string to_string() const { return text_.str(); }
    bool is_owned() const { return text_.is_owned(); }

    Glob into_owned() &&;
    Glob into_owned() const&;

    // Walk the tree at `root`, yielding entries that match. A rooted glob
    // ignores `root`. Defined in walk.cpp.
    Walk walk(const std::filesystem::path& root, const WalkBehavior& behavior) const;

    struct Token {
        enum Kind { Literal, AnyChar, AnyRun, Class };
        Kind kind = Literal;
        std::string literal;                          // for Literal
        bool negate = false;                          // for Class
        std::vector<std::pair<char32_t, char32_t>> ranges;   // for Class, code points
    };

    struct Segment {
        bool tree = false;            // '**'
        std::vector<Token> tokens;
        size_t begin = 0;             // offsets into text()
        size_t end = 0;
        bool escaped = false;         // contains a '\' escape

        bool is_literal() const {
            return !tree && (tokens.empty() ||
                (tokens.size() == 1 && tokens[0].kind == Token::Literal));
        }
    };

    const std::vector<Segment>& segments() const { return segments_; }

private:
    static Result<Glob> build(MaybeOwned text);

    MaybeOwned text_;
    bool rooted_ = false;
    std::vector<Segment> segments_;
};

} // namespace treeish
