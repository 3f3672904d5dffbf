#include <treeish/glob.hpp>

namespace treeish {

// ---- Compiler ----

namespace {

// Decode the UTF-8 sequence at `i` and advance past it. A byte that does not
// start a well-formed sequence decodes as itself.
char32_t decode_utf8(std::string_view s, size_t& i) {
    auto byte = [&](size_t k) { return static_cast<unsigned char>(s[k]); };
    unsigned char b0 = byte(i);

    size_t len = 1;
    char32_t cp = b0;
    if (b0 >= 0xC2 && b0 <= 0xDF) {
        len = 2;
        cp = b0 & 0x1F;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
        len = 3;
        cp = b0 & 0x0F;
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
        len = 4;
        cp = b0 & 0x07;
    }

    if (len == 1 || i + len > s.size()) {
        ++i;
        return b0;
    }
    for (size_t k = 1; k < len; ++k) {
        if ((byte(i + k) & 0xC0) != 0x80) {
            ++i;
            return b0;
        }
        cp = (cp << 6) | (byte(i + k) & 0x3F);
    }
    i += len;
    return cp;
}

struct Compiler {
    std::string_view text;
    size_t pos = 0;

    explicit Compiler(std::string_view t) : text(t) {}

    TreeishError fail(std::string msg, std::string hint, size_t at) const {
        return TreeishError{TreeishError::Glob, std::move(msg), std::move(hint),
                            std::string(text), at};
    }

    static void push_literal(Glob::Segment& seg, char c) {
        if (seg.tokens.empty() || seg.tokens.back().kind != Glob::Token::Literal) {
            seg.tokens.push_back(Glob::Token{});
        }
        seg.tokens.back().literal.push_back(c);
    }

    // Already positioned on '['.
    Result<Glob::Token> parse_class() {
        size_t open = pos;
        ++pos; // skip '['

        Glob::Token tok;
        tok.kind = Glob::Token::Class;
        if (pos < text.size() && text[pos] == '!') {
            tok.negate = true;
            ++pos;
        }

        while (pos < text.size() && text[pos] != ']') {
            if (text[pos] == '/') {
                return fail("character class cannot contain '/'",
                    "path separators only delimit segments", pos);
            }
            if (text[pos] == '\\') {
                if (pos + 1 >= text.size()) {
                    return fail("unclosed character class", "add a matching ']'", open);
                }
                ++pos;
            }
            size_t lo_pos = pos;
            char32_t lo = decode_utf8(text, pos);

            if (pos + 1 < text.size() && text[pos] == '-' && text[pos + 1] != ']') {
                ++pos; // skip '-'
                if (text[pos] == '\\') {
                    if (pos + 1 >= text.size()) {
                        return fail("unclosed character class", "add a matching ']'", open);
                    }
                    ++pos;
                }
                char32_t hi = decode_utf8(text, pos);
                if (hi < lo) {
                    return fail("invalid range in character class",
                        "ranges are written low-high, as in [a-z]", lo_pos);
                }
                tok.ranges.emplace_back(lo, hi);
            } else {
                tok.ranges.emplace_back(lo, lo);
            }
        }

        if (pos >= text.size()) {
            return fail("unclosed character class", "add a matching ']'", open);
        }
        ++pos; // skip ']'

        if (tok.ranges.empty()) {
            return fail("empty character class", "a class must name at least one character", open);
        }
        return Result<Glob::Token>::ok(std::move(tok));
    }

    // Parse the segment starting at pos, up to (not including) the next '/'.
    Result<Glob::Segment> parse_segment() {
        Glob::Segment seg;
        seg.begin = pos;

        while (pos < text.size() && text[pos] != '/') {
            char c = text[pos];

            if (c == '*') {
                if (pos + 1 < text.size() && text[pos + 1] == '*') {
                    size_t after = pos + 2;
                    bool whole = pos == seg.begin &&
                        (after == text.size() || text[after] == '/');
                    if (!whole) {
                        return fail("'**' must be a complete path segment",
                            "write '**/' or '/**', or use a single '*'", pos);
                    }
                    seg.tree = true;
                    pos = after;
                    continue;
                }
                seg.tokens.push_back(Glob::Token{Glob::Token::AnyRun, {}, false, {}});
                ++pos;
                continue;
            }

            if (c == '?') {
                seg.tokens.push_back(Glob::Token{Glob::Token::AnyChar, {}, false, {}});
                ++pos;
                continue;
            }

            if (c == '[') {
                auto cls = parse_class();
                if (cls.is_err()) return std::move(cls).error();
                seg.tokens.push_back(std::move(cls).value());
                continue;
            }

            if (c == '\\') {
                if (pos + 1 >= text.size()) {
                    return fail("trailing escape character",
                        "escape the backslash itself as '\\\\'", pos);
                }
                seg.escaped = true;
                push_literal(seg, text[pos + 1]);
                pos += 2;
                continue;
            }

            push_literal(seg, c);
            ++pos;
        }

        seg.end = pos;
        return Result<Glob::Segment>::ok(std::move(seg));
    }
};

} // anonymous namespace

Result<Glob> Glob::build(MaybeOwned text) {
    Glob glob;
    Compiler compiler(text.view());
    auto src = text.view();

    if (!src.empty() && src[0] == '/') {
        glob.rooted_ = true;
    }

    while (compiler.pos < src.size()) {
        // Collapse consecutive separators
        if (src[compiler.pos] == '/') {
            ++compiler.pos;
            continue;
        }
        auto seg = compiler.parse_segment();
        if (seg.is_err()) return std::move(seg).error();
        glob.segments_.push_back(std::move(seg).value());
    }

    glob.text_ = std::move(text);
    return Result<Glob>::ok(std::move(glob));
}

Result<Glob> Glob::compile(std::string_view text) {
    return build(MaybeOwned::borrowed(text));
}

Result<Glob> Glob::compile_owned(std::string text) {
    return build(MaybeOwned::owned(std::move(text)));
}

Glob Glob::into_owned() && {
    text_ = std::move(text_).into_owned();
    return std::move(*this);
}

Glob Glob::into_owned() const& {
    Glob copy(*this);
    return std::move(copy).into_owned();
}

// ---- Partition ----

std::pair<MaybeOwned, Glob> Glob::partition() const {
    size_t literal = 0;
    bool escaped = false;
    while (literal < segments_.size() && segments_[literal].is_literal()) {
        escaped = escaped || segments_[literal].escaped;
        ++literal;
    }

    MaybeOwned prefix;
    if (literal > 0 || rooted_) {
        if (escaped) {
            std::string native = rooted_ ? "/" : "";
            for (size_t i = 0; i < literal; ++i) {
                if (i > 0) native += '/';
                native += segments_[i].tokens[0].literal;
            }
            prefix = MaybeOwned::owned(std::move(native));
        } else if (literal == segments_.size()) {
            // Whole glob is a literal path; keep its exact text
            prefix = text_;
        } else if (literal == 0) {
            prefix = text_.substr(0, 1);
        } else {
            prefix = text_.substr(0, segments_[literal - 1].end);
        }
    }

    Glob rest;
    if (literal < segments_.size()) {
        size_t base = segments_[literal].begin;
        rest.text_ = text_.substr(base);
        for (size_t i = literal; i < segments_.size(); ++i) {
            Segment seg = segments_[i];
            seg.begin -= base;
            seg.end -= base;
            rest.segments_.push_back(std::move(seg));
        }
    }

    return {std::move(prefix), std::move(rest)};
}

// ---- Matching ----

static std::vector<std::string_view> split_components(std::string_view path) {
    std::vector<std::string_view> out;
    size_t i = 0;
    while (i < path.size()) {
        size_t next = path.find('/', i);
        if (next == std::string_view::npos) next = path.size();
        if (next > i) out.push_back(path.substr(i, next - i));
        i = next + 1;
    }
    return out;
}

static bool class_matches(const Glob::Token& tok, char32_t c) {
    bool matched = false;
    for (const auto& [lo, hi] : tok.ranges) {
        if (c >= lo && c <= hi) {
            matched = true;
            break;
        }
    }
    return tok.negate ? !matched : matched;
}

// Match one path component against the tokens of one segment.
static bool match_tokens(const std::vector<Glob::Token>& toks, size_t ti,
                         std::string_view str, size_t si) {
    while (ti < toks.size()) {
        const auto& tok = toks[ti];
        switch (tok.kind) {
        case Glob::Token::AnyRun:
            // Consecutive stars collapse
            while (ti < toks.size() && toks[ti].kind == Glob::Token::AnyRun) ti++;
            if (ti == toks.size()) return true;
            // Resume only at code point boundaries
            for (size_t k = si; ; decode_utf8(str, k)) {
                if (match_tokens(toks, ti, str, k)) return true;
                if (k >= str.size()) break;
            }
            return false;
        case Glob::Token::AnyChar:
            if (si >= str.size()) return false;
            decode_utf8(str, si);
            break;
        case Glob::Token::Class:
            if (si >= str.size() || !class_matches(tok, decode_utf8(str, si))) return false;
            break;
        case Glob::Token::Literal:
            if (str.compare(si, tok.literal.size(), tok.literal) != 0) return false;
            si += tok.literal.size();
            break;
        }
        ti++;
    }
    return si == str.size();
}

// Recursive matching over path components, handling '**'.
static bool match_segments(const std::vector<Glob::Segment>& segs, size_t gi,
                           const std::vector<std::string_view>& comps, size_t ci) {
    while (gi < segs.size() && ci < comps.size()) {
        if (segs[gi].tree) {
            while (gi < segs.size() && segs[gi].tree) gi++;
            if (gi == segs.size()) return true;
            for (size_t k = ci; k <= comps.size(); k++) {
                if (match_segments(segs, gi, comps, k)) return true;
            }
            return false;
        }

        if (!match_tokens(segs[gi].tokens, 0, comps[ci], 0)) return false;
        gi++;
        ci++;
    }

    // Trailing '**' matches nothing as well
    while (gi < segs.size() && segs[gi].tree) gi++;

    return gi == segs.size() && ci == comps.size();
}

bool Glob::is_match(std::string_view relative) const {
    if (segments_.empty()) return true;
    return match_segments(segments_, 0, split_components(relative), 0);
}

} // namespace treeish
