#pragma once

#include <cstddef>
#include <string>

namespace treeish {

struct TreeishError {
    enum Code {
        Glob,
        Parse,
        Rule,
        IO,
        Config,
        InvalidArg
    };

    static constexpr size_t npos = static_cast<size_t>(-1);

    Code code;
    std::string message;
    std::string hint;
    std::string expression;
    size_t offset = npos;

    TreeishError() = default;
    TreeishError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    TreeishError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    TreeishError(Code c, std::string msg, std::string h, std::string expr, size_t off = npos)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          expression(std::move(expr)), offset(off) {}

    // True for the failures that can come out of building a Treeish.
    bool is_build_error() const;

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace treeish
