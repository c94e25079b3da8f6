#ifndef SPLITPOLICY_TOKEN_HPP
#define SPLITPOLICY_TOKEN_HPP

#include <cstddef>
#include <string>
#include <utility>

namespace splitpolicy {

// --- Token: a lexical token with its source offsets ---

struct Token {
    std::string text;
    int start{0};
    int end{0};

    Token() = default;
    Token(std::string t, int s, int e) : text(std::move(t)), start(s), end(e) {}
};

// --- FormatToken: the boundary between two adjacent tokens ---
//
// Offsets are non-decreasing along a forward scan; every End boundary relies
// on that to expire monotonically.

struct FormatToken {
    Token left;
    Token right;
    std::size_t index{0};

    FormatToken() = default;
    FormatToken(Token l, Token r, std::size_t i = 0)
        : left(std::move(l)), right(std::move(r)), index(i) {}
};

} // namespace splitpolicy

#endif // SPLITPOLICY_TOKEN_HPP
