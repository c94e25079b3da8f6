#ifndef SPLITPOLICY_PRETTY_PRINT_HPP
#define SPLITPOLICY_PRETTY_PRINT_HPP

#include <ostream>
#include <string>

#include <fmt/format.h>

#include <splitpolicy/end.hpp>
#include <splitpolicy/policy.hpp>
#include <splitpolicy/split.hpp>

namespace splitpolicy {

// Diagnostic rendering:
//   NoPolicy              the empty policy
//   label>12d  label>12!d clause with its End; '!' marks no_dequeue
//   (p1 & p2)  (p1 | p2)  composites
//   label*(inner)@12d     proxy over inner, with the proxy's own End and
//                         the inner's no_dequeue
inline std::string to_string(const Policy& p) {
    return p.visit(detail::overloaded{
        [](const EmptyNode&) -> std::string { return "NoPolicy"; },
        [](const ClauseNode& c) -> std::string {
            return fmt::format("{}{}{}d", c.label, c.end.to_string(),
                               c.no_dequeue ? "!" : "");
        },
        [](const AndThenNode& n) -> std::string {
            return fmt::format("({} & {})", to_string(n.first),
                               to_string(n.second));
        },
        [](const OrElseNode& n) -> std::string {
            return fmt::format("({} | {})", to_string(n.first),
                               to_string(n.second));
        },
        [](const ProxyNode& n) -> std::string {
            return fmt::format("{}*({}){}{}d", n.label, to_string(n.inner),
                               n.end.to_string(),
                               n.inner.no_dequeue() ? "!" : "");
        },
    });
}

inline std::string to_string(const Split& s) {
    if (s.tag.empty())
        return fmt::format("{}[{}]", modification_name(s.modification),
                           s.cost);
    return fmt::format("{}[{}]:{}", modification_name(s.modification), s.cost,
                       s.tag);
}

inline std::ostream& operator<<(std::ostream& os, const Policy& p) {
    return os << to_string(p);
}

inline std::ostream& operator<<(std::ostream& os, const End& e) {
    return os << e.to_string();
}

inline std::ostream& operator<<(std::ostream& os, const Split& s) {
    return os << to_string(s);
}

} // namespace splitpolicy

#endif // SPLITPOLICY_PRETTY_PRINT_HPP
