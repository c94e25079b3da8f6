// 02_proxy_delegation.cpp: A proxy rule over an evolving inner rule set
//
// Shows: Policy::proxy(), operator|, unexpired() re-deriving the proxy's
//        override, filter() pruning one branch, to_string() diagnostics.

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <splitpolicy/splitpolicy.hpp>

using namespace splitpolicy;

static Override when_left(std::string text, Split result) {
    return [text, result](const Decision& d)
               -> std::optional<std::vector<Split>> {
        if (d.ft().left.text != text)
            return std::nullopt;
        return std::vector<Split>{result};
    };
}

int main() {
    configure(Config::from_env());

    auto paren = Policy::clause(
        End::after(10), when_left("(", Split{Modification::newline, 0}),
        "paren");
    auto comma = Policy::clause(
        End::after(20), when_left(",", Split{Modification::space, 0}), "comma");

    // The proxy applies whatever its inner rules currently say, but only
    // while the enclosing block (ending at 30) is open.
    auto block = Policy::proxy(
        paren | comma, End::on(30),
        [](const Policy& inner) -> Override {
            return [inner](const Decision& d) { return inner.try_apply(d); };
        },
        "block");

    std::cout << "attached:        " << block << "\n";

    auto at = [](int left_end, const char* left) {
        return FormatToken{Token{left, left_end - 1, left_end},
                           Token{"x", left_end, left_end + 1}};
    };
    for (int pos : {5, 15, 25, 35}) {
        auto narrowed = block.unexpired(at(pos, "("));
        Decision d{at(pos, "("), {Split{Modification::space, 0}}};
        std::cout << "at " << pos << ": " << narrowed << "  splits:";
        for (const auto& s : narrowed.apply(d))
            std::cout << ' ' << s;
        std::cout << "\n";
    }

    auto pruned =
        block.filter([](const Clause& c) { return c.label() != "paren"; });
    std::cout << "without paren:   " << pruned << "\n";
}
