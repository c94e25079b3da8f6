// 01_bracket_newlines.cpp: Forcing newlines inside a bracket
//
// Shows: Policy::before(), ScanPath::next(), splits_for(), expiry as the
//        scan passes the closing bracket, configure() from the environment.
//
// Run with SPLITPOLICY_LOG_LEVEL=trace to see each rule expire.

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <splitpolicy/splitpolicy.hpp>

using namespace splitpolicy;

static std::vector<Token> tokenize(const std::string& src) {
    std::vector<Token> out;
    for (int i = 0; i < static_cast<int>(src.size()); ++i)
        out.emplace_back(std::string(1, src[i]), i, i + 1);
    return out;
}

int main() {
    configure(Config::from_env());

    const auto tokens = tokenize("f(a,b,c);");
    const Token& close = tokens[7];

    // Once we break after `(`, every argument goes on its own line.
    auto one_per_line = Policy::before(
        close,
        [](const Decision& d) -> std::optional<std::vector<Split>> {
            return d.only_newlines();
        },
        "args-one-per-line");

    ScanPath path;
    for (std::size_t i = 0; i + 1 < tokens.size(); ++i) {
        Decision d{FormatToken{tokens[i], tokens[i + 1], i},
                   {Split{Modification::no_split, 0},
                    Split{Modification::newline, 1}}};
        auto splits = path.splits_for(d);
        // Cheapest remaining candidate, except that we always break after `(`
        Split chosen = splits.front();
        Policy rule{};
        if (tokens[i].text == "(") {
            chosen = Split{Modification::newline, 1};
            rule = one_per_line;
        }
        path = path.next(d, chosen, rule);

        std::cout << tokens[i].text << " | " << tokens[i + 1].text << "  -> "
                  << chosen << "   policy: " << path.policy() << "\n";
    }
    std::cout << "total cost " << path.cost() << "\n";
}
