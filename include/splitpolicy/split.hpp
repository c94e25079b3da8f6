#ifndef SPLITPOLICY_SPLIT_HPP
#define SPLITPOLICY_SPLIT_HPP

#include <string>
#include <string_view>
#include <utility>

namespace splitpolicy {

enum class Modification { no_split, space, newline };

constexpr std::string_view modification_name(Modification m) {
    switch (m) {
    case Modification::no_split:
        return "NoSplit";
    case Modification::space:
        return "Space";
    case Modification::newline:
        return "Newline";
    }
    return "?";
}

// A candidate layout action. Policies move Splits around without looking
// inside them beyond these fields.
struct Split {
    Modification modification{Modification::no_split};
    int cost{0};
    std::string tag;

    Split() = default;
    Split(Modification m, int c = 0, std::string t = {})
        : modification(m), cost(c), tag(std::move(t)) {}

    bool is_newline() const { return modification == Modification::newline; }

    bool operator==(const Split&) const = default;
};

} // namespace splitpolicy

#endif // SPLITPOLICY_SPLIT_HPP
