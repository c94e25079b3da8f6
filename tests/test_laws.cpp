#include <gtest/gtest.h>
#include <splitpolicy/policy.hpp>
#include <splitpolicy/pretty_print.hpp>

#include <optional>
#include <string>
#include <vector>

using namespace splitpolicy;

// Algebraic laws checked over a small fixed universe of policies,
// decisions and scan positions.

namespace {

FormatToken boundary(int left_end, const char* left = "l") {
    return FormatToken{Token{left, left_end - 1, left_end},
                       Token{"r", left_end, left_end + 1}};
}

Decision decision(FormatToken ft) {
    return Decision{std::move(ft),
                    {Split{Modification::no_split}, Split{Modification::space},
                     Split{Modification::newline, 1},
                     Split{Modification::newline, 3, "deep"}}};
}

Override when_left(std::string text, Override inner) {
    return [text, inner](const Decision& d)
               -> std::optional<std::vector<Split>> {
        if (d.ft().left.text != text)
            return std::nullopt;
        return inner(d);
    };
}

Override only_newlines() {
    return [](const Decision& d) -> std::optional<std::vector<Split>> {
        return d.only_newlines();
    };
}

Override drop_first() {
    return [](const Decision& d) -> std::optional<std::vector<Split>> {
        if (d.splits().empty())
            return std::vector<Split>{};
        return std::vector<Split>(d.splits().begin() + 1, d.splits().end());
    };
}

Override keep_last() {
    return [](const Decision& d) -> std::optional<std::vector<Split>> {
        if (d.splits().empty())
            return std::vector<Split>{};
        return std::vector<Split>{d.splits().back()};
    };
}

ProxyFactory delegate() {
    return [](const Policy& inner) -> Override {
        return [inner](const Decision& d) { return inner.try_apply(d); };
    };
}

struct Universe {
    std::vector<Policy> policies;
    std::vector<Decision> decisions;
    std::vector<FormatToken> scan;

    Universe() {
        auto nl = Policy::clause(End::after(8), when_left("(", only_newlines()),
                                 "nl", true);
        auto drop = Policy::clause(End::before(14), drop_first(), "drop");
        auto last =
            Policy::clause(End::on(20), when_left(",", keep_last()), "last");
        auto px = Policy::proxy(nl | last, End::after(16), delegate(), "px");
        policies = {nl, drop, last, px, nl & drop, drop | last};

        for (const char* text : {"(", ",", "x"})
            for (int pos : {2, 9, 15})
                decisions.push_back(decision(boundary(pos, text)));

        for (int pos = 1; pos <= 24; ++pos)
            scan.push_back(boundary(pos));
    }
};

bool same_overrides(const Policy& a, const Policy& b,
                    const std::vector<Decision>& decisions) {
    for (const auto& d : decisions)
        if (a.try_apply(d) != b.try_apply(d))
            return false;
    return true;
}

} // namespace

TEST(Laws, Identity) {
    Universe u;
    const auto& e = Policy::empty();
    for (const auto& p : u.policies) {
        EXPECT_EQ(p & e, p) << p;
        EXPECT_EQ(e & p, p) << p;
        EXPECT_EQ(p | e, p) << p;
        EXPECT_EQ(e | p, p) << p;
    }
}

TEST(Laws, AssociativeUpToBehaviour) {
    Universe u;
    auto has_label = [](std::string label) {
        return [label](const Clause& c) { return c.label() == label; };
    };
    for (const auto& a : u.policies)
        for (const auto& b : u.policies)
            for (const auto& c : u.policies) {
                auto and_left = (a & b) & c;
                auto and_right = a & (b & c);
                auto or_left = (a | b) | c;
                auto or_right = a | (b | c);
                EXPECT_TRUE(same_overrides(and_left, and_right, u.decisions))
                    << and_left << " vs " << and_right;
                EXPECT_TRUE(same_overrides(or_left, or_right, u.decisions))
                    << or_left << " vs " << or_right;

                for (const auto& ft : u.scan) {
                    auto al = and_left.unexpired(ft);
                    auto ar = and_right.unexpired(ft);
                    EXPECT_EQ(al.is_empty(), ar.is_empty());
                    EXPECT_TRUE(same_overrides(al, ar, u.decisions));
                    EXPECT_EQ(al.no_dequeue(), ar.no_dequeue());
                    for (const char* label : {"nl", "drop", "last", "px"}) {
                        EXPECT_EQ(al.exists(has_label(label)),
                                  ar.exists(has_label(label)));
                        EXPECT_EQ(or_left.unexpired(ft).exists(has_label(label)),
                                  or_right.unexpired(ft).exists(has_label(label)));
                    }
                }
            }
}

TEST(Laws, ExpiryIsMonotonic) {
    Universe u;
    for (const auto& a : u.policies)
        for (const auto& b : u.policies)
            for (const auto& p : {a, a & b, a | b}) {
                bool expired = false;
                for (const auto& ft : u.scan) {
                    bool gone = p.unexpired(ft).is_empty();
                    if (expired) {
                        EXPECT_TRUE(gone) << p << " revived at " << ft.index;
                    }
                    expired = expired || gone;
                }
            }
}

TEST(Laws, NarrowingAlongScanMatchesDirectNarrowing) {
    Universe u;
    for (const auto& p : u.policies) {
        Policy carried = p;
        for (const auto& ft : u.scan) {
            carried = carried.unexpired(ft);
            EXPECT_EQ(carried.is_empty(), p.unexpired(ft).is_empty()) << p;
        }
    }
}

TEST(Laws, OrElsePrecedence) {
    Universe u;
    for (const auto& p1 : u.policies)
        for (const auto& p2 : u.policies)
            for (const auto& d : u.decisions)
                if (auto first = p1.try_apply(d)) {
                    EXPECT_EQ((p1 | p2).try_apply(d), first);
                }
}

TEST(Laws, AndThenPipelining) {
    Universe u;
    for (const auto& p1 : u.policies)
        for (const auto& p2 : u.policies)
            for (const auto& d : u.decisions) {
                auto first = p1.try_apply(d);
                if (!first)
                    continue;
                auto second = p2.try_apply(d.with_splits(*first));
                if (!second)
                    continue;
                EXPECT_EQ((p1 & p2).try_apply(d), second);
            }
}

TEST(Laws, NoDequeuePropagation) {
    Universe u;
    for (const auto& p1 : u.policies)
        for (const auto& p2 : u.policies) {
            bool expected = p1.no_dequeue() || p2.no_dequeue();
            EXPECT_EQ((p1 & p2).no_dequeue(), expected);
            EXPECT_EQ((p1 | p2).no_dequeue(), expected);
        }
}
