#ifndef SPLITPOLICY_POLICY_HPP
#define SPLITPOLICY_POLICY_HPP

// Policy algebra: immutable rules that override the Splits of future
// Decisions until they expire.
//
// A Policy is a handle over one of five node kinds:
//   EmptyNode    no constraint; one canonical instance, compared by identity
//   ClauseNode   override + End + no_dequeue flag + label
//   AndThenNode  (p1 & p2) p1 narrows first, p2 narrows the result
//   OrElseNode   (p1 | p2) p1 if it applies, otherwise p2
//   ProxyNode    override derived from an inner policy, re-derived whenever
//                the inner policy narrows
//
// Nodes are never mutated after construction; every operation returns a new
// handle or one of its inputs.

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include <splitpolicy/decision.hpp>
#include <splitpolicy/end.hpp>
#include <splitpolicy/log.hpp>
#include <splitpolicy/split.hpp>
#include <splitpolicy/token.hpp>

namespace splitpolicy {

class Policy;
class Clause;

// Partial override: std::nullopt means the Decision is outside its domain.
using Override =
    std::function<std::optional<std::vector<Split>>(const Decision&)>;
using ProxyFactory = std::function<Override(const Policy&)>;
using ClausePredicate = std::function<bool(const Clause&)>;

namespace detail {
struct PolicyNode;
}

class Policy {
  public:
    // The canonical empty policy.
    Policy();

    static const Policy& empty();

    static Policy clause(End end, Override f, std::string label,
                         bool no_dequeue = false);
    static Policy after(const Token& t, Override f, std::string label,
                        bool no_dequeue = false);
    static Policy before(const Token& t, Override f, std::string label,
                         bool no_dequeue = false);
    static Policy on(const Token& t, Override f, std::string label,
                     bool no_dequeue = false);

    // Empty if inner is empty; otherwise a clause whose override is
    // factory(inner).
    static Policy proxy(Policy inner, End end, ProxyFactory factory,
                        std::string label);

    bool is_empty() const;
    bool non_empty() const { return !is_empty(); }

    const Override& override_fn() const;
    std::optional<std::vector<Split>> try_apply(const Decision& d) const;
    // Override result, or the Decision's own Splits where it does not apply.
    std::vector<Split> apply(const Decision& d) const;

    Policy unexpired(const FormatToken& ft) const;
    std::optional<Policy> unexpired_opt(const FormatToken& ft) const;
    Policy filter(const ClausePredicate& pred) const;
    bool exists(const ClausePredicate& pred) const;
    bool no_dequeue() const;

    Policy operator&(const Policy& other) const;
    Policy operator|(const Policy& other) const;
    Policy operator&(const std::optional<Policy>& other) const;
    Policy operator|(const std::optional<Policy>& other) const;

    // Identity, not structural equality.
    bool operator==(const Policy& other) const { return node_ == other.node_; }

    template <typename Visitor> decltype(auto) visit(Visitor&& vis) const;

  private:
    explicit Policy(std::shared_ptr<const detail::PolicyNode> node)
        : node_(std::move(node)) {}

    friend struct detail::PolicyNode;

    Clause as_clause(const std::string& label, const End& end,
                     bool proxy) const;

    std::shared_ptr<const detail::PolicyNode> node_;
};

// --- Node kinds ---

struct EmptyNode {};

struct ClauseNode {
    End end;
    bool no_dequeue{false};
    std::string label;
};

struct AndThenNode {
    Policy first;
    Policy second;
};

struct OrElseNode {
    Policy first;
    Policy second;
};

struct ProxyNode {
    Policy inner;
    ProxyFactory factory;
    End end;
    std::string label;
};

namespace detail {

using NodeVariant =
    std::variant<EmptyNode, ClauseNode, AndThenNode, OrElseNode, ProxyNode>;

// Allocated non-const so the destructor may move children out; handles
// only ever see it through shared_ptr<const PolicyNode>.
struct PolicyNode {
    PolicyNode(NodeVariant n, Override fn)
        : node(std::move(n)), f(std::move(fn)) {}
    PolicyNode(const PolicyNode&) = delete;
    PolicyNode& operator=(const PolicyNode&) = delete;
    ~PolicyNode();

    NodeVariant node;
    Override f;
};

template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

inline std::optional<std::vector<Split>> no_override(const Decision&) {
    return std::nullopt;
}

inline const std::shared_ptr<const PolicyNode>& empty_node() {
    static const std::shared_ptr<const PolicyNode> instance =
        std::make_shared<PolicyNode>(EmptyNode{}, Override{no_override});
    return instance;
}

inline void log_expired(const std::string& label, const End& end,
                        const FormatToken& ft) {
    auto& log = logger();
    if (log.should_log(spdlog::level::trace))
        log.trace("expired {}{} at boundary {} ('{}' '{}')", label,
                  end.to_string(), ft.index, ft.left.text, ft.right.text);
}

} // namespace detail

// --- Clause: the view handed to filter/exists predicates ---
//
// Both plain clauses and proxies are clauses. The view holds its policy, so
// the references it returns stay valid for its lifetime.

class Clause {
  public:
    const std::string& label() const { return *label_; }
    const End& end() const { return *end_; }
    bool no_dequeue() const { return policy_.no_dequeue(); }
    bool is_proxy() const { return proxy_; }
    const Policy& policy() const { return policy_; }

  private:
    friend class Policy;
    Clause(Policy p, const std::string& label, const End& end, bool proxy)
        : policy_(std::move(p)), label_(&label), end_(&end), proxy_(proxy) {}

    Policy policy_;
    const std::string* label_;
    const End* end_;
    bool proxy_;
};

// --- Policy implementation ---

inline Policy::Policy() : node_(detail::empty_node()) {}

inline const Policy& Policy::empty() {
    static const Policy instance{};
    return instance;
}

template <typename Visitor> decltype(auto) Policy::visit(Visitor&& vis) const {
    return std::visit(std::forward<Visitor>(vis), node_->node);
}

inline Clause Policy::as_clause(const std::string& label, const End& end,
                                bool proxy) const {
    return Clause{*this, label, end, proxy};
}

inline Policy Policy::clause(End end, Override f, std::string label,
                             bool no_dequeue) {
    if (!f)
        throw std::invalid_argument(
            fmt::format("splitpolicy: clause '{}' has no override", label));
    return Policy{std::make_shared<detail::PolicyNode>(
        ClauseNode{end, no_dequeue, std::move(label)}, std::move(f))};
}

inline Policy Policy::after(const Token& t, Override f, std::string label,
                            bool no_dequeue) {
    return clause(End::after(t), std::move(f), std::move(label), no_dequeue);
}

inline Policy Policy::before(const Token& t, Override f, std::string label,
                             bool no_dequeue) {
    return clause(End::before(t), std::move(f), std::move(label), no_dequeue);
}

inline Policy Policy::on(const Token& t, Override f, std::string label,
                         bool no_dequeue) {
    return clause(End::on(t), std::move(f), std::move(label), no_dequeue);
}

inline Policy Policy::proxy(Policy inner, End end, ProxyFactory factory,
                            std::string label) {
    if (!factory)
        throw std::invalid_argument(
            fmt::format("splitpolicy: proxy '{}' has no factory", label));
    if (inner.is_empty())
        return empty();
    Override f = factory(inner);
    if (!f)
        throw std::invalid_argument(fmt::format(
            "splitpolicy: proxy '{}' factory returned no override", label));
    return Policy{std::make_shared<detail::PolicyNode>(
        ProxyNode{std::move(inner), std::move(factory), end, std::move(label)},
        std::move(f))};
}

inline bool Policy::is_empty() const {
    return node_ == detail::empty_node();
}

inline const Override& Policy::override_fn() const { return node_->f; }

inline std::optional<std::vector<Split>>
Policy::try_apply(const Decision& d) const {
    return node_->f(d);
}

inline std::vector<Split> Policy::apply(const Decision& d) const {
    if (auto result = try_apply(d))
        return std::move(*result);
    return d.splits();
}

inline Policy Policy::unexpired(const FormatToken& ft) const {
    return visit(detail::overloaded{
        [&](const EmptyNode&) -> Policy { return *this; },
        [&](const ClauseNode& c) -> Policy {
            if (c.end.not_expired_by(ft))
                return *this;
            detail::log_expired(c.label, c.end, ft);
            return empty();
        },
        [&](const AndThenNode& n) -> Policy {
            Policy a = n.first.unexpired(ft);
            Policy b = n.second.unexpired(ft);
            if (a == n.first && b == n.second)
                return *this;
            return a & b;
        },
        [&](const OrElseNode& n) -> Policy {
            Policy a = n.first.unexpired(ft);
            Policy b = n.second.unexpired(ft);
            if (a == n.first && b == n.second)
                return *this;
            return a | b;
        },
        [&](const ProxyNode& p) -> Policy {
            if (!p.end.not_expired_by(ft)) {
                detail::log_expired(p.label, p.end, ft);
                return empty();
            }
            // Always rebuilt, so the override never closes over a stale inner.
            return proxy(p.inner.unexpired(ft), p.end, p.factory, p.label);
        },
    });
}

inline std::optional<Policy> Policy::unexpired_opt(const FormatToken& ft) const {
    Policy p = unexpired(ft);
    if (p.is_empty())
        return std::nullopt;
    return p;
}

inline Policy Policy::filter(const ClausePredicate& pred) const {
    return visit(detail::overloaded{
        [&](const EmptyNode&) -> Policy { return *this; },
        [&](const ClauseNode& c) -> Policy {
            return pred(as_clause(c.label, c.end, false)) ? *this : empty();
        },
        [&](const AndThenNode& n) -> Policy {
            Policy a = n.first.filter(pred);
            Policy b = n.second.filter(pred);
            if (a == n.first && b == n.second)
                return *this;
            return a & b;
        },
        [&](const OrElseNode& n) -> Policy {
            Policy a = n.first.filter(pred);
            Policy b = n.second.filter(pred);
            if (a == n.first && b == n.second)
                return *this;
            return a | b;
        },
        [&](const ProxyNode& p) -> Policy {
            if (!pred(as_clause(p.label, p.end, true)))
                return empty();
            return proxy(p.inner.filter(pred), p.end, p.factory, p.label);
        },
    });
}

inline bool Policy::exists(const ClausePredicate& pred) const {
    return visit(detail::overloaded{
        [](const EmptyNode&) { return false; },
        [&](const ClauseNode& c) {
            return pred(as_clause(c.label, c.end, false));
        },
        [&](const AndThenNode& n) {
            return n.first.exists(pred) || n.second.exists(pred);
        },
        [&](const OrElseNode& n) {
            return n.first.exists(pred) || n.second.exists(pred);
        },
        [&](const ProxyNode& p) {
            return pred(as_clause(p.label, p.end, true)) ||
                   p.inner.exists(pred);
        },
    });
}

inline bool Policy::no_dequeue() const {
    return visit(detail::overloaded{
        [](const EmptyNode&) { return false; },
        [](const ClauseNode& c) { return c.no_dequeue; },
        [](const AndThenNode& n) {
            return n.first.no_dequeue() || n.second.no_dequeue();
        },
        [](const OrElseNode& n) {
            return n.first.no_dequeue() || n.second.no_dequeue();
        },
        [](const ProxyNode& p) { return p.inner.no_dequeue(); },
    });
}

// --- Composition ---

inline Policy Policy::operator&(const Policy& other) const {
    if (other.is_empty())
        return *this;
    if (is_empty())
        return other;
    Override f = [p1 = *this, p2 = other](const Decision& d)
        -> std::optional<std::vector<Split>> {
        auto first = p1.try_apply(d);
        if (!first) {
            if (auto second = p2.try_apply(d))
                return second;
            return d.splits();
        }
        const Decision narrowed = d.with_splits(std::move(*first));
        if (auto second = p2.try_apply(narrowed))
            return second;
        return narrowed.splits();
    };
    return Policy{std::make_shared<detail::PolicyNode>(AndThenNode{*this, other},
                                                       std::move(f))};
}

inline Policy Policy::operator|(const Policy& other) const {
    if (other.is_empty())
        return *this;
    if (is_empty())
        return other;
    Override f = [p1 = *this, p2 = other](const Decision& d)
        -> std::optional<std::vector<Split>> {
        if (auto first = p1.try_apply(d))
            return first;
        return p2.try_apply(d);
    };
    return Policy{std::make_shared<detail::PolicyNode>(OrElseNode{*this, other},
                                                       std::move(f))};
}

inline Policy Policy::operator&(const std::optional<Policy>& other) const {
    return other ? *this & *other : *this;
}

inline Policy Policy::operator|(const std::optional<Policy>& other) const {
    return other ? *this | *other : *this;
}

// --- Teardown ---
//
// A long & chain is a left-deep tree; letting each shared_ptr free its
// children recursively runs out of stack. Children this node solely owns are
// detached onto a worklist instead, so every node is freed with no children
// left to recurse into.

inline detail::PolicyNode::~PolicyNode() {
    std::vector<std::shared_ptr<const PolicyNode>> pending;
    auto detach = [&pending](PolicyNode& n) {
        // composite overrides hold their own copies of the operands
        n.f = nullptr;
        auto take = [&pending](Policy& p) {
            if (p.node_ && p.node_.use_count() == 1)
                pending.push_back(std::move(p.node_));
        };
        std::visit(overloaded{
                       [&](AndThenNode& c) {
                           take(c.first);
                           take(c.second);
                       },
                       [&](OrElseNode& c) {
                           take(c.first);
                           take(c.second);
                       },
                       [&](ProxyNode& c) {
                           c.factory = nullptr;
                           take(c.inner);
                       },
                       [](auto&) {},
                   },
                   n.node);
    };

    detach(*this);
    while (!pending.empty()) {
        auto next = std::move(pending.back());
        pending.pop_back();
        if (next.use_count() == 1)
            detach(const_cast<PolicyNode&>(*next));
    }
}

} // namespace splitpolicy

#endif // SPLITPOLICY_POLICY_HPP
