#ifndef SPLITPOLICY_SCAN_PATH_HPP
#define SPLITPOLICY_SCAN_PATH_HPP

#include <cstddef>
#include <utility>
#include <vector>

#include <splitpolicy/decision.hpp>
#include <splitpolicy/log.hpp>
#include <splitpolicy/policy.hpp>
#include <splitpolicy/pretty_print.hpp>
#include <splitpolicy/split.hpp>
#include <splitpolicy/token.hpp>

namespace splitpolicy {

// --- ScanPath: the policy side of one search path ---
//
// Immutable: every step returns a new path. Copies share policy nodes, so
// forking a path for each candidate Split is a handful of refcount bumps.
//
// Per Decision a search engine:
//   1. narrows the held policy to the boundary        narrowed_to()
//   2. takes the overridden candidates                splits_for()
//   3. picks a Split and attaches any new rule        next() / attach()
//   4. keeps the state queued while it blocks dequeue blocks_dequeue()

class ScanPath {
  public:
    ScanPath() = default;
    explicit ScanPath(Policy policy) : policy_(std::move(policy)) {}

    const Policy& policy() const { return policy_; }
    int cost() const { return cost_; }
    std::size_t depth() const { return depth_; }

    ScanPath narrowed_to(const FormatToken& ft) const {
        ScanPath p = *this;
        p.policy_ = policy_.unexpired(ft);
        return p;
    }

    std::vector<Split> splits_for(const Decision& d) const {
        return policy_.unexpired(d.ft()).apply(d);
    }

    ScanPath attach(const Policy& rule) const {
        ScanPath p = *this;
        p.policy_ = policy_ & rule;
        log_attach("&", rule);
        return p;
    }

    ScanPath attach_fallback(const Policy& rule) const {
        ScanPath p = *this;
        p.policy_ = policy_ | rule;
        log_attach("|", rule);
        return p;
    }

    // Drops every clause matching pred, e.g. the rules of an abandoned
    // branch.
    ScanPath without(const ClausePredicate& pred) const {
        ScanPath p = *this;
        p.policy_ =
            policy_.filter([&](const Clause& c) { return !pred(c); });
        return p;
    }

    // Takes `chosen` at `d`: narrows to the boundary, then attaches `rule`.
    ScanPath next(const Decision& d, const Split& chosen,
                  const Policy& rule = Policy::empty()) const {
        ScanPath p = narrowed_to(d.ft()).attach(rule);
        p.cost_ += chosen.cost;
        ++p.depth_;
        auto& log = logger();
        if (p.blocks_dequeue() && log.should_log(spdlog::level::debug))
            log.debug("path at boundary {} blocks dequeue: {}", d.ft().index,
                      to_string(p.policy_));
        return p;
    }

    bool blocks_dequeue() const { return policy_.no_dequeue(); }

  private:
    static void log_attach(const char* op, const Policy& rule) {
        auto& log = logger();
        if (rule.non_empty() && log.should_log(spdlog::level::debug))
            log.debug("attach {} {}", op, to_string(rule));
    }

    Policy policy_{};
    int cost_{0};
    std::size_t depth_{0};
};

} // namespace splitpolicy

#endif // SPLITPOLICY_SCAN_PATH_HPP
