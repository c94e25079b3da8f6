#ifndef SPLITPOLICY_DECISION_HPP
#define SPLITPOLICY_DECISION_HPP

#include <algorithm>
#include <iterator>
#include <utility>
#include <vector>

#include <splitpolicy/split.hpp>
#include <splitpolicy/token.hpp>

namespace splitpolicy {

// --- Decision: the candidate Splits at one token boundary ---
//
// Immutable: with_splits() returns a new Decision on the same boundary.

class Decision {
  public:
    Decision(FormatToken ft, std::vector<Split> splits)
        : ft_(std::move(ft)), splits_(std::move(splits)) {}

    const FormatToken& ft() const { return ft_; }
    const std::vector<Split>& splits() const { return splits_; }

    Decision with_splits(std::vector<Split> splits) const {
        return Decision{ft_, std::move(splits)};
    }

    std::vector<Split> only_newlines() const {
        std::vector<Split> out;
        std::copy_if(splits_.begin(), splits_.end(), std::back_inserter(out),
                     [](const Split& s) { return s.is_newline(); });
        return out;
    }

    std::vector<Split> no_newlines() const {
        std::vector<Split> out;
        std::copy_if(splits_.begin(), splits_.end(), std::back_inserter(out),
                     [](const Split& s) { return !s.is_newline(); });
        return out;
    }

  private:
    FormatToken ft_;
    std::vector<Split> splits_;
};

} // namespace splitpolicy

#endif // SPLITPOLICY_DECISION_HPP
