#ifndef SPLITPOLICY_END_HPP
#define SPLITPOLICY_END_HPP

#include <string>

#include <splitpolicy/token.hpp>

namespace splitpolicy {

// --- End: the offset at which a policy stops applying ---
//
//   After(p)   active while left.end  <= p
//   Before(p)  active while right.end <  p
//   On(p)      active while right.end <= p
//
// Each predicate is monotonic in the boundary offsets, so once an End reports
// expiry it stays expired for the rest of a forward scan.

enum class EndKind { after, before, on };

class End {
  public:
    static End after(int pos) { return End{EndKind::after, pos}; }
    static End before(int pos) { return End{EndKind::before, pos}; }
    static End on(int pos) { return End{EndKind::on, pos}; }

    static End after(const Token& t) { return after(t.end); }
    static End before(const Token& t) { return before(t.end); }
    static End on(const Token& t) { return on(t.end); }

    EndKind kind() const { return kind_; }
    int pos() const { return pos_; }

    bool not_expired_by(const FormatToken& ft) const {
        switch (kind_) {
        case EndKind::after:
            return ft.left.end <= pos_;
        case EndKind::before:
            return ft.right.end < pos_;
        case EndKind::on:
            return ft.right.end <= pos_;
        }
        return false;
    }

    char symbol() const {
        switch (kind_) {
        case EndKind::after:
            return '>';
        case EndKind::before:
            return '<';
        case EndKind::on:
            return '@';
        }
        return '?';
    }

    std::string to_string() const { return symbol() + std::to_string(pos_); }

    bool operator==(const End&) const = default;

  private:
    End(EndKind k, int p) : kind_(k), pos_(p) {}

    EndKind kind_;
    int pos_;
};

} // namespace splitpolicy

#endif // SPLITPOLICY_END_HPP
