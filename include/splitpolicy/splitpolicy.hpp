#ifndef SPLITPOLICY_SPLITPOLICY_HPP
#define SPLITPOLICY_SPLITPOLICY_HPP

#include <splitpolicy/token.hpp>
#include <splitpolicy/split.hpp>
#include <splitpolicy/decision.hpp>
#include <splitpolicy/end.hpp>
#include <splitpolicy/log.hpp>
#include <splitpolicy/config.hpp>
#include <splitpolicy/policy.hpp>
#include <splitpolicy/pretty_print.hpp>
#include <splitpolicy/scan_path.hpp>

#endif // SPLITPOLICY_SPLITPOLICY_HPP
