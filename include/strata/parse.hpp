#ifndef STRATA_PARSE_HPP
#define STRATA_PARSE_HPP

#include <optional>
#include <string>
#include <vector>

#include "error.hpp"
#include "flag_set.hpp"
#include "options.hpp"

namespace strata {

// Resolves every flag visible from `fs` from args, then the environment, then
// the config file. A flag set by one stage is never overwritten by a later one;
// within a stage, repeated values are all applied in order.
//
// An own flag whose name is also used by an ancestor fails with DuplicateFlag.
// With envVars on, flags whose derived environment names collide fail the
// whole call with AmbiguousName before anything is applied.
std::optional<Error> parse(FlagSet& fs, const std::vector<std::string>& args, const ParseOptions& opts = {});

} // namespace strata

#endif // STRATA_PARSE_HPP
