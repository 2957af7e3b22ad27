#ifndef STRATA_HELP_HPP
#define STRATA_HELP_HPP

#include <string>

#include "command.hpp"
#include "flag.hpp"
#include "flag_set.hpp"

namespace strata {

// Plain-text help pages, one blank line between sections.
//
// For a command this describes the selected command when there is one:
// title, USAGE, long help, SUBCOMMANDS, then FLAGS and one "FLAGS (<group>)"
// section per ancestor that contributes flags.
[[nodiscard]] std::string help(const Command& cmd);
[[nodiscard]] std::string help(const FlagSet& fs);

// "-v, --verbose BOOL" style left column for a flag.
[[nodiscard]] std::string flagSpec(const Flag& f);

} // namespace strata

#endif // STRATA_HELP_HPP
