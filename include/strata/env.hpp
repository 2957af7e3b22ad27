#ifndef STRATA_ENV_HPP
#define STRATA_ENV_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "error.hpp"
#include "flag.hpp"
#include "flag_set.hpp"
#include "options.hpp"

namespace strata {

// Environment variable name for one flag name: leading dashes dropped,
// '-', '.' and '/' turned into '_', prefixed with "<PREFIX>_", and uppercased
// unless case sensitivity is on.
[[nodiscard]] std::string envVarKey(std::string_view flagName, const ParseOptions& opts);

// Candidate keys for a flag, long name first. The short name only takes part
// when envVarShortNames is set.
[[nodiscard]] std::vector<std::string> envVarKeys(const Flag& flag, const ParseOptions& opts);

// Splits on `separator`; a backslash right before a separator keeps it literal.
[[nodiscard]] std::vector<std::string> splitEscape(std::string_view s, std::string_view separator);

// Reverse index from derived environment key to the flags that produce it.
class EnvIndex {
public:
    EnvIndex() = default;

    // Indexes every flag visible from `fs`, ancestors included.
    static EnvIndex build(const FlagSet& fs, const ParseOptions& opts);

    // Flags whose key matches `key` exactly. Empty when none do.
    [[nodiscard]] const std::vector<Flag*>& find(std::string_view key) const;

    // First key shared by more than one flag, as AmbiguousName listing each of them.
    [[nodiscard]] std::optional<Error> checkAmbiguous() const;

private:
    std::vector<std::pair<std::string, std::vector<Flag*>>> buckets_;
};

} // namespace strata

#endif // STRATA_ENV_HPP
