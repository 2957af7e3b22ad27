#ifndef STRATA_PARSERS_HPP
#define STRATA_PARSERS_HPP

#include <istream>
#include <optional>
#include <string>

#include "error.hpp"
#include "options.hpp"

namespace strata {

// Line-oriented "name value" config files.
//
//   # full-line comment
//   timeout 250ms     # end-of-line comments need a space before '#'
//   foo     abc def   # value is the rest of the line, trimmed
//   --bar   1         # leading dashes on the name are ignored
//   verbose           # a bare name means "true"
//
// Values are passed through literally; quotes and escapes are not processed.
class PlainParser {
public:
    std::optional<Error> operator()(std::istream& in, const ConfigSetter& set) const;
};

// .env files: NAME=value per line.
//
// Names and values are trimmed. Double-quoted values are unescaped (\n \t \r
// \\ \"), backquoted values are taken raw. A non-blank line without '=' is a
// ConfigParseError. With a prefix, a leading "<PREFIX>_" is dropped from names.
class EnvFileParser {
public:
    EnvFileParser() = default;
    explicit EnvFileParser(std::string prefix) : prefix_(std::move(prefix)) {}

    std::optional<Error> operator()(std::istream& in, const ConfigSetter& set) const;

private:
    std::string prefix_;
};

} // namespace strata

#endif // STRATA_PARSERS_HPP
