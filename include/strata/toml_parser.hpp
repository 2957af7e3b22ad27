#ifndef STRATA_TOML_PARSER_HPP
#define STRATA_TOML_PARSER_HPP

#include <istream>
#include <optional>
#include <string>
#include <utility>

#include "error.hpp"
#include "node.hpp"
#include "options.hpp"

namespace strata {

// TOML config files. Tables nest with the delimiter; dates and times are
// passed on in their TOML text form.
class TomlParser {
public:
    explicit TomlParser(std::string delimiter = ".") : delimiter_(std::move(delimiter)) {}

    std::optional<Error> operator()(std::istream& in, const ConfigSetter& set) const;

    static std::optional<Error> decode(std::istream& in, Node& out);

private:
    std::string delimiter_;
};

} // namespace strata

#endif // STRATA_TOML_PARSER_HPP
