#ifndef STRATA_YAML_PARSER_HPP
#define STRATA_YAML_PARSER_HPP

#include <istream>
#include <optional>
#include <string>
#include <utility>

#include "error.hpp"
#include "node.hpp"
#include "options.hpp"

namespace strata {

// YAML config files (first document only).
//
// Quoted scalars stay strings. Plain scalars resolve to null, bool
// (true/false/yes/no/on/off), integer, float, or string, in that order.
class YamlParser {
public:
    explicit YamlParser(std::string delimiter = ".") : delimiter_(std::move(delimiter)) {}

    std::optional<Error> operator()(std::istream& in, const ConfigSetter& set) const;

    static std::optional<Error> decode(std::istream& in, Node& out);

private:
    std::string delimiter_;
};

} // namespace strata

#endif // STRATA_YAML_PARSER_HPP
