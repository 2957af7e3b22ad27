#ifndef STRATA_JSON_PARSER_HPP
#define STRATA_JSON_PARSER_HPP

#include <istream>
#include <optional>
#include <string>
#include <utility>

#include "error.hpp"
#include "node.hpp"
#include "options.hpp"

namespace strata {

// JSON config files. The top-level value must be an object; nested objects
// are joined with the delimiter, arrays feed repeatable flags.
class JsonParser {
public:
    explicit JsonParser(std::string delimiter = ".") : delimiter_(std::move(delimiter)) {}

    std::optional<Error> operator()(std::istream& in, const ConfigSetter& set) const;

    // Decodes a whole document into a Node tree. Syntax errors are ConfigParseError.
    static std::optional<Error> decode(std::istream& in, Node& out);

private:
    std::string delimiter_;
};

} // namespace strata

#endif // STRATA_JSON_PARSER_HPP
