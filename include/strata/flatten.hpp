#ifndef STRATA_FLATTEN_HPP
#define STRATA_FLATTEN_HPP

#include <optional>
#include <string>
#include <string_view>

#include "error.hpp"
#include "node.hpp"
#include "options.hpp"

namespace strata {

// Canonical text of a scalar node: "true"/"false", base-10 integers, shortest
// round-tripping floats, strings unchanged. Null and container nodes fail with
// StringConversionError.
[[nodiscard]] std::optional<Error> scalarToString(const Node& node, std::string& out);

// Walks a decoded document and reports every leaf to `set`.
//
// Mapping keys are joined with `delimiter` into the flag name. A sequence calls
// `set` once per element under the sequence's own name, so repeatable flags
// receive every element in order. A null root is an empty document; any other
// non-mapping root is a ConfigParseError. Setter errors come back unchanged.
[[nodiscard]] std::optional<Error> flatten(const Node& root, std::string_view delimiter, const ConfigSetter& set);

} // namespace strata

#endif // STRATA_FLATTEN_HPP
