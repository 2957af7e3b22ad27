#include "strata/json_parser.hpp"

#include <limits>

#include <nlohmann/json.hpp>

#include "strata/flatten.hpp"

namespace strata {

namespace {

using json = nlohmann::ordered_json;

Node toNode(const json& j) {
    switch (j.type()) {
        case json::value_t::null: return Node::null();
        case json::value_t::boolean: return Node::boolean(j.get<bool>());
        case json::value_t::number_integer: return Node::integer(j.get<std::int64_t>());
        case json::value_t::number_unsigned: {
            const auto v = j.get<std::uint64_t>();
            if (v > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) return Node::string(std::to_string(v));
            return Node::integer(static_cast<std::int64_t>(v));
        }
        case json::value_t::number_float: return Node::floating(j.get<double>());
        case json::value_t::string: return Node::string(j.get<std::string>());
        case json::value_t::array: {
            Node seq = Node::sequence();
            for (const auto& item : j) seq.push(toNode(item));
            return seq;
        }
        case json::value_t::object: {
            Node map = Node::mapping();
            for (auto it = j.begin(); it != j.end(); ++it) map.add(it.key(), toNode(it.value()));
            return map;
        }
        default: break;
    }
    return Node::null();
}

} // namespace

std::optional<Error> JsonParser::decode(std::istream& in, Node& out) {
    json doc;
    try {
        doc = json::parse(in);
    } catch (const json::parse_error& e) {
        return Error(ErrorKind::ConfigParseError, std::string("error parsing JSON config: ") + e.what());
    }
    out = toNode(doc);
    return std::nullopt;
}

std::optional<Error> JsonParser::operator()(std::istream& in, const ConfigSetter& set) const {
    Node root;
    if (auto err = decode(in, root)) return err;
    return flatten(root, delimiter_, set);
}

} // namespace strata
