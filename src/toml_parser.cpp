#include "strata/toml_parser.hpp"

#include <sstream>

#include <toml++/toml.hpp>

#include "strata/flatten.hpp"

namespace strata {

namespace {

template <typename T>
std::string streamed(const T& v) {
    std::ostringstream os;
    os << v;
    return os.str();
}

Node toNode(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::table: {
            Node map = Node::mapping();
            for (const auto& [key, value] : *node.as_table()) map.add(std::string(key.str()), toNode(value));
            return map;
        }
        case toml::node_type::array: {
            Node seq = Node::sequence();
            for (const auto& item : *node.as_array()) seq.push(toNode(item));
            return seq;
        }
        case toml::node_type::string: return Node::string(node.as_string()->get());
        case toml::node_type::integer: return Node::integer(node.as_integer()->get());
        case toml::node_type::floating_point: return Node::floating(node.as_floating_point()->get());
        case toml::node_type::boolean: return Node::boolean(node.as_boolean()->get());
        case toml::node_type::date: return Node::string(streamed(node.as_date()->get()));
        case toml::node_type::time: return Node::string(streamed(node.as_time()->get()));
        case toml::node_type::date_time: return Node::string(streamed(node.as_date_time()->get()));
        case toml::node_type::none: break;
    }
    return Node::null();
}

} // namespace

std::optional<Error> TomlParser::decode(std::istream& in, Node& out) {
    try {
        const toml::table table = toml::parse(in);
        out = toNode(table);
    } catch (const toml::parse_error& e) {
        std::ostringstream msg;
        msg << "error parsing TOML config: " << e.description() << " (" << e.source().begin << ")";
        return Error(ErrorKind::ConfigParseError, msg.str());
    }
    return std::nullopt;
}

std::optional<Error> TomlParser::operator()(std::istream& in, const ConfigSetter& set) const {
    Node root;
    if (auto err = decode(in, root)) return err;
    return flatten(root, delimiter_, set);
}

} // namespace strata
