#include "strata/yaml_parser.hpp"

#include <array>
#include <string_view>

#include <yaml-cpp/yaml.h>

#include "strata/flatten.hpp"

namespace strata {

namespace {

constexpr std::array<std::string_view, 5> kNullWords{"", "~", "null", "Null", "NULL"};
constexpr std::array<std::string_view, 9> kTrueWords{"true", "True", "TRUE", "yes", "Yes", "YES", "on", "On", "ON"};
constexpr std::array<std::string_view, 9> kFalseWords{"false", "False", "FALSE", "no", "No", "NO", "off", "Off", "OFF"};

template <std::size_t N>
bool oneOf(const std::array<std::string_view, N>& words, std::string_view s) {
    for (auto w : words) {
        if (w == s) return true;
    }
    return false;
}

Node scalarNode(const YAML::Node& node) {
    const std::string& text = node.Scalar();
    if (node.Tag() == "!") return Node::string(text);

    if (oneOf(kNullWords, text)) return Node::null();
    if (oneOf(kTrueWords, text)) return Node::boolean(true);
    if (oneOf(kFalseWords, text)) return Node::boolean(false);

    std::int64_t i = 0;
    if (YAML::convert<std::int64_t>::decode(node, i)) return Node::integer(i);
    double d = 0.0;
    if (YAML::convert<double>::decode(node, d)) return Node::floating(d);
    return Node::string(text);
}

Node toNode(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Scalar: return scalarNode(node);
        case YAML::NodeType::Sequence: {
            Node seq = Node::sequence();
            for (const auto& item : node) seq.push(toNode(item));
            return seq;
        }
        case YAML::NodeType::Map: {
            Node map = Node::mapping();
            for (const auto& kv : node) map.add(kv.first.as<std::string>(), toNode(kv.second));
            return map;
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined: break;
    }
    return Node::null();
}

} // namespace

std::optional<Error> YamlParser::decode(std::istream& in, Node& out) {
    try {
        out = toNode(YAML::Load(in));
    } catch (const YAML::Exception& e) {
        return Error(ErrorKind::ConfigParseError, std::string("error parsing YAML config: ") + e.what());
    }
    return std::nullopt;
}

std::optional<Error> YamlParser::operator()(std::istream& in, const ConfigSetter& set) const {
    Node root;
    if (auto err = decode(in, root)) return err;
    return flatten(root, delimiter_, set);
}

} // namespace strata
