#include "strata/flatten.hpp"

#include "strata/convert.hpp"

namespace strata {

namespace {

std::optional<Error> unsupported(const Node& node, const std::string& path) {
    return Error(ErrorKind::StringConversionError,
                 path + ": couldn't convert " + std::string(toString(node.kind())) + " value to string");
}

std::optional<Error> walk(const Node& node, const std::string& path, std::string_view delimiter, const ConfigSetter& set) {
    switch (node.kind()) {
        case Node::Kind::Mapping:
            for (const auto& [key, child] : node.entries()) {
                const std::string name = path.empty() ? key : path + std::string(delimiter) + key;
                if (auto err = walk(child, name, delimiter, set)) return err;
            }
            return std::nullopt;

        case Node::Kind::Sequence:
            for (const auto& item : node.items()) {
                std::string value;
                if (!item.isScalar()) return unsupported(item, path);
                if (auto err = scalarToString(item, value)) return err->wrap(path);
                if (auto err = set(path, value)) return err;
            }
            return std::nullopt;

        default: {
            std::string value;
            if (auto err = scalarToString(node, value)) return err->wrap(path);
            return set(path, value);
        }
    }
}

} // namespace

std::optional<Error> scalarToString(const Node& node, std::string& out) {
    switch (node.kind()) {
        case Node::Kind::Bool: out = node.asBool() ? "true" : "false"; return std::nullopt;
        case Node::Kind::Int: out = std::to_string(node.asInt()); return std::nullopt;
        case Node::Kind::Float: out = convert::formatFloat(node.asFloat()); return std::nullopt;
        case Node::Kind::String: out = node.asString(); return std::nullopt;
        default: break;
    }
    return Error(ErrorKind::StringConversionError,
                 "couldn't convert " + std::string(toString(node.kind())) + " value to string");
}

std::optional<Error> flatten(const Node& root, std::string_view delimiter, const ConfigSetter& set) {
    if (root.isNull()) return std::nullopt;
    if (root.kind() != Node::Kind::Mapping) {
        return Error(ErrorKind::ConfigParseError,
                     "config root must be a mapping, got " + std::string(toString(root.kind())));
    }
    return walk(root, "", delimiter, set);
}

} // namespace strata
