#include "strata/node.hpp"

namespace strata {

Node Node::boolean(bool v) {
    Node n;
    n.kind_ = Kind::Bool;
    n.bool_ = v;
    return n;
}

Node Node::integer(std::int64_t v) {
    Node n;
    n.kind_ = Kind::Int;
    n.int_ = v;
    return n;
}

Node Node::floating(double v) {
    Node n;
    n.kind_ = Kind::Float;
    n.float_ = v;
    return n;
}

Node Node::string(std::string v) {
    Node n;
    n.kind_ = Kind::String;
    n.string_ = std::move(v);
    return n;
}

Node Node::sequence(std::vector<Node> items) {
    Node n;
    n.kind_ = Kind::Sequence;
    n.items_ = std::move(items);
    return n;
}

Node Node::mapping(std::vector<Entry> entries) {
    Node n;
    n.kind_ = Kind::Mapping;
    n.entries_ = std::move(entries);
    return n;
}

Node& Node::push(Node item) {
    items_.push_back(std::move(item));
    return *this;
}

Node& Node::add(std::string key, Node value) {
    entries_.emplace_back(std::move(key), std::move(value));
    return *this;
}

std::string_view toString(Node::Kind kind) {
    switch (kind) {
        case Node::Kind::Null: return "null";
        case Node::Kind::Bool: return "bool";
        case Node::Kind::Int: return "int";
        case Node::Kind::Float: return "float";
        case Node::Kind::String: return "string";
        case Node::Kind::Sequence: return "sequence";
        case Node::Kind::Mapping: return "mapping";
    }
    return "unknown";
}

} // namespace strata
