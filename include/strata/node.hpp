#ifndef STRATA_NODE_HPP
#define STRATA_NODE_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace strata {

// Generic document tree that structured config decoders translate into before
// flattening. Mapping entries keep document order.
class Node {
public:
    enum class Kind { Null, Bool, Int, Float, String, Sequence, Mapping };

    using Entry = std::pair<std::string, Node>;

    Node() = default;

    static Node null() { return Node(); }
    static Node boolean(bool v);
    static Node integer(std::int64_t v);
    static Node floating(double v);
    static Node string(std::string v);
    static Node sequence(std::vector<Node> items = {});
    static Node mapping(std::vector<Entry> entries = {});

    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] bool isNull() const { return kind_ == Kind::Null; }
    [[nodiscard]] bool isScalar() const { return kind_ != Kind::Sequence && kind_ != Kind::Mapping; }

    [[nodiscard]] bool asBool() const { return bool_; }
    [[nodiscard]] std::int64_t asInt() const { return int_; }
    [[nodiscard]] double asFloat() const { return float_; }
    [[nodiscard]] const std::string& asString() const { return string_; }
    [[nodiscard]] const std::vector<Node>& items() const { return items_; }
    [[nodiscard]] const std::vector<Entry>& entries() const { return entries_; }

    Node& push(Node item);
    Node& add(std::string key, Node value);

private:
    Kind kind_{Kind::Null};
    bool bool_{false};
    std::int64_t int_{0};
    double float_{0.0};
    std::string string_;
    std::vector<Node> items_;
    std::vector<Entry> entries_;
};

[[nodiscard]] std::string_view toString(Node::Kind kind);

} // namespace strata

#endif // STRATA_NODE_HPP
