#ifndef STRATA_VALUE_HPP
#define STRATA_VALUE_HPP

#include <algorithm>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "convert.hpp"

namespace strata {

// Value interface for flag storage.
//
// Notes:
// - `set()` is called once per occurrence, from whichever source provided it
//   (args, environment, config file), in occurrence order.
// - `set()` returns a reason string on failure; empty optional indicates success.
// - Scalar values overwrite on every set; collection values append.
class Value {
public:
    virtual ~Value() = default;

    // A human-readable type name (e.g. "int", "duration", "strings").
    [[nodiscard]] virtual std::string type() const = 0;
    // Current value in string form.
    [[nodiscard]] virtual std::string string() const = 0;
    // Parse one occurrence.
    [[nodiscard]] virtual std::optional<std::string> set(std::string_view value) = 0;
    // Restore the value it had at construction.
    virtual void reset() = 0;

    // Bool flags may be given without a value on the command line.
    [[nodiscard]] virtual bool isBoolFlag() const { return false; }
    // Example value used in help output; empty means derive from type().
    [[nodiscard]] virtual std::string placeholder() const { return {}; }
};

// Scalar value of type T. Binds to an external variable when given one,
// otherwise keeps its own storage.
template <typename T>
class BasicValue : public Value {
public:
    explicit BasicValue(T defaultValue = T{}) : default_(defaultValue), owned_(defaultValue), target_(&owned_) {}

    BasicValue(T& target, T defaultValue) : default_(defaultValue), target_(&target) { *target_ = default_; }

    BasicValue(const BasicValue&) = delete;
    BasicValue& operator=(const BasicValue&) = delete;

    [[nodiscard]] std::string type() const override { return convert::typeName<T>(); }
    [[nodiscard]] std::string string() const override { return convert::format(*target_); }

    [[nodiscard]] std::optional<std::string> set(std::string_view value) override {
        T parsed{};
        if (!convert::parse(value, parsed)) return "invalid " + type() + " value";
        *target_ = std::move(parsed);
        return std::nullopt;
    }

    void reset() override { *target_ = default_; }

    [[nodiscard]] bool isBoolFlag() const override { return std::is_same_v<T, bool>; }

    [[nodiscard]] std::string placeholder() const override {
        if constexpr (std::is_same_v<T, bool>) {
            return {};
        } else {
            return utils::toUpper(type());
        }
    }

    [[nodiscard]] const T& get() const { return *target_; }

private:
    T default_;
    T owned_{};
    T* target_;
};

// Every set appends the parsed element. Duplicates are permitted.
template <typename T>
class ListValue : public Value {
public:
    ListValue() : target_(&owned_) {}
    explicit ListValue(std::vector<T>& target) : target_(&target) { target_->clear(); }

    ListValue(const ListValue&) = delete;
    ListValue& operator=(const ListValue&) = delete;

    [[nodiscard]] std::string type() const override { return convert::typeName<T>() + "s"; }

    [[nodiscard]] std::string string() const override {
        std::string out;
        for (std::size_t i = 0; i < target_->size(); ++i) {
            if (i > 0) out += ", ";
            out += convert::format<T>((*target_)[i]);
        }
        return out;
    }

    [[nodiscard]] std::optional<std::string> set(std::string_view value) override {
        T parsed{};
        if (!convert::parse(value, parsed)) return "invalid " + convert::typeName<T>() + " value";
        target_->push_back(std::move(parsed));
        return std::nullopt;
    }

    void reset() override { target_->clear(); }

    [[nodiscard]] std::string placeholder() const override { return utils::toUpper(convert::typeName<T>()); }

    [[nodiscard]] const std::vector<T>& get() const { return *target_; }

private:
    std::vector<T> owned_;
    std::vector<T>* target_;
};

// Like ListValue, but setting a value already present is an error.
template <typename T>
class UniqueListValue : public ListValue<T> {
public:
    using ListValue<T>::ListValue;

    [[nodiscard]] std::optional<std::string> set(std::string_view value) override {
        T parsed{};
        if (!convert::parse(value, parsed)) return "invalid " + convert::typeName<T>() + " value";
        const auto& current = this->get();
        if (std::find(current.begin(), current.end(), parsed) != current.end()) {
            return "duplicate value " + convert::format(parsed);
        }
        return ListValue<T>::set(value);
    }
};

// A string restricted to a fixed set of choices. The first choice is the default.
class EnumValue : public Value {
public:
    explicit EnumValue(std::vector<std::string> choices);
    EnumValue(std::string& target, std::vector<std::string> choices);

    EnumValue(const EnumValue&) = delete;
    EnumValue& operator=(const EnumValue&) = delete;

    [[nodiscard]] std::string type() const override { return "enum"; }
    [[nodiscard]] std::string string() const override { return *target_; }
    [[nodiscard]] std::optional<std::string> set(std::string_view value) override;
    void reset() override;
    [[nodiscard]] std::string placeholder() const override;

    [[nodiscard]] const std::string& get() const { return *target_; }
    [[nodiscard]] const std::vector<std::string>& choices() const { return choices_; }

private:
    std::vector<std::string> choices_;
    std::string owned_;
    std::string* target_;
};

// Invokes a callback per occurrence and remembers the last accepted text.
class FuncValue : public Value {
public:
    using Callback = std::function<std::optional<std::string>(std::string_view value)>;

    explicit FuncValue(Callback fn) : fn_(std::move(fn)) {}

    [[nodiscard]] std::string type() const override { return "func"; }
    [[nodiscard]] std::string string() const override { return last_; }

    [[nodiscard]] std::optional<std::string> set(std::string_view value) override {
        if (fn_) {
            if (auto err = fn_(value)) return err;
        }
        last_ = std::string(value);
        return std::nullopt;
    }

    void reset() override { last_.clear(); }

    [[nodiscard]] std::string placeholder() const override { return "VALUE"; }

private:
    Callback fn_;
    std::string last_;
};

} // namespace strata

#endif // STRATA_VALUE_HPP
