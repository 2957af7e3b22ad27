#ifndef STRATA_ENVIRONMENT_HPP
#define STRATA_ENVIRONMENT_HPP

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace strata {

// An ordered snapshot of environment variables.
//
// Parsing never reads the process environment directly; callers pass a
// snapshot (usually Environment::current()) so tests can inject their own.
class Environment {
public:
    using Entry = std::pair<std::string, std::string>;

    Environment() = default;
    Environment(std::initializer_list<Entry> entries);

    // Captures the live process environment.
    static Environment current();

    // Replaces an existing entry with the exact same name, or appends.
    Environment& set(std::string name, std::string value);

    // First entry whose name matches. Without case sensitivity, names are
    // compared ASCII case-insensitively.
    [[nodiscard]] std::optional<std::string> lookup(std::string_view name, bool caseSensitive = true) const;

    [[nodiscard]] const std::vector<Entry>& entries() const { return entries_; }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

private:
    std::vector<Entry> entries_;
};

} // namespace strata

#endif // STRATA_ENVIRONMENT_HPP
