#ifndef STRATA_FLAG_SET_HPP
#define STRATA_FLAG_SET_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"
#include "flag.hpp"
#include "value.hpp"

namespace strata {

// An ordered collection of flags, owned exclusively by the set.
//
// A set may be given a parent. Parent flags (recursively) become visible to
// lookup and iteration (getFlag, walkFlags) so that environment and config
// file sources can fill them, but argument tokenization only matches the
// set's own flags.
class FlagSet {
public:
    explicit FlagSet(std::string name);

    FlagSet(FlagSet&&) = default;
    FlagSet& operator=(FlagSet&&) = default;
    FlagSet(const FlagSet&) = delete;
    FlagSet& operator=(const FlagSet&) = delete;

    [[nodiscard]] const std::string& name() const { return name_; }

    // Non-owning. The parent must outlive any parse of this set.
    FlagSet& setParent(FlagSet* parent) {
        parent_ = parent;
        return *this;
    }
    [[nodiscard]] FlagSet* parent() const { return parent_; }

    // Registers a flag. Fails with DuplicateFlag if its short or long name is
    // already used in this set, and with InvalidFlag if it has no name or no
    // value.
    std::optional<Error> addFlag(FlagConfig cfg);

    // Declaration helpers. They bind the flag to `target`, assign the default
    // immediately, and throw std::invalid_argument on invalid declarations.
    FlagSet& boolVar(bool& target, char shortName, std::string longName, bool defaultValue, std::string usage);
    FlagSet& stringVar(std::string& target, char shortName, std::string longName, std::string defaultValue, std::string usage);
    FlagSet& intVar(int& target, char shortName, std::string longName, int defaultValue, std::string usage);
    FlagSet& int64Var(std::int64_t& target, char shortName, std::string longName, std::int64_t defaultValue, std::string usage);
    FlagSet& uintVar(unsigned& target, char shortName, std::string longName, unsigned defaultValue, std::string usage);
    FlagSet& uint64Var(std::uint64_t& target, char shortName, std::string longName, std::uint64_t defaultValue, std::string usage);
    FlagSet& doubleVar(double& target, char shortName, std::string longName, double defaultValue, std::string usage);
    FlagSet& durationVar(Duration& target, char shortName, std::string longName, Duration defaultValue, std::string usage);
    FlagSet& stringListVar(std::vector<std::string>& target, char shortName, std::string longName, std::string usage);
    FlagSet& enumVar(std::string& target, char shortName, std::string longName, std::vector<std::string> choices, std::string usage);
    FlagSet& func(char shortName, std::string longName, FuncValue::Callback fn, std::string usage);
    FlagSet& value(char shortName, std::string longName, std::unique_ptr<Value> value, std::string usage);

    // Tokenizes args against this set's own flags. See the grammar notes in
    // flag_set.cpp. On success the leftover positional args are available
    // from args(); on failure args() is empty.
    std::optional<Error> parseArgs(const std::vector<std::string>& args);

    // Finds a visible flag: long-name match first (own set, then ancestors),
    // then, for single-character names, short-name match.
    [[nodiscard]] Flag* getFlag(std::string_view name) const;

    // Own flags only.
    [[nodiscard]] Flag* findLong(std::string_view longName) const;
    [[nodiscard]] Flag* findShort(char shortName) const;

    // Visits own flags in declaration order, then each ancestor's.
    void walkFlags(const std::function<void(Flag&)>& fn) const;
    [[nodiscard]] std::vector<Flag*> visibleFlags() const;

    [[nodiscard]] const std::vector<std::unique_ptr<Flag>>& flags() const { return flags_; }
    [[nodiscard]] const std::vector<std::string>& args() const { return args_; }
    [[nodiscard]] bool isParsed() const { return parsed_; }

    // Reports the first own flag whose name is also used by an ancestor.
    [[nodiscard]] std::optional<Error> checkAncestorCollisions() const;

    // Restores every own flag to its default and clears the parse state.
    void reset();

private:
    template <typename T>
    FlagSet& declare(T& target, char shortName, std::string longName, T defaultValue, std::string usage);
    FlagSet& mustAdd(FlagConfig cfg);

    std::optional<Error> parseLongFlag(std::string_view body, const std::vector<std::string>& args, std::size_t& next);
    std::optional<Error> parseShortFlag(std::string_view body, const std::vector<std::string>& args, std::size_t& next);
    [[nodiscard]] Error unknownFlag(std::string_view token) const;

    std::string name_;
    std::vector<std::unique_ptr<Flag>> flags_;
    FlagSet* parent_{nullptr};
    std::vector<std::string> args_;
    bool parsed_{false};
};

} // namespace strata

#endif // STRATA_FLAG_SET_HPP
