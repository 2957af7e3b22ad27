#ifndef STRATA_FLAG_HPP
#define STRATA_FLAG_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "error.hpp"
#include "value.hpp"

namespace strata {

// Declaration parameters for FlagSet::addFlag.
struct FlagConfig {
    // Set with a single dash (-v). '\0' means no short name.
    char shortName{'\0'};
    // Set with a double dash (--verbose). Empty means no long name.
    std::string longName;
    std::string usage;
    // Example value for help output. Derived from the value when empty.
    std::string placeholder;
    std::unique_ptr<Value> value;
};

class Flag {
public:
    Flag(FlagConfig cfg, std::string group);

    Flag(const Flag&) = delete;
    Flag& operator=(const Flag&) = delete;

    [[nodiscard]] bool hasShortName() const { return shortName_ != '\0'; }
    [[nodiscard]] bool hasLongName() const { return !longName_.empty(); }
    [[nodiscard]] char shortName() const { return shortName_; }
    [[nodiscard]] const std::string& longName() const { return longName_; }
    [[nodiscard]] const std::string& usage() const { return usage_; }
    [[nodiscard]] const std::string& placeholder() const { return placeholder_; }
    // Text form of the value at declaration time.
    [[nodiscard]] const std::string& defaultValue() const { return defaultValue_; }
    // Name of the FlagSet that declared this flag.
    [[nodiscard]] const std::string& group() const { return group_; }
    [[nodiscard]] bool isSet() const { return isSet_; }
    [[nodiscard]] bool isBoolFlag() const { return value_->isBoolFlag(); }

    [[nodiscard]] Value& value() { return *value_; }
    [[nodiscard]] const Value& value() const { return *value_; }

    // Current value in string form.
    [[nodiscard]] std::string string() const { return value_->string(); }

    // Applies one occurrence and marks the flag as set. Conversion failures
    // come back as ParseValueError naming the flag and the offending text.
    std::optional<Error> setValue(std::string_view text);

    // Restores the default and clears the set marker.
    void reset();

    // "-v, --verbose", "-v" or "--verbose".
    [[nodiscard]] std::string displayName() const;

    [[nodiscard]] bool collidesWith(const Flag& other) const;

private:
    char shortName_;
    std::string longName_;
    std::string usage_;
    std::string placeholder_;
    std::string defaultValue_;
    std::string group_;
    std::unique_ptr<Value> value_;
    bool isSet_{false};
};

} // namespace strata

#endif // STRATA_FLAG_HPP
