#include "strata/flag.hpp"

namespace strata {

namespace {

// A `backticked` word in the usage text wins over the value's own placeholder.
std::string placeholderFromUsage(const std::string& usage) {
    const auto open = usage.find('`');
    if (open == std::string::npos) return {};
    const auto close = usage.find('`', open + 1);
    if (close == std::string::npos) return {};
    return usage.substr(open + 1, close - open - 1);
}

} // namespace

Flag::Flag(FlagConfig cfg, std::string group)
    : shortName_(cfg.shortName),
      longName_(std::move(cfg.longName)),
      usage_(std::move(cfg.usage)),
      placeholder_(std::move(cfg.placeholder)),
      group_(std::move(group)),
      value_(std::move(cfg.value)) {
    defaultValue_ = value_->string();
    if (placeholder_.empty()) placeholder_ = placeholderFromUsage(usage_);
    if (placeholder_.empty()) placeholder_ = value_->placeholder();
}

std::optional<Error> Flag::setValue(std::string_view text) {
    if (auto reason = value_->set(text)) {
        return Error(ErrorKind::ParseValueError, displayName() + ": set \"" + std::string(text) + "\": " + *reason);
    }
    isSet_ = true;
    return std::nullopt;
}

void Flag::reset() {
    value_->reset();
    isSet_ = false;
}

std::string Flag::displayName() const {
    std::string out;
    if (hasShortName()) {
        out.push_back('-');
        out.push_back(shortName_);
    }
    if (hasLongName()) {
        if (!out.empty()) out += ", ";
        out += "--" + longName_;
    }
    return out;
}

bool Flag::collidesWith(const Flag& other) const {
    const bool sameShort = hasShortName() && other.hasShortName() && shortName_ == other.shortName_;
    const bool sameLong = hasLongName() && other.hasLongName() && longName_ == other.longName_;
    return sameShort || sameLong;
}

} // namespace strata
