#include "strata/value.hpp"

namespace strata {

EnumValue::EnumValue(std::vector<std::string> choices) : choices_(std::move(choices)), target_(&owned_) {
    reset();
}

EnumValue::EnumValue(std::string& target, std::vector<std::string> choices)
    : choices_(std::move(choices)), target_(&target) {
    reset();
}

std::optional<std::string> EnumValue::set(std::string_view value) {
    for (const auto& c : choices_) {
        if (c == value) {
            *target_ = c;
            return std::nullopt;
        }
    }
    std::string msg = "must be one of: ";
    for (std::size_t i = 0; i < choices_.size(); ++i) {
        if (i > 0) msg += ", ";
        msg += choices_[i];
    }
    return msg;
}

void EnumValue::reset() {
    if (choices_.empty()) {
        target_->clear();
        return;
    }
    *target_ = choices_.front();
}

std::string EnumValue::placeholder() const {
    std::string out;
    for (std::size_t i = 0; i < choices_.size(); ++i) {
        if (i > 0) out.push_back('|');
        out += choices_[i];
    }
    return out;
}

} // namespace strata
