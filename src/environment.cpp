#include "strata/environment.hpp"

#include "strata/utils.hpp"

#ifdef _WIN32
#include <stdlib.h>
#define STRATA_ENVIRON _environ
#else
extern char** environ;
#define STRATA_ENVIRON environ
#endif

namespace strata {

Environment::Environment(std::initializer_list<Entry> entries) {
    for (const auto& e : entries) set(e.first, e.second);
}

Environment Environment::current() {
    Environment env;
    char** cursor = STRATA_ENVIRON;
    if (cursor == nullptr) return env;
    for (; *cursor != nullptr; ++cursor) {
        const std::string_view kv(*cursor);
        const auto eq = kv.find('=');
        if (eq == std::string_view::npos || eq == 0) continue;
        env.entries_.emplace_back(std::string(kv.substr(0, eq)), std::string(kv.substr(eq + 1)));
    }
    return env;
}

Environment& Environment::set(std::string name, std::string value) {
    for (auto& e : entries_) {
        if (e.first == name) {
            e.second = std::move(value);
            return *this;
        }
    }
    entries_.emplace_back(std::move(name), std::move(value));
    return *this;
}

std::optional<std::string> Environment::lookup(std::string_view name, bool caseSensitive) const {
    for (const auto& e : entries_) {
        const bool match = caseSensitive ? e.first == name : utils::equalFold(e.first, name);
        if (match) return e.second;
    }
    return std::nullopt;
}

} // namespace strata
