#include "strata/env.hpp"

#include <algorithm>

#include "strata/utils.hpp"

namespace strata {

std::string envVarKey(std::string_view flagName, const ParseOptions& opts) {
    while (!flagName.empty() && flagName.front() == '-') flagName.remove_prefix(1);

    std::string key(flagName);
    std::replace_if(key.begin(), key.end(), [](char c) { return c == '-' || c == '.' || c == '/'; }, '_');
    if (!opts.envVarPrefix.empty()) key = opts.envVarPrefix + "_" + key;
    if (!opts.envVarCaseSensitive) key = utils::toUpper(key);
    return key;
}

std::vector<std::string> envVarKeys(const Flag& flag, const ParseOptions& opts) {
    std::vector<std::string> keys;
    if (flag.hasLongName()) keys.push_back(envVarKey(flag.longName(), opts));
    if (flag.hasShortName() && opts.envVarShortNames) keys.push_back(envVarKey(std::string(1, flag.shortName()), opts));
    return keys;
}

std::vector<std::string> splitEscape(std::string_view s, std::string_view separator) {
    std::vector<std::string> tokens;
    if (separator.empty()) {
        tokens.emplace_back(s);
        return tokens;
    }

    std::string current;
    std::size_t pos = 0;
    while (true) {
        const auto hit = s.find(separator, pos);
        if (hit == std::string_view::npos) {
            current.append(s.substr(pos));
            break;
        }
        current.append(s.substr(pos, hit - pos));
        pos = hit + separator.size();
        if (!current.empty() && current.back() == '\\') {
            current.back() = separator.front();
            current.append(separator.substr(1));
            continue;
        }
        tokens.push_back(std::move(current));
        current.clear();
    }
    tokens.push_back(std::move(current));
    return tokens;
}

EnvIndex EnvIndex::build(const FlagSet& fs, const ParseOptions& opts) {
    EnvIndex index;
    fs.walkFlags([&](Flag& f) {
        for (auto& key : envVarKeys(f, opts)) {
            auto it = std::find_if(index.buckets_.begin(), index.buckets_.end(),
                                   [&](const auto& bucket) { return bucket.first == key; });
            if (it == index.buckets_.end()) {
                index.buckets_.emplace_back(std::move(key), std::vector<Flag*>{&f});
                continue;
            }
            if (std::find(it->second.begin(), it->second.end(), &f) == it->second.end()) it->second.push_back(&f);
        }
    });
    return index;
}

const std::vector<Flag*>& EnvIndex::find(std::string_view key) const {
    static const std::vector<Flag*> none;
    for (const auto& bucket : buckets_) {
        if (bucket.first == key) return bucket.second;
    }
    return none;
}

std::optional<Error> EnvIndex::checkAmbiguous() const {
    for (const auto& [key, flags] : buckets_) {
        if (flags.size() < 2) continue;
        std::string msg = key + ": ambiguous environment variable name (";
        for (std::size_t i = 0; i < flags.size(); ++i) {
            if (i > 0) msg += ", ";
            msg += flags[i]->displayName();
        }
        msg += ")";
        return Error(ErrorKind::AmbiguousName, std::move(msg));
    }
    return std::nullopt;
}

} // namespace strata
