#include "strata/parse.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>

#include <spdlog/spdlog.h>

#include "strata/env.hpp"

namespace strata {

namespace {

// Flags that a higher-priority stage already provided.
class Provided {
public:
    void mark(const FlagSet& fs) {
        fs.walkFlags([this](Flag& f) {
            if (f.isSet() && !has(&f)) flags_.push_back(&f);
        });
    }

    [[nodiscard]] bool has(const Flag* f) const { return std::find(flags_.begin(), flags_.end(), f) != flags_.end(); }

private:
    std::vector<const Flag*> flags_;
};

std::unique_ptr<std::istream> openFile(const std::string& path, std::optional<Error>& err) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return nullptr;
    auto file = std::make_unique<std::ifstream>(path);
    if (!file->is_open()) {
        err = Error(ErrorKind::ConfigFileOpen, "open config file " + path + ": cannot read");
        return nullptr;
    }
    return file;
}

std::optional<Error> parseEnvironment(FlagSet& fs, const ParseOptions& opts, const Provided& provided) {
    std::optional<Error> result;
    fs.walkFlags([&](Flag& f) {
        if (result || provided.has(&f)) return;
        for (const auto& key : envVarKeys(f, opts)) {
            const auto raw = opts.environment.lookup(key, opts.envVarCaseSensitive);
            if (!raw) continue;

            std::vector<std::string> values{*raw};
            if (!opts.envVarSplit.empty()) values = splitEscape(*raw, opts.envVarSplit);
            for (const auto& v : values) {
                if (auto err = f.setValue(v)) {
                    result = err->wrap(key + "=\"" + *raw + "\"");
                    return;
                }
            }
            spdlog::debug("{}: set from environment {}", f.displayName(), key);
            return;
        }
    });
    return result;
}

// Empty when no config file applies to this set.
std::string configFilePath(const FlagSet& fs, const ParseOptions& opts) {
    if (!opts.configFile.empty()) return opts.configFile;
    if (opts.configFileFlag.empty()) return {};
    // Not visible from this set, e.g. a --config declared only on a subcommand.
    const Flag* f = fs.getFlag(opts.configFileFlag);
    if (!f) {
        spdlog::debug("{}: config file flag {} not visible, skipping config file", fs.name(), opts.configFileFlag);
        return {};
    }
    return f->string();
}

std::optional<Error> parseConfigFile(FlagSet& fs, const ParseOptions& opts, const EnvIndex& index, const Provided& provided) {
    const std::string path = configFilePath(fs, opts);
    if (path.empty() || !opts.configParser) return std::nullopt;

    std::optional<Error> openErr;
    std::unique_ptr<std::istream> in = opts.configOpen ? opts.configOpen(path) : openFile(path, openErr);
    if (openErr) return openErr;
    if (!in) {
        if (opts.configAllowMissingFile) {
            spdlog::debug("config file {} not found, skipping", path);
            return std::nullopt;
        }
        return Error(ErrorKind::ConfigFileMissing, "open config file " + path + ": no such file");
    }
    spdlog::debug("reading config file {}", path);

    const ConfigSetter set = [&](const std::string& name, const std::string& value) -> std::optional<Error> {
        Flag* target = opts.configIgnoreFlagNames ? nullptr : fs.getFlag(name);
        if (!target && !opts.configIgnoreEnvNames) {
            const auto& matches = index.find(name);
            if (matches.size() > 1) {
                return Error(ErrorKind::AmbiguousName, name + ": ambiguous config key (" + matches[0]->displayName() +
                                                           ", " + matches[1]->displayName() + ")");
            }
            if (matches.size() == 1) target = matches.front();
        }
        if (!target) {
            if (opts.configIgnoreUndefinedFlags) {
                spdlog::debug("config file {}: ignoring undefined key {}", path, name);
                return std::nullopt;
            }
            return Error(ErrorKind::ConfigParseError, name + ": unknown flag");
        }
        if (provided.has(target)) return std::nullopt;
        if (auto err = target->setValue(value)) return err->wrap(name);
        spdlog::debug("{}: set from config file {}", target->displayName(), path);
        return std::nullopt;
    };

    if (auto err = opts.configParser(*in, set)) return err->wrap("parse config file");
    return std::nullopt;
}

} // namespace

std::optional<Error> parse(FlagSet& fs, const std::vector<std::string>& args, const ParseOptions& opts) {
    if (auto err = fs.checkAncestorCollisions()) return err;

    const EnvIndex index = EnvIndex::build(fs, opts);
    if (opts.envVars) {
        if (auto err = index.checkAmbiguous()) return err;
    }

    if (auto err = fs.parseArgs(args)) return err->wrap("parse args");
    for (const auto& f : fs.flags()) {
        if (f->isSet()) spdlog::debug("{}: set from args", f->displayName());
    }

    Provided provided;
    provided.mark(fs);

    if (opts.envVars) {
        if (auto err = parseEnvironment(fs, opts, provided)) return err->wrap("parse environment");
    }
    provided.mark(fs);

    if (auto err = parseConfigFile(fs, opts, index, provided)) return err;
    return std::nullopt;
}

} // namespace strata
