#ifndef STRATA_OPTIONS_HPP
#define STRATA_OPTIONS_HPP

#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <string>

#include "environment.hpp"
#include "error.hpp"

namespace strata {

// Receives one flattened (name, value) pair from a config parser.
using ConfigSetter = std::function<std::optional<Error>(const std::string& name, const std::string& value)>;

// Decodes a config stream and reports every pair through the setter. Errors
// returned by the setter must be propagated unchanged.
using ConfigParseFunc = std::function<std::optional<Error>(std::istream& in, const ConfigSetter& set)>;

// Opens a config file. nullptr means the file does not exist.
using ConfigOpenFunc = std::function<std::unique_ptr<std::istream>(const std::string& path)>;

// Toggles read once per top-level parse.
//
// Precedence is fixed: args, then environment, then config file, then the
// declared default. Each later source only fills flags the earlier ones left
// unset.
struct ParseOptions {
    // Environment.
    bool envVars{false};
    std::string envVarPrefix;          // "APP" turns --log-level into APP_LOG_LEVEL
    bool envVarCaseSensitive{false};
    bool envVarShortNames{false};      // also try APP_V for -v
    std::string envVarSplit;           // splits one variable into several values; "\" escapes it
    Environment environment;

    // Config file. A static path wins over the flag-provided one.
    std::string configFile;
    std::string configFileFlag;        // e.g. "config": path is read from --config after args and env
    ConfigParseFunc configParser;
    ConfigOpenFunc configOpen;         // defaults to std::ifstream
    bool configAllowMissingFile{false};
    bool configIgnoreUndefinedFlags{false};
    bool configIgnoreFlagNames{false}; // keys never match flag names directly
    bool configIgnoreEnvNames{false};  // keys never match derived environment names
};

} // namespace strata

#endif // STRATA_OPTIONS_HPP
