#include "strata/flag_set.hpp"

#include <cctype>
#include <stdexcept>

#include "strata/utils.hpp"

// Argument grammar
//
//   --name              bool flag: true; a following bool literal is consumed
//   --name value        value flag
//   --name=value        any flag; "--name=" on a bool flag means true
//   -abc                cluster of bool short flags
//   -nvalue, -n value   short value flag; "-n=value" drops the '='
//   --                  consumed, ends flag scanning
//   -, "", positional   ends flag scanning; kept in args()
//
// Undeclared -h and --help report HelpRequested instead of UnknownFlag. So does
// a declared bool flag named "help" once it is set to true.

namespace strata {

namespace {

bool isHelpFlag(const Flag& f) {
    return f.isBoolFlag() && f.longName() == "help" && f.string() == "true";
}

} // namespace

FlagSet::FlagSet(std::string name) : name_(std::move(name)) {}

std::optional<Error> FlagSet::addFlag(FlagConfig cfg) {
    cfg.longName = std::string(utils::trim(cfg.longName));
    if (!cfg.value) return Error(ErrorKind::InvalidFlag, name_ + ": flag value is required");
    const bool hasShort = cfg.shortName != '\0';
    const bool hasLong = !cfg.longName.empty();
    if (!hasShort && !hasLong) return Error(ErrorKind::InvalidFlag, name_ + ": at least one flag name is required");
    if (hasShort && (cfg.shortName == '-' || cfg.shortName == '=' || std::isspace(static_cast<unsigned char>(cfg.shortName)))) {
        return Error(ErrorKind::InvalidFlag, std::string("-") + cfg.shortName + ": invalid short name");
    }
    if (hasLong && (cfg.longName.front() == '-' || cfg.longName.find('=') != std::string::npos)) {
        return Error(ErrorKind::InvalidFlag, "--" + cfg.longName + ": invalid long name");
    }
    if (hasShort && hasLong && cfg.longName.size() == 1 && cfg.longName.front() == cfg.shortName) {
        return Error(ErrorKind::InvalidFlag, "--" + cfg.longName + ": short name identical to long name");
    }
    if (!hasLong && cfg.value->isBoolFlag() && cfg.value->string() == "true") {
        return Error(ErrorKind::InvalidFlag, std::string("-") + cfg.shortName + ": default true boolean flag requires a long name");
    }

    auto flag = std::make_unique<Flag>(std::move(cfg), name_);
    for (const auto& existing : flags_) {
        if (flag->collidesWith(*existing)) {
            return Error(ErrorKind::DuplicateFlag, flag->displayName() + ": duplicate flag (" + existing->displayName() + ")");
        }
    }
    flags_.push_back(std::move(flag));
    return std::nullopt;
}

FlagSet& FlagSet::mustAdd(FlagConfig cfg) {
    if (auto err = addFlag(std::move(cfg))) throw std::invalid_argument(err->message());
    return *this;
}

template <typename T>
FlagSet& FlagSet::declare(T& target, char shortName, std::string longName, T defaultValue, std::string usage) {
    FlagConfig cfg;
    cfg.shortName = shortName;
    cfg.longName = std::move(longName);
    cfg.usage = std::move(usage);
    cfg.value = std::make_unique<BasicValue<T>>(target, std::move(defaultValue));
    return mustAdd(std::move(cfg));
}

FlagSet& FlagSet::boolVar(bool& target, char shortName, std::string longName, bool defaultValue, std::string usage) {
    return declare(target, shortName, std::move(longName), defaultValue, std::move(usage));
}

FlagSet& FlagSet::stringVar(std::string& target, char shortName, std::string longName, std::string defaultValue, std::string usage) {
    return declare(target, shortName, std::move(longName), std::move(defaultValue), std::move(usage));
}

FlagSet& FlagSet::intVar(int& target, char shortName, std::string longName, int defaultValue, std::string usage) {
    return declare(target, shortName, std::move(longName), defaultValue, std::move(usage));
}

FlagSet& FlagSet::int64Var(std::int64_t& target, char shortName, std::string longName, std::int64_t defaultValue, std::string usage) {
    return declare(target, shortName, std::move(longName), defaultValue, std::move(usage));
}

FlagSet& FlagSet::uintVar(unsigned& target, char shortName, std::string longName, unsigned defaultValue, std::string usage) {
    return declare(target, shortName, std::move(longName), defaultValue, std::move(usage));
}

FlagSet& FlagSet::uint64Var(std::uint64_t& target, char shortName, std::string longName, std::uint64_t defaultValue, std::string usage) {
    return declare(target, shortName, std::move(longName), defaultValue, std::move(usage));
}

FlagSet& FlagSet::doubleVar(double& target, char shortName, std::string longName, double defaultValue, std::string usage) {
    return declare(target, shortName, std::move(longName), defaultValue, std::move(usage));
}

FlagSet& FlagSet::durationVar(Duration& target, char shortName, std::string longName, Duration defaultValue, std::string usage) {
    return declare(target, shortName, std::move(longName), defaultValue, std::move(usage));
}

FlagSet& FlagSet::stringListVar(std::vector<std::string>& target, char shortName, std::string longName, std::string usage) {
    FlagConfig cfg;
    cfg.shortName = shortName;
    cfg.longName = std::move(longName);
    cfg.usage = std::move(usage);
    cfg.value = std::make_unique<ListValue<std::string>>(target);
    return mustAdd(std::move(cfg));
}

FlagSet& FlagSet::enumVar(std::string& target, char shortName, std::string longName, std::vector<std::string> choices, std::string usage) {
    if (choices.empty()) throw std::invalid_argument("--" + longName + ": enum flag requires at least one choice");
    FlagConfig cfg;
    cfg.shortName = shortName;
    cfg.longName = std::move(longName);
    cfg.usage = std::move(usage);
    cfg.value = std::make_unique<EnumValue>(target, std::move(choices));
    return mustAdd(std::move(cfg));
}

FlagSet& FlagSet::func(char shortName, std::string longName, FuncValue::Callback fn, std::string usage) {
    FlagConfig cfg;
    cfg.shortName = shortName;
    cfg.longName = std::move(longName);
    cfg.usage = std::move(usage);
    cfg.value = std::make_unique<FuncValue>(std::move(fn));
    return mustAdd(std::move(cfg));
}

FlagSet& FlagSet::value(char shortName, std::string longName, std::unique_ptr<Value> value, std::string usage) {
    FlagConfig cfg;
    cfg.shortName = shortName;
    cfg.longName = std::move(longName);
    cfg.usage = std::move(usage);
    cfg.value = std::move(value);
    return mustAdd(std::move(cfg));
}

std::optional<Error> FlagSet::parseArgs(const std::vector<std::string>& args) {
    if (parsed_) return Error(ErrorKind::AlreadyParsed, name_ + ": already parsed");

    std::size_t next = 0;
    std::optional<Error> err;
    while (next < args.size()) {
        const std::string& arg = args[next];
        if (arg.empty() || arg.front() != '-' || arg == "-") break;
        ++next;
        if (arg == "--") break;

        if (arg.size() > 2 && arg[1] == '-') {
            err = parseLongFlag(std::string_view(arg).substr(2), args, next);
        } else {
            err = parseShortFlag(std::string_view(arg).substr(1), args, next);
        }
        if (err) break;
    }

    if (err) {
        args_.clear();
        return err;
    }
    args_.assign(args.begin() + static_cast<std::ptrdiff_t>(next), args.end());
    parsed_ = true;
    return std::nullopt;
}

std::optional<Error> FlagSet::parseLongFlag(std::string_view body, const std::vector<std::string>& args, std::size_t& next) {
    std::string_view name = body;
    std::string value;
    bool hasValue = false;
    if (const auto eq = body.find('='); eq != std::string_view::npos && eq > 0) {
        name = body.substr(0, eq);
        value = std::string(body.substr(eq + 1));
        hasValue = true;
    }

    Flag* f = findLong(name);
    if (!f) {
        if (utils::equalFold(name, "help")) return Error::helpRequested();
        return unknownFlag("--" + std::string(name));
    }

    if (hasValue && value.empty() && f->isBoolFlag()) hasValue = false;

    if (!hasValue) {
        if (f->isBoolFlag()) {
            value = "true";
            if (next < args.size() && convert::isBoolLiteral(args[next])) value = args[next++];
        } else if (next < args.size()) {
            value = args[next++];
        } else {
            return Error(ErrorKind::MissingValue, f->displayName() + ": missing value");
        }
    }

    if (auto err = f->setValue(value)) return err;
    if (isHelpFlag(*f)) return Error::helpRequested();
    return std::nullopt;
}

std::optional<Error> FlagSet::parseShortFlag(std::string_view body, const std::vector<std::string>& args, std::size_t& next) {
    for (std::size_t i = 0; i < body.size(); ++i) {
        const char c = body[i];
        Flag* f = findShort(c);
        if (!f) {
            if (c == 'h') return Error::helpRequested();
            return unknownFlag(std::string("-") + c);
        }

        std::string value;
        const std::string_view rest = body.substr(i + 1);
        if (f->isBoolFlag()) {
            if (!rest.empty() && rest.front() == '=') {
                value = rest.size() > 1 ? std::string(rest.substr(1)) : "true";
                i = body.size();
            } else {
                value = "true";
            }
        } else {
            value = std::string(!rest.empty() && rest.front() == '=' ? rest.substr(1) : rest);
            if (rest.empty()) {
                if (next >= args.size()) return Error(ErrorKind::MissingValue, f->displayName() + ": missing value");
                value = args[next++];
            }
            i = body.size();
        }

        if (auto err = f->setValue(value)) return err;
        if (isHelpFlag(*f)) return Error::helpRequested();
    }
    return std::nullopt;
}

Error FlagSet::unknownFlag(std::string_view token) const {
    std::string msg = "unknown flag: " + std::string(token);

    std::vector<std::string> known;
    for (const auto& f : flags_) {
        if (f->hasLongName()) known.push_back("--" + f->longName());
        if (f->hasShortName()) known.push_back(std::string("-") + f->shortName());
    }
    const auto suggestions = utils::suggest(token, known);
    if (!suggestions.empty()) {
        msg += " (did you mean ";
        for (std::size_t i = 0; i < suggestions.size(); ++i) {
            if (i > 0) msg += ", ";
            msg += suggestions[i];
        }
        msg += "?)";
    }
    return Error(ErrorKind::UnknownFlag, std::move(msg));
}

Flag* FlagSet::findLong(std::string_view longName) const {
    if (longName.empty()) return nullptr;
    for (const auto& f : flags_) {
        if (f->hasLongName() && f->longName() == longName) return f.get();
    }
    return nullptr;
}

Flag* FlagSet::findShort(char shortName) const {
    if (shortName == '\0') return nullptr;
    for (const auto& f : flags_) {
        if (f->hasShortName() && f->shortName() == shortName) return f.get();
    }
    return nullptr;
}

Flag* FlagSet::getFlag(std::string_view name) const {
    if (name.empty()) return nullptr;
    for (const FlagSet* cursor = this; cursor != nullptr; cursor = cursor->parent_) {
        if (Flag* f = cursor->findLong(name)) return f;
    }
    if (name.size() == 1) {
        for (const FlagSet* cursor = this; cursor != nullptr; cursor = cursor->parent_) {
            if (Flag* f = cursor->findShort(name.front())) return f;
        }
    }
    return nullptr;
}

void FlagSet::walkFlags(const std::function<void(Flag&)>& fn) const {
    for (const FlagSet* cursor = this; cursor != nullptr; cursor = cursor->parent_) {
        for (const auto& f : cursor->flags_) fn(*f);
    }
}

std::vector<Flag*> FlagSet::visibleFlags() const {
    std::vector<Flag*> out;
    walkFlags([&out](Flag& f) { out.push_back(&f); });
    return out;
}

std::optional<Error> FlagSet::checkAncestorCollisions() const {
    for (const auto& own : flags_) {
        for (const FlagSet* cursor = parent_; cursor != nullptr; cursor = cursor->parent_) {
            for (const auto& other : cursor->flags_) {
                if (own->collidesWith(*other)) {
                    return Error(ErrorKind::DuplicateFlag,
                                 own->displayName() + ": duplicate flag (" + other->displayName() + " in " + cursor->name_ + ")");
                }
            }
        }
    }
    return std::nullopt;
}

void FlagSet::reset() {
    for (auto& f : flags_) f->reset();
    args_.clear();
    parsed_ = false;
}

} // namespace strata
