#include "strata/error.hpp"

namespace strata {

std::string_view toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnknownFlag: return "unknown flag";
        case ErrorKind::MissingValue: return "missing value";
        case ErrorKind::ParseValueError: return "invalid value";
        case ErrorKind::AmbiguousName: return "ambiguous name";
        case ErrorKind::DuplicateFlag: return "duplicate flag";
        case ErrorKind::InvalidFlag: return "invalid flag";
        case ErrorKind::ConfigFileMissing: return "config file missing";
        case ErrorKind::ConfigFileOpen: return "config file open";
        case ErrorKind::ConfigParseError: return "config parse error";
        case ErrorKind::StringConversionError: return "string conversion error";
        case ErrorKind::NoExec: return "no exec function";
        case ErrorKind::HelpRequested: return "help requested";
        case ErrorKind::NotParsed: return "not parsed";
        case ErrorKind::AlreadyParsed: return "already parsed";
        case ErrorKind::InvalidCommand: return "invalid command";
        case ErrorKind::Exec: return "exec";
    }
    return "unknown";
}

Error Error::wrap(std::string_view context) const {
    if (context.empty()) return *this;
    std::string msg(context);
    msg += ": ";
    msg += message_;
    return Error(kind_, std::move(msg));
}

std::ostream& operator<<(std::ostream& os, const Error& e) {
    return os << e.message();
}

} // namespace strata
