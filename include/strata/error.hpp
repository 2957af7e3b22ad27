#ifndef STRATA_ERROR_HPP
#define STRATA_ERROR_HPP

#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace strata {

enum class ErrorKind {
    UnknownFlag,
    MissingValue,
    ParseValueError,
    AmbiguousName,
    DuplicateFlag,
    InvalidFlag,
    ConfigFileMissing,
    ConfigFileOpen,
    ConfigParseError,
    StringConversionError,
    NoExec,
    HelpRequested,
    NotParsed,
    AlreadyParsed,
    InvalidCommand,
    Exec,
};

[[nodiscard]] std::string_view toString(ErrorKind kind);

// Error value returned (inside std::optional) by every fallible operation.
// An empty optional means success.
//
// The kind survives wrapping, so callers can special-case sentinels such as
// HelpRequested and NoExec regardless of how much context was prepended.
class Error {
public:
    Error(ErrorKind kind, std::string message) : kind_(kind), message_(std::move(message)) {}

    [[nodiscard]] ErrorKind kind() const { return kind_; }
    [[nodiscard]] const std::string& message() const { return message_; }
    [[nodiscard]] bool is(ErrorKind kind) const { return kind_ == kind; }

    // Returns a copy with "context: " prepended to the message.
    [[nodiscard]] Error wrap(std::string_view context) const;

    static Error helpRequested() { return Error(ErrorKind::HelpRequested, "help requested"); }
    static Error noExec() { return Error(ErrorKind::NoExec, "no exec function"); }

private:
    ErrorKind kind_;
    std::string message_;
};

inline bool operator==(const Error& e, ErrorKind kind) { return e.is(kind); }
inline bool operator!=(const Error& e, ErrorKind kind) { return !e.is(kind); }

std::ostream& operator<<(std::ostream& os, const Error& e);

} // namespace strata

#endif // STRATA_ERROR_HPP
