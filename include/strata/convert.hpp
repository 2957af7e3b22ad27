#ifndef STRATA_CONVERT_HPP
#define STRATA_CONVERT_HPP

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>

#include "utils.hpp"

namespace strata {

using Duration = std::chrono::nanoseconds;

// Text <-> value conversions shared by flag values and config decoders.
namespace convert {

// Accepts 1 t T true True TRUE on yes, and 0 f F false False FALSE off no.
bool parseBool(std::string_view s, bool& out);
// The narrower set a bool flag may consume as its next argument: 1 t T true
// True TRUE, 0 f F false False FALSE. Words like "on" or "no" stay positional.
bool isBoolLiteral(std::string_view s);

// Go-style durations: a signed sequence of decimal numbers, each with a unit
// suffix (ns, us, µs, ms, s, m, h), e.g. "300ms", "-1.5h" or "2h45m". A bare
// "0" is accepted without unit.
bool parseDuration(std::string_view s, Duration& out);
std::string formatDuration(Duration d);

// Shortest decimal text that round-trips to the same double.
std::string formatFloat(double v);

template <typename T>
bool parseSigned(std::string_view s, T& out) {
    static_assert(std::numeric_limits<T>::is_integer && std::numeric_limits<T>::is_signed, "signed integer required");
    const auto t = utils::trim(s);
    if (t.empty()) return false;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(tmp.c_str(), &end, 0);
    if (errno != 0) return false;
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
    if (v < static_cast<long long>(std::numeric_limits<T>::min()) || v > static_cast<long long>(std::numeric_limits<T>::max())) {
        return false;
    }
    out = static_cast<T>(v);
    return true;
}

template <typename T>
bool parseUnsigned(std::string_view s, T& out) {
    static_assert(std::numeric_limits<T>::is_integer && !std::numeric_limits<T>::is_signed, "unsigned integer required");
    const auto t = utils::trim(s);
    if (t.empty() || t.front() == '-') return false;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    const unsigned long long v = std::strtoull(tmp.c_str(), &end, 0);
    if (errno != 0) return false;
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
    if (v > static_cast<unsigned long long>(std::numeric_limits<T>::max())) return false;
    out = static_cast<T>(v);
    return true;
}

template <typename T>
bool parseFloat(std::string_view s, T& out) {
    static_assert(std::is_floating_point_v<T>, "floating point required");
    const auto t = utils::trim(s);
    if (t.empty()) return false;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(tmp.c_str(), &end);
    if (errno != 0) return false;
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
    out = static_cast<T>(v);
    return true;
}

template <typename T>
bool parse(std::string_view s, T& out) {
    if constexpr (std::is_same_v<T, bool>) {
        return parseBool(s, out);
    } else if constexpr (std::is_same_v<T, std::string>) {
        out = std::string(s);
        return true;
    } else if constexpr (std::is_same_v<T, Duration>) {
        return parseDuration(s, out);
    } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
        return parseSigned<T>(s, out);
    } else if constexpr (std::is_integral_v<T>) {
        return parseUnsigned<T>(s, out);
    } else if constexpr (std::is_floating_point_v<T>) {
        return parseFloat<T>(s, out);
    } else {
        static_assert(sizeof(T) == 0, "no text conversion for this type");
        return false;
    }
}

template <typename T>
std::string format(const T& v) {
    if constexpr (std::is_same_v<T, bool>) {
        return v ? "true" : "false";
    } else if constexpr (std::is_same_v<T, std::string>) {
        return v;
    } else if constexpr (std::is_same_v<T, Duration>) {
        return formatDuration(v);
    } else if constexpr (std::is_integral_v<T>) {
        return std::to_string(v);
    } else if constexpr (std::is_floating_point_v<T>) {
        return formatFloat(static_cast<double>(v));
    } else {
        static_assert(sizeof(T) == 0, "no text conversion for this type");
        return {};
    }
}

template <typename T>
std::string typeName() {
    if constexpr (std::is_same_v<T, bool>) {
        return "bool";
    } else if constexpr (std::is_same_v<T, std::string>) {
        return "string";
    } else if constexpr (std::is_same_v<T, Duration>) {
        return "duration";
    } else if constexpr (std::is_same_v<T, int>) {
        return "int";
    } else if constexpr (std::is_same_v<T, unsigned>) {
        return "uint";
    } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
        return "int" + std::to_string(sizeof(T) * 8);
    } else if constexpr (std::is_integral_v<T>) {
        return "uint" + std::to_string(sizeof(T) * 8);
    } else if constexpr (std::is_floating_point_v<T>) {
        return "float";
    } else {
        return "value";
    }
}

} // namespace convert
} // namespace strata

#endif // STRATA_CONVERT_HPP
