#include "strata/convert.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <cstdint>

namespace strata::convert {

namespace {

constexpr std::string_view kMicroSign = "\xc2\xb5s"; // U+00B5
constexpr std::string_view kGreekMu = "\xce\xbcs";   // U+03BC

// Renders value / 10^digits with trailing fractional zeros dropped.
std::string fixedPoint(std::uint64_t value, int digits) {
    std::uint64_t scale = 1;
    for (int i = 0; i < digits; ++i) scale *= 10;
    std::string out = std::to_string(value / scale);
    std::uint64_t frac = value % scale;
    if (frac == 0) return out;

    std::string fracText = std::to_string(frac);
    fracText.insert(0, static_cast<std::size_t>(digits) - fracText.size(), '0');
    while (!fracText.empty() && fracText.back() == '0') fracText.pop_back();
    out.push_back('.');
    out += fracText;
    return out;
}

} // namespace

bool parseBool(std::string_view s, bool& out) {
    const auto t = utils::trim(s);
    if (t == "1" || t == "t" || t == "T" || t == "true" || t == "True" || t == "TRUE" || t == "on" || t == "yes") {
        out = true;
        return true;
    }
    if (t == "0" || t == "f" || t == "F" || t == "false" || t == "False" || t == "FALSE" || t == "off" || t == "no") {
        out = false;
        return true;
    }
    return false;
}

bool isBoolLiteral(std::string_view s) {
    return s == "1" || s == "t" || s == "T" || s == "true" || s == "True" || s == "TRUE" ||
           s == "0" || s == "f" || s == "F" || s == "false" || s == "False" || s == "FALSE";
}

bool parseDuration(std::string_view s, Duration& out) {
    const auto sv = utils::trim(s);
    if (sv.empty()) return false;

    std::size_t pos = 0;
    int sign = 1;
    if (sv[pos] == '+' || sv[pos] == '-') {
        if (sv[pos] == '-') sign = -1;
        ++pos;
    }
    if (pos >= sv.size()) return false;

    if (sv.substr(pos) == "0") {
        out = Duration(0);
        return true;
    }

    long double totalNs = 0.0L;
    while (pos < sv.size()) {
        const std::size_t numStart = pos;
        bool seenDigit = false;
        bool seenDot = false;
        for (; pos < sv.size(); ++pos) {
            const char ch = sv[pos];
            if (ch >= '0' && ch <= '9') {
                seenDigit = true;
                continue;
            }
            if (ch == '.' && !seenDot) {
                seenDot = true;
                continue;
            }
            break;
        }
        if (!seenDigit) return false;
        const std::size_t numEnd = pos;
        if (pos >= sv.size()) return false; // missing unit

        const std::string_view rest = sv.substr(pos);
        std::size_t unitLen = 0;
        long double multiplier = 0.0L;
        if (utils::startsWith(rest, "ns")) {
            unitLen = 2;
            multiplier = 1.0L;
        } else if (utils::startsWith(rest, "us")) {
            unitLen = 2;
            multiplier = 1e3L;
        } else if (utils::startsWith(rest, kMicroSign)) {
            unitLen = kMicroSign.size();
            multiplier = 1e3L;
        } else if (utils::startsWith(rest, kGreekMu)) {
            unitLen = kGreekMu.size();
            multiplier = 1e3L;
        } else if (utils::startsWith(rest, "ms")) {
            unitLen = 2;
            multiplier = 1e6L;
        } else if (utils::startsWith(rest, "s")) {
            unitLen = 1;
            multiplier = 1e9L;
        } else if (utils::startsWith(rest, "m")) {
            unitLen = 1;
            multiplier = 60e9L;
        } else if (utils::startsWith(rest, "h")) {
            unitLen = 1;
            multiplier = 3600e9L;
        } else {
            return false;
        }

        const std::string number(sv.substr(numStart, numEnd - numStart));
        char* end = nullptr;
        const long double value = std::strtold(number.c_str(), &end);
        if (end == nullptr || *end != '\0') return false;

        totalNs += value * multiplier;
        pos += unitLen;
    }

    totalNs *= static_cast<long double>(sign);
    if (totalNs > static_cast<long double>(std::numeric_limits<std::int64_t>::max())) return false;
    if (totalNs < static_cast<long double>(std::numeric_limits<std::int64_t>::min())) return false;
    out = Duration(static_cast<std::int64_t>(std::llround(totalNs)));
    return true;
}

std::string formatDuration(Duration d) {
    const std::int64_t ns = d.count();
    if (ns == 0) return "0s";

    const bool negative = ns < 0;
    const std::uint64_t u = negative ? (0 - static_cast<std::uint64_t>(ns)) : static_cast<std::uint64_t>(ns);

    std::string out;
    if (u < 1000ULL) {
        out = std::to_string(u) + "ns";
    } else if (u < 1000000ULL) {
        out = fixedPoint(u, 3) + std::string(kMicroSign);
    } else if (u < 1000000000ULL) {
        out = fixedPoint(u, 6) + "ms";
    } else {
        const std::uint64_t totalSeconds = u / 1000000000ULL;
        const std::uint64_t hours = totalSeconds / 3600;
        const std::uint64_t minutes = (totalSeconds / 60) % 60;
        const std::uint64_t secondsNs = u - (hours * 3600 + minutes * 60) * 1000000000ULL;
        const std::string seconds = fixedPoint(secondsNs, 9) + "s";
        if (hours > 0) {
            out = std::to_string(hours) + "h" + std::to_string(minutes) + "m" + seconds;
        } else if (minutes > 0) {
            out = std::to_string(minutes) + "m" + seconds;
        } else {
            out = seconds;
        }
    }
    return negative ? "-" + out : out;
}

std::string formatFloat(double v) {
    if (std::isnan(v)) return "NaN";
    if (std::isinf(v)) return v > 0 ? "+Inf" : "-Inf";
    std::array<char, 64> buf{};
    const auto res = std::to_chars(buf.data(), buf.data() + buf.size(), v);
    return std::string(buf.data(), res.ptr);
}

} // namespace strata::convert
